#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string_view>
#include <vector>

#include <hospes/crypto/hash.hpp>
#include <hospes/error.hpp>
#include <hospes/schema/layout.hpp>
#include <hospes/schema/types.hpp>
#include <hospes/vm/module.hpp>

namespace hospes::vm {

constexpr std::string_view initializer_export = "_initialize";

struct function_binding
{
  schema::function_signature signature;
  schema::flat_signature flat;
  std::uint32_t index = 0;
};

/**
 * The validated mapping from schema functions to guest exports.
 *
 * Only functions in this table are reachable from the host.
 */
class binding_table final
{
public:
  const function_binding* find( std::string_view name ) const noexcept;
  const std::vector< function_binding >& functions() const noexcept;

  std::optional< std::uint32_t > allocator() const noexcept;
  std::optional< std::uint32_t > deallocator() const noexcept;
  std::optional< std::uint32_t > initializer() const noexcept;

private:
  friend result< binding_table > validate( const module& m, const schema::interface_schema& schema );

  std::vector< function_binding > _functions;
  std::optional< std::uint32_t > _allocator;
  std::optional< std::uint32_t > _deallocator;
  std::optional< std::uint32_t > _initializer;
};

// Checks every schema function, in schema order, against the module exports.
result< binding_table > validate( const module& m, const schema::interface_schema& schema );

// A module validated against a schema; the unit instances are built from.
struct component
{
  module_ptr code;
  schema::interface_schema schema;
  binding_table bindings;
  crypto::digest id;
};

using component_ptr = std::shared_ptr< const component >;

// Identity of a module under a schema: BLAKE3 of the module hash and schema fingerprint.
crypto::digest component_id( const crypto::digest& module_id, const schema::interface_schema& schema );

result< component_ptr > make_component( module_ptr code, schema::interface_schema schema );

} // namespace hospes::vm
