#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include <fizzy/fizzy.h>

#include <hospes/crypto/hash.hpp>
#include <hospes/error.hpp>
#include <hospes/schema/layout.hpp>

namespace hospes::vm {

enum class extern_kind : std::uint8_t
{
  function,
  table,
  memory,
  global
};

struct function_type
{
  std::vector< schema::core_type > inputs;
  std::optional< schema::core_type > output;

  std::string to_string() const;

  bool operator==( const function_type& ) const = default;
};

struct export_entry
{
  std::string name;
  extern_kind kind;
  std::uint32_t index;
};

struct import_entry
{
  std::string module;
  std::string name;
  extern_kind kind;
};

/**
 * A parsed guest module.
 *
 * Immutable once constructed and shared read-only by every instance built
 * from it. Instances clone the underlying engine module because
 * instantiation consumes it.
 */
class module final
{
public:
  module( const FizzyModule* m, const crypto::digest& id );
  module( const module& ) = delete;
  module( module&& )      = delete;

  ~module();

  module& operator=( const module& ) = delete;
  module& operator=( module&& )      = delete;

  const FizzyModule* get() const noexcept;
  const crypto::digest& id() const noexcept;

  const std::vector< export_entry >& exports() const noexcept;
  const std::vector< import_entry >& imports() const noexcept;
  bool has_memory() const noexcept;
  bool has_start_function() const noexcept;

  std::optional< std::uint32_t > find_function( std::string_view name ) const noexcept;
  std::optional< function_type > type_of( std::uint32_t function_index ) const;

private:
  const FizzyModule* _module;
  crypto::digest _id;
  std::vector< export_entry > _exports;
  std::vector< import_entry > _imports;
};

using module_ptr = std::shared_ptr< const module >;

result< module_ptr > parse_module( std::span< const std::byte > bytecode );

} // namespace hospes::vm
