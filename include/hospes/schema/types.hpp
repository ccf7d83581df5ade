#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

#include <hospes/crypto/hash.hpp>

namespace hospes::schema {

enum class kind : std::uint8_t
{
  boolean,
  s32,
  s64,
  u32,
  u64,
  f32,
  f64,
  string,
  bytes,
  list,
  record,
  variant
};

std::string_view to_string( kind k ) noexcept;

// Names a type that needs no parameters: scalars, string and bytes.
std::optional< kind > primitive_from_string( std::string_view name ) noexcept;

struct field;
struct variant_case;

/**
 * Describes one type of the portable value model.
 *
 * Children are held by value so a descriptor is always a finite tree.
 */
class type_descriptor final
{
public:
  type_descriptor( kind k = kind::boolean ); // NOLINT(google-explicit-constructor)

  static type_descriptor list_of( type_descriptor element );
  static type_descriptor record_of( std::vector< field > fields );
  static type_descriptor variant_of( std::vector< variant_case > cases );

  kind tag() const noexcept;

  // True for bool, integers and floats.
  bool is_scalar() const noexcept;

  const type_descriptor& element() const;
  const std::vector< field >& fields() const;
  const std::vector< variant_case >& cases() const;

  // Empty records and variants, and duplicate member names, are malformed.
  std::error_code check() const;

  std::string to_string() const;

  bool operator==( const type_descriptor& other ) const;

private:
  kind _kind;
  std::vector< type_descriptor > _element;
  std::vector< field > _fields;
  std::vector< variant_case > _cases;
};

struct field
{
  std::string name;
  type_descriptor type;

  bool operator==( const field& ) const = default;
};

struct variant_case
{
  std::string name;
  std::optional< type_descriptor > payload;

  bool operator==( const variant_case& ) const = default;
};

struct function_signature
{
  std::string name;
  std::vector< type_descriptor > params;
  std::vector< type_descriptor > returns;

  bool operator==( const function_signature& ) const = default;
};

class interface_schema final
{
public:
  static constexpr std::string_view default_allocator   = "cabi_realloc";
  static constexpr std::string_view default_deallocator = "cabi_free";

  interface_schema();

  std::error_code add( function_signature signature );

  const function_signature* find( std::string_view name ) const noexcept;
  const std::vector< function_signature >& functions() const noexcept;

  const std::string& allocator() const noexcept;
  void set_allocator( std::string name );

  // An empty name means the guest exports no deallocator.
  const std::string& deallocator() const noexcept;
  void set_deallocator( std::string name );

  crypto::digest fingerprint() const;

private:
  std::vector< function_signature > _functions;
  std::string _allocator;
  std::string _deallocator;
};

} // namespace hospes::schema
