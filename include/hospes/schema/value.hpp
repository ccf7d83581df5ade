#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include <hospes/schema/types.hpp>

namespace hospes::schema {

class value;

using byte_buffer = std::vector< std::byte >;

struct list_value
{
  std::vector< value > elements;
};

struct record_value
{
  std::vector< value > fields;
};

struct variant_value
{
  std::uint32_t discriminant = 0;
  std::vector< value > payload;
};

bool operator==( const list_value& lhs, const list_value& rhs );
bool operator==( const record_value& lhs, const record_value& rhs );
bool operator==( const variant_value& lhs, const variant_value& rhs );

/**
 * A host side value of the portable value model.
 *
 * Values carry no type; they are checked against a type_descriptor when they
 * cross into a guest.
 */
class value final
{
public:
  using storage = std::variant< bool,
                                std::int32_t,
                                std::int64_t,
                                std::uint32_t,
                                std::uint64_t,
                                float,
                                double,
                                std::string,
                                byte_buffer,
                                list_value,
                                record_value,
                                variant_value >;

  value();

  static value boolean( bool b );
  static value s32( std::int32_t v );
  static value s64( std::int64_t v );
  static value u32( std::uint32_t v );
  static value u64( std::uint64_t v );
  static value f32( float v );
  static value f64( double v );
  static value string( std::string s );
  static value bytes( byte_buffer b );
  static value list( std::vector< value > elements );
  static value record( std::vector< value > fields );
  static value variant( std::uint32_t discriminant );
  static value variant( std::uint32_t discriminant, value payload );

  template< typename T >
  bool holds() const noexcept
  {
    return std::holds_alternative< T >( _data );
  }

  template< typename T >
  const T& get() const
  {
    return std::get< T >( _data );
  }

  const storage& data() const noexcept;

  // Renders the value for display, using the type for names where one is given.
  std::string to_string() const;
  std::string to_string( const type_descriptor& type ) const;

  bool operator==( const value& other ) const;

private:
  explicit value( storage data );

  storage _data;
};

} // namespace hospes::schema
