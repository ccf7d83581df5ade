#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include <hospes/schema/types.hpp>

namespace hospes::schema {

enum class core_type : std::uint8_t
{
  i32,
  i64,
  f32,
  f64
};

std::string_view to_string( core_type t ) noexcept;

struct layout
{
  std::uint32_t size      = 0;
  std::uint32_t alignment = 1;
};

struct record_layout
{
  layout whole;
  std::vector< std::uint32_t > offsets;
};

struct variant_layout
{
  layout whole;
  std::uint32_t discriminant_size = 1;
  std::uint32_t payload_offset    = 0;
};

constexpr std::uint32_t pointer_size = 4;

// Strings, bytes and lists are stored as (u32 offset, u32 length).
constexpr layout indirect_layout{ 2 * pointer_size, pointer_size };

std::uint32_t align_to( std::uint32_t offset, std::uint32_t alignment ) noexcept;

layout layout_of( const type_descriptor& t );
record_layout layout_of_record( std::span< const type_descriptor > members );
record_layout layout_of_record( const std::vector< field >& fields );
variant_layout layout_of_variant( const std::vector< variant_case >& cases );

/**
 * The core signature a guest export must have to implement a function.
 *
 * Parameters flatten individually. Results flatten to nothing, to a single
 * core value when there is exactly one scalar result, and otherwise to an
 * i32 offset of a return area laid out as a record of the results.
 */
struct flat_signature
{
  std::vector< core_type > params;
  std::optional< core_type > result;
  bool uses_return_area = false;
  bool stages_arguments = false;
  bool uses_memory      = false;

  std::string to_string() const;

  bool operator==( const flat_signature& ) const = default;
};

std::optional< core_type > core_type_of( const type_descriptor& t ) noexcept;

flat_signature flatten( const function_signature& signature );

} // namespace hospes::schema
