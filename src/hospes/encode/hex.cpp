#include <hospes/encode/hex.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>

namespace hospes::encode {

namespace {

constexpr std::array< char, 16 > digits{
  '0', '1', '2', '3', '4', '5', '6', '7', '8', '9', 'a', 'b', 'c', 'd', 'e', 'f' };

constexpr std::uint8_t nibble_bits = 4;
constexpr std::uint8_t nibble_mask = 0x0f;
constexpr std::uint8_t hex_offset  = 10;

std::optional< std::uint8_t > nibble( char c ) noexcept
{
  if( c >= '0' && c <= '9' )
    return static_cast< std::uint8_t >( c - '0' );
  if( c >= 'a' && c <= 'f' )
    return static_cast< std::uint8_t >( c - 'a' + hex_offset );
  if( c >= 'A' && c <= 'F' )
    return static_cast< std::uint8_t >( c - 'A' + hex_offset );

  return std::nullopt;
}

fault malformed( std::string detail )
{
  return fault( runtime_errc::encoding_fault, fault_phase::none, {}, std::move( detail ) );
}

fault bad_digit( std::string_view sv, std::size_t i )
{
  return malformed( "invalid hex digit '" + std::string( 1, sv[ i ] ) + "' at offset " + std::to_string( i ) );
}

} // namespace

std::string to_hex( std::span< const std::byte > s )
{
  std::string out;
  out.reserve( s.size() * 2 );

  for( auto b: s )
  {
    auto v = std::to_integer< std::uint8_t >( b );
    out.push_back( digits[ v >> nibble_bits ] );   // NOLINT(cppcoreguidelines-pro-bounds-constant-array-index)
    out.push_back( digits[ v & nibble_mask ] );    // NOLINT(cppcoreguidelines-pro-bounds-constant-array-index)
  }

  return out;
}

result< std::vector< std::byte > > from_hex( std::string_view sv )
{
  if( sv.starts_with( "0x" ) || sv.starts_with( "0X" ) )
    sv.remove_prefix( 2 );

  if( sv.size() % 2 != 0 )
    return std::unexpected( malformed( "odd number of hex digits (" + std::to_string( sv.size() ) + ")" ) );

  std::vector< std::byte > bytes;
  bytes.reserve( sv.size() / 2 );

  for( std::size_t i = 0; i < sv.size(); i += 2 )
  {
    auto high = nibble( sv[ i ] );
    if( !high )
      return std::unexpected( bad_digit( sv, i ) );

    auto low = nibble( sv[ i + 1 ] );
    if( !low )
      return std::unexpected( bad_digit( sv, i + 1 ) );

    bytes.push_back( static_cast< std::byte >( *high << nibble_bits | *low ) );
  }

  return bytes;
}

} // namespace hospes::encode
