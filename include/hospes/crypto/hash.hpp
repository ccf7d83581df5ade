#pragma once

#include <array>
#include <cstddef>
#include <span>
#include <string_view>
#include <type_traits>

#include <boost/endian/conversion.hpp>

namespace hospes::crypto {

constexpr std::size_t digest_length = 32;

using digest = std::array< std::byte, digest_length >;

digest hash( std::span< const std::byte > bytes ) noexcept;
digest hash( std::string_view sv ) noexcept;

// Incremental hashing on a thread local BLAKE3 state.
void hasher_reset() noexcept;
void hasher_update( std::span< const std::byte > bytes ) noexcept;
void hasher_update( std::string_view sv ) noexcept;
digest hasher_finalize() noexcept;

template< typename T >
  requires std::is_integral_v< T >
void hasher_update( T t ) noexcept
{
  boost::endian::native_to_little_inplace( t );
  hasher_update( std::as_bytes( std::span( &t, 1 ) ) );
}

} // namespace hospes::crypto
