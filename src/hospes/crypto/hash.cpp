#include <hospes/crypto/hash.hpp>
#include <hospes/memory/memory.hpp>

#include <cstdint>

#include <blake3.h>

namespace hospes::crypto {

namespace detail {

struct blake3
{
  blake3_hasher hasher{};

  blake3()
  {
    blake3_hasher_init( &hasher );
  }
};

} // namespace detail

// NOLINTBEGIN
thread_local static detail::blake3 state;

// NOLINTEND

digest hash( std::span< const std::byte > bytes ) noexcept
{
  blake3_hasher hasher;
  blake3_hasher_init( &hasher );
  blake3_hasher_update( &hasher, bytes.data(), bytes.size() );

  digest out;
  blake3_hasher_finalize( &hasher, memory::pointer_cast< std::uint8_t* >( out.data() ), out.size() );
  return out;
}

digest hash( std::string_view sv ) noexcept
{
  return hash( std::as_bytes( std::span( sv ) ) );
}

void hasher_reset() noexcept
{
  blake3_hasher_reset( &state.hasher );
}

void hasher_update( std::span< const std::byte > bytes ) noexcept
{
  blake3_hasher_update( &state.hasher, bytes.data(), bytes.size() );
}

void hasher_update( std::string_view sv ) noexcept
{
  // Length prefixed so that adjacent strings cannot alias.
  hasher_update( static_cast< std::uint64_t >( sv.size() ) );
  blake3_hasher_update( &state.hasher, sv.data(), sv.size() );
}

digest hasher_finalize() noexcept
{
  digest out;
  blake3_hasher_finalize( &state.hasher, memory::pointer_cast< std::uint8_t* >( out.data() ), out.size() );
  blake3_hasher_reset( &state.hasher );
  return out;
}

} // namespace hospes::crypto
