// NOLINTBEGIN

#include <gtest/gtest.h>

#include <hospes/crypto/hash.hpp>
#include <hospes/encode/hex.hpp>

#include <cstdint>
#include <vector>

TEST( hash, blake3 )
{
  EXPECT_EQ( hospes::encode::to_hex( hospes::crypto::hash( std::string_view( "" ) ) ),
             "af1349b9f5f9a1a6a0404dea36dcc9499bcb25c9adc112b7cc9a93cae41f3262" );

  EXPECT_EQ( hospes::encode::to_hex( hospes::crypto::hash( std::string_view( "abc" ) ) ),
             "6437b3ac38465133ffb63b75273a8db548c558465d79db03fd359c6cd5bd9d85" );

  const std::vector< std::byte > bytes{ std::byte{ 'a' }, std::byte{ 'b' }, std::byte{ 'c' } };
  EXPECT_EQ( hospes::crypto::hash( bytes ), hospes::crypto::hash( std::string_view( "abc" ) ) );
}

TEST( hash, incremental )
{
  hospes::crypto::hasher_reset();
  hospes::crypto::hasher_update( std::string_view( "ab" ) );
  hospes::crypto::hasher_update( std::string_view( "c" ) );
  auto split = hospes::crypto::hasher_finalize();

  hospes::crypto::hasher_reset();
  hospes::crypto::hasher_update( std::string_view( "a" ) );
  hospes::crypto::hasher_update( std::string_view( "bc" ) );
  auto other_split = hospes::crypto::hasher_finalize();

  // Strings are length prefixed.
  EXPECT_NE( split, other_split );

  hospes::crypto::hasher_update( std::string_view( "ab" ) );
  hospes::crypto::hasher_update( std::string_view( "c" ) );
  EXPECT_EQ( hospes::crypto::hasher_finalize(), split );

  hospes::crypto::hasher_update( std::uint32_t( 1 ) );
  auto one = hospes::crypto::hasher_finalize();

  hospes::crypto::hasher_update( std::uint64_t( 1 ) );
  EXPECT_NE( hospes::crypto::hasher_finalize(), one );
}

TEST( hash, integers_are_little_endian )
{
  hospes::crypto::hasher_update( std::uint32_t( 0x0102'0304 ) );
  auto integer = hospes::crypto::hasher_finalize();

  const std::vector< std::byte > bytes{ std::byte{ 4 }, std::byte{ 3 }, std::byte{ 2 }, std::byte{ 1 } };
  hospes::crypto::hasher_update( bytes );
  EXPECT_EQ( integer, hospes::crypto::hasher_finalize() );
  EXPECT_EQ( integer, hospes::crypto::hash( bytes ) );

  hospes::crypto::hasher_update( std::int16_t( -2 ) );
  EXPECT_EQ( hospes::crypto::hasher_finalize(),
             hospes::crypto::hash( std::vector< std::byte >{ std::byte{ 0xfe }, std::byte{ 0xff } } ) );
}

// NOLINTEND
