#pragma once

#include <span>

#include <quill/BinaryDataDeferredFormatCodec.h>

#include <hospes/encode/hex.hpp>

namespace hospes::log {

struct hex_tag
{};

using hex = quill::BinaryData< hex_tag >;

} // namespace hospes::log

template<>
struct fmtquill::formatter< hospes::log::hex >
{
  constexpr auto parse( format_parse_context& ctx )
  {
    return ctx.begin();
  }

  auto format( const hospes::log::hex& bin_data, format_context& ctx ) const
  {
    return fmtquill::format_to( ctx.out(),
                                "{}",
                                hospes::encode::to_hex( std::span( bin_data.data(), bin_data.size() ) ) );
  }
};

template<>
struct quill::Codec< hospes::log::hex >: quill::BinaryDataDeferredFormatCodec< hospes::log::hex >
{};
