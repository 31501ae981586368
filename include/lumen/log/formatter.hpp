#pragma once

#include <span>

#include <quill/BinaryDataDeferredFormatCodec.h>

#include <lumen/encode/base58.hpp>
#include <lumen/encode/hex.hpp>

namespace lumen::log {

struct hex_tag
{};

using hex = quill::BinaryData< hex_tag >;

struct base58_tag
{};

using base58 = quill::BinaryData< base58_tag >;

} // namespace lumen::log

template<>
struct fmtquill::formatter< lumen::log::hex >
{
  constexpr auto parse( format_parse_context& ctx )
  {
    return ctx.begin();
  }

  auto format( const lumen::log::hex& bin_data, format_context& ctx ) const
  {
    return fmtquill::format_to( ctx.out(),
                                "{}",
                                lumen::encode::to_hex( std::span( bin_data.data(), bin_data.size() ) ) );
  }
};

template<>
struct quill::Codec< lumen::log::hex >: quill::BinaryDataDeferredFormatCodec< lumen::log::hex >
{};

template<>
struct fmtquill::formatter< lumen::log::base58 >
{
  constexpr auto parse( format_parse_context& ctx )
  {
    return ctx.begin();
  }

  auto format( const lumen::log::base58& bin_data, format_context& ctx ) const
  {
    return fmtquill::format_to(
      ctx.out(),
      "{}",
      lumen::encode::to_base58( std::span( bin_data.data(), bin_data.size() ), lumen::encode::base58_alphabet::stellar ) );
  }
};

template<>
struct quill::Codec< lumen::log::base58 >: quill::BinaryDataDeferredFormatCodec< lumen::log::base58 >
{};
