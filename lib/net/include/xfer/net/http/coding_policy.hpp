/*
Module Name:
- coding_policy.hpp

Abstract:
- Receiver-side decisions layered over the Transfer-Encoding parser: which codings a
  recipient can undo, and whether the message body is chunk framed.
- The parser stays policy free. An extension token is only "unsupported" here.
*/
#pragma once

// C++ Standard Library
#include <optional>
#include <string_view>
#include <system_error>

// Project
#include <xfer/net/http/error.hpp>
#include <xfer/net/http/transfer_coding.hpp>

namespace xfer::net::http
{

    // bitmask of codings a recipient can decode
    enum class coding_mask : unsigned
    {
        none = 0,
        chunked = 1u << 0,
        compress = 1u << 1,
        deflate = 1u << 2,
        gzip = 1u << 3,
    };

    constexpr coding_mask operator|(coding_mask a, coding_mask b)
    {
        return static_cast<coding_mask>(static_cast<unsigned>(a) | static_cast<unsigned>(b));
    }
    constexpr coding_mask operator&(coding_mask a, coding_mask b)
    {
        return static_cast<coding_mask>(static_cast<unsigned>(a) & static_cast<unsigned>(b));
    }
    constexpr coding_mask& operator|=(coding_mask& a, coding_mask b)
    {
        a = a | b;
        return a;
    }
    constexpr bool any(coding_mask v)
    {
        return static_cast<unsigned>(v) != 0;
    }

    // coding::other maps to none, so it is never contained in a mask.
    constexpr coding_mask mask_of(coding kind)
    {
        switch (kind)
        {
        case coding::chunked:
            return coding_mask::chunked;
        case coding::compress:
            return coding_mask::compress;
        case coding::deflate:
            return coding_mask::deflate;
        case coding::gzip:
            return coding_mask::gzip;
        case coding::other:
            break;
        }
        return coding_mask::none;
    }

    constexpr bool contains(coding_mask mask, coding kind)
    {
        return any(mask & mask_of(kind));
    }

    // First token that is an extension or a coding outside 'supported'.
    [[nodiscard]] std::optional<transfer_encoding> first_unsupported(std::string_view value,
                                                                     coding_mask supported) noexcept;

    // True when every token of value is supported. Otherwise false with
    // ec = errc::unsupported_transfer_coding.
    [[nodiscard]] bool check_supported(std::string_view value, coding_mask supported, std::error_code& ec) noexcept;

    // Last token of value, which is the last coding applied by the sender.
    [[nodiscard]] std::optional<transfer_encoding> final_coding(std::string_view value) noexcept;

    // RFC 7230 §3.3.3: body length is delimited by chunked framing iff chunked is the final coding.
    [[nodiscard]] bool is_chunked(std::string_view value) noexcept;

} // namespace xfer::net::http
