/*
Module Name:
- header_fields.hpp

Abstract:
- Boost.Beast glue that produces the single Transfer-Encoding value the parser expects.
- Repeated field lines are joined with ", " in arrival order (RFC 7230 §3.2.2).
- A raw HTTP/1.x head (start line, fields, blank line) can be run through a Beast
  header parser; requests and responses are told apart by the "HTTP/" prefix.
*/
#pragma once

// C++ Standard Library
#include <optional>
#include <string>
#include <string_view>
#include <system_error>

// Boost.Beast
#include <boost/beast/http/fields.hpp>

namespace xfer::net::http
{

    // Joined value of every Transfer-Encoding line in fields; empty when there is none.
    [[nodiscard]] std::string joined_transfer_encoding(const boost::beast::http::fields& fields);

    // Joined Transfer-Encoding of a raw request or response head.
    // nullopt with a clear ec when the head has no Transfer-Encoding;
    // nullopt with errc::malformed_header or errc::incomplete_header on failure.
    [[nodiscard]] std::optional<std::string> transfer_encoding_of(std::string_view raw_head, std::error_code& ec);

} // namespace xfer::net::http
