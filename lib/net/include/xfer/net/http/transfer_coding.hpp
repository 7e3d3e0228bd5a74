/*
Module Name:
- transfer_coding.hpp

Abstract:
- Classified Transfer-Encoding token: either one of the registered transfer-codings
  or an opaque extension name.
- Registered names match ASCII case-insensitively (RFC 7230 §4). The deprecated
  aliases x-gzip and x-compress fold into gzip and compress.
- Values are views into the caller's header buffer. They become dangling as soon as
  that buffer is mutated or freed.
*/
#pragma once

// C++ Standard Library
#include <cstdint>
#include <string_view>

namespace xfer::net::http
{

    // Registered transfer-codings. 'other' tags an extension token.
    enum class coding : std::uint8_t
    {
        other = 0,
        chunked,
        compress,
        deflate,
        gzip,
    };

    struct transfer_encoding
    {
        coding kind = coding::other;
        std::string_view name; // trimmed token exactly as it appeared in the header

        [[nodiscard]] constexpr bool is_standard() const noexcept
        {
            return kind != coding::other;
        }
        [[nodiscard]] constexpr bool is_other() const noexcept
        {
            return kind == coding::other;
        }

        // Standard values compare by kind only ("GZIP" == "gzip"); extensions compare bytes.
        friend constexpr bool operator==(const transfer_encoding& a, const transfer_encoding& b) noexcept
        {
            if (a.kind != b.kind)
                return false;
            return a.is_standard() || a.name == b.name;
        }
    };

    [[nodiscard]] transfer_encoding standard_encoding(coding kind) noexcept;

    [[nodiscard]] constexpr transfer_encoding other_encoding(std::string_view name) noexcept
    {
        return { coding::other, name };
    }

    // Registered name lookup. Returns coding::other when name is not registered.
    [[nodiscard]] coding find_coding(std::string_view name) noexcept;

    // Classify one isolated token. Surrounding OWS is stripped first, so an empty or
    // blank token classifies as other("").
    [[nodiscard]] transfer_encoding classify(std::string_view token) noexcept;

    // Canonical lowercase registry name; "other" for coding::other.
    [[nodiscard]] std::string_view to_string(coding kind) noexcept;

} // namespace xfer::net::http
