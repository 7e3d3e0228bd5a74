/*
Module Name:
- ascii.hpp

Abstract:
- Locale-free ASCII helpers for HTTP token handling.
- Header grammar is ASCII only, so case folding never consults <locale> or <cctype>.
- All helpers are constexpr and allocation free; views in, views out.
*/
#pragma once

// C++ Standard Library
#include <cstddef>
#include <string_view>

// Core
#include <xfer/utils/attributes.hpp>

namespace xfer::ascii
{

    // OWS = *( SP / HTAB ) per RFC 7230 §3.2.3.
    [[nodiscard]]
    XFER_FORCE_INLINE constexpr bool is_ows(char c) noexcept
    {
        return c == ' ' || c == '\t';
    }

    [[nodiscard]]
    XFER_FORCE_INLINE constexpr char to_lower(char c) noexcept
    {
        return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c;
    }

    // Strip leading and trailing OWS. Result is a sub-view of sv.
    [[nodiscard]]
    XFER_FORCE_INLINE constexpr std::string_view trim_ows(std::string_view sv) noexcept
    {
        while (!sv.empty() && is_ows(sv.front()))
            sv.remove_prefix(1);
        while (!sv.empty() && is_ows(sv.back()))
            sv.remove_suffix(1);
        return sv;
    }

    // Case-insensitive compare for ASCII letters; every other byte must match exactly.
    [[nodiscard]]
    constexpr bool iequals(std::string_view a, std::string_view b) noexcept
    {
        if (a.size() != b.size())
            return false;
        for (std::size_t i = 0; i < a.size(); ++i)
        {
            if (to_lower(a[i]) != to_lower(b[i]))
                return false;
        }
        return true;
    }

} // namespace xfer::ascii
