// C++ Standard Library
#include <array>
#include <string_view>

// Core
#include <xfer/utils/ascii.hpp>

// Project
#include <xfer/net/http/transfer_coding.hpp>

namespace xfer::net::http
{

    namespace
    {
        struct coding_name
        {
            std::string_view name;
            coding kind;
        };

        // IANA HTTP Transfer Coding Registry. Most frequent names first.
        constexpr std::array<coding_name, 6> coding_table{ {
            { "chunked", coding::chunked },
            { "gzip", coding::gzip },
            { "deflate", coding::deflate },
            { "compress", coding::compress },
            { "x-gzip", coding::gzip },
            { "x-compress", coding::compress },
        } };
    } // namespace

    transfer_encoding standard_encoding(coding kind) noexcept
    {
        return { kind, to_string(kind) };
    }

    coding find_coding(std::string_view name) noexcept
    {
        for (const auto& entry : coding_table)
        {
            if (ascii::iequals(name, entry.name))
                return entry.kind;
        }
        return coding::other;
    }

    transfer_encoding classify(std::string_view token) noexcept
    {
        token = ascii::trim_ows(token);
        return { find_coding(token), token };
    }

    std::string_view to_string(coding kind) noexcept
    {
        switch (kind)
        {
        case coding::chunked:
            return "chunked";
        case coding::compress:
            return "compress";
        case coding::deflate:
            return "deflate";
        case coding::gzip:
            return "gzip";
        case coding::other:
            break;
        }
        return "other";
    }

} // namespace xfer::net::http
