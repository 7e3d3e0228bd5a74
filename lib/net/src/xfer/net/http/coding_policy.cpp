// Project
#include <xfer/net/http/coding_policy.hpp>
#include <xfer/net/http/transfer_encoding_parser.hpp>

namespace xfer::net::http
{

    std::optional<transfer_encoding> first_unsupported(std::string_view value, coding_mask supported) noexcept
    {
        transfer_encoding_parser parser{ value };
        while (auto enc = parser.next())
        {
            if (!contains(supported, enc->kind))
                return enc;
        }
        return std::nullopt;
    }

    bool check_supported(std::string_view value, coding_mask supported, std::error_code& ec) noexcept
    {
        if (first_unsupported(value, supported))
        {
            ec = errc::unsupported_transfer_coding;
            return false;
        }
        ec.clear();
        return true;
    }

    std::optional<transfer_encoding> final_coding(std::string_view value) noexcept
    {
        std::optional<transfer_encoding> last;
        for (const auto& enc : transfer_encodings(value))
            last = enc;
        return last;
    }

    bool is_chunked(std::string_view value) noexcept
    {
        const auto last = final_coding(value);
        return last && last->kind == coding::chunked;
    }

} // namespace xfer::net::http
