// C++ Standard Library
#include <algorithm>
#include <string_view>

// Core
#include <xfer/utils/ascii.hpp>
#include <xfer/utils/attributes.hpp>

// Project
#include <xfer/net/http/transfer_encoding_parser.hpp>

namespace xfer::net::http
{

    std::optional<transfer_encoding> transfer_encoding_parser::next() noexcept
    {
        while (pos_ < value_.size())
        {
            const std::string_view rest = value_.substr(pos_);
            const auto comma = rest.find(',');

            std::string_view raw;
            if (comma == std::string_view::npos)
            {
                raw = rest;
                pos_ = value_.size();
            }
            else
            {
                raw = rest.substr(0, comma);
                pos_ += comma + 1;
            }

            const std::string_view token = ascii::trim_ows(raw);
            if (XFER_UNLIKELY(token.empty()))
                continue; // "a,,b", leading or trailing comma

            Ensures(token.data() >= value_.data() && token.data() + token.size() <= value_.data() + value_.size());
            return transfer_encoding{ find_coding(token), token };
        }
        return std::nullopt;
    }

    void collect(std::string_view value, std::vector<transfer_encoding>& out)
    {
        transfer_encoding_parser parser{ value };
        while (auto enc = parser.next())
            out.push_back(*enc);
    }

    std::vector<transfer_encoding> collect(std::string_view value)
    {
        std::vector<transfer_encoding> out;
        collect(value, out);
        return out;
    }

    std::vector<transfer_encoding> decode_order(std::string_view value)
    {
        auto out = collect(value);
        std::reverse(out.begin(), out.end());
        return out;
    }

} // namespace xfer::net::http
