// C++ Standard Library
#include <string_view>

// Boost.Asio
#include <boost/asio/buffer.hpp>

// Boost.Beast
#include <boost/beast/core/error.hpp>
#include <boost/beast/http/empty_body.hpp>
#include <boost/beast/http/error.hpp>
#include <boost/beast/http/field.hpp>
#include <boost/beast/http/parser.hpp>

// Project
#include <xfer/net/http/error.hpp>
#include <xfer/net/http/header_fields.hpp>

namespace xfer::net::http
{

    namespace beast_http = boost::beast::http;

    namespace
    {
        constexpr std::string_view list_separator = ", ";

        template<bool isRequest>
        std::optional<std::string> extract(std::string_view raw_head, std::error_code& ec)
        {
            beast_http::parser<isRequest, beast_http::empty_body> parser;
            parser.eager(false); // stop once the header is complete

            boost::beast::error_code bec;
            (void)parser.put(boost::asio::buffer(raw_head.data(), raw_head.size()), bec);

            if (bec == beast_http::error::need_more || (!bec && !parser.is_header_done()))
            {
                ec = errc::incomplete_header;
                return std::nullopt;
            }
            if (bec)
            {
                ec = errc::malformed_header;
                return std::nullopt;
            }

            ec.clear();
            const auto& fields = parser.get().base();
            if (fields.find(beast_http::field::transfer_encoding) == fields.end())
                return std::nullopt;
            return joined_transfer_encoding(fields);
        }
    } // namespace

    std::string joined_transfer_encoding(const boost::beast::http::fields& fields)
    {
        std::string joined;
        const auto [first, last] = fields.equal_range(beast_http::field::transfer_encoding);
        for (auto it = first; it != last; ++it)
        {
            const auto value = it->value();
            if (!joined.empty())
                joined.append(list_separator);
            joined.append(value.data(), value.size());
        }
        return joined;
    }

    std::optional<std::string> transfer_encoding_of(std::string_view raw_head, std::error_code& ec)
    {
        constexpr std::string_view status_line_prefix = "HTTP/";
        if (raw_head.substr(0, status_line_prefix.size()) == status_line_prefix)
            return extract<false>(raw_head, ec);
        return extract<true>(raw_head, ec);
    }

} // namespace xfer::net::http
