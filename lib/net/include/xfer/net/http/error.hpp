/*
Module Name:
- error.hpp

Abstract:
- Defines xfer::net error codes and a std::error_category so callers can use
  std::error_code with the header helpers. Provides make_error_code and enables
  implicit conversion via is_error_code_enum.
- The Transfer-Encoding parser itself never fails; these codes come from the
  policy and header-extraction layers around it.
*/
#pragma once

// C++ Standard Library
#include <string>
#include <system_error>

namespace xfer::net
{

    enum class errc
    {
        unsupported_transfer_coding = 1,
        malformed_header,
        incomplete_header,
    };

    // Category for xfer::net errors.
    struct error_category_impl final : std::error_category
    {
        const char* name() const noexcept override
        {
            return "xfer.net";
        }
        std::string message(int ev) const override
        {
            switch (static_cast<errc>(ev))
            {
            case errc::unsupported_transfer_coding:
                return "unsupported transfer-coding";
            case errc::malformed_header:
                return "malformed http header";
            case errc::incomplete_header:
                return "incomplete http header";
            }
            return "unknown xfer.net error";
        }
    };

    inline const std::error_category& error_category()
    {
        static error_category_impl cat;
        return cat;
    }

    inline std::error_code make_error_code(errc e) noexcept
    {
        return { static_cast<int>(e), error_category() };
    }

} // namespace xfer::net

// Enable implicit conversion to std::error_code for xfer::net::errc.
namespace std
{
    template<>
    struct is_error_code_enum<xfer::net::errc> : true_type
    {
    };
} // namespace std
