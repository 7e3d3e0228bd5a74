/*
Module Name:
- inspector.hpp

Abstract:
- Drives the Transfer-Encoding parser for xfer-inspect and renders a plain-text report.
- One report block per header value: the value line, one line per token, then the
  policy lines when a supported set is configured.
- Output and diagnostics go to caller-supplied streams so the reports can be tested.
*/
#pragma once

// C++ Standard Library
#include <istream>
#include <ostream>
#include <string_view>

// Project
#include <app/config.hpp>

namespace app
{

    // Process exit status of xfer-inspect.
    enum class ExitStatus : int
    {
        ok = 0,
        unsupported = 1, // at least one value carried a coding outside the supported set
        error = 2, // usage, configuration, or input failure
    };

    // Combine two statuses, keeping the more severe one.
    [[nodiscard]] constexpr ExitStatus worst(ExitStatus a, ExitStatus b) noexcept
    {
        return static_cast<int>(a) >= static_cast<int>(b) ? a : b;
    }

    class Inspector
    {
    public:
        Inspector(env::InspectConfig cfg, std::ostream& out, std::ostream& log);

        // Report one Transfer-Encoding value.
        ExitStatus inspect_value(std::string_view value);

        // Report the joined Transfer-Encoding of a raw HTTP head.
        ExitStatus inspect_head(std::string_view raw_head);

        // Report every line of in as one value. Blank lines are reported too.
        ExitStatus inspect_lines(std::istream& in);

    private:
        void debug(std::string_view what);

        env::InspectConfig cfg_;
        std::ostream& out_;
        std::ostream& log_;
        unsigned values_seen_ = 0;
    };

} // namespace app
