// C++ Standard Library
#include <string>
#include <system_error>
#include <utility>
#include <vector>

// Project
#include <app/inspector.hpp>
#include <xfer/net/http/coding_policy.hpp>
#include <xfer/net/http/header_fields.hpp>
#include <xfer/net/http/transfer_encoding_parser.hpp>

namespace app
{

    namespace xhttp = xfer::net::http;

    namespace
    {
        void write_token(std::ostream& out, const xhttp::transfer_encoding& enc)
        {
            if (enc.is_standard())
                out << "  standard " << xhttp::to_string(enc.kind) << '\n';
            else
                out << "  extension " << enc.name << '\n';
        }
    } // namespace

    Inspector::Inspector(env::InspectConfig cfg, std::ostream& out, std::ostream& log) :
        cfg_{ std::move(cfg) }, out_{ out }, log_{ log }
    {
    }

    void Inspector::debug(std::string_view what)
    {
        if (cfg_.verbose)
            log_ << "[xfer-inspect] " << what << '\n';
    }

    ExitStatus Inspector::inspect_value(std::string_view value)
    {
        ++values_seen_;
        out_ << "value: " << value << '\n';

        const auto encodings = cfg_.order == env::ReportOrder::decode ? xhttp::decode_order(value)
                                                                      : xhttp::collect(value);
        for (const auto& enc : encodings)
            write_token(out_, enc);

        debug("value #" + std::to_string(values_seen_) + ": " + std::to_string(encodings.size()) + " token(s)");

        if (!cfg_.supported)
            return ExitStatus::ok;

        out_ << "  chunked: " << (xhttp::is_chunked(value) ? "yes" : "no") << '\n';
        if (const auto bad = xhttp::first_unsupported(value, *cfg_.supported))
        {
            out_ << "  unsupported " << bad->name << '\n';
            return ExitStatus::unsupported;
        }
        return ExitStatus::ok;
    }

    ExitStatus Inspector::inspect_head(std::string_view raw_head)
    {
        std::error_code ec;
        const auto value = xhttp::transfer_encoding_of(raw_head, ec);
        if (ec)
        {
            log_ << "[xfer-inspect] head rejected: " << ec.message() << '\n';
            return ExitStatus::error;
        }
        if (!value)
        {
            out_ << "no Transfer-Encoding\n";
            return ExitStatus::ok;
        }
        debug("joined Transfer-Encoding: " + *value);
        return inspect_value(*value);
    }

    ExitStatus Inspector::inspect_lines(std::istream& in)
    {
        ExitStatus status = ExitStatus::ok;
        std::string line;
        while (std::getline(in, line))
        {
            if (!line.empty() && line.back() == '\r')
                line.pop_back();
            status = worst(status, inspect_value(line));
        }
        if (in.bad())
        {
            log_ << "[xfer-inspect] read error on input\n";
            return ExitStatus::error;
        }
        return status;
    }

} // namespace app
