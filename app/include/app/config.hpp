/*
Module Name:
- config.hpp

Abstract:
- Immutable configuration for xfer-inspect loaded from a single TOML file.
- Surfaces the [inspect] section: report order, the codings the caller can decode,
  and verbosity.
- Fails fast with ConfigError on invalid configuration. A missing default file is
  not an error; built-in defaults apply.
*/
#pragma once

// C++ Standard Library
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

// Project
#include <xfer/net/http/coding_policy.hpp>

namespace env
{

    /// Configuration-loading failure. Prefer specific errors over generic runtime_error.
    class ConfigError final : public std::runtime_error
    {
    public:
        explicit ConfigError(const std::string& msg) noexcept;
    };

    /// Order in which tokens are reported.
    enum class ReportOrder
    {
        header, ///< as written, first-applied coding first
        decode, ///< as removed by a recipient, last-applied coding first
    };

    /// [inspect] section.
    struct InspectConfig
    {
        ReportOrder order = ReportOrder::header;
        /// Codings the caller can decode. Unset disables the policy report.
        std::optional<xfer::net::http::coding_mask> supported;
        bool verbose = false;
    };

    /// Parse "header" or "decode". Throws ConfigError otherwise.
    [[nodiscard]] ReportOrder parse_report_order(std::string_view text);

    /// Immutable application configuration (single TOML file).
    class Config
    {
    public:
        /// Load from the file at path.
        /// Pre: !path.empty()
        static Config load_file(const std::filesystem::path& path);

        /// Load from "./xfer.toml", or defaults when that file does not exist.
        static Config load();

        /// Parse TOML text. source names the text in error messages.
        static Config load_string(std::string_view toml_text, std::string_view source = "<string>");

        [[nodiscard]] const InspectConfig& inspect() const noexcept
        {
            return inspect_;
        }
        /// Mutable access for command-line overrides.
        [[nodiscard]] InspectConfig& inspect() noexcept
        {
            return inspect_;
        }
        /// Absolute path of the loaded file; empty when defaults or a string were used.
        [[nodiscard]] const std::filesystem::path& path() const noexcept
        {
            return path_;
        }

    private:
        Config(std::filesystem::path path, InspectConfig inspect_cfg) noexcept :
            path_{ std::move(path) }, inspect_{ std::move(inspect_cfg) }
        {
        }

        std::filesystem::path path_;
        InspectConfig inspect_;
    };

} // namespace env
