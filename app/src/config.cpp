// C++ Standard Library
#include <initializer_list>
#include <string_view>
#include <utility>

// TOML++
#include <toml++/toml.hpp>

// Project
#include <app/config.hpp>
#include <xfer/net/http/transfer_coding.hpp>

namespace env
{

    namespace
    {
        namespace xhttp = xfer::net::http;

        // Node at dotted key path, or nullptr when any segment is missing.
        const toml::node* find_node(const toml::table& root, std::initializer_list<std::string_view> keys)
        {
            const toml::node* node = &root;
            for (auto key : keys)
            {
                const auto* table_ptr = node->as_table();
                if (!table_ptr)
                    return nullptr;
                node = table_ptr->get(key);
                if (!node)
                    return nullptr;
            }
            return node;
        }

        // Convert the [inspect] section. Missing keys keep their defaults.
        InspectConfig read_inspect(const toml::table& root, const std::string& source)
        {
            InspectConfig cfg;

            if (const auto* section = find_node(root, { "inspect" }); section && !section->is_table())
                throw ConfigError("Expected table 'inspect' in " + source);

            if (const auto* node = find_node(root, { "inspect", "order" }))
            {
                auto opt = node->value<std::string>();
                if (!opt)
                    throw ConfigError("Invalid value for inspect.order in " + source);
                cfg.order = parse_report_order(*opt);
            }

            if (const auto* node = find_node(root, { "inspect", "supported" }))
            {
                const auto* arr = node->as_array();
                if (!arr)
                    throw ConfigError("inspect.supported must be an array in " + source);

                auto mask = xhttp::coding_mask::none;
                for (const auto& elem : *arr)
                {
                    auto name = elem.value<std::string>();
                    if (!name)
                        throw ConfigError("inspect.supported entries must be strings in " + source);
                    const auto kind = xhttp::find_coding(*name);
                    if (kind == xhttp::coding::other)
                        throw ConfigError("Unknown transfer-coding '" + *name + "' in " + source);
                    mask |= xhttp::mask_of(kind);
                }
                cfg.supported = mask;
            }

            if (const auto* node = find_node(root, { "inspect", "verbose" }))
            {
                auto opt = node->value<bool>();
                if (!opt)
                    throw ConfigError("Invalid value for inspect.verbose in " + source);
                cfg.verbose = *opt;
            }

            return cfg;
        }
    } // namespace

    ReportOrder parse_report_order(std::string_view text)
    {
        if (text == "header")
            return ReportOrder::header;
        if (text == "decode")
            return ReportOrder::decode;
        throw ConfigError("Unknown report order '" + std::string{ text } + "' (expected header or decode)");
    }

    Config Config::load_file(const std::filesystem::path& path)
    {
        if (path.empty())
            throw ConfigError("Config file path must not be empty");

        const auto path_str = path.string();
        toml::table tbl;
        try
        {
            tbl = toml::parse_file(path_str);
        }
        catch (const toml::parse_error& e)
        {
            throw ConfigError("TOML parse error in '" + path_str + "': " + std::string{ e.what() });
        }

        auto inspect_cfg = read_inspect(tbl, path_str);
        return Config(std::filesystem::absolute(path), std::move(inspect_cfg));
    }

    Config Config::load()
    {
        const auto default_path = std::filesystem::current_path() / "xfer.toml";
        if (!std::filesystem::exists(default_path))
            return Config({}, InspectConfig{});
        return load_file(default_path);
    }

    Config Config::load_string(std::string_view toml_text, std::string_view source)
    {
        const std::string source_str{ source };
        toml::table tbl;
        try
        {
            tbl = toml::parse(toml_text, source);
        }
        catch (const toml::parse_error& e)
        {
            throw ConfigError("TOML parse error in '" + source_str + "': " + std::string{ e.what() });
        }
        return Config({}, read_inspect(tbl, source_str));
    }

    ConfigError::ConfigError(const std::string& msg) noexcept :
        std::runtime_error{ msg }
    {
    }

} // namespace env
