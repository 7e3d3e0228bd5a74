/*
Module: main.cpp

Purpose:
- Entry point for xfer-inspect: classifies Transfer-Encoding values from the command
  line, from stdin, or from a raw HTTP head.

Notes:
- Config is loaded from --config FILE, else ./xfer.toml when present (see env::Config).
  Fails fast with ConfigError.
- --order overrides inspect.order from the config file.
- Exit status: 0 ok, 1 unsupported coding seen, 2 usage/config/input error.
*/

// C++ Standard Library
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <iterator>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

// Project
#include <app/config.hpp>
#include <app/inspector.hpp>

namespace
{
    struct Options
    {
        std::optional<std::string> config_path;
        std::optional<std::string> order;
        std::optional<std::string> head_path;
        std::vector<std::string> values;
        bool help = false;
    };

    void print_usage(std::ostream& os)
    {
        os << "usage: xfer-inspect [--config FILE] [--order header|decode] [--head FILE] [VALUE...]\n"
              "  VALUE        Transfer-Encoding value to classify (default: one per stdin line)\n"
              "  --head FILE  read a raw HTTP head from FILE ('-' for stdin)\n"
              "  --config     TOML config (default: ./xfer.toml when present)\n"
              "  --order      report tokens as written or in decode order\n";
    }

    // Returns nullopt on a usage error (already reported).
    std::optional<Options> parse_args(int argc, char** argv)
    {
        Options opts;
        for (int i = 1; i < argc; ++i)
        {
            const std::string_view arg = argv[i];
            auto take_value = [&](std::optional<std::string>& slot) {
                if (i + 1 >= argc)
                {
                    std::cerr << "[xfer-inspect] missing value for " << arg << '\n';
                    return false;
                }
                slot = argv[++i];
                return true;
            };

            if (arg == "--help" || arg == "-h")
                opts.help = true;
            else if (arg == "--config")
            {
                if (!take_value(opts.config_path))
                    return std::nullopt;
            }
            else if (arg == "--order")
            {
                if (!take_value(opts.order))
                    return std::nullopt;
            }
            else if (arg == "--head")
            {
                if (!take_value(opts.head_path))
                    return std::nullopt;
            }
            else if (arg == "--")
            {
                for (++i; i < argc; ++i)
                    opts.values.emplace_back(argv[i]);
            }
            else if (arg.size() > 2 && arg.substr(0, 2) == "--")
            {
                std::cerr << "[xfer-inspect] unknown option " << arg << '\n';
                return std::nullopt;
            }
            else
                opts.values.emplace_back(arg);
        }
        return opts;
    }

    std::optional<std::string> read_all(const std::string& path)
    {
        if (path == "-")
            return std::string{ std::istreambuf_iterator<char>{ std::cin }, std::istreambuf_iterator<char>{} };

        std::ifstream ifs(path, std::ios::binary);
        if (!ifs)
            return std::nullopt;
        std::ostringstream ss;
        ss << ifs.rdbuf();
        return ss.str();
    }
} // namespace

int main(int argc, char** argv)
{
    const auto opts = parse_args(argc, argv);
    if (!opts)
    {
        print_usage(std::cerr);
        return static_cast<int>(app::ExitStatus::error);
    }
    if (opts->help)
    {
        print_usage(std::cout);
        return EXIT_SUCCESS;
    }

    try
    {
        auto cfg = opts->config_path ? env::Config::load_file(*opts->config_path) : env::Config::load();
        if (opts->order)
            cfg.inspect().order = env::parse_report_order(*opts->order);

        if (cfg.inspect().verbose && !cfg.path().empty())
            std::cerr << "[config] loaded " << cfg.path().string() << '\n';

        app::Inspector inspector{ cfg.inspect(), std::cout, std::cerr };

        if (opts->head_path)
        {
            const auto head = read_all(*opts->head_path);
            if (!head)
            {
                std::cerr << "[xfer-inspect] cannot open " << *opts->head_path << '\n';
                return static_cast<int>(app::ExitStatus::error);
            }
            return static_cast<int>(inspector.inspect_head(*head));
        }

        if (opts->values.empty())
            return static_cast<int>(inspector.inspect_lines(std::cin));

        auto status = app::ExitStatus::ok;
        for (const auto& value : opts->values)
            status = app::worst(status, inspector.inspect_value(value));
        return static_cast<int>(status);
    }
    catch (const env::ConfigError& e)
    {
        std::cerr << "Configuration error: " << e.what() << '\n';
        return static_cast<int>(app::ExitStatus::error);
    }
    catch (const std::exception& e)
    {
        std::cerr << "Fatal error: " << e.what() << '\n';
        return static_cast<int>(app::ExitStatus::error);
    }
}
