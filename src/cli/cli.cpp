#include <cstdint>
#include <fstream>
#include <iostream>
#include <iterator>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <variant>
#include <vector>
#include <wasmbox/cli/cli.h>
#include <wasmbox/runtime/module_cache.h>
#include <wasmbox/runtime/report.h>
#include <wasmbox/runtime/supervisor.h>
#include <wasmbox/server/config.h>
#include <wasmbox/server/log.h>
#include <wasmbox/server/router.h>
#include <wasmbox/server/server.h>

namespace wasmbox::cli
{

namespace
{

constexpr int kExitOk = 0;
constexpr int kExitError = 1;
constexpr int kExitUsage = 2;

void print_usage(std::ostream& out)
{
    out << "wasmbox: sandboxed WebAssembly execution service\n\n";
    out << "usage:\n";
    out << "  wasmbox --help\n";
    out << "  wasmbox serve [--host <ipv4>] [--port <n>] [--profile module|component]\n";
    out << "                [--workers <n>] [--fuel <n>] [--timeout-ms <n>]\n";
    out << "  wasmbox run [--profile module|component] [--fuel <n>] [--timeout-ms <n>]\n";
    out << "              [--env KEY=VALUE]... <file.wasm> [args...]\n";
    out << "  wasmbox <file.wasm>\n";
    out << "\n";
    out << "Flags override HOST, PORT and the WASMBOX_* environment variables.\n";
}

bool is_help_flag(std::string_view arg)
{
    return arg == "--help" || arg == "-h" || arg == "help";
}

bool ends_with(std::string_view s, std::string_view suffix)
{
    return s.size() >= suffix.size() && s.substr(s.size() - suffix.size()) == suffix;
}

int usage_error(const std::string& message)
{
    std::cerr << "error: " << message << "\n\n";
    print_usage(std::cerr);
    return kExitUsage;
}

enum class Scan
{
    NoMatch,
    Matched,
    Missing,
};

// Accepts `--flag value` and `--flag=value`.
Scan take_flag(const std::vector<std::string_view>& args, std::size_t& i, std::string_view flag,
               std::string_view& value)
{
    const std::string_view a = args[i];
    if (a == flag)
    {
        if (i + 1 >= args.size())
        {
            return Scan::Missing;
        }
        value = args[i + 1];
        i += 2;
        return Scan::Matched;
    }
    if (a.size() > flag.size() && a.starts_with(flag) && a[flag.size()] == '=')
    {
        value = a.substr(flag.size() + 1);
        if (value.empty())
        {
            return Scan::Missing;
        }
        ++i;
        return Scan::Matched;
    }
    return Scan::NoMatch;
}

/** @brief One `--name value` option and how it lands in the configuration. */
struct Flag
{
    std::string_view name;
    std::string_view expected;
    bool (*apply)(std::string_view value, server::ServerConfig& config);
};

bool apply_host(std::string_view v, server::ServerConfig& c)
{
    c.host = std::string(v);
    return true;
}

bool apply_port(std::string_view v, server::ServerConfig& c)
{
    const auto port = server::parse_port(v);
    if (port)
    {
        c.port = *port;
    }
    return port.has_value();
}

bool apply_profile(std::string_view v, server::ServerConfig& c)
{
    const auto profile = runtime::parse_profile(v);
    if (profile)
    {
        c.profile = *profile;
    }
    return profile.has_value();
}

bool apply_workers(std::string_view v, server::ServerConfig& c)
{
    const auto n = runtime::parse_uint(v);
    if (!n || *n == 0 || *n > server::kMaxWorkers)
    {
        return false;
    }
    c.workers = static_cast<std::uint32_t>(*n);
    return true;
}

bool apply_fuel(std::string_view v, server::ServerConfig& c)
{
    const auto n = runtime::parse_uint(v);
    if (n)
    {
        c.limits.fuel = *n;
    }
    return n.has_value();
}

bool apply_timeout(std::string_view v, server::ServerConfig& c)
{
    const auto n = runtime::parse_uint(v);
    if (n)
    {
        c.limits.timeout_ms = *n;
    }
    return n.has_value();
}

constexpr Flag kHostFlag{"--host", "an IPv4 address", apply_host};
constexpr Flag kPortFlag{"--port", "a port number 0..65535", apply_port};
constexpr Flag kProfileFlag{"--profile", "'module' or 'component'", apply_profile};
constexpr Flag kWorkersFlag{"--workers", "a worker count 1..256", apply_workers};
constexpr Flag kFuelFlag{"--fuel", "a non-negative integer", apply_fuel};
constexpr Flag kTimeoutFlag{"--timeout-ms", "milliseconds", apply_timeout};

const std::vector<Flag>& serve_flags()
{
    static const std::vector<Flag> flags = {kHostFlag,    kPortFlag, kProfileFlag,
                                            kWorkersFlag, kFuelFlag, kTimeoutFlag};
    return flags;
}

const std::vector<Flag>& run_flags()
{
    static const std::vector<Flag> flags = {kProfileFlag, kFuelFlag, kTimeoutFlag};
    return flags;
}

/**
 * @brief Try every flag in `flags` at `args[i]`.
 *
 * Returns nullopt when nothing matched, 0 when a flag was applied, or a usage exit code.
 */
std::optional<int> scan_flags(const std::vector<Flag>& flags,
                              const std::vector<std::string_view>& args, std::size_t& i,
                              server::ServerConfig& config)
{
    for (const Flag& flag : flags)
    {
        std::string_view value;
        switch (take_flag(args, i, flag.name, value))
        {
        case Scan::NoMatch:
            continue;
        case Scan::Missing:
            return usage_error("expected " + std::string(flag.expected) + " after " +
                               std::string(flag.name));
        case Scan::Matched:
            if (!flag.apply(value, config))
            {
                return usage_error(std::string(flag.name) + ": expected " +
                                   std::string(flag.expected) + ", got '" + std::string(value) +
                                   "'");
            }
            return 0;
        }
    }
    return std::nullopt;
}

std::variant<server::ServerConfig, int> load_config()
{
    auto loaded = server::load_server_config(runtime::process_env());
    if (auto* err = std::get_if<runtime::ConfigError>(&loaded))
    {
        std::cerr << "error: invalid configuration: " << err->message << "\n";
        return kExitUsage;
    }
    return std::get<server::ServerConfig>(std::move(loaded));
}

std::optional<std::vector<std::uint8_t>> read_file(const std::string& path)
{
    std::ifstream in(path, std::ios::binary);
    if (!in)
    {
        return std::nullopt;
    }
    std::vector<std::uint8_t> bytes((std::istreambuf_iterator<char>(in)),
                                    std::istreambuf_iterator<char>());
    if (in.bad())
    {
        return std::nullopt;
    }
    return bytes;
}

int exit_code_for(const runtime::ExecutionOutcome& outcome)
{
    return std::visit(
        [](const auto& o) -> int
        {
            using T = std::decay_t<decltype(o)>;
            if constexpr (std::is_same_v<T, runtime::Completed>)
            {
                if (o.exit_code == 0)
                {
                    return kExitOk;
                }
                // Keep a non-zero code non-zero after the shell's 8-bit truncation.
                const int low = o.exit_code & 0xFF;
                return low == 0 ? kExitError : low;
            }
            else if constexpr (std::is_same_v<T, runtime::Trapped>)
            {
                return kExitOk;
            }
            else
            {
                return kExitError;
            }
        },
        outcome);
}

int cmd_serve(const std::vector<std::string_view>& args)
{
    auto loaded = load_config();
    if (auto* rc = std::get_if<int>(&loaded))
    {
        return *rc;
    }
    server::ServerConfig config = std::get<server::ServerConfig>(std::move(loaded));

    for (std::size_t i = 0; i < args.size();)
    {
        if (auto rc = scan_flags(serve_flags(), args, i, config))
        {
            if (*rc != 0)
            {
                return *rc;
            }
            continue;
        }
        if (args[i].starts_with('-'))
        {
            return usage_error("unknown option: " + std::string(args[i]));
        }
        return usage_error("unexpected argument: " + std::string(args[i]));
    }
    if (auto err = server::validate(config))
    {
        std::cerr << "error: invalid configuration: " << err->message << "\n";
        return kExitUsage;
    }

    runtime::ModuleCache cache(config.cache_entries);
    const runtime::Supervisor supervisor(config.limits, config.profile, &cache);
    server::DiagnosticLog log(std::cout);
    const server::Router router(supervisor, log);
    server::Server srv(config, router, log);

    if (auto err = srv.listen())
    {
        std::cerr << "error: " << *err << "\n";
        return kExitError;
    }
    server::install_stop_signals(srv);
    srv.serve();
    server::clear_stop_signals();
    return kExitOk;
}

int cmd_run(const std::vector<std::string_view>& args)
{
    auto loaded = load_config();
    if (auto* rc = std::get_if<int>(&loaded))
    {
        return *rc;
    }
    server::ServerConfig config = std::get<server::ServerConfig>(std::move(loaded));

    runtime::ExecutionOptions options;
    std::optional<std::string> path;
    for (std::size_t i = 0; i < args.size();)
    {
        if (path.has_value())
        {
            // Everything after the module belongs to the guest.
            options.args.emplace_back(args[i]);
            ++i;
            continue;
        }
        if (auto rc = scan_flags(run_flags(), args, i, config))
        {
            if (*rc != 0)
            {
                return *rc;
            }
            continue;
        }
        std::string_view env_entry;
        const Scan env_scan = take_flag(args, i, "--env", env_entry);
        if (env_scan == Scan::Missing)
        {
            return usage_error("expected KEY=VALUE after --env");
        }
        if (env_scan == Scan::Matched)
        {
            const std::size_t eq = env_entry.find('=');
            if (eq == std::string_view::npos || eq == 0)
            {
                return usage_error("--env: expected KEY=VALUE, got '" + std::string(env_entry) +
                                   "'");
            }
            options.env.insert_or_assign(std::string(env_entry.substr(0, eq)),
                                         std::string(env_entry.substr(eq + 1)));
            continue;
        }
        if (args[i].starts_with('-'))
        {
            return usage_error("unknown option: " + std::string(args[i]));
        }
        path = std::string(args[i]);
        options.args.push_back(*path);
        ++i;
    }

    if (!path.has_value())
    {
        return usage_error("expected <file.wasm>");
    }
    if (auto err = server::validate(config))
    {
        std::cerr << "error: invalid configuration: " << err->message << "\n";
        return kExitUsage;
    }

    const auto bytes = read_file(*path);
    if (!bytes.has_value())
    {
        std::cerr << "error: cannot read " << *path << "\n";
        return kExitError;
    }

    const runtime::Supervisor supervisor(config.limits, config.profile);
    const runtime::ExecutionOutcome outcome = supervisor.execute(*bytes, options);
    if (std::holds_alternative<runtime::Failed>(outcome))
    {
        std::cerr << runtime::render_report(outcome);
    }
    else
    {
        std::cout << runtime::render_report(outcome);
    }
    return exit_code_for(outcome);
}

} // namespace

int run(int argc, char** argv)
{
    if (argc <= 1)
    {
        print_usage(std::cerr);
        return kExitUsage;
    }

    const std::string_view first = argv[1];
    if (is_help_flag(first))
    {
        print_usage(std::cout);
        return kExitOk;
    }

    std::vector<std::string_view> args;
    for (int i = 2; i < argc; ++i)
    {
        args.push_back(argv[i]);
    }

    // `wasmbox file.wasm` is the same as `wasmbox run file.wasm`.
    if (argc == 2 && !first.starts_with('-') && ends_with(first, ".wasm"))
    {
        return cmd_run({first});
    }

    if (first == "serve")
    {
        return cmd_serve(args);
    }
    if (first == "run")
    {
        return cmd_run(args);
    }
    return usage_error("unknown command: " + std::string(first));
}

} // namespace wasmbox::cli
