#include <cleanbench/config/config_helpers.h>
#include <cleanbench/config/run_config.h>

#include <spdlog/spdlog.h>

#include <charconv>
#include <filesystem>

namespace cleanbench::config {

namespace {

std::optional<int> parse_int(const std::string& text) {
    std::string s = text;
    trim(s);
    int value = 0;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
    if (ec != std::errc() || ptr != s.data() + s.size()) {
        return std::nullopt;
    }
    return value;
}

void replace_all(std::string& s, std::string_view from, const std::string& to) {
    size_t pos = 0;
    while ((pos = s.find(from, pos)) != std::string::npos) {
        s.replace(pos, from.size(), to);
        pos += to.size();
    }
}

Result<void> apply_rates(RunConfiguration& config, const std::string& raw) {
    std::vector<int> rates;
    for (const auto& item : parse_list(raw)) {
        auto v = parse_int(item);
        if (!v) {
            return Error{ErrorCode::InvalidArgument, "Invalid rate '" + item + "'"};
        }
        rates.push_back(*v);
    }
    config.rates = std::move(rates);
    return Result<void>();
}

Result<void> apply_port(RunConfiguration& config, const std::string& raw) {
    auto v = parse_int(raw);
    if (!v) {
        return Error{ErrorCode::InvalidArgument, "Invalid port '" + raw + "'"};
    }
    config.port = *v;
    return Result<void>();
}

} // namespace

Result<void> setDuration(RunConfiguration& config, const std::string& text) {
    auto parsed = parse_duration(text);
    if (!parsed) {
        return Error{ErrorCode::InvalidArgument, "Invalid duration '" + text + "'"};
    }
    config.duration = *parsed;
    config.durationText = text;
    trim(config.durationText);
    return Result<void>();
}

Result<RunConfiguration> loadRunConfiguration(const std::filesystem::path& configFile) {
    RunConfiguration config;

    std::error_code ec;
    if (!configFile.empty() && std::filesystem::exists(configFile, ec)) {
        spdlog::debug("Loading configuration from {}", configFile.string());
        auto value = [&](const char* section, const char* key) {
            return parse_config_value(configFile, section, key);
        };

        if (auto v = value("server", "command"); !v.empty())
            config.server.commandTemplate = v;
        if (auto v = value("server", "host"); !v.empty())
            config.host = v;
        if (auto v = value("server", "port"); !v.empty()) {
            if (auto r = apply_port(config, v); !r)
                return r.error();
        }
        if (auto v = value("server", "workers"); !v.empty()) {
            auto w = parse_int(v);
            if (!w)
                return Error{ErrorCode::InvalidArgument, "Invalid workers '" + v + "'"};
            config.workers = *w;
        }
        if (auto v = value("server", "health_path"); !v.empty())
            config.server.healthPath = v;
        if (auto v = value("server", "seed_path"); !v.empty())
            config.server.seedPath = v;
        if (auto v = value("server", "resource_id"); !v.empty())
            config.server.resourceId = v;
        if (auto v = value("server", "signature"); !v.empty())
            config.server.signature = v;

        if (auto v = value("loadgen", "binary"); !v.empty())
            config.loadgen.binary = v;
        if (auto v = value("loadgen", "request_timeout"); !v.empty()) {
            auto t = parse_duration(v);
            if (!t)
                return Error{ErrorCode::InvalidArgument, "Invalid request_timeout '" + v + "'"};
            config.loadgen.requestTimeout = *t;
        }

        if (auto v = value("run", "rates"); !v.empty()) {
            if (auto r = apply_rates(config, v); !r)
                return r.error();
        }
        if (auto v = value("run", "duration"); !v.empty()) {
            if (auto r = setDuration(config, v); !r)
                return r.error();
        }
        if (auto v = value("run", "output_root"); !v.empty())
            config.outputRoot = expand_tilde(v);
        if (auto v = value("run", "routes"); !v.empty())
            config.routesPath = expand_tilde(v);
        if (auto v = value("run", "filter"); !v.empty())
            config.filterPrefix = v;
    }

    // Environment overrides config file
    if (auto v = env_value("CLEANBENCH_HOST"))
        config.host = *v;
    if (auto v = env_value("CLEANBENCH_PORT")) {
        if (auto r = apply_port(config, *v); !r)
            return r.error();
    }
    if (auto v = env_value("CLEANBENCH_ROUTES"))
        config.routesPath = expand_tilde(*v);
    if (auto v = env_value("CLEANBENCH_OUTPUT_ROOT"))
        config.outputRoot = expand_tilde(*v);
    if (auto v = env_value("CLEANBENCH_LOADGEN"))
        config.loadgen.binary = *v;

    return config;
}

Result<void> validateRunConfiguration(const RunConfiguration& config) {
    if (config.rates.empty()) {
        return Error{ErrorCode::InvalidArgument, "At least one rate is required"};
    }
    for (int rate : config.rates) {
        if (rate <= 0) {
            return Error{ErrorCode::InvalidArgument,
                         "Rates must be positive (got " + std::to_string(rate) + ")"};
        }
    }
    if (config.port < 1 || config.port > 65535) {
        return Error{ErrorCode::InvalidArgument, "Port out of range: " + std::to_string(config.port)};
    }
    if (config.workers < 1) {
        return Error{ErrorCode::InvalidArgument, "Workers must be at least 1"};
    }
    if (config.duration.count() <= 0) {
        return Error{ErrorCode::InvalidArgument, "Duration must be positive"};
    }
    if (config.host.empty()) {
        return Error{ErrorCode::InvalidArgument, "Host must not be empty"};
    }
    if (splitCommandLine(config.server.commandTemplate).empty()) {
        return Error{ErrorCode::InvalidArgument, "Server command is empty"};
    }
    return Result<void>();
}

std::vector<std::string> splitCommandLine(const std::string& command) {
    std::vector<std::string> args;
    std::string current;
    char quote = '\0';
    bool hasToken = false;

    for (char c : command) {
        if (quote != '\0') {
            if (c == quote) {
                quote = '\0';
            } else {
                current.push_back(c);
            }
        } else if (c == '"' || c == '\'') {
            quote = c;
            hasToken = true;
        } else if (std::isspace(static_cast<unsigned char>(c)) != 0) {
            if (hasToken) {
                args.push_back(std::move(current));
                current.clear();
                hasToken = false;
            }
        } else {
            current.push_back(c);
            hasToken = true;
        }
    }
    if (hasToken) {
        args.push_back(std::move(current));
    }
    return args;
}

std::vector<std::string> renderServerCommand(const RunConfiguration& config) {
    auto args = splitCommandLine(config.server.commandTemplate);
    for (auto& arg : args) {
        replace_all(arg, "{host}", config.host);
        replace_all(arg, "{port}", std::to_string(config.port));
        replace_all(arg, "{workers}", std::to_string(config.workers));
    }
    return args;
}

std::string launchSignature(const RunConfiguration& config) {
    if (!config.server.signature.empty()) {
        return config.server.signature;
    }
    std::string joined;
    for (const auto& arg : renderServerCommand(config)) {
        if (!joined.empty())
            joined.push_back(' ');
        joined += arg;
    }
    return joined;
}

} // namespace cleanbench::config
