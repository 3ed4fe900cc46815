#include <charconv>
#include <fstream>
#include <cleanbench/config/config_helpers.h>

namespace cleanbench::config {

std::string parse_config_value(const std::filesystem::path& config_path, const std::string& section,
                               const std::string& key) {
    std::ifstream file(config_path);
    if (!file) {
        return "";
    }

    std::string line;
    std::string currentSection;
    bool in_target_section = section.empty();

    while (std::getline(file, line)) {
        trim(line);

        // Skip comments and empty lines
        if (line.empty() || line[0] == '#') {
            continue;
        }

        // Check for section headers [section]
        if (line[0] == '[') {
            size_t end = line.find(']');
            if (end != std::string::npos) {
                currentSection = line.substr(1, end - 1);
                trim(currentSection);
                in_target_section = (section.empty() || currentSection == section);
            }
            continue;
        }

        size_t eq = line.find('=');
        if (eq == std::string::npos) {
            continue;
        }

        std::string k = line.substr(0, eq);
        std::string v = line.substr(eq + 1);
        trim(k);
        trim(v);

        // Remove inline comments (outside of quotes)
        bool inQuote = false;
        for (size_t i = 0; i < v.size(); ++i) {
            if (v[i] == '"' || v[i] == '\'') {
                inQuote = !inQuote;
            } else if (v[i] == '#' && !inQuote) {
                v = v.substr(0, i);
                trim(v);
                break;
            }
        }

        // Support both "server.port" at top level and "[server] port"
        if ((in_target_section && k == key) || (!section.empty() && k == section + "." + key)) {
            return unquote(v);
        }
    }

    return "";
}

std::vector<std::string> parse_list(const std::string& raw) {
    std::string s = raw;
    trim(s);
    if (s.size() >= 2 && s.front() == '[' && s.back() == ']') {
        s = s.substr(1, s.size() - 2);
    }

    std::vector<std::string> out;
    size_t start = 0;
    while (start <= s.size()) {
        size_t comma = s.find(',', start);
        std::string item =
            s.substr(start, comma == std::string::npos ? std::string::npos : comma - start);
        item = unquote(item);
        if (!item.empty()) {
            out.push_back(std::move(item));
        }
        if (comma == std::string::npos) {
            break;
        }
        start = comma + 1;
    }
    return out;
}

std::optional<std::chrono::milliseconds> parse_duration(std::string_view text) {
    std::string s{text};
    trim(s);
    if (s.empty()) {
        return std::nullopt;
    }

    size_t split = 0;
    while (split < s.size() && (std::isdigit(static_cast<unsigned char>(s[split])) != 0)) {
        ++split;
    }
    if (split == 0) {
        return std::nullopt;
    }

    long long amount = 0;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + split, amount);
    if (ec != std::errc() || ptr != s.data() + split) {
        return std::nullopt;
    }

    const std::string unit = s.substr(split);
    if (unit.empty() || unit == "s") {
        return std::chrono::seconds(amount);
    }
    if (unit == "ms") {
        return std::chrono::milliseconds(amount);
    }
    if (unit == "m") {
        return std::chrono::minutes(amount);
    }
    if (unit == "h") {
        return std::chrono::hours(amount);
    }
    return std::nullopt;
}

std::optional<std::string> env_value(const char* name) {
    if (const char* v = std::getenv(name); v && *v) {
        return std::string(v);
    }
    return std::nullopt;
}

std::filesystem::path get_config_path(const std::string& override_path) {
    if (!override_path.empty()) {
        return expand_tilde(override_path);
    }

    if (auto env = env_value("CLEANBENCH_CONFIG")) {
        return expand_tilde(*env);
    }

    const char* xdgConfigHome = std::getenv("XDG_CONFIG_HOME");
    const char* homeEnv = std::getenv("HOME");

    std::filesystem::path configHome;
    if (xdgConfigHome && *xdgConfigHome) {
        configHome = std::filesystem::path(xdgConfigHome);
    } else if (homeEnv) {
        configHome = std::filesystem::path(homeEnv) / ".config";
    } else {
        return std::filesystem::path(".cleanbench") / "config.toml";
    }

    return configHome / "cleanbench" / "config.toml";
}

} // namespace cleanbench::config
