#include <watchman/config/config_helpers.h>

#include <charconv>
#include <fstream>

#ifndef _WIN32
#include <unistd.h>
#endif

namespace watchman::config {

namespace {

// Strip a trailing "# comment" that is not inside a quoted string.
void strip_inline_comment(std::string& v) {
    char quote = 0;
    for (std::size_t i = 0; i < v.size(); ++i) {
        char c = v[i];
        if (quote) {
            if (c == quote)
                quote = 0;
        } else if (c == '"' || c == '\'') {
            quote = c;
        } else if (c == '#') {
            v.erase(i);
            break;
        }
    }
    trim(v);
}

} // namespace

std::map<std::string, std::string> parse_simple_toml(const std::filesystem::path& path) {
    std::map<std::string, std::string> values;
    std::ifstream file(path);
    if (!file) {
        return values;
    }

    std::string line;
    std::string currentSection;
    while (std::getline(file, line)) {
        trim(line);
        if (line.empty() || line[0] == '#') {
            continue;
        }

        if (line[0] == '[') {
            size_t end = line.find(']');
            if (end != std::string::npos) {
                currentSection = line.substr(1, end - 1);
                trim(currentSection);
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
        strip_inline_comment(v);
        if (k.empty()) {
            continue;
        }
        values[currentSection.empty() ? k : currentSection + "." + k] = unquote(v);
    }
    return values;
}

std::optional<std::int64_t> parse_int(std::string_view s) {
    std::int64_t out = 0;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), out);
    if (ec != std::errc{} || ptr != s.data() + s.size() || s.empty()) {
        return std::nullopt;
    }
    return out;
}

std::filesystem::path get_config_path(const std::string& override_path) {
    if (!override_path.empty()) {
        return expand_tilde(override_path);
    }
    if (const char* env = std::getenv("WATCHMAN_CONFIG_FILE"); env && *env) {
        return std::filesystem::path(env);
    }

    const char* xdgConfigHome = std::getenv("XDG_CONFIG_HOME");
    const char* homeEnv = std::getenv("HOME");

    std::filesystem::path configHome;
    if (xdgConfigHome && *xdgConfigHome) {
        configHome = std::filesystem::path(xdgConfigHome);
    } else if (homeEnv && *homeEnv) {
        configHome = std::filesystem::path(homeEnv) / ".config";
    } else {
        return {};
    }
    return configHome / "watchman" / "config.toml";
}

std::filesystem::path get_runtime_dir() {
    if (const char* xdg = std::getenv("XDG_RUNTIME_DIR"); xdg && *xdg) {
        return std::filesystem::path(xdg) / "watchman";
    }
#ifndef _WIN32
    return std::filesystem::path("/tmp") / ("watchman-" + std::to_string(::getuid()));
#else
    return std::filesystem::temp_directory_path() / "watchman";
#endif
}

std::filesystem::path default_socket_path() {
    return get_runtime_dir() / "sock";
}

std::filesystem::path get_state_dir() {
    if (const char* xdg = std::getenv("XDG_STATE_HOME"); xdg && *xdg) {
        return std::filesystem::path(xdg) / "watchman";
    }
    if (const char* home = std::getenv("HOME"); home && *home) {
        return std::filesystem::path(home) / ".local" / "state" / "watchman";
    }
    return get_runtime_dir();
}

std::filesystem::path resolve_socket_path(const std::string& override_path,
                                          const std::filesystem::path& config_path,
                                          const std::string& section) {
    if (!override_path.empty()) {
        return expand_tilde(override_path);
    }
    if (const char* env = std::getenv("WATCHMAN_SOCK"); env && *env) {
        return std::filesystem::path(env);
    }
    if (!config_path.empty()) {
        auto values = parse_simple_toml(config_path);
        for (const auto& key : {section + ".socket_path", std::string("daemon.socket_path")}) {
            if (auto it = values.find(key); it != values.end() && !it->second.empty()) {
                return expand_tilde(it->second);
            }
        }
    }
    return default_socket_path();
}

} // namespace watchman::config
