#pragma once

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace watchman::config {

inline void ltrim(std::string& s) {
    s.erase(s.begin(),
            std::find_if(s.begin(), s.end(), [](unsigned char ch) { return !std::isspace(ch); }));
}

inline void rtrim(std::string& s) {
    s.erase(std::find_if(s.rbegin(), s.rend(), [](unsigned char ch) { return !std::isspace(ch); })
                .base(),
            s.end());
}

inline void trim(std::string& s) {
    ltrim(s);
    rtrim(s);
}

inline std::string unquote(std::string val) {
    trim(val);
    if (val.size() >= 2 && ((val.front() == '"' && val.back() == '"') ||
                            (val.front() == '\'' && val.back() == '\''))) {
        return val.substr(1, val.size() - 2);
    }
    return val;
}

// "~" and "~/x" expand against $HOME; anything else is returned as is.
inline std::filesystem::path expand_tilde(const std::string& path) {
    if (path == "~" || path.rfind("~/", 0) == 0) {
        if (const char* home = std::getenv("HOME"); home && *home) {
            return path.size() <= 2 ? std::filesystem::path(home)
                                    : std::filesystem::path(home) / path.substr(2);
        }
    }
    return path;
}

// Flattened "section.key" -> value for a TOML subset: [section] headers,
// key = value pairs, quoted strings and # comments. Keys before the first
// header are stored without a section prefix. A missing file yields an empty map.
std::map<std::string, std::string> parse_simple_toml(const std::filesystem::path& path);

std::optional<std::int64_t> parse_int(std::string_view s);

// --config override, else $WATCHMAN_CONFIG_FILE, else
// $XDG_CONFIG_HOME/watchman/config.toml, else ~/.config/watchman/config.toml.
std::filesystem::path get_config_path(const std::string& override_path = "");

/// $XDG_RUNTIME_DIR/watchman, else /tmp/watchman-$UID
std::filesystem::path get_runtime_dir();

/// get_runtime_dir() / "sock"
std::filesystem::path default_socket_path();

/// State directory for the daemon log: $XDG_STATE_HOME/watchman or ~/.local/state/watchman
std::filesystem::path get_state_dir();

// Socket path precedence: explicit override, $WATCHMAN_SOCK, socket_path in
// the given config section (then [daemon]), default_socket_path().
std::filesystem::path resolve_socket_path(const std::string& override_path,
                                          const std::filesystem::path& config_path,
                                          const std::string& section = "daemon");

} // namespace watchman::config
