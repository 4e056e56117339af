#include <chatmedia/config/config_helpers.h>

#include <fstream>

namespace chatmedia::config {

std::optional<bool> parse_bool(std::string_view s) {
    std::string v(s);
    trim(v);
    std::transform(v.begin(), v.end(), v.begin(), [](unsigned char c) { return std::tolower(c); });
    if (v == "true" || v == "yes" || v == "on" || v == "1")
        return true;
    if (v == "false" || v == "no" || v == "off" || v == "0")
        return false;
    return std::nullopt;
}

std::optional<std::chrono::milliseconds> parse_ms(std::string_view s) {
    try {
        std::size_t consumed = 0;
        std::string v(s);
        trim(v);
        auto n = std::stoll(v, &consumed);
        if (consumed != v.size() || n < 0)
            return std::nullopt;
        return std::chrono::milliseconds(n);
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

ConfigValues parse_config_file(const std::filesystem::path& config_path) {
    ConfigValues values;
    std::ifstream file(config_path);
    if (!file) {
        return values;
    }

    std::string line;
    std::string currentSection;

    while (std::getline(file, line)) {
        trim(line);

        // Skip comments and empty lines
        if (line.empty() || line[0] == '#') {
            continue;
        }

        // Section headers [section]
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
        trim(v);

        // Remove inline comments outside of quotes
        if (!v.empty() && (v.front() == '"' || v.front() == '\'')) {
            size_t close = v.find(v.front(), 1);
            if (close != std::string::npos) {
                v.erase(close + 1);
            }
        } else if (!v.empty()) {
            size_t comment = v.find('#');
            if (comment != std::string::npos) {
                v = v.substr(0, comment);
                trim(v);
            }
        }

        // "section.key = v" at top level is accepted as well as "[section] key = v"
        std::string fullKey = currentSection.empty() ? k : currentSection + "." + k;
        values[fullKey] = unquote(v);
    }

    return values;
}

std::string parse_config_value(const std::filesystem::path& config_path, const std::string& section,
                               const std::string& key) {
    auto values = parse_config_file(config_path);
    auto it = values.find(section.empty() ? key : section + "." + key);
    return it == values.end() ? std::string{} : it->second;
}

std::vector<std::filesystem::path> parse_path_list(const std::string& raw) {
    std::vector<std::filesystem::path> out;
    std::string s = raw;
    trim(s);
    if (s.size() >= 2 && s.front() == '[' && s.back() == ']') {
        s = s.substr(1, s.size() - 2);
    }

    size_t start = 0;
    while (start <= s.size()) {
        size_t comma = s.find(',', start);
        std::string item = s.substr(start, comma == std::string::npos ? std::string::npos
                                                                      : comma - start);
        item = unquote(item);
        if (!item.empty()) {
            out.push_back(expand_tilde(item));
        }
        if (comma == std::string::npos)
            break;
        start = comma + 1;
    }
    return out;
}

std::filesystem::path get_config_dir() {
    if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg) {
        return std::filesystem::path(xdg) / "chatmedia";
    }
    if (const char* home = std::getenv("HOME"); home && *home) {
        return std::filesystem::path(home) / ".config" / "chatmedia";
    }
    return std::filesystem::path("~/.config") / "chatmedia";
}

std::filesystem::path get_config_path(const std::string& override_path) {
    if (!override_path.empty()) {
        return expand_tilde(override_path);
    }
    if (const char* env = std::getenv("CHATMEDIA_CONFIG"); env && *env) {
        return expand_tilde(env);
    }
    return get_config_dir() / "config.toml";
}

std::filesystem::path get_cache_dir() {
    if (const char* xdg = std::getenv("XDG_CACHE_HOME"); xdg && *xdg) {
        return std::filesystem::path(xdg) / "chatmedia";
    }
    if (const char* home = std::getenv("HOME"); home && *home) {
        return std::filesystem::path(home) / ".cache" / "chatmedia";
    }
    return std::filesystem::temp_directory_path() / "chatmedia-cache";
}

} // namespace chatmedia::config
