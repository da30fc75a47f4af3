#include "config.h"

#include <fcntl.h>
#include <unistd.h>

#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <sstream>
#include <utility>

#include "log.h"
#include "util.h"

namespace cutie {

EnvLookup process_env() {
    return [](const std::string& key) -> std::optional<std::string> {
        const char* value = std::getenv(key.c_str());
        if (!value) {
            return std::nullopt;
        }
        return std::string(value);
    };
}

namespace {

std::string unquote(const std::string& raw) {
    const std::string v = trim(raw);
    if (v.size() < 2) {
        return v;
    }
    const char q = v.front();
    if ((q != '"' && q != '\'') || v.back() != q) {
        return v;
    }
    std::string out;
    out.reserve(v.size());
    for (size_t i = 1; i + 1 < v.size(); ++i) {
        if (q == '"' && v[i] == '\\' && i + 2 < v.size()) {
            ++i;
        }
        out.push_back(v[i]);
    }
    return out;
}

std::string quote(const std::string& value) {
    std::string out = "\"";
    for (char ch : value) {
        if (ch == '"' || ch == '\\') {
            out.push_back('\\');
        }
        out.push_back(ch);
    }
    out.push_back('"');
    return out;
}

}  // namespace

KeyValueMap parse_key_values(const std::string& text) {
    KeyValueMap values;
    std::istringstream in(text);
    std::string line;
    int line_no = 0;
    while (std::getline(in, line)) {
        ++line_no;
        const std::string t = trim(line);
        if (t.empty() || t.front() == '#') {
            continue;
        }
        const size_t eq = t.find('=');
        if (eq == std::string::npos || eq == 0) {
            spdlog::debug("config line {} ignored: no KEY=value", line_no);
            continue;
        }
        const std::string key = trim(t.substr(0, eq));
        if (key.empty()) {
            continue;
        }
        values[key] = unquote(t.substr(eq + 1));
    }
    return values;
}

std::string serialize_key_values(const KeyValueMap& values) {
    std::string out = "# Cutie-Pi Configuration\n";
    for (const auto& kv : values) {
        out += kv.first + "=" + quote(kv.second) + "\n";
    }
    return out;
}

std::optional<KeyValueMap> load_key_value_file(const std::string& path) {
    const std::optional<std::string> text = read_text_file(path);
    if (!text) {
        return std::nullopt;
    }
    return parse_key_values(*text);
}

bool store_key_value_file(const std::string& path, const KeyValueMap& values, std::string* error) {
    const std::string tmp_path = path + ".tmp";
    const std::string content = serialize_key_values(values);

    const int fd = ::open(tmp_path.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0600);
    if (fd < 0) {
        if (error) *error = "open " + tmp_path + ": " + std::strerror(errno);
        return false;
    }

    size_t written = 0;
    while (written < content.size()) {
        const ssize_t n = ::write(fd, content.data() + written, content.size() - written);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            if (error) *error = "write " + tmp_path + ": " + std::strerror(errno);
            ::close(fd);
            ::unlink(tmp_path.c_str());
            return false;
        }
        written += static_cast<size_t>(n);
    }

    if (::close(fd) != 0) {
        if (error) *error = "close " + tmp_path + ": " + std::strerror(errno);
        ::unlink(tmp_path.c_str());
        return false;
    }
    if (std::rename(tmp_path.c_str(), path.c_str()) != 0) {
        if (error) *error = "rename " + tmp_path + ": " + std::strerror(errno);
        ::unlink(tmp_path.c_str());
        return false;
    }
    return true;
}

ConfigSource::ConfigSource(EnvLookup env, KeyValueMap file_values)
    : env_(std::move(env)), file_values_(std::move(file_values)) {}

std::optional<std::string> ConfigSource::get(const std::string& key) const {
    if (env_) {
        std::optional<std::string> value = env_(key);
        if (value) {
            return value;
        }
    }
    auto it = file_values_.find(key);
    if (it == file_values_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::string ConfigSource::get_string(const std::string& key, const std::string& fallback) const {
    const std::optional<std::string> value = get(key);
    if (!value || trim(*value).empty()) {
        return fallback;
    }
    return trim(*value);
}

int ConfigSource::get_int(const std::string& key, int fallback, int lo, int hi) const {
    const std::optional<std::string> value = get(key);
    if (!value) {
        return fallback;
    }
    const std::optional<int> parsed = parse_int(*value);
    if (!parsed) {
        spdlog::warn("{}='{}' is not a number, using {}", key, *value, fallback);
        return fallback;
    }
    const int clamped = clampi(*parsed, lo, hi);
    if (clamped != *parsed) {
        spdlog::warn("{}={} out of range [{}, {}], using {}", key, *parsed, lo, hi, clamped);
    }
    return clamped;
}

bool ConfigSource::get_bool(const std::string& key, bool fallback) const {
    const std::optional<std::string> value = get(key);
    if (!value) {
        return fallback;
    }
    const std::optional<bool> parsed = parse_bool(*value);
    if (!parsed) {
        spdlog::warn("{}='{}' is not on/off, using {}", key, *value, fallback ? "on" : "off");
        return fallback;
    }
    return *parsed;
}

std::string config_file_path(const EnvLookup& env) {
    const std::optional<std::string> path = env("CUTIE_CONFIG_FILE");
    return path && !trim(*path).empty() ? trim(*path) : std::string(kDefaultConfigPath);
}

RuntimeConfig load_runtime_config(const ConfigSource& source, const std::string& config_path) {
    RuntimeConfig cfg;
    cfg.config_path = config_path;
    cfg.api_url = source.get_string("CUTIE_PIHOLE_API", cfg.api_url);
    while (cfg.api_url.size() > 1 && cfg.api_url.back() == '/') {
        cfg.api_url.pop_back();
    }
    cfg.api_password = source.get("CUTIE_PIHOLE_PASSWORD").value_or("");
    cfg.screen_width = source.get_int("CUTIE_SCREEN_WIDTH", cfg.screen_width, 64, 4096);
    cfg.screen_height = source.get_int("CUTIE_SCREEN_HEIGHT", cfg.screen_height, 64, 4096);
    cfg.fps = source.get_int("CUTIE_FPS", cfg.fps, 1, 120);
    cfg.system_interval_sec = source.get_int("CUTIE_SYSTEM_INTERVAL", cfg.system_interval_sec, 1, 3600);
    cfg.swipe_threshold = source.get_int("CUTIE_SWIPE_THRESHOLD", cfg.swipe_threshold, 1, 1000);
    cfg.log_path = source.get_string("CUTIE_LOG_FILE", cfg.log_path);
    cfg.log_level = source.get_string("CUTIE_LOG_LEVEL", cfg.log_level);
    cfg.sysfs_root = source.get("CUTIE_SYSFS_ROOT").value_or("");
    return cfg;
}

}  // namespace cutie
