#ifndef CUTIE_CONFIG_H
#define CUTIE_CONFIG_H

#include <functional>
#include <map>
#include <optional>
#include <string>

namespace cutie {

constexpr const char* kDefaultConfigPath = "/etc/cutie-pi/config";
constexpr const char* kDefaultLogPath = "/var/log/cutie-pi.log";

using EnvLookup = std::function<std::optional<std::string>(const std::string&)>;
using KeyValueMap = std::map<std::string, std::string>;

EnvLookup process_env();

// KEY="value" lines; blank lines and '#' comments are skipped.
KeyValueMap parse_key_values(const std::string& text);
std::string serialize_key_values(const KeyValueMap& values);

// nullopt when the file does not exist or cannot be read.
std::optional<KeyValueMap> load_key_value_file(const std::string& path);

// Writes through a temporary sibling and renames it into place.
bool store_key_value_file(const std::string& path, const KeyValueMap& values, std::string* error);

class ConfigSource {
public:
    ConfigSource(EnvLookup env, KeyValueMap file_values);

    std::optional<std::string> get(const std::string& key) const;
    std::string get_string(const std::string& key, const std::string& fallback) const;
    int get_int(const std::string& key, int fallback, int lo, int hi) const;
    bool get_bool(const std::string& key, bool fallback) const;

private:
    EnvLookup env_;
    KeyValueMap file_values_;
};

struct RuntimeConfig {
    std::string api_url = "http://localhost/api";
    std::string api_password;
    int screen_width = 480;
    int screen_height = 320;
    int fps = 30;
    int system_interval_sec = 2;
    int swipe_threshold = 50;
    std::string config_path = kDefaultConfigPath;
    std::string log_path = kDefaultLogPath;
    std::string log_level = "info";
    std::string sysfs_root;
};

// Settings file location: CUTIE_CONFIG_FILE from the environment, else the
// default. Only the environment can move it, so the file that was loaded is the
// one that gets saved.
std::string config_file_path(const EnvLookup& env);

RuntimeConfig load_runtime_config(const ConfigSource& source, const std::string& config_path);

}  // namespace cutie

#endif  // CUTIE_CONFIG_H
