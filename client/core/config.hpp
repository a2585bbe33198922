#pragma once

#include <string>

namespace core {

struct ControlsConfig {
    int exit{0};
    int toggle_overlay{0};
};

struct LoggingConfig {
    bool enabled{true};
    int level{0};
    std::string file{};
};

struct ClientConfig {
    ControlsConfig controls{};
    LoggingConfig logging{};

    struct WindowConfig {
        int width{1280};
        int height{720};
        std::string title{"Glacier"};
        int target_fps{60};
        bool vsync{true};
    } window{};

    struct ScriptConfig {
        // Relative paths resolve against `base`.
        std::string path{"scripts/demo.lua"};
        std::string base{"."};
        bool sandbox{true};
    } script{};

    struct ViewerConfig {
        bool draw_grid{true};
        bool draw_names{true};
        bool overlay{true};
    } viewer{};
};

class Config {
public:
    static Config& instance();

    bool load_from_file(const std::string& path);

    // Back to built-in defaults (used between test cases).
    void reset();

    const std::string& loaded_from_path() const { return loaded_from_path_; }

    const ClientConfig& get() const { return config_; }
    ClientConfig& mutable_get() { return config_; }

    const ControlsConfig& controls() const { return config_.controls; }
    const LoggingConfig& logging() const { return config_.logging; }
    const ClientConfig::WindowConfig& window() const { return config_.window; }
    const ClientConfig::ScriptConfig& script() const { return config_.script; }
    const ClientConfig::ViewerConfig& viewer() const { return config_.viewer; }

private:
    Config();

    ClientConfig config_{};

    std::string loaded_from_path_{};

    static std::string trim(std::string s);
    static std::string to_lower(std::string s);

    static bool parse_bool(const std::string& v, bool default_value);
    static int parse_int(const std::string& v, int default_value);

    static int key_from_string(const std::string& v, int default_value);
    static int log_level_from_string(const std::string& v, int default_value);

    void apply_kv(const std::string& section, const std::string& key, const std::string& value);
};

std::string key_name(int key);

} // namespace core
