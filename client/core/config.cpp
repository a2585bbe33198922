#include "config.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <unordered_map>

#include <raylib.h>

namespace core {

std::string key_name(int key) {
    if (key >= KEY_A && key <= KEY_Z) {
        return std::string(1, static_cast<char>('A' + (key - KEY_A)));
    }

    if (key >= KEY_ZERO && key <= KEY_NINE) {
        return std::string(1, static_cast<char>('0' + (key - KEY_ZERO)));
    }

    if (key >= KEY_F1 && key <= KEY_F12) {
        return "F" + std::to_string(key - KEY_F1 + 1);
    }

    switch (key) {
        case KEY_NULL: return "NONE";
        case KEY_SPACE: return "SPACE";
        case KEY_ESCAPE: return "ESC";
        case KEY_ENTER: return "ENTER";
        case KEY_TAB: return "TAB";
        case KEY_BACKSPACE: return "BACKSPACE";
        case KEY_UP: return "UP";
        case KEY_DOWN: return "DOWN";
        case KEY_LEFT: return "LEFT";
        case KEY_RIGHT: return "RIGHT";
        default: break;
    }

    return std::to_string(key);
}

Config& Config::instance() {
    static Config inst;
    return inst;
}

Config::Config() {
    reset();
}

void Config::reset() {
    config_ = ClientConfig{};
    loaded_from_path_.clear();

    config_.controls.exit = KEY_ESCAPE;
    config_.controls.toggle_overlay = KEY_F1;

    config_.logging.enabled = true;
    config_.logging.level = LOG_INFO;
    config_.logging.file = "";
}

std::string Config::trim(std::string s) {
    auto is_space = [](unsigned char c) { return std::isspace(c) != 0; };

    while (!s.empty() && is_space(static_cast<unsigned char>(s.front()))) s.erase(s.begin());
    while (!s.empty() && is_space(static_cast<unsigned char>(s.back()))) s.pop_back();

    return s;
}

std::string Config::to_lower(std::string s) {
    for (char& c : s) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return s;
}

bool Config::parse_bool(const std::string& v, bool default_value) {
    std::string s = to_lower(trim(v));
    if (s == "1" || s == "true" || s == "yes" || s == "on") return true;
    if (s == "0" || s == "false" || s == "no" || s == "off") return false;
    return default_value;
}

int Config::parse_int(const std::string& v, int default_value) {
    try {
        size_t idx = 0;
        const std::string s = trim(v);
        int out = std::stoi(s, &idx, 10);
        if (idx != s.size()) return default_value;
        return out;
    } catch (const std::exception&) {
        return default_value;
    }
}

static std::string strip_quotes(std::string s) {
    auto is_space = [](unsigned char c) { return std::isspace(c) != 0; };
    while (!s.empty() && is_space(static_cast<unsigned char>(s.front()))) s.erase(s.begin());
    while (!s.empty() && is_space(static_cast<unsigned char>(s.back()))) s.pop_back();

    if (s.size() >= 2) {
        const char a = s.front();
        const char b = s.back();
        if ((a == '"' && b == '"') || (a == '\'' && b == '\'')) {
            return s.substr(1, s.size() - 2);
        }
    }
    return s;
}

int Config::key_from_string(const std::string& v, int default_value) {
    std::string s = to_lower(strip_quotes(v));

    if (s.size() == 1) {
        const char c = s[0];
        if (c >= 'a' && c <= 'z') return KEY_A + (c - 'a');
        if (c >= '0' && c <= '9') return KEY_ZERO + (c - '0');
    }

    if (s.rfind("key_", 0) == 0) s = s.substr(4);

    // f1..f12
    if (s.size() >= 2 && s[0] == 'f') {
        const int n = parse_int(s.substr(1), 0);
        if (n >= 1 && n <= 12) return KEY_F1 + (n - 1);
    }

    static const std::unordered_map<std::string, int> map = {
        {"none", KEY_NULL}, {"null", KEY_NULL},
        {"space", KEY_SPACE},
        {"escape", KEY_ESCAPE}, {"esc", KEY_ESCAPE},
        {"enter", KEY_ENTER}, {"return", KEY_ENTER},
        {"tab", KEY_TAB},
        {"backspace", KEY_BACKSPACE},
        {"up", KEY_UP}, {"down", KEY_DOWN}, {"left", KEY_LEFT}, {"right", KEY_RIGHT},
    };

    auto it = map.find(s);
    if (it != map.end()) return it->second;

    return default_value;
}

int Config::log_level_from_string(const std::string& v, int default_value) {
    std::string s = to_lower(strip_quotes(v));

    static const std::unordered_map<std::string, int> map = {
        {"all", LOG_ALL},
        {"trace", LOG_TRACE},
        {"debug", LOG_DEBUG},
        {"info", LOG_INFO},
        {"warning", LOG_WARNING}, {"warn", LOG_WARNING},
        {"error", LOG_ERROR},
        {"fatal", LOG_FATAL},
        {"none", LOG_NONE}, {"off", LOG_NONE},
    };

    auto it = map.find(s);
    if (it != map.end()) return it->second;

    return parse_int(s, default_value);
}

void Config::apply_kv(const std::string& section, const std::string& key, const std::string& value) {
    const std::string sec = to_lower(trim(section));
    const std::string k = to_lower(trim(key));
    const std::string v = strip_quotes(value);

    if (sec == "window") {
        auto& w = config_.window;
        if (k == "width") w.width = std::max(1, parse_int(v, w.width));
        else if (k == "height") w.height = std::max(1, parse_int(v, w.height));
        else if (k == "title") w.title = v;
        else if (k == "fps") w.target_fps = std::max(0, parse_int(v, w.target_fps));
        else if (k == "vsync") w.vsync = parse_bool(v, w.vsync);
        return;
    }

    if (sec == "controls") {
        if (k == "exit") config_.controls.exit = key_from_string(v, config_.controls.exit);
        else if (k == "toggle_overlay") config_.controls.toggle_overlay = key_from_string(v, config_.controls.toggle_overlay);
        return;
    }

    if (sec == "logging") {
        if (k == "enabled") config_.logging.enabled = parse_bool(v, config_.logging.enabled);
        else if (k == "level") config_.logging.level = log_level_from_string(v, config_.logging.level);
        else if (k == "file") config_.logging.file = v;
        return;
    }

    if (sec == "script") {
        auto& s = config_.script;
        if (k == "path") s.path = v;
        else if (k == "base") s.base = v;
        else if (k == "sandbox") s.sandbox = parse_bool(v, s.sandbox);
        return;
    }

    if (sec == "viewer") {
        auto& vw = config_.viewer;
        if (k == "draw_grid") vw.draw_grid = parse_bool(v, vw.draw_grid);
        else if (k == "draw_names") vw.draw_names = parse_bool(v, vw.draw_names);
        else if (k == "overlay") vw.overlay = parse_bool(v, vw.overlay);
        return;
    }
}

bool Config::load_from_file(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        return false;
    }

    std::string section;
    std::string line;

    while (std::getline(in, line)) {
        // Comments start at the first '#' or ';'.
        auto hash = line.find('#');
        auto semi = line.find(';');
        size_t cut = std::string::npos;
        if (hash != std::string::npos) cut = hash;
        if (semi != std::string::npos) cut = (cut == std::string::npos) ? semi : std::min(cut, semi);
        if (cut != std::string::npos) line = line.substr(0, cut);

        line = trim(line);
        if (line.empty()) continue;

        if (line.front() == '[' && line.back() == ']') {
            section = trim(line.substr(1, line.size() - 2));
            continue;
        }

        auto eq = line.find('=');
        if (eq == std::string::npos) continue;

        std::string key = trim(line.substr(0, eq));
        std::string value = trim(line.substr(eq + 1));
        if (key.empty()) continue;

        apply_kv(section, key, value);
    }

    loaded_from_path_ = path;
    return true;
}

} // namespace core
