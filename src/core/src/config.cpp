#include "core/config.hpp"
#include "core/log.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <functional>
#include <sstream>
#include <stdexcept>
#include <type_traits>

namespace nle::core {

namespace {

std::string trim(const std::string& s) {
    size_t b = 0, e = s.size();
    while(b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
    while(e > b && std::isspace(static_cast<unsigned char>(s[e-1]))) --e;
    return s.substr(b, e - b);
}

bool parse_bool(const std::string& v, bool& out) {
    std::string l = v;
    std::transform(l.begin(), l.end(), l.begin(), [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
    if(l == "1" || l == "true" || l == "on" || l == "yes") { out = true; return true; }
    if(l == "0" || l == "false" || l == "off" || l == "no") { out = false; return true; }
    return false;
}

bool parse_double(const std::string& v, double& out) {
    try {
        size_t used = 0;
        double d = std::stod(v, &used);
        if(used != v.size()) return false;
        out = d;
        return true;
    } catch(const std::invalid_argument&) {
        return false;
    } catch(const std::out_of_range&) {
        return false;
    }
}

using Setter = std::function<bool(const std::string&)>;

template <class T>
Setter number_setter(T& field) {
    return [&field](const std::string& v) {
        double d = 0.0;
        if(!parse_double(v, d)) return false;
        if constexpr (std::is_unsigned_v<T>) { if(d < 0.0) return false; }
        field = static_cast<T>(d);
        return true;
    };
}

Setter bool_setter(bool& field) {
    return [&field](const std::string& v) { return parse_bool(v, field); };
}

ConfigLoadResult apply(const std::map<std::string, std::string>& values,
                       const std::map<std::string, Setter>& setters,
                       const char* section) {
    ConfigLoadResult result;
    result.success = true;
    for(const auto& [key, value] : values) {
        auto it = setters.find(key);
        if(it == setters.end()) {
            result.unknown_keys.push_back(key);
            nle::log::warn(std::string("Ignoring unknown ") + section + " config key: " + key);
            continue;
        }
        if(!it->second(value)) {
            result.success = false;
            result.error = "Invalid value for " + key + ": '" + value + "'";
            nle::log::error(result.error);
            return result;
        }
    }
    return result;
}

ConfigLoadResult load_file(const std::string& path, const std::function<ConfigLoadResult(const std::map<std::string, std::string>&)>& apply_fn) {
    std::ifstream ifs(path);
    if(!ifs) return {false, "Failed to open config file: " + path, {}};
    std::stringstream buf; buf << ifs.rdbuf();
    std::map<std::string, std::string> values;
    std::string error;
    if(!parse_key_values(buf.str(), values, error)) return {false, error, {}};
    return apply_fn(values);
}

} // namespace

bool parse_key_values(const std::string& text, std::map<std::string, std::string>& out, std::string& error) {
    std::istringstream in(text);
    std::string line;
    int line_no = 0;
    while(std::getline(in, line)) {
        ++line_no;
        auto hash = line.find('#');
        if(hash != std::string::npos) line.erase(hash);
        line = trim(line);
        if(line.empty()) continue;
        auto eq = line.find('=');
        if(eq == std::string::npos) {
            error = "Line " + std::to_string(line_no) + ": expected key = value";
            return false;
        }
        auto key = trim(line.substr(0, eq));
        auto value = trim(line.substr(eq + 1));
        if(key.empty()) {
            error = "Line " + std::to_string(line_no) + ": empty key";
            return false;
        }
        out[key] = value;
    }
    return true;
}

ConfigLoadResult apply_editor_config(const std::map<std::string, std::string>& values, EditorConfig& cfg) {
    EditorConfig staged = cfg;
    const std::map<std::string, Setter> setters{
        {"adjacency_epsilon", number_setter(staged.adjacency_epsilon)},
        {"min_clip_duration", number_setter(staged.min_clip_duration)},
        {"default_transition_duration", number_setter(staged.default_transition_duration)},
        {"min_transition_duration", number_setter(staged.min_transition_duration)},
        {"max_transition_duration", number_setter(staged.max_transition_duration)},
        {"snap_threshold_px", number_setter(staged.snap_threshold_px)},
        {"snap_grid_interval", number_setter(staged.snap_grid_interval)},
        {"min_zoom", number_setter(staged.min_zoom)},
        {"max_zoom", number_setter(staged.max_zoom)},
        {"default_zoom", number_setter(staged.default_zoom)},
        {"zoom_step", number_setter(staged.zoom_step)},
        {"nudge_step", number_setter(staged.nudge_step)},
        {"history_limit", number_setter(staged.history_limit)},
        {"merge_window_ms", number_setter(staged.merge_window_ms)},
        {"default_ripple", bool_setter(staged.default_ripple)},
        {"default_delete_ripple", bool_setter(staged.default_delete_ripple)},
    };
    auto result = apply(values, setters, "editor");
    if(result.success && (staged.min_zoom <= 0.0 || staged.min_zoom > staged.max_zoom)) {
        result.success = false;
        result.error = "min_zoom must be positive and not exceed max_zoom";
    }
    if(result.success && staged.min_transition_duration > staged.max_transition_duration) {
        result.success = false;
        result.error = "min_transition_duration exceeds max_transition_duration";
    }
    if(result.success) cfg = staged;
    return result;
}

ConfigLoadResult apply_audio_config(const std::map<std::string, std::string>& values, AudioEngineConfig& cfg) {
    AudioEngineConfig staged = cfg;
    const std::map<std::string, Setter> setters{
        {"sample_rate", number_setter(staged.sample_rate)},
        {"channels", number_setter(staged.channels)},
        {"lookahead", number_setter(staged.lookahead)},
        {"fade_ms", number_setter(staged.fade_ms)},
        {"master_volume", number_setter(staged.master_volume)},
        {"decode_threads", number_setter(staged.decode_threads)},
    };
    auto result = apply(values, setters, "audio");
    if(result.success && (staged.sample_rate == 0 || staged.channels == 0)) {
        result.success = false;
        result.error = "sample_rate and channels must be non-zero";
    }
    if(result.success) cfg = staged;
    return result;
}

ConfigLoadResult load_editor_config(const std::string& path, EditorConfig& cfg) {
    return load_file(path, [&cfg](const std::map<std::string, std::string>& v){ return apply_editor_config(v, cfg); });
}

ConfigLoadResult load_audio_config(const std::string& path, AudioEngineConfig& cfg) {
    return load_file(path, [&cfg](const std::map<std::string, std::string>& v){ return apply_audio_config(v, cfg); });
}

} // namespace nle::core
