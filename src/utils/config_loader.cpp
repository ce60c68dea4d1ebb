#include "flakelib/utils/config_loader.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <fstream>
#include <sstream>

#include "flakelib/utils/env.hpp"

namespace flakelib::utils {

ConfigLoader::ConfigLoader() = default;

bool ConfigLoader::load_from_file(const std::filesystem::path& file_path) {
    std::ifstream ifs(file_path);
    if (!ifs) {
        std::lock_guard<std::mutex> lk(config_mutex_);
        last_error_ = "cannot open " + file_path.string();
        return false;
    }
    std::ostringstream ss;
    ss << ifs.rdbuf();
    return load_from_string(ss.str());
}

bool ConfigLoader::load_from_string(const std::string& content) {
    std::lock_guard<std::mutex> lk(config_mutex_);
    last_error_.clear();
    return parse_lines(content);
}

bool ConfigLoader::parse_lines(const std::string& content) {
    std::istringstream in(content);
    std::string raw;
    std::string section;
    size_t line_no = 0;
    bool ok = true;
    while (std::getline(in, raw)) {
        ++line_no;
        std::string line = config_utils::trim(raw);
        if (line.empty() || line[0] == '#' || line[0] == ';') continue;
        if (line.front() == '[') {
            if (line.back() != ']') {
                last_error_ = "line " + std::to_string(line_no) + ": unterminated section";
                ok = false;
                continue;
            }
            section = config_utils::trim(line.substr(1, line.size() - 2));
            continue;
        }
        auto eq = line.find('=');
        if (eq == std::string::npos) {
            last_error_ = "line " + std::to_string(line_no) + ": expected key = value";
            ok = false;
            continue;
        }
        std::string key = config_utils::trim(line.substr(0, eq));
        std::string value = config_utils::trim(line.substr(eq + 1));
        if (key.empty()) {
            last_error_ = "line " + std::to_string(line_no) + ": empty key";
            ok = false;
            continue;
        }
        // 値を囲む引用符は外す
        if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'') && value.back() == value.front()) {
            value = value.substr(1, value.size() - 2);
        }
        config_data_[section.empty() ? key : section + "." + key] = value;
    }
    return ok;
}

size_t ConfigLoader::load_from_environment(const std::string& prefix, const std::vector<std::string>& keys) {
    size_t n = 0;
    for (const auto& key : keys) {
        auto value = config_utils::get_env_var(config_utils::normalize_env_var_name(key, prefix));
        if (!value) continue;
        set(key, *value);
        ++n;
    }
    return n;
}

size_t ConfigLoader::load_from_command_line(int argc, char* argv[]) {
    size_t n = 0;
    std::lock_guard<std::mutex> lk(config_mutex_);
    positional_.clear();
    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        if (a.rfind("--", 0) != 0 || a.size() == 2) {
            positional_.push_back(a);
            continue;
        }
        auto eq = a.find('=');
        std::string key = a.substr(2, eq == std::string::npos ? std::string::npos : eq - 2);
        std::replace(key.begin(), key.end(), '-', '_');
        if (eq == std::string::npos) {
            config_data_[key] = true;
        } else {
            config_data_[key] = a.substr(eq + 1);
        }
        ++n;
    }
    return n;
}

std::string ConfigLoader::get_string(const std::string& key, const std::string& def) const {
    std::lock_guard<std::mutex> lk(config_mutex_);
    if (auto* v = find_value(key)) return to_string(*v);
    return def;
}

int64_t ConfigLoader::get_int(const std::string& key, int64_t def) const {
    std::lock_guard<std::mutex> lk(config_mutex_);
    const ConfigValue* v = find_value(key);
    if (!v) return def;
    if (auto* i = std::get_if<int64_t>(v)) return *i;
    if (auto* b = std::get_if<bool>(v)) return *b ? 1 : 0;
    const std::string& s = std::get<std::string>(*v);
    int64_t out = 0;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), out);
    if (ec != std::errc{} || ptr != s.data() + s.size()) return def;
    return out;
}

bool ConfigLoader::get_bool(const std::string& key, bool def) const {
    std::lock_guard<std::mutex> lk(config_mutex_);
    const ConfigValue* v = find_value(key);
    if (!v) return def;
    if (auto* b = std::get_if<bool>(v)) return *b;
    if (auto* i = std::get_if<int64_t>(v)) return *i != 0;
    return config_utils::parse_bool(std::get<std::string>(*v)).value_or(def);
}

void ConfigLoader::set(const std::string& key, const ConfigValue& value) {
    std::lock_guard<std::mutex> lk(config_mutex_);
    config_data_[key] = value;
}

bool ConfigLoader::has(const std::string& key) const {
    std::lock_guard<std::mutex> lk(config_mutex_);
    return find_value(key) != nullptr;
}

void ConfigLoader::load_defaults(const std::unordered_map<std::string, ConfigValue>& defaults) {
    std::lock_guard<std::mutex> lk(config_mutex_);
    for (const auto& [k, v] : defaults) config_data_.emplace(k, v);
}

std::vector<std::string> ConfigLoader::get_all_keys() const {
    std::lock_guard<std::mutex> lk(config_mutex_);
    std::vector<std::string> keys;
    keys.reserve(config_data_.size());
    for (const auto& [k, _] : config_data_) keys.push_back(k);
    std::sort(keys.begin(), keys.end());
    return keys;
}

std::vector<std::string> ConfigLoader::positional_args() const {
    std::lock_guard<std::mutex> lk(config_mutex_);
    return positional_;
}

std::string ConfigLoader::last_error() const {
    std::lock_guard<std::mutex> lk(config_mutex_);
    return last_error_;
}

const ConfigValue* ConfigLoader::find_value(const std::string& key) const {
    auto it = config_data_.find(key);
    return it == config_data_.end() ? nullptr : &it->second;
}

std::string ConfigLoader::to_string(const ConfigValue& value) const {
    if (auto* s = std::get_if<std::string>(&value)) return *s;
    if (auto* i = std::get_if<int64_t>(&value)) return std::to_string(*i);
    return std::get<bool>(value) ? "true" : "false";
}

// utils
namespace config_utils {

std::string normalize_env_var_name(const std::string& key, const std::string& prefix) {
    std::string r = prefix;
    for (char c : key) {
        r += (c == '.' || c == '-') ? '_' : static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }
    return r;
}

std::optional<std::string> get_env_var(const std::string& name) {
    return getenv_os(name);
}

std::optional<bool> parse_bool(const std::string& str) {
    std::string s;
    for (char c : str) s += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    if (s == "1" || s == "true" || s == "yes" || s == "on") return true;
    if (s == "0" || s == "false" || s == "no" || s == "off") return false;
    return std::nullopt;
}

std::string trim(const std::string& str) {
    auto first = std::find_if_not(str.begin(), str.end(), [](unsigned char c) { return std::isspace(c); });
    auto last = std::find_if_not(str.rbegin(), str.rend(), [](unsigned char c) { return std::isspace(c); }).base();
    return first < last ? std::string(first, last) : std::string();
}

} // namespace config_utils

} // namespace flakelib::utils
