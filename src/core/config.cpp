#include <vectrix/core/config.hpp>
#include <vectrix/core/logger.hpp>
#include <vectrix/core/utils.hpp>
#include <fstream>
#include <sstream>

namespace vectrix {

Config::Config() : data_(Json::object()) {}

Config::Config(const Json& data) : data_(data.is_object() ? data : Json::object()) {}

Status Config::load_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        LOG_ERROR("[Config] Cannot open %s", path.c_str());
        return Status::fail(ErrorKind::IO, "cannot open config file " + path);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    Status s = load_string(buffer.str());
    if (!s.success) {
        return s.wrap(path);
    }
    LOG_DEBUG("[Config] Loaded %s", path.c_str());
    return s;
}

Status Config::load_string(const std::string& text) {
    Json parsed;
    try {
        parsed = Json::parse(text);
    } catch (const std::exception& e) {
        LOG_ERROR("[Config] Failed to parse JSON: %s", e.what());
        return Status::fail(ErrorKind::PARSE, std::string("invalid JSON: ") + e.what());
    }
    if (!parsed.is_object()) {
        return Status::fail(ErrorKind::PARSE, "config root must be a JSON object");
    }
    data_ = parsed;
    return Status::ok();
}

const Json* Config::find(const std::string& key) const {
    const Json* node = &data_;
    for (const auto& part : split(key, '.')) {
        if (!node->is_object()) return nullptr;
        auto it = node->find(part);
        if (it == node->end()) return nullptr;
        node = &(*it);
    }
    return node;
}

bool Config::has(const std::string& key) const {
    const Json* node = find(key);
    return node && !node->is_null();
}

std::string Config::get_string(const std::string& key, const std::string& default_val) const {
    const Json* node = find(key);
    if (!node || !node->is_string()) return default_val;
    return node->get<std::string>();
}

int64_t Config::get_int(const std::string& key, int64_t default_val) const {
    const Json* node = find(key);
    if (!node || !node->is_number()) return default_val;
    return node->get<int64_t>();
}

double Config::get_double(const std::string& key, double default_val) const {
    const Json* node = find(key);
    if (!node || !node->is_number()) return default_val;
    return node->get<double>();
}

bool Config::get_bool(const std::string& key, bool default_val) const {
    const Json* node = find(key);
    if (!node || !node->is_boolean()) return default_val;
    return node->get<bool>();
}

std::vector<std::string> Config::get_string_array(const std::string& key) const {
    std::vector<std::string> result;
    const Json* node = find(key);
    if (!node || !node->is_array()) return result;
    for (const auto& v : *node) {
        if (v.is_string()) result.push_back(v.get<std::string>());
    }
    return result;
}

std::vector<int64_t> Config::get_int_array(const std::string& key) const {
    std::vector<int64_t> result;
    const Json* node = find(key);
    if (!node || !node->is_array()) return result;
    for (const auto& v : *node) {
        if (v.is_number()) result.push_back(v.get<int64_t>());
    }
    return result;
}

void Config::set_string(const std::string& key, const std::string& value) {
    Json* node = &data_;
    std::vector<std::string> parts = split(key, '.');
    for (size_t i = 0; i + 1 < parts.size(); ++i) {
        Json& child = (*node)[parts[i]];
        if (!child.is_object()) child = Json::object();
        node = &child;
    }
    if (!parts.empty()) {
        (*node)[parts.back()] = value;
    }
}

} // namespace vectrix
