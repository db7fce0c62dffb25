/*
 * vectrix C++17 - Configuration
 *
 * JSON-backed settings with dotted-path lookup ("embeddings.model").
 */
#ifndef vectrix_CORE_CONFIG_HPP
#define vectrix_CORE_CONFIG_HPP

#include <vectrix/core/json.hpp>
#include <vectrix/core/status.hpp>
#include <string>
#include <vector>
#include <cstdint>

namespace vectrix {

class Config {
public:
    Config();
    explicit Config(const Json& data);

    // Load from a JSON file. PARSE on malformed JSON, IO when unreadable.
    Status load_file(const std::string& path);
    Status load_string(const std::string& text);

    bool has(const std::string& key) const;

    std::string get_string(const std::string& key, const std::string& default_val) const;
    int64_t get_int(const std::string& key, int64_t default_val) const;
    double get_double(const std::string& key, double default_val) const;
    bool get_bool(const std::string& key, bool default_val) const;
    std::vector<std::string> get_string_array(const std::string& key) const;
    std::vector<int64_t> get_int_array(const std::string& key) const;

    void set_string(const std::string& key, const std::string& value);

    const Json& raw() const { return data_; }

private:
    const Json* find(const std::string& key) const;

    Json data_;
};

} // namespace vectrix

#endif // vectrix_CORE_CONFIG_HPP
