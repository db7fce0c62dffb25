/*
 * vectrix C++17 - JSON alias
 *
 * All on-disk formats, item metadata and metadata filters are nlohmann::json values.
 */
#ifndef vectrix_CORE_JSON_HPP
#define vectrix_CORE_JSON_HPP

#include <nlohmann/json.hpp>
#include <string>

namespace vectrix {

typedef nlohmann::json Json;

// Compact serialization. Invalid UTF-8 is replaced rather than thrown on.
inline std::string dump_json(const Json& j) {
    return j.dump(-1, ' ', false, Json::error_handler_t::replace);
}

} // namespace vectrix

#endif // vectrix_CORE_JSON_HPP
