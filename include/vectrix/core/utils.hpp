#ifndef vectrix_CORE_UTILS_HPP
#define vectrix_CORE_UTILS_HPP

#include <string>
#include <vector>
#include <cstdint>
#include <ctime>

namespace vectrix {

// ============ Time utilities ============

// Sleep for the specified number of milliseconds
void sleep_ms(int milliseconds);

// Get current Unix timestamp in milliseconds
int64_t current_timestamp_ms();

// ============ String utilities ============

// Trim whitespace from both ends of a string
std::string trim(const std::string& s);

// Trim whitespace from left side
std::string ltrim(const std::string& s);

// Trim whitespace from right side
std::string rtrim(const std::string& s);

// Convert string to lowercase (ASCII only)
std::string to_lower(const std::string& s);

// Check if string starts with prefix
bool starts_with(const std::string& s, const std::string& prefix);

// Split string by delimiter
std::vector<std::string> split(const std::string& s, char delimiter);

// Split string by string delimiter (keeps empty parts)
std::vector<std::string> split(const std::string& s, const std::string& delimiter);

// Join strings with delimiter
std::string join(const std::vector<std::string>& parts, const std::string& delimiter);

// Replace every occurrence of `from` with `to`
std::string replace_all(const std::string& s, const std::string& from, const std::string& to);

// Truncate string safely (UTF-8 aware, doesn't break multi-byte chars)
std::string truncate_safe(const std::string& s, size_t max_len);

// True for UTF-8 continuation bytes (10xxxxxx)
inline bool is_utf8_continuation(unsigned char c) {
    return (c & 0xC0) == 0x80;
}

// ============ Path utilities ============

// Normalize path (resolve . and .., collapse slashes)
std::string normalize_path(const std::string& path);

// Join path components
std::string join_path(const std::string& a, const std::string& b);

// Last path component
std::string base_name(const std::string& path);

// Everything before the last path component ("" when there is none)
std::string parent_path(const std::string& path);

// Create a directory and any missing parents (mkdir -p)
bool create_directories(const std::string& path);

// Create the parent directory of a file path
bool create_parent_directory(const std::string& filepath);

// Lowercased extension without the dot ("" when there is none)
std::string file_extension(const std::string& path);

// ============ UUID utilities ============

// Generate a random UUID v4
std::string generate_uuid();

} // namespace vectrix

#endif // vectrix_CORE_UTILS_HPP
