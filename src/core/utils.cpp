#include <vectrix/core/utils.hpp>
#include <algorithm>
#include <numeric>
#include <cctype>
#include <sstream>
#include <iomanip>
#include <unistd.h>
#include <sys/stat.h>
#include <cerrno>
#include <openssl/rand.h>

namespace vectrix {

// ============ Time utilities ============

void sleep_ms(int milliseconds) {
    if (milliseconds <= 0) return;
    usleep(static_cast<useconds_t>(milliseconds) * 1000);
}

int64_t current_timestamp_ms() {
    struct timespec ts;
    clock_gettime(CLOCK_REALTIME, &ts);
    return static_cast<int64_t>(ts.tv_sec) * 1000 + ts.tv_nsec / 1000000;
}

// ============ String utilities ============

std::string trim(const std::string& s) {
    return rtrim(ltrim(s));
}

std::string ltrim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\n\r");
    if (start == std::string::npos) return "";
    return s.substr(start);
}

std::string rtrim(const std::string& s) {
    size_t end = s.find_last_not_of(" \t\n\r");
    if (end == std::string::npos) return "";
    return s.substr(0, end + 1);
}

std::string to_lower(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return result;
}

bool starts_with(const std::string& s, const std::string& prefix) {
    return s.size() >= prefix.size() && 
           std::equal(prefix.begin(), prefix.end(), s.begin());
}

std::vector<std::string> split(const std::string& s, char delimiter) {
    std::vector<std::string> parts;
    std::istringstream iss(s);
    std::string part;
    while (std::getline(iss, part, delimiter)) {
        parts.push_back(part);
    }
    return parts;
}

std::vector<std::string> split(const std::string& s, const std::string& delimiter) {
    std::vector<std::string> parts;
    if (delimiter.empty()) {
        parts.push_back(s);
        return parts;
    }
    size_t start = 0;
    size_t end;
    while ((end = s.find(delimiter, start)) != std::string::npos) {
        parts.push_back(s.substr(start, end - start));
        start = end + delimiter.size();
    }
    parts.push_back(s.substr(start));
    return parts;
}

std::string join(const std::vector<std::string>& parts, const std::string& delimiter) {
    if (parts.empty()) return "";
    return std::accumulate(
        std::next(parts.begin()), parts.end(), parts[0],
        [&](const std::string& a, const std::string& b) {
            return a + delimiter + b;
        });
}

std::string replace_all(const std::string& s, const std::string& from, const std::string& to) {
    if (from.empty()) return s;
    std::string result;
    result.reserve(s.size());
    size_t start = 0;
    size_t pos;
    while ((pos = s.find(from, start)) != std::string::npos) {
        result.append(s, start, pos - start);
        result += to;
        start = pos + from.size();
    }
    result.append(s, start, std::string::npos);
    return result;
}

std::string truncate_safe(const std::string& s, size_t max_len) {
    if (s.size() <= max_len) return s;
    
    size_t len = max_len;
    while (len > 0 && is_utf8_continuation(static_cast<unsigned char>(s[len]))) {
        --len;  // Back up if in the middle of a multi-byte sequence
    }
    return s.substr(0, len);
}

// ============ Path utilities ============

std::string normalize_path(const std::string& path) {
    if (path.empty()) return path;
    
    std::vector<std::string> parts = split(path, '/');
    std::vector<std::string> result;
    
    for (size_t i = 0; i < parts.size(); ++i) {
        if (parts[i].empty() || parts[i] == ".") {
            continue;
        }
        if (parts[i] == "..") {
            if (!result.empty() && result.back() != "..") {
                result.pop_back();
            } else if (path[0] != '/') {
                result.push_back("..");
            }
        } else {
            result.push_back(parts[i]);
        }
    }
    
    std::string normalized = join(result, "/");
    if (path[0] == '/') {
        normalized = "/" + normalized;
    }
    
    return normalized.empty() ? "." : normalized;
}

std::string join_path(const std::string& a, const std::string& b) {
    if (a.empty()) return b;
    if (b.empty()) return a;
    
    bool a_ends_slash = a.back() == '/';
    bool b_starts_slash = b[0] == '/';
    
    if (a_ends_slash && b_starts_slash) {
        return a + b.substr(1);
    }
    if (!a_ends_slash && !b_starts_slash) {
        return a + "/" + b;
    }
    return a + b;
}

std::string base_name(const std::string& path) {
    std::string p = path;
    while (p.size() > 1 && p.back() == '/') p.pop_back();
    size_t pos = p.rfind('/');
    return pos == std::string::npos ? p : p.substr(pos + 1);
}

std::string parent_path(const std::string& path) {
    std::string p = path;
    while (p.size() > 1 && p.back() == '/') p.pop_back();
    size_t pos = p.rfind('/');
    if (pos == std::string::npos) return "";
    if (pos == 0) return "/";
    return p.substr(0, pos);
}

bool create_directories(const std::string& dir) {
    if (dir.empty()) return true;
    
    // Simple recursive mkdir
    std::string current;
    for (size_t i = 0; i < dir.size(); ++i) {
        current += dir[i];
        if (dir[i] == '/' || i == dir.size() - 1) {
            struct stat st;
            if (stat(current.c_str(), &st) != 0) {
                if (mkdir(current.c_str(), 0755) != 0 && errno != EEXIST) {
                    return false;
                }
            } else if (!S_ISDIR(st.st_mode)) {
                return false;
            }
        }
    }
    
    return true;
}

bool create_parent_directory(const std::string& filepath) {
    size_t pos = filepath.rfind('/');
    if (pos == std::string::npos || pos == 0) return true; // No directory component
    return create_directories(filepath.substr(0, pos));
}

std::string file_extension(const std::string& path) {
    std::string name = base_name(path);
    size_t pos = name.rfind('.');
    if (pos == std::string::npos || pos + 1 >= name.size()) return "";
    return to_lower(name.substr(pos + 1));
}

// ============ UUID utilities ============

std::string generate_uuid() {
    unsigned char bytes[16];
    if (RAND_bytes(bytes, 16) != 1) {
        // OpenSSL RNG unavailable; fall back to the process-seeded PRNG
        static bool seeded = false;
        if (!seeded) {
            srand(static_cast<unsigned>(current_timestamp_ms()) ^ static_cast<unsigned>(getpid()));
            seeded = true;
        }
        for (int i = 0; i < 16; ++i) {
            bytes[i] = static_cast<unsigned char>(rand() % 256);
        }
    }
    
    // Set version 4
    bytes[6] = (bytes[6] & 0x0F) | 0x40;
    // Set variant
    bytes[8] = (bytes[8] & 0x3F) | 0x80;
    
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    
    for (int i = 0; i < 16; ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10) {
            oss << '-';
        }
        oss << std::setw(2) << static_cast<int>(bytes[i]);
    }
    
    return oss.str();
}

} // namespace vectrix
