/*
 * vectrix C++17 - Operation Status
 *
 * Every fallible store, catalog and storage operation returns a Status.
 * Values are handed back through out-parameters.
 */
#ifndef vectrix_CORE_STATUS_HPP
#define vectrix_CORE_STATUS_HPP

#include <string>

namespace vectrix {

enum class ErrorKind {
    NONE = 0,
    VALIDATION,     // Bad input or configuration (missing vector, bad chunk sizes)
    CONFLICT,       // Duplicate id, index already exists, transaction already open
    STATE,          // No transaction open, embeddings not configured, index missing
    IO,             // Storage failure
    UPSTREAM,       // Embeddings service failure
    NOT_FOUND,      // Path or entry does not exist
    PARSE           // Malformed JSON on disk or over the wire
};

const char* error_kind_name(ErrorKind kind);

struct Status {
    bool success;
    ErrorKind kind;
    std::string error;

    Status() : success(true), kind(ErrorKind::NONE) {}

    static Status ok() {
        return Status();
    }

    static Status fail(ErrorKind kind, const std::string& err) {
        Status s;
        s.success = false;
        s.kind = kind;
        s.error = err;
        return s;
    }

    // Prefix context onto a failure, keeping its kind and the original cause.
    Status wrap(const std::string& context) const {
        if (success) return *this;
        return fail(kind, context + ": " + error);
    }
};

} // namespace vectrix

#endif // vectrix_CORE_STATUS_HPP
