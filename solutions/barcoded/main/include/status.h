#ifndef STATUS_H
#define STATUS_H

#include <string>
#include <utility>

typedef enum {
    STATUS_OK = 0,
    STATUS_VALIDATION_ERROR,
    STATUS_ENCODING_ERROR,
    STATUS_DECODING_ERROR,
    STATUS_INTERNAL_ERROR,
} status_code_t;

// Outcome of a validator or dispatcher call. Library exceptions never
// cross these boundaries, they are folded into one of the codes above.
struct status_t {
    status_code_t code = STATUS_OK;
    std::string msg;

    bool ok() const { return code == STATUS_OK; }

    static status_t success() { return {}; }
    static status_t validation(std::string msg) { return { STATUS_VALIDATION_ERROR, std::move(msg) }; }
    static status_t encoding(std::string msg) { return { STATUS_ENCODING_ERROR, std::move(msg) }; }
    static status_t decoding(std::string msg) { return { STATUS_DECODING_ERROR, std::move(msg) }; }
    static status_t internal(std::string msg) { return { STATUS_INTERNAL_ERROR, std::move(msg) }; }
};

inline const char* status_name(status_code_t code)
{
    switch (code) {
    case STATUS_OK:
        return "OK";
    case STATUS_VALIDATION_ERROR:
        return "ValidationError";
    case STATUS_ENCODING_ERROR:
        return "EncodingError";
    case STATUS_DECODING_ERROR:
        return "DecodingError";
    default:
        return "InternalError";
    }
}

#endif // STATUS_H
