#ifndef REQUEST_H
#define REQUEST_H

#include <cstdint>
#include <string>

#include <nlohmann/json.hpp>

#include "format_registry.h"
#include "global_cfg.h"
#include "status.h"

using json = nlohmann::json;

typedef enum {
    RETURN_INLINE = 0, // base64 inside the JSON reply
    RETURN_FILE, // binary image/png stream
} return_format_t;

struct color_t {
    uint8_t r;
    uint8_t g;
    uint8_t b;
};

struct barcode_style {
    double module_width = DEFAULT_MODULE_WIDTH;
    double module_height = DEFAULT_MODULE_HEIGHT;
    double quiet_zone = DEFAULT_QUIET_ZONE;
    int font_size = DEFAULT_FONT_SIZE;
    double text_distance = DEFAULT_TEXT_DISTANCE;
    color_t foreground = { 0, 0, 0 };
    color_t background = { 255, 255, 255 };
};

struct generation_request {
    std::string data;
    std::string format;
    barcode_style style;
    return_format_t return_format = RETURN_INLINE;
};

struct qr_request {
    std::string data;
    int version = DEFAULT_QR_VERSION;
    char error_correction = DEFAULT_QR_EC_LEVEL[0];
    int box_size = DEFAULT_QR_BOX_SIZE;
    int border = DEFAULT_QR_BORDER;
    color_t fill = { 0, 0, 0 };
    color_t back = { 255, 255, 255 };
    return_format_t return_format = RETURN_INLINE;
};

// Body parsers: type-check every known field, fill the request, then run
// the matching validator. Unknown fields are ignored.
status_t parse_generation_request(const json& body, const format_registry& registry, generation_request& out);
status_t parse_qr_request(const json& body, qr_request& out);

status_t validate_generation_request(const generation_request& req, const format_registry& registry);
status_t validate_qr_request(const qr_request& req);

status_t parse_color(const std::string& field, const std::string& text, color_t& out);
status_t parse_return_format(const std::string& text, return_format_t& out);
std::string trim(const std::string& s);

#endif // REQUEST_H
