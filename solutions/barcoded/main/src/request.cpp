#include <algorithm>
#include <cctype>
#include <limits>
#include <map>

#include "request.h"

#define RETURN_IF_ERROR(expr)      \
    do {                           \
        status_t __st = (expr);    \
        if (!__st.ok())            \
            return __st;           \
    } while (0)

static const std::map<std::string, color_t> _named_colors = {
    { "black", { 0, 0, 0 } },
    { "white", { 255, 255, 255 } },
    { "red", { 255, 0, 0 } },
    { "green", { 0, 128, 0 } },
    { "blue", { 0, 0, 255 } },
    { "yellow", { 255, 255, 0 } },
    { "cyan", { 0, 255, 255 } },
    { "magenta", { 255, 0, 255 } },
    { "gray", { 128, 128, 128 } },
    { "grey", { 128, 128, 128 } },
    { "orange", { 255, 165, 0 } },
    { "purple", { 128, 0, 128 } },
    { "brown", { 165, 42, 42 } },
    { "pink", { 255, 192, 203 } },
    { "navy", { 0, 0, 128 } },
    { "maroon", { 128, 0, 0 } },
    { "olive", { 128, 128, 0 } },
    { "teal", { 0, 128, 128 } },
    { "silver", { 192, 192, 192 } },
    { "lime", { 0, 255, 0 } },
};

static std::string to_lower(std::string s)
{
    std::transform(s.begin(), s.end(), s.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

static bool is_digits(const std::string& s)
{
    return !s.empty() && std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isdigit(c); });
}

std::string trim(const std::string& s)
{
    static const char* ws = " \t\r\n\f\v";
    size_t begin = s.find_first_not_of(ws);
    if (begin == std::string::npos)
        return "";
    size_t end = s.find_last_not_of(ws);
    return s.substr(begin, end - begin + 1);
}

status_t parse_color(const std::string& field, const std::string& text, color_t& out)
{
    std::string t = to_lower(trim(text));

    auto it = _named_colors.find(t);
    if (it != _named_colors.end()) {
        out = it->second;
        return status_t::success();
    }

    if ((t.size() == 7 || t.size() == 4) && t[0] == '#'
        && std::all_of(t.begin() + 1, t.end(), [](unsigned char c) { return std::isxdigit(c); })) {
        if (t.size() == 4) {
            // #rgb -> #rrggbb
            t = std::string("#") + t[1] + t[1] + t[2] + t[2] + t[3] + t[3];
        }
        out.r = static_cast<uint8_t>(std::stoi(t.substr(1, 2), nullptr, 16));
        out.g = static_cast<uint8_t>(std::stoi(t.substr(3, 2), nullptr, 16));
        out.b = static_cast<uint8_t>(std::stoi(t.substr(5, 2), nullptr, 16));
        return status_t::success();
    }

    return status_t::validation(field + " is not a valid color");
}

status_t parse_return_format(const std::string& text, return_format_t& out)
{
    std::string t = to_lower(trim(text));
    if (t == "base64" || t == "inline" || t == "json") {
        out = RETURN_INLINE;
    } else if (t == "image" || t == "file" || t == "png") {
        out = RETURN_FILE;
    } else {
        return status_t::validation("return_format must be one of base64, image");
    }
    return status_t::success();
}

// Field readers leave `out` untouched when the key is absent or null.
static status_t get_string(const json& body, const char* key, std::string& out)
{
    auto it = body.find(key);
    if (it == body.end() || it->is_null())
        return status_t::success();
    if (!it->is_string())
        return status_t::validation(std::string(key) + " must be a string");
    out = it->get<std::string>();
    return status_t::success();
}

static status_t get_number(const json& body, const char* key, double& out)
{
    auto it = body.find(key);
    if (it == body.end() || it->is_null())
        return status_t::success();
    if (!it->is_number())
        return status_t::validation(std::string(key) + " must be a number");
    out = it->get<double>();
    return status_t::success();
}

static status_t get_integer(const json& body, const char* key, int& out)
{
    auto it = body.find(key);
    if (it == body.end() || it->is_null())
        return status_t::success();
    if (!it->is_number_integer())
        return status_t::validation(std::string(key) + " must be an integer");
    int64_t v = it->get<int64_t>();
    if (v < std::numeric_limits<int>::min() || v > std::numeric_limits<int>::max())
        return status_t::validation(std::string(key) + " is out of range");
    out = static_cast<int>(v);
    return status_t::success();
}

static status_t get_color(const json& body, const char* key, const char* alias, color_t& out)
{
    std::string text;
    RETURN_IF_ERROR(get_string(body, alias, text));
    RETURN_IF_ERROR(get_string(body, key, text));
    if (text.empty())
        return status_t::success();
    return parse_color(key, text, out);
}

static status_t get_return_format(const json& body, return_format_t& out)
{
    std::string text;
    RETURN_IF_ERROR(get_string(body, "return_format", text));
    if (text.empty())
        return status_t::success();
    return parse_return_format(text, out);
}

status_t parse_generation_request(const json& body, const format_registry& registry, generation_request& out)
{
    if (!body.is_object())
        return status_t::validation("request body must be a JSON object");

    out = generation_request();
    if (!body.contains("data"))
        return status_t::validation("data is required");
    RETURN_IF_ERROR(get_string(body, "data", out.data));
    out.data = trim(out.data);

    if (!body.contains("format"))
        return status_t::validation("format is required");
    RETURN_IF_ERROR(get_string(body, "format", out.format));
    out.format = to_lower(trim(out.format));

    barcode_style& style = out.style;
    RETURN_IF_ERROR(get_number(body, "width", style.module_width));
    RETURN_IF_ERROR(get_number(body, "height", style.module_height));
    RETURN_IF_ERROR(get_number(body, "quiet_zone", style.quiet_zone));
    RETURN_IF_ERROR(get_integer(body, "font_size", style.font_size));
    RETURN_IF_ERROR(get_number(body, "text_distance", style.text_distance));
    RETURN_IF_ERROR(get_color(body, "foreground", "foreground_color", style.foreground));
    RETURN_IF_ERROR(get_color(body, "background", "background_color", style.background));
    RETURN_IF_ERROR(get_return_format(body, out.return_format));

    return validate_generation_request(out, registry);
}

status_t validate_generation_request(const generation_request& req, const format_registry& registry)
{
    if (trim(req.data).empty())
        return status_t::validation("data cannot be empty");

    const format_info* info = registry.lookup(req.format);
    if (info == nullptr)
        return status_t::validation("unsupported format");

    // written as !(x > 0) so NaN is rejected too
    const barcode_style& style = req.style;
    if (!(style.module_width > 0))
        return status_t::validation("width must be positive");
    if (!(style.module_height > 0))
        return status_t::validation("height must be positive");
    if (!(style.quiet_zone > 0))
        return status_t::validation("quiet_zone must be positive");
    if (!(style.text_distance > 0))
        return status_t::validation("text_distance must be positive");
    if (style.font_size < MIN_FONT_SIZE || style.font_size > MAX_FONT_SIZE)
        return status_t::validation("font_size must be between 1 and 100");

    if (info->fixed_length > 0) {
        if (req.data.size() != info->fixed_length || !is_digits(req.data))
            return status_t::validation("invalid data length/format for " + req.format);
    }

    return status_t::success();
}

status_t parse_qr_request(const json& body, qr_request& out)
{
    if (!body.is_object())
        return status_t::validation("request body must be a JSON object");

    out = qr_request();
    if (!body.contains("data"))
        return status_t::validation("data is required");
    RETURN_IF_ERROR(get_string(body, "data", out.data));
    out.data = trim(out.data);

    RETURN_IF_ERROR(get_integer(body, "version", out.version));

    std::string level(1, out.error_correction);
    RETURN_IF_ERROR(get_string(body, "error_correction", level));
    level = trim(level);
    if (level.size() != 1)
        return status_t::validation("error_correction must be one of L, M, Q, H");
    out.error_correction = static_cast<char>(std::toupper(static_cast<unsigned char>(level[0])));

    RETURN_IF_ERROR(get_integer(body, "box_size", out.box_size));
    RETURN_IF_ERROR(get_integer(body, "border", out.border));
    RETURN_IF_ERROR(get_color(body, "fill_color", "foreground", out.fill));
    RETURN_IF_ERROR(get_color(body, "back_color", "background", out.back));
    RETURN_IF_ERROR(get_return_format(body, out.return_format));

    return validate_qr_request(out);
}

status_t validate_qr_request(const qr_request& req)
{
    if (trim(req.data).empty())
        return status_t::validation("data cannot be empty");
    if (req.version < MIN_QR_VERSION || req.version > MAX_QR_VERSION)
        return status_t::validation("version must be between 1 and 40");

    switch (req.error_correction) {
    case 'L':
    case 'M':
    case 'Q':
    case 'H':
        break;
    default:
        return status_t::validation("error_correction must be one of L, M, Q, H");
    }

    if (req.box_size < 1 || req.box_size > MAX_QR_BOX_SIZE)
        return status_t::validation("box_size must be between 1 and 100");
    if (req.border < 0 || req.border > MAX_QR_BORDER)
        return status_t::validation("border must be between 0 and 100");

    return status_t::success();
}
