#include <algorithm>
#include <cctype>

#include "api_barcode.h"

static status_t parse_flag(const std::string& field, std::string value, bool& out)
{
    std::transform(value.begin(), value.end(), value.begin(),
        [](unsigned char c) { return std::tolower(c); });
    if (value == "true" || value == "1" || value == "yes" || value == "on") {
        out = true;
    } else if (value.empty() || value == "false" || value == "0" || value == "no" || value == "off") {
        out = false;
    } else {
        return status_t::validation(field + " must be a boolean");
    }
    return status_t::success();
}

status_t api_barcode::parse(request_t req, generation_request& out) const
{
    json body;
    status_t st = parse_body(req, body);
    if (!st.ok()) {
        return st;
    }
    return parse_generation_request(body, _registry, out);
}

api_status_t api_barcode::reply(const generation_request& req, return_format_t format, response_t res)
{
    encoded_image image;
    status_t st = _encoder.encode(req, image);
    if (!st.ok()) {
        return reply_error(res, st);
    }

    LOGI("%s: %zu bytes png", req.format.c_str(), image.size());
    if (format == RETURN_FILE) {
        format_file(std::move(image), req.format, req.data, res);
        return API_STATUS_REPLY_FILE;
    }

    const char* message = (req.format == "qrcode") ? "QR code generated successfully"
                                                   : "Barcode generated successfully";
    format_inline(std::move(image), req.format, req.data, message, res);
    return API_STATUS_OK;
}

api_status_t api_barcode::generate(request_t req, response_t res)
{
    generation_request r;
    status_t st = parse(req, r);
    if (!st.ok()) {
        return reply_error(res, st);
    }
    return reply(r, RETURN_INLINE, res);
}

api_status_t api_barcode::generate_image(request_t req, response_t res)
{
    generation_request r;
    status_t st = parse(req, r);
    if (!st.ok()) {
        return reply_error(res, st);
    }
    return reply(r, RETURN_FILE, res);
}

api_status_t api_barcode::create_barcode(request_t req, response_t res)
{
    generation_request r;
    status_t st = parse(req, r);
    if (!st.ok()) {
        return reply_error(res, st);
    }
    return reply(r, r.return_format, res);
}

// GET /generate/quick?data=...&format=code128&return_image=false
api_status_t api_barcode::quick(request_t req, response_t res)
{
    json body = json::object();
    body["data"] = get_query_var(req, "data");
    std::string format = get_query_var(req, "format");
    body["format"] = format.empty() ? "code128" : format;

    bool return_image = false;
    status_t st = parse_flag("return_image", get_query_var(req, "return_image"), return_image);
    if (!st.ok()) {
        return reply_error(res, st);
    }

    generation_request r;
    st = parse_generation_request(body, _registry, r);
    if (!st.ok()) {
        return reply_error(res, st);
    }
    return reply(r, return_image ? RETURN_FILE : RETURN_INLINE, res);
}
