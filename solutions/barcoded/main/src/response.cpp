#include <algorithm>
#include <cctype>
#include <iomanip>
#include <sstream>

#include <mongoose.h>
#include <openssl/sha.h>

#include "global_cfg.h"
#include "response.h"

static std::string to_hex(const unsigned char* data, size_t len)
{
    std::stringstream ss;
    ss << std::hex << std::setfill('0');
    for (size_t i = 0; i < len; ++i)
        ss << std::setw(2) << static_cast<int>(data[i]);
    return ss.str();
}

static bool filename_safe(const std::string& s)
{
    if (s.empty() || s.size() > FILENAME_MAX_DATA_LEN || s[0] == '.')
        return false;
    return std::all_of(s.begin(), s.end(), [](unsigned char c) {
        return std::isalnum(c) || c == '-' || c == '_' || c == '.';
    });
}

std::string content_digest(const std::string& data)
{
    unsigned char md[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(data.data()), data.size(), md);
    return to_hex(md, sizeof(md)).substr(0, FILENAME_DIGEST_LEN);
}

std::string image_filename(const std::string& format, const std::string& data)
{
    // QR payloads are arbitrary text (URLs, vCards...), never put them in a header
    const std::string stem = (format != "qrcode" && filename_safe(data)) ? data : content_digest(data);
    return format + "_" + stem + ".png";
}

std::string base64_encode(const std::vector<uchar>& bytes)
{
    std::string out(4 * ((bytes.size() + 2) / 3) + 1, '\0');
    size_t n = mg_base64_encode(bytes.data(), bytes.size(), &out[0], out.size());
    out.resize(n);
    return out;
}

void format_inline(encoded_image&& image, const std::string& format, const std::string& data,
    const std::string& message, json& res)
{
    encoded_image img(std::move(image));
    res["success"] = true;
    res["format"] = format;
    res["data"] = data;
    res["image_base64"] = base64_encode(img.png);
    res["message"] = message;
}

void format_file(encoded_image&& image, const std::string& format, const std::string& data, json& res)
{
    encoded_image img(std::move(image));
    json file = json::object();
    file["content_type"] = "image/png";
    file["filename"] = image_filename(format, data);
    file["body"] = json::binary(std::move(img.png));
    res["file"] = std::move(file);
}

void format_scan(const scan_report& report, json& res)
{
    json results = json::array();
    for (const auto& r : report.results) {
        json polygon = json::array();
        int left = 0, top = 0, right = 0, bottom = 0;
        for (size_t i = 0; i < r.polygon.size(); ++i) {
            const scan_point& p = r.polygon[i];
            polygon.push_back({ p.x, p.y });
            left = (i == 0) ? p.x : std::min(left, p.x);
            top = (i == 0) ? p.y : std::min(top, p.y);
            right = (i == 0) ? p.x : std::max(right, p.x);
            bottom = (i == 0) ? p.y : std::max(bottom, p.y);
        }

        json item = json::object();
        item["data"] = r.text;
        item["type"] = r.type;
        item["quality"] = r.quality ? json(*r.quality) : json(nullptr);
        item["polygon"] = std::move(polygon);
        item["rect"] = { { "left", left }, { "top", top }, { "width", right - left }, { "height", bottom - top } };
        results.push_back(std::move(item));
    }

    res["success"] = true;
    res["codes_found"] = report.count();
    res["results"] = std::move(results);
    res["message"] = report.count() == 0
        ? "No barcodes or QR codes found in image"
        : "Found " + std::to_string(report.count()) + " code(s) in image";
}

void format_error(const status_t& st, json& res)
{
    res = json::object();
    res["success"] = false;
    res["error"] = status_name(st.code);
    // internal details stay in the log
    res["detail"] = (st.code == STATUS_INTERNAL_ERROR) ? std::string("internal server error") : st.msg;
}
