#ifndef RESPONSE_H
#define RESPONSE_H

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "encoder.h"
#include "scanner.h"
#include "status.h"

using json = nlohmann::json;

// Shapes an encoded image into the reply document.
//   inline: { success, format, data, image_base64, message }
//   file:   { file: { content_type, filename, body <binary> } }
// The image is consumed by either call.
void format_inline(encoded_image&& image, const std::string& format, const std::string& data,
    const std::string& message, json& res);
void format_file(encoded_image&& image, const std::string& format, const std::string& data, json& res);

void format_scan(const scan_report& report, json& res);
void format_error(const status_t& st, json& res);

std::string image_filename(const std::string& format, const std::string& data);
std::string content_digest(const std::string& data);
std::string base64_encode(const std::vector<uchar>& bytes);

#endif // RESPONSE_H
