#include "api_scan.h"

// Accepts multipart/form-data under any field name, or the raw image as
// the request body. The first part carrying a filename wins.
api_status_t api_scan::scan_image(request_t req, response_t res)
{
    auto parts = get_multiparts(req, "image");
    if (parts.empty()) {
        return reply_error(res, status_t::validation("no file uploaded"));
    }

    const multipart_t* file = &parts.front();
    for (const auto& part : parts) {
        if (!part.filename.empty()) {
            file = &part;
            break;
        }
    }
    LOGD("scan: field '%s' file '%s' type '%s' %zu bytes", file->name.c_str(),
        file->filename.c_str(), file->content_type.c_str(), file->len);

    scan_report report;
    status_t st = _scanner.scan(file->content_type, file->data, file->len, report);
    if (!st.ok()) {
        return reply_error(res, st);
    }

    LOGI("scan: %zu code(s) found", report.count());
    format_scan(report, res);
    return API_STATUS_OK;
}
