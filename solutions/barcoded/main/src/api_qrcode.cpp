#include "api_qrcode.h"

api_status_t api_qrcode::create_qr_code(request_t req, response_t res)
{
    json body;
    qr_request r;
    status_t st = parse_body(req, body);
    if (st.ok()) {
        st = parse_qr_request(body, r);
    }
    if (!st.ok()) {
        return reply_error(res, st);
    }

    encoded_image image;
    st = _encoder.encode(r, image);
    if (!st.ok()) {
        return reply_error(res, st);
    }

    LOGI("qrcode v%d-%c: %zu bytes png", r.version, r.error_correction, image.size());
    if (r.return_format == RETURN_FILE) {
        format_file(std::move(image), "qrcode", r.data, res);
        return API_STATUS_REPLY_FILE;
    }
    format_inline(std::move(image), "qrcode", r.data, "QR code generated successfully", res);
    return API_STATUS_OK;
}
