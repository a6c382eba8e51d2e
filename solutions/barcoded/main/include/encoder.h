#ifndef ENCODER_H
#define ENCODER_H

#include <string>
#include <vector>

#include <opencv2/core.hpp>

#include "format_registry.h"
#include "global_cfg.h"
#include "request.h"
#include "status.h"

// PNG bytes of one rendered symbol. Move-only: it is handed to the
// response formatter once and dropped with the request.
struct encoded_image {
    std::vector<uchar> png;

    encoded_image() = default;
    encoded_image(encoded_image&&) = default;
    encoded_image& operator=(encoded_image&&) = default;
    encoded_image(const encoded_image&) = delete;
    encoded_image& operator=(const encoded_image&) = delete;

    bool empty() const { return png.empty(); }
    size_t size() const { return png.size(); }
};

class encoder {
public:
    explicit encoder(const format_registry& registry, int dpi = DEFAULT_DPI);

    status_t encode(const generation_request& req, encoded_image& out) const;
    status_t encode(const qr_request& req, encoded_image& out) const;

    int dpi() const { return _dpi; }

private:
    const format_registry& _registry;
    const int _dpi;

    double mm_to_px(double mm) const;
    int pt_to_px(int pt) const;

    status_t render_linear(const format_info& info, const generation_request& req, cv::Mat& img) const;
    status_t render_qrcode(const qr_request& req, cv::Mat& img) const;

    static status_t to_png(const cv::Mat& img, encoded_image& out);
};

#endif // ENCODER_H
