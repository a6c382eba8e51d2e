#include <algorithm>
#include <cerrno>
#include <cmath>
#include <cstdint>
#include <cstring>
#include <memory>

#include <ZXing/BitMatrix.h>
#include <ZXing/MultiFormatWriter.h>
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>
#include <qrencode.h>

#include "encoder.h"
#include "logger.hpp"

static const int TEXT_FONT = cv::FONT_HERSHEY_SIMPLEX;

static cv::Scalar to_scalar(const color_t& c)
{
    return cv::Scalar(c.b, c.g, c.r);
}

static std::string encode_failure(const std::string& data, const std::string& format, const std::string& reason)
{
    return "invalid data '" + data + "' for format '" + format + "': " + reason;
}

static bool too_large(double width, double height)
{
    return !(width * height <= static_cast<double>(MAX_RASTER_PIXELS));
}

encoder::encoder(const format_registry& registry, int dpi)
    : _registry(registry)
    , _dpi(dpi)
{
    LOGV("dpi: %d", _dpi);
}

double encoder::mm_to_px(double mm) const
{
    return std::round(mm * _dpi / 25.4);
}

int encoder::pt_to_px(int pt) const
{
    return static_cast<int>(std::lround(pt * _dpi / 72.0));
}

status_t encoder::encode(const generation_request& req, encoded_image& out) const
{
    const format_info* info = _registry.lookup(req.format);
    if (info == nullptr)
        return status_t::validation("unsupported format");

    if (info->kind == ENCODER_QRCODE) {
        qr_request qr;
        qr.data = req.data;
        qr.fill = req.style.foreground;
        qr.back = req.style.background;
        qr.return_format = req.return_format;
        return encode(qr, out);
    }

    cv::Mat img;
    status_t st = render_linear(*info, req, img);
    if (!st.ok())
        return st;
    return to_png(img, out);
}

status_t encoder::encode(const qr_request& req, encoded_image& out) const
{
    cv::Mat img;
    status_t st = render_qrcode(req, img);
    if (!st.ok())
        return st;
    return to_png(img, out);
}

status_t encoder::render_linear(const format_info& info, const generation_request& req, cv::Mat& img) const
{
    std::string payload;
    status_t st = info.payload(req.data, payload);
    if (!st.ok()) {
        LOGD("%s rejected '%s': %s", info.id.c_str(), req.data.c_str(), st.msg.c_str());
        return status_t::encoding(encode_failure(req.data, req.format, st.msg));
    }

    // one pixel per module, no margin: scaling and quiet zone are drawn here
    ZXing::BitMatrix bars;
    try {
        ZXing::MultiFormatWriter writer(info.symbology);
        writer.setMargin(0);
        bars = writer.encode(info.encoded_text(payload), 0, 1);
    } catch (const std::exception& e) {
        LOGD("%s rejected '%s': %s", info.id.c_str(), req.data.c_str(), e.what());
        return status_t::encoding(encode_failure(req.data, req.format, e.what()));
    }
    if (bars.width() <= 0 || bars.height() <= 0)
        return status_t::encoding(encode_failure(req.data, req.format, "no modules produced"));

    const barcode_style& style = req.style;
    const double module_d = std::max(1.0, mm_to_px(style.module_width));
    const double bar_d = std::max(1.0, mm_to_px(style.module_height));
    const double quiet_d = mm_to_px(style.quiet_zone);
    const double gap_d = mm_to_px(style.text_distance);
    if (too_large(bars.width() * module_d + 2 * quiet_d, bar_d + gap_d + quiet_d))
        return status_t::encoding("requested image is too large");

    const int module_px = static_cast<int>(module_d);
    const int bar_h = static_cast<int>(bar_d);
    const int quiet = static_cast<int>(quiet_d);
    const int gap = static_cast<int>(gap_d);
    const int vmargin = quiet / 2;

    const std::string text = info.display_text(payload);
    const int font_px = std::max(1, pt_to_px(style.font_size));
    const int thickness = std::max(1, font_px / 10);

    try {
        int baseline = 0;
        cv::Size unit = cv::getTextSize(text, TEXT_FONT, 1.0, thickness, &baseline);
        const double scale = (unit.height > 0) ? static_cast<double>(font_px) / unit.height : 1.0;
        cv::Size text_size = cv::getTextSize(text, TEXT_FONT, scale, thickness, &baseline);

        const int bars_w = bars.width() * module_px;
        const int width = std::max(bars_w, text_size.width) + 2 * quiet;
        const int height = vmargin + bar_h + gap + text_size.height + baseline + vmargin;
        if (too_large(width, height))
            return status_t::encoding("requested image is too large");

        const cv::Scalar fg = to_scalar(style.foreground);
        img = cv::Mat(height, width, CV_8UC3, to_scalar(style.background));

        const int x0 = (width - bars_w) / 2;
        for (int x = 0; x < bars.width(); ++x) {
            if (bars.get(x, 0)) {
                cv::rectangle(img, cv::Rect(x0 + x * module_px, vmargin, module_px, bar_h), fg, cv::FILLED);
            }
        }

        cv::putText(img, text,
            cv::Point((width - text_size.width) / 2, vmargin + bar_h + gap + text_size.height),
            TEXT_FONT, scale, fg, thickness, cv::LINE_AA);
    } catch (const cv::Exception& e) {
        LOGE("render %s: %s", info.id.c_str(), e.what());
        return status_t::internal(e.what());
    }

    return status_t::success();
}

status_t encoder::render_qrcode(const qr_request& req, cv::Mat& img) const
{
    QRecLevel level = QR_ECLEVEL_M;
    switch (req.error_correction) {
    case 'L':
        level = QR_ECLEVEL_L;
        break;
    case 'Q':
        level = QR_ECLEVEL_Q;
        break;
    case 'H':
        level = QR_ECLEVEL_H;
        break;
    default:
        break;
    }

    // version is a lower bound, libqrencode grows it until the data fits
    // 8-bit mode over the raw bytes, embedded NULs included
    errno = 0;
    std::unique_ptr<QRcode, decltype(&QRcode_free)> code(
        QRcode_encodeData(static_cast<int>(req.data.size()),
            reinterpret_cast<const unsigned char*>(req.data.data()), req.version, level),
        QRcode_free);
    if (!code) {
        std::string reason = (errno == ERANGE) ? "data too large for a QR code"
            : (errno != 0)                     ? std::strerror(errno)
                                               : "QR encoding failed";
        LOGD("QRcode_encodeData failed: %s", reason.c_str());
        return status_t::encoding(encode_failure(req.data, "qrcode", reason));
    }

    const int box = req.box_size;
    const int size = (code->width + 2 * req.border) * box;
    if (too_large(size, size))
        return status_t::encoding("requested image is too large");

    try {
        const cv::Scalar fill = to_scalar(req.fill);
        img = cv::Mat(size, size, CV_8UC3, to_scalar(req.back));

        const unsigned char* p = code->data;
        for (int y = 0; y < code->width; y++) {
            for (int x = 0; x < code->width; x++) {
                if (*p & 1) {
                    cv::rectangle(img, cv::Rect((x + req.border) * box, (y + req.border) * box, box, box),
                        fill, cv::FILLED);
                }
                ++p;
            }
        }
    } catch (const cv::Exception& e) {
        LOGE("render qrcode: %s", e.what());
        return status_t::internal(e.what());
    }

    return status_t::success();
}

status_t encoder::to_png(const cv::Mat& img, encoded_image& out)
{
    try {
        std::vector<uchar> buf;
        if (!cv::imencode(".png", img, buf)) {
            LOGE("cv::imencode failed");
            return status_t::internal("PNG encoding failed");
        }
        out.png = std::move(buf);
    } catch (const cv::Exception& e) {
        LOGE("cv::imencode: %s", e.what());
        return status_t::internal(e.what());
    }
    return status_t::success();
}
