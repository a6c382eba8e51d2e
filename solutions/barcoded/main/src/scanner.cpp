#include <algorithm>
#include <cctype>

#include <ZXing/ReadBarcode.h>
#include <nlohmann/json.hpp>
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

#include "logger.hpp"
#include "scanner.h"

scanner::scanner()
{
    _options.setFormats(ZXing::BarcodeFormat::Any);
    _options.setTryHarder(true);
    _options.setTryRotate(true);
    _options.setTextMode(ZXing::TextMode::Plain);
}

// nlohmann's serializer rejects overlong forms, surrogates and code
// points above U+10FFFF while dumping a string.
bool scanner::is_utf8(const std::string& bytes)
{
    try {
        nlohmann::json(bytes).dump();
    } catch (const nlohmann::json::type_error& e) {
        LOGV("%s", e.what());
        return false;
    }
    return true;
}

bool scanner::is_image_type(const std::string& content_type)
{
    std::string t = content_type;
    t.erase(0, t.find_first_not_of(" \t"));
    std::transform(t.begin(), t.end(), t.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return t.rfind("image/", 0) == 0;
}

status_t scanner::scan(const std::string& content_type, const char* data, size_t len, scan_report& out) const
{
    if (!is_image_type(content_type))
        return status_t::validation("file must be an image");
    if (data == nullptr || len == 0)
        return status_t::decoding("invalid image format");

    cv::Mat gray;
    try {
        cv::Mat raw(1, static_cast<int>(len), CV_8UC1, const_cast<char*>(data));
        cv::Mat img = cv::imdecode(raw, cv::IMREAD_COLOR);
        if (img.empty())
            return status_t::decoding("invalid image format");
        cv::cvtColor(img, gray, cv::COLOR_BGR2GRAY);
    } catch (const cv::Exception& e) {
        LOGD("cv::imdecode: %s", e.what());
        return status_t::decoding("invalid image format");
    }

    ZXing::Barcodes barcodes;
    try {
        ZXing::ImageView view(gray.data, gray.cols, gray.rows, ZXing::ImageFormat::Lum, static_cast<int>(gray.step));
        barcodes = ZXing::ReadBarcodes(view, _options);
    } catch (const std::exception& e) {
        LOGE("ZXing::ReadBarcodes: %s", e.what());
        return status_t::decoding(std::string("failed to scan image: ") + e.what());
    }

    out.results.clear();
    for (const auto& barcode : barcodes) {
        if (barcode.error())
            return status_t::decoding("failed to decode symbol: " + barcode.error().msg());

        // raw payload, not ZXing's charset-guessed transcoding
        const ZXing::ByteArray& bytes = barcode.bytes();
        std::string text(bytes.begin(), bytes.end());
        if (!is_utf8(text))
            return status_t::decoding("symbol payload is not valid UTF-8");

        scan_result r;
        r.text = std::move(text);
        r.type = ZXing::ToString(barcode.format());
        if (barcode.lineCount() > 0)
            r.quality = barcode.lineCount();
        for (const auto& p : barcode.position()) {
            r.polygon.push_back({ p.x, p.y });
        }
        out.results.emplace_back(std::move(r));
    }

    LOGV("%dx%d image, codes found: %zu", gray.cols, gray.rows, out.count());
    return status_t::success();
}
