#include <algorithm>
#include <cctype>

#include "format_registry.h"

using ZXing::BarcodeFormat;

// U+00F1 is the FNC1 escape understood by the ZXing Code128 writer
#define GS1_FNC1 "\xC3\xB1"

static std::vector<format_info> build_table()
{
    return {
        // id, description, kind, symbology, prefix, suffix, label, fixed_length, uppercase
        // [, digit_lengths, check_digit]
        { "code128", "Code 128 - Variable length, alphanumeric",
            ENCODER_LINEAR, BarcodeFormat::Code128, "", "", "", 0, false },
        { "code39", "Code 39 - Variable length, alphanumeric",
            ENCODER_LINEAR, BarcodeFormat::Code39, "", "", "", 0, true },
        { "ean8", "EAN-8 - 8 digits",
            ENCODER_LINEAR, BarcodeFormat::EAN8, "", "", "", 7, false },
        { "ean13", "EAN-13 - 13 digits",
            ENCODER_LINEAR, BarcodeFormat::EAN13, "", "", "", 12, false },
        { "ean14", "EAN-14 - 14 digits",
            ENCODER_LINEAR, BarcodeFormat::Code128, GS1_FNC1 "01", "", "(01) ", 0, false,
            { 13, 14 }, CHECK_DIGIT_GS1 },
        { "jan", "JAN - Japanese Article Number",
            ENCODER_LINEAR, BarcodeFormat::EAN13, "", "", "", 0, false },
        { "upc", "UPC-A - 12 digits",
            ENCODER_LINEAR, BarcodeFormat::UPCA, "", "", "", 11, false },
        { "isbn10", "ISBN-10 - 10 digits",
            ENCODER_LINEAR, BarcodeFormat::EAN13, "978", "", "ISBN ", 9, false },
        { "isbn13", "ISBN-13 - 13 digits",
            ENCODER_LINEAR, BarcodeFormat::EAN13, "", "", "ISBN ", 12, false },
        { "issn", "ISSN - International Standard Serial Number",
            ENCODER_LINEAR, BarcodeFormat::EAN13, "977", "00", "ISSN ", 0, false },
        { "itf", "ITF - Interleaved 2 of 5",
            ENCODER_LINEAR, BarcodeFormat::ITF, "", "", "", 0, false },
        { "pzn", "PZN - Pharmazentralnummer",
            ENCODER_LINEAR, BarcodeFormat::Code39, "-", "", "PZN ", 0, false,
            { 6, 7 }, CHECK_DIGIT_PZN },
        { "qrcode", "QR Code - Variable length, any text",
            ENCODER_QRCODE, BarcodeFormat::None, "", "", "", 0, false },
    };
}

static bool is_digits(const std::string& s)
{
    return !s.empty() && std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isdigit(c); });
}

// -1 when the digits have no valid check digit (PZN remainder 10)
static int compute_check_digit(check_digit_t kind, const std::string& digits)
{
    int sum = 0;
    switch (kind) {
    case CHECK_DIGIT_GS1:
        for (size_t i = 0; i < digits.size(); ++i) {
            int d = digits[digits.size() - 1 - i] - '0';
            sum += (i % 2 == 0) ? 3 * d : d;
        }
        return (10 - sum % 10) % 10;
    case CHECK_DIGIT_PZN:
        for (size_t i = 0; i < digits.size(); ++i) {
            sum += (digits[i] - '0') * static_cast<int>(i + 2);
        }
        return (sum % 11 == 10) ? -1 : sum % 11;
    default:
        return -1;
    }
}

status_t format_info::payload(const std::string& data, std::string& out) const
{
    if (digit_lengths.empty()) {
        out = data;
        return status_t::success();
    }

    if (!is_digits(data)
        || std::find(digit_lengths.begin(), digit_lengths.end(), data.size()) == digit_lengths.end()) {
        std::string lengths;
        for (size_t n : digit_lengths) {
            lengths += (lengths.empty() ? "" : " or ") + std::to_string(n);
        }
        return status_t::encoding(id + " takes " + lengths + " digits");
    }

    if (check_digit == CHECK_DIGIT_NONE) {
        out = data;
        return status_t::success();
    }

    // the longest accepted length already carries the check digit
    const size_t full = *std::max_element(digit_lengths.begin(), digit_lengths.end());
    const std::string body = (data.size() == full) ? data.substr(0, full - 1) : data;
    const int check = compute_check_digit(check_digit, body);
    if (check < 0) {
        return status_t::encoding("no valid check digit exists for " + data);
    }
    if (data.size() == full && data.back() - '0' != check) {
        return status_t::encoding("wrong check digit, expected " + std::to_string(check));
    }
    out = body + static_cast<char>('0' + check);
    return status_t::success();
}

std::string format_info::encoded_text(const std::string& payload) const
{
    std::string body = payload;
    if (uppercase) {
        std::transform(body.begin(), body.end(), body.begin(),
            [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    }
    return prefix + body + suffix;
}

std::string format_info::display_text(const std::string& payload) const
{
    return label + payload;
}

format_registry::format_registry()
    : _formats(build_table())
{
    for (const auto& f : _formats) {
        _index.emplace(f.id, &f);
    }
}

const format_info* format_registry::lookup(const std::string& id) const
{
    auto it = _index.find(id);
    return (it == _index.end()) ? nullptr : it->second;
}

std::vector<std::string> format_registry::ids() const
{
    std::vector<std::string> ids;
    ids.reserve(_formats.size());
    for (const auto& f : _formats) {
        ids.emplace_back(f.id);
    }
    return ids;
}
