#ifndef FORMAT_REGISTRY_H
#define FORMAT_REGISTRY_H

#include <cstddef>
#include <string>
#include <unordered_map>
#include <vector>

#include <ZXing/BarcodeFormat.h>

#include "status.h"

typedef enum {
    ENCODER_LINEAR = 0,
    ENCODER_QRCODE,
} encoder_kind_t;

typedef enum {
    CHECK_DIGIT_NONE = 0, // left to the symbology writer
    CHECK_DIGIT_GS1, // mod 10, weights 3,1 from the right (GTIN)
    CHECK_DIGIT_PZN, // mod 11, weights 2..7 (PZN7)
} check_digit_t;

struct format_info {
    std::string id;
    std::string description;
    encoder_kind_t kind;
    ZXing::BarcodeFormat symbology; // None for QR
    std::string prefix; // prepended to the data before encoding
    std::string suffix; // appended to the data before encoding
    std::string label; // human readable prefix printed under the bars
    size_t fixed_length; // 0: no length pre-check
    bool uppercase;
    // Digits only, with one of these lengths. Without the check digit the
    // payload gets it appended, with it the digit is verified.
    std::vector<size_t> digit_lengths = {};
    check_digit_t check_digit = CHECK_DIGIT_NONE;

    // Shape check for symbologies mapped onto a more permissive writer.
    status_t payload(const std::string& data, std::string& out) const;
    std::string encoded_text(const std::string& payload) const;
    std::string display_text(const std::string& payload) const;
};

// Immutable table of the supported symbologies. Built once at start-up and
// shared by const reference, so lookups need no locking.
class format_registry {
public:
    format_registry();

    format_registry(const format_registry&) = delete;
    format_registry& operator=(const format_registry&) = delete;

    const format_info* lookup(const std::string& id) const;
    bool contains(const std::string& id) const { return lookup(id) != nullptr; }

    const std::vector<format_info>& formats() const { return _formats; }
    std::vector<std::string> ids() const;

private:
    const std::vector<format_info> _formats;
    std::unordered_map<std::string, const format_info*> _index;
};

#endif // FORMAT_REGISTRY_H
