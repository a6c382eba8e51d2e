#ifndef SCANNER_H
#define SCANNER_H

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include <ZXing/ReaderOptions.h>

#include "status.h"

struct scan_point {
    int x;
    int y;
};

struct scan_result {
    std::string text;
    std::string type;
    std::optional<int> quality; // agreeing scan lines, linear symbologies only
    std::vector<scan_point> polygon;
};

struct scan_report {
    std::vector<scan_result> results; // detector order

    size_t count() const { return results.size(); }
};

class scanner {
public:
    scanner();

    // `content_type` is the type declared by the client for the upload.
    status_t scan(const std::string& content_type, const char* data, size_t len, scan_report& out) const;

    static bool is_image_type(const std::string& content_type);
    static bool is_utf8(const std::string& bytes);

private:
    ZXing::ReaderOptions _options;
};

#endif // SCANNER_H
