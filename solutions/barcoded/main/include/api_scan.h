#ifndef API_SCAN_H
#define API_SCAN_H

#include "api_base.h"
#include "scanner.h"

class api_scan : public api_base {
private:
    const scanner& _scanner;

    api_status_t scan_image(request_t req, response_t res);

public:
    explicit api_scan(const scanner& scn)
        : api_base("scan")
        , _scanner(scn)
    {
        REG_POST("/scan-image", scan_image);
    }

    ~api_scan()
    {
        LOGV("");
    }
};

#endif // API_SCAN_H
