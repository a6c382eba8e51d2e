#ifndef API_QRCODE_H
#define API_QRCODE_H

#include "api_base.h"
#include "encoder.h"
#include "request.h"

class api_qrcode : public api_base {
private:
    const encoder& _encoder;

    api_status_t create_qr_code(request_t req, response_t res);

public:
    explicit api_qrcode(const encoder& enc)
        : api_base("qrcode")
        , _encoder(enc)
    {
        REG_POST("/create-qr-code", create_qr_code);
    }

    ~api_qrcode()
    {
        LOGV("");
    }
};

#endif // API_QRCODE_H
