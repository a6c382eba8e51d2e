#ifndef API_BARCODE_H
#define API_BARCODE_H

#include "api_base.h"
#include "encoder.h"
#include "format_registry.h"
#include "request.h"

class api_barcode : public api_base {
private:
    const format_registry& _registry;
    const encoder& _encoder;

    api_status_t generate(request_t req, response_t res);
    api_status_t generate_image(request_t req, response_t res);
    api_status_t quick(request_t req, response_t res);
    api_status_t create_barcode(request_t req, response_t res);

    status_t parse(request_t req, generation_request& out) const;
    api_status_t reply(const generation_request& req, return_format_t format, response_t res);

public:
    api_barcode(const format_registry& registry, const encoder& enc)
        : api_base("barcode")
        , _registry(registry)
        , _encoder(enc)
    {
        REG_POST("/generate", generate);
        REG_POST("/generate/image", generate_image);
        REG_GET("/generate/quick", quick);
        REG_POST("/create-barcode", create_barcode);
    }

    ~api_barcode()
    {
        LOGV("");
    }
};

#endif // API_BARCODE_H
