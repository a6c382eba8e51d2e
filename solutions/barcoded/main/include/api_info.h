#ifndef API_INFO_H
#define API_INFO_H

#include "api_base.h"
#include "format_registry.h"

class api_info : public api_base {
private:
    const format_registry& _registry;

    api_status_t root(request_t req, response_t res);
    api_status_t health(request_t req, response_t res);
    api_status_t formats(request_t req, response_t res);

public:
    explicit api_info(const format_registry& registry)
        : api_base("info")
        , _registry(registry)
    {
        REG_GET("/", root);
        REG_GET("/health", health);
        REG_GET("/formats", formats);
        REG_GET("/supported-formats", formats);
    }

    ~api_info()
    {
        LOGV("");
    }
};

#endif // API_INFO_H
