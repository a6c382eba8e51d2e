#ifndef API_BASE_H
#define API_BASE_H

#include <functional>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

#include "http_interface.h"
#include "logger.hpp"
#include "response.h"
#include "status.h"

typedef std::function<api_status_t(request_t req, response_t res)> api_handler_t;

class rest_api {
public:
    rest_api(const std::string& method, const api_handler_t& handler)
        : _method(method)
        , _handler(handler)
    {
    }
    ~rest_api() = default;

    api_status_t operator()(request_t req, response_t res) const { return _handler(req, res); }

    inline const std::string& method() const { return _method; }

private:
    const std::string _method;
    const api_handler_t _handler;
};

#define REG_API(__method, __uri, __handler) \
    register_api(__method, __uri, [this](request_t req, response_t res) { return __handler(req, res); })
#define REG_GET(__uri, __handler) REG_API("GET", __uri, __handler)
#define REG_POST(__uri, __handler) REG_API("POST", __uri, __handler)

// A group of endpoints. Each group owns its routes; the server asks every
// group in turn until one of them claims the request.
class api_base : public http_interface {
public:
    api_base(std::string group = "")
        : _group(group)
    {
    }
    virtual ~api_base() = default;

    void register_api(const std::string& method, const std::string& uri, api_handler_t handler)
    {
        LOGV("%s: %s %s", _group.c_str(), method.c_str(), uri.c_str());
        _api_map[uri].emplace_back(std::make_unique<rest_api>(method, handler));
    }

    api_status_t api_handler(request_t req, response_t res) const
    {
        auto api = _api_map.find(get_uri(req));
        if (api == _api_map.end()) {
            return API_STATUS_NEXT;
        }

        std::string method = get_method(req);
        for (const auto& route : api->second) {
            if (route->method() == method) {
                return (*route)(req, res);
            }
        }

        status_t st = status_t::validation("method " + method + " not allowed");
        format_error(st, res);
        res["error"] = "MethodNotAllowed";
        return API_STATUS_METHOD_NOT_ALLOWED;
    }

    const std::string& group() const { return _group; }

protected:
    // Map a failed status onto the reply; internal details are logged only.
    static api_status_t reply_error(response_t res, const status_t& st)
    {
        format_error(st, res);
        if (st.code == STATUS_INTERNAL_ERROR) {
            LOGE("internal error: %s", st.msg.c_str());
            return API_STATUS_ERROR;
        }
        LOGD("%s: %s", status_name(st.code), st.msg.c_str());
        return API_STATUS_BAD_REQUEST;
    }

private:
    const std::string _group;
    std::unordered_map<std::string, std::vector<std::unique_ptr<rest_api>>> _api_map;
};

#endif // API_BASE_H
