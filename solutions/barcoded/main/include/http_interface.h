#ifndef _HTTP_INTERFACE_H_
#define _HTTP_INTERFACE_H_

#include <algorithm>
#include <cctype>
#include <string>
#include <string_view>
#include <vector>

#include <mongoose.h>
#include <nlohmann/json.hpp>

#include "logger.hpp"
#include "status.h"

using json = nlohmann::json;

typedef enum {
    API_STATUS_OK = 0,
    API_STATUS_NEXT,
    API_STATUS_ERROR,
    API_STATUS_REPLY_FILE,
    API_STATUS_BAD_REQUEST,
    API_STATUS_NOT_FOUND,
    API_STATUS_METHOD_NOT_ALLOWED,
} api_status_t;
typedef const struct mg_http_message* request_t;
typedef json& response_t;

class http_interface {
public:
    http_interface() = default;
    virtual ~http_interface() = default;

    static std::string get_uri(request_t req)
    {
        return std::string(req->uri.buf, req->uri.len);
    }

    static std::string get_method(request_t req)
    {
        return std::string(req->method.buf, req->method.len);
    }

    static std::string get_header_var(request_t req, const char* name)
    {
        mg_str* hdr = mg_http_get_header(const_cast<mg_http_message*>(req), name);
        return (hdr == nullptr) ? "" : std::string(hdr->buf, hdr->len);
    }

    // URL-decoded query parameter, empty when absent
    static std::string get_query_var(request_t req, const std::string& param)
    {
        std::string buf(req->query.len + 1, '\0');
        int n = mg_http_get_var(&req->query, param.c_str(), &buf[0], buf.size());
        if (n <= 0)
            return "";
        buf.resize(n);
        return buf;
    }

    static std::string get_body_raw(request_t req)
    {
        return std::string(req->body.buf, req->body.len);
    }

    static status_t parse_body(request_t req, json& body)
    {
        std::string type = get_header_var(req, "Content-Type");
        if (!type.empty() && type.find("application/json") == std::string::npos) {
            return status_t::validation("Content-Type must be application/json");
        }
        if (req->body.len == 0) {
            return status_t::validation("request body is empty");
        }
        body = json::parse(req->body.buf, req->body.buf + req->body.len, nullptr, false);
        if (body.is_discarded()) {
            LOGD("invalid JSON body: %s", get_body_raw(req).c_str());
            return status_t::validation("request body is not valid JSON");
        }
        return status_t::success();
    }

    typedef struct {
        std::string name;
        std::string filename;
        std::string content_type;
        const char* data;
        size_t len;
    } multipart_t;

    static std::vector<multipart_t> get_multiparts(request_t req, const std::string& param = "")
    {
        std::vector<multipart_t> parts;
        auto&& type = get_header_var(req, "Content-Type");

        if (type.find("multipart/form-data") != std::string::npos) {
            size_t pos = 0;
            struct mg_http_part part;
            while ((pos = mg_http_next_multipart(req->body, pos, &part)) > 0) {
                multipart_t mp;
                mp.name = std::string(part.name.buf, part.name.len);
                mp.filename = std::string(part.filename.buf, part.filename.len);
                mp.content_type = _get_part_type(req, part);
                mp.data = part.body.buf;
                mp.len = part.body.len;
                parts.emplace_back(mp);
            }
        } else {
            if (!param.empty() && req->body.len > 0) {
                multipart_t mp;
                mp.name = param;
                mp.filename = get_query_var(req, "filename");
                mp.content_type = type;
                mp.data = req->body.buf;
                mp.len = req->body.len;
                parts.emplace_back(mp);
            }
        }

        return parts;
    }

private:
    // mg_http_part carries no headers; look back from the part body to the
    // boundary line and pick the part's own Content-Type.
    static std::string _get_part_type(request_t req, const struct mg_http_part& part)
    {
        if (part.body.buf == nullptr || part.body.buf < req->body.buf)
            return "";
        std::string_view head(req->body.buf, part.body.buf - req->body.buf);
        size_t start = head.rfind("\n--");
        if (start != std::string_view::npos)
            head.remove_prefix(start + 1);

        static const std::string_view key = "content-type:";
        size_t line = 0;
        while (line < head.size()) {
            size_t eol = head.find('\n', line);
            std::string_view l = head.substr(line, (eol == std::string_view::npos) ? std::string_view::npos : eol - line);
            if (l.size() > key.size()
                && std::equal(key.begin(), key.end(), l.begin(),
                    [](char a, char b) { return a == std::tolower(static_cast<unsigned char>(b)); })) {
                std::string value(l.substr(key.size()));
                value.erase(0, value.find_first_not_of(" \t"));
                value.erase(value.find_last_not_of(" \t\r") + 1);
                return value;
            }
            if (eol == std::string_view::npos)
                break;
            line = eol + 1;
        }
        return "";
    }
};

#endif // _HTTP_INTERFACE_H_
