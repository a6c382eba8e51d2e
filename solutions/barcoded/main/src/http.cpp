#include <signal.h>
#include <pthread.h>

#include "api_barcode.h"
#include "api_info.h"
#include "api_qrcode.h"
#include "api_scan.h"
#include "http_server.h"

#define CORS_HEADERS                                         \
    "Access-Control-Allow-Origin: *\r\n"                     \
    "Access-Control-Allow-Methods: GET, POST, OPTIONS\r\n"   \
    "Access-Control-Allow-Headers: Authorization, Content-Type\r\n"

http_server::http_server(const server_config& cfg, const format_registry& registry)
    : _cfg(cfg)
    , _encoder(registry, cfg.dpi)
{
    _apis.emplace_back(std::make_unique<api_info>(registry));
    _apis.emplace_back(std::make_unique<api_barcode>(registry, _encoder));
    _apis.emplace_back(std::make_unique<api_qrcode>(_encoder));
    _apis.emplace_back(std::make_unique<api_scan>(_scanner));
    mg_mgr_init(&mgr);
}

http_server::~http_server()
{
    stop();
    mg_mgr_free(&mgr);
}

bool http_server::start()
{
    std::string url = "http://" + _cfg.listen_addr + ":" + _cfg.http_port;
    http_conn = mg_http_listen(&mgr, url.c_str(), event_handler, this);
    if (!http_conn) {
        LOGE("Failed to listen on %s", url.c_str());
        return false;
    }
    LOGI("HTTP server started on %s (%d dpi)", url.c_str(), _encoder.dpi());

    running = true;
    worker = std::thread([this]() {
        signal(SIGUSR1, [](int sig) {
        });
        while (running)
            mg_mgr_poll(&mgr, 100);
        LOGV("poll_loop exit");
    });

    return true;
}

void http_server::stop()
{
    if (running) {
        running = false;
        pthread_kill(worker.native_handle(), SIGUSR1);
        if (worker.joinable()) {
            worker.join();
        }
        LOGI("Server stopped");
    }
}

int http_server::http_status(api_status_t status)
{
    switch (status) {
    case API_STATUS_OK:
    case API_STATUS_REPLY_FILE:
        return 200;
    case API_STATUS_BAD_REQUEST:
        return 400;
    case API_STATUS_NOT_FOUND:
    case API_STATUS_NEXT:
        return 404;
    case API_STATUS_METHOD_NOT_ALLOWED:
        return 405;
    default:
        return 500;
    }
}

int http_server::dispatch(request_t req, response_t res) const
{
    api_status_t status = API_STATUS_NEXT;
    try {
        for (const auto& api : _apis) {
            status = api->api_handler(req, res);
            if (status != API_STATUS_NEXT)
                break;
        }
    } catch (const std::exception& e) {
        LOGE("%s %s: %s", http_interface::get_method(req).c_str(),
            http_interface::get_uri(req).c_str(), e.what());
        res = json::object();
        format_error(status_t::internal(e.what()), res);
        status = API_STATUS_ERROR;
    }

    if (status == API_STATUS_NEXT) {
        res = json::object();
        res["success"] = false;
        res["error"] = "NotFound";
        res["detail"] = "endpoint not found";
        status = API_STATUS_NOT_FOUND;
    }
    return http_status(status);
}

void http_server::reply_json(mg_connection* c, int code, const json& res)
{
    std::string body = res.dump(-1, ' ', false, json::error_handler_t::replace);
    mg_http_reply(c, code, "Content-Type: application/json\r\n" CORS_HEADERS, "%s", body.c_str());
}

void http_server::reply_file(mg_connection* c, const json& res)
{
    const json& file = res.at("file");
    const auto& body = file.at("body").get_binary();
    std::string type = file.at("content_type").get<std::string>();
    std::string name = file.at("filename").get<std::string>();

    mg_printf(c,
        "HTTP/1.1 200 OK\r\n"
        "Content-Type: %s\r\n"
        "Content-Disposition: attachment; filename=%s\r\n"
        "Content-Length: %lu\r\n" CORS_HEADERS "\r\n",
        type.c_str(), name.c_str(), (unsigned long)body.size());
    mg_send(c, body.data(), body.size());
}

void http_server::event_handler(mg_connection* c, int ev, void* ev_data)
{
    if (ev != MG_EV_HTTP_MSG)
        return;

    http_server* server = static_cast<http_server*>(c->fn_data);
    mg_http_message* hm = (mg_http_message*)ev_data;
    std::string method = http_interface::get_method(hm);
    std::string uri = http_interface::get_uri(hm);

    LOGV("---> %s %s ?%.*s", method.c_str(), uri.c_str(), (int)hm->query.len, hm->query.buf);

    if (method == "OPTIONS") {
        mg_http_reply(c, 204, CORS_HEADERS, "");
        return;
    }

    json res;
    int code = server->dispatch(hm, res);
    LOGD("<--- %s %s %d", method.c_str(), uri.c_str(), code);

    if (code == 200 && res.contains("file")) {
        reply_file(c, res);
        return;
    }
    reply_json(c, code, res);
}
