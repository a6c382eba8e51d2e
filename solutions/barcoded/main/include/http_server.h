#ifndef HTTP_SERVER_H
#define HTTP_SERVER_H

#include <atomic>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "api_base.h"
#include "encoder.h"
#include "format_registry.h"
#include "global_cfg.h"
#include "logger.hpp"
#include "scanner.h"

class http_server {
public:
    http_server(const server_config& cfg, const format_registry& registry);
    ~http_server();

    http_server(const http_server&) = delete;
    http_server& operator=(const http_server&) = delete;

    bool start();
    void stop();

    // Route one request through the endpoint groups. Never throws; the
    // returned value is the HTTP status code for the reply.
    int dispatch(request_t req, response_t res) const;

    static int http_status(api_status_t status);

private:
    const server_config _cfg;
    const encoder _encoder;
    const scanner _scanner;

    mg_mgr mgr;
    mg_connection* http_conn = nullptr;

    std::atomic<bool> running { false };
    std::thread worker;
    std::vector<std::unique_ptr<api_base>> _apis;

    static void event_handler(mg_connection* c, int ev, void* ev_data);
    static void reply_json(mg_connection* c, int code, const json& res);
    static void reply_file(mg_connection* c, const json& res);
};

#endif // HTTP_SERVER_H
