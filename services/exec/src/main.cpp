#include <chrono>
#include <csignal>
#include <iostream>
#include <map>
#include <memory>
#include <string>
#include <thread>
#include <vector>
#include <curl/curl.h>
#include <microhttpd.h>
#include "api.hpp"
#include "config.hpp"
#include "exec_context.hpp"

#if MHD_VERSION >= 0x00097002
using MhdResult = enum MHD_Result;
#else
using MhdResult = int;
#endif

static volatile std::sig_atomic_t g_stop = 0;

struct ConnInfo {
    std::string method;
    std::string url;
    std::string body;
    std::chrono::steady_clock::time_point started;
};

static MhdResult send_response(struct MHD_Connection* conn, int status, const std::string& body,
                               const char* ctype = "application/json") {
    struct MHD_Response* resp = MHD_create_response_from_buffer(body.size(), (void*)body.data(), MHD_RESPMEM_MUST_COPY);
    if (!resp) return MHD_NO;
    MHD_add_response_header(resp, MHD_HTTP_HEADER_CONTENT_TYPE, ctype);
    MHD_add_response_header(resp, "Access-Control-Allow-Origin", "*");
    MhdResult ret = MHD_queue_response(conn, status, resp);
    MHD_destroy_response(resp);
    return ret;
}

static MhdResult collect_arg(void* cls, enum MHD_ValueKind, const char* key, const char* val) {
    auto* m = static_cast<std::map<std::string, std::string>*>(cls);
    (*m)[key ? key : ""] = val ? val : "";
    return MHD_YES;
}

static std::map<std::string, std::string> parse_query(struct MHD_Connection* conn) {
    std::map<std::string, std::string> out;
    MHD_get_connection_values(conn, MHD_GET_ARGUMENT_KIND, &collect_arg, &out);
    return out;
}

static MhdResult handler(void* cls, struct MHD_Connection* connection, const char* url, const char* method,
                         const char* /*version*/, const char* upload_data, size_t* upload_data_size,
                         void** con_cls) {
    auto* ctx = static_cast<ExecContext*>(cls);
    ConnInfo* ci = static_cast<ConnInfo*>(*con_cls);
    if (!ci) {
        ci = new ConnInfo{method, url, {}, std::chrono::steady_clock::now()};
        *con_cls = ci;
        return MHD_YES;
    }

    if (*upload_data_size) {
        ci->body.append(upload_data, *upload_data_size);
        *upload_data_size = 0;
        return MHD_YES;
    }

    if (ci->method == "OPTIONS") return send_response(connection, MHD_HTTP_NO_CONTENT, "", "text/plain");

    ApiRequest req{ci->method, ci->url, parse_query(connection), ci->body};
    ApiResponse resp = handle_request(*ctx, req);

    auto elapsed = std::chrono::steady_clock::now() - ci->started;
    RequestEntry entry;
    entry.endpoint = ci->url;
    entry.route = resp.route;
    entry.method = ci->method;
    entry.worker = resp.worker;
    entry.duration_ms = static_cast<long>(std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count());
    entry.success = resp.status < 400;
    entry.timestamp = std::chrono::system_clock::now();
    ctx->requests.add(std::move(entry));

    return send_response(connection, resp.status, resp.body.dump());
}

static void request_completed(void* /*cls*/, struct MHD_Connection* /*connection*/, void** con_cls,
                              enum MHD_RequestTerminationCode /*toe*/) {
    delete static_cast<ConnInfo*>(*con_cls);
    *con_cls = nullptr;
}

int main(int argc, char** argv) {
    ExecConfig cfg = load_config_from_env();
    std::vector<std::string> args(argv + 1, argv + argc);
    if (!args.empty() && (args[0] == "--help" || args[0] == "-h")) {
        std::cout << usage();
        return 0;
    }
    try {
        apply_args(cfg, args);
    } catch (const std::exception& e) {
        std::cerr << "[exec] " << e.what() << "\n" << usage();
        return 2;
    }

    if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
        std::cerr << "[exec] curl_global_init failed" << std::endl;
        return 1;
    }

    int rc = 0;
    {
        ExecContext ctx(cfg, std::make_unique<CurlWorkerTransport>());
        ctx.registry.load_file(cfg.hub_config);

        std::cout << "[exec] Starting HTTP server on port " << cfg.port << " (pool " << cfg.max_jobs
                  << ", monitor " << cfg.monitor_ms << "ms)..." << std::endl;
        struct MHD_Daemon* d = MHD_start_daemon(MHD_USE_AUTO | MHD_USE_INTERNAL_POLLING_THREAD | MHD_USE_THREAD_PER_CONNECTION,
                                                static_cast<uint16_t>(cfg.port), nullptr, nullptr,
                                                &handler, &ctx,
                                                MHD_OPTION_NOTIFY_COMPLETED, &request_completed, nullptr,
                                                MHD_OPTION_END);
        if (!d) {
            std::cerr << "[exec] Failed to start HTTP server" << std::endl;
            rc = 1;
        } else {
            std::signal(SIGINT, [](int) { g_stop = 1; });
            std::signal(SIGTERM, [](int) { g_stop = 1; });

            auto last_cleanup = std::chrono::steady_clock::now();
            while (!g_stop) {
                std::this_thread::sleep_for(std::chrono::milliseconds(200));
                if (std::chrono::steady_clock::now() - last_cleanup >= std::chrono::hours(1)) {
                    ctx.jobs.cleanup(std::chrono::hours(cfg.retention_hours));
                    last_cleanup = std::chrono::steady_clock::now();
                }
            }
            std::cout << "[exec] Stopping..." << std::endl;
            MHD_stop_daemon(d);
        }
        ctx.jobs.shutdown();
    }
    curl_global_cleanup();
    return rc;
}
