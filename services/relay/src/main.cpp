#include <iostream>
#include <string>
#include <memory>
#include <map>
#include <cctype>
#include <csignal>
#include <cstring>
#include <thread>
#include <chrono>
#include <curl/curl.h>
#include <microhttpd.h>
#include "config.hpp"
#include "router.hpp"
#include "session_store.hpp"

#if MHD_VERSION >= 0x00097002
using MhdResult = enum MHD_Result;
#else
using MhdResult = int;
#endif

namespace {
volatile std::sig_atomic_t g_stop = 0;

struct ConnInfo {
    std::string method;
    std::string url;
    std::string body;
};

MhdResult send_response(struct MHD_Connection* conn, const HttpReply& reply) {
    struct MHD_Response* resp = MHD_create_response_from_buffer(reply.body.size(), (void*)reply.body.data(), MHD_RESPMEM_MUST_COPY);
    if (!resp) return MHD_NO;
    MHD_add_response_header(resp, MHD_HTTP_HEADER_CONTENT_TYPE, reply.content_type.c_str());
    for (const auto& h : reply.headers) MHD_add_response_header(resp, h.first.c_str(), h.second.c_str());
    MhdResult ret = MHD_queue_response(conn, reply.status, resp);
    MHD_destroy_response(resp);
    return ret;
}

std::map<std::string, std::string> connection_values(struct MHD_Connection* conn, enum MHD_ValueKind kind, bool lower_keys) {
    struct Ctx { std::map<std::string, std::string> out; bool lower; } ctx{{}, lower_keys};
    MHD_get_connection_values(conn, kind,
        [](void* cls, enum MHD_ValueKind, const char* key, const char* val) -> MhdResult {
            auto* c = static_cast<Ctx*>(cls);
            std::string k = key ? key : "";
            if (c->lower) for (auto& ch : k) ch = (char)std::tolower((unsigned char)ch);
            c->out[k] = val ? val : "";
            return MHD_YES;
        }, &ctx);
    return ctx.out;
}

MhdResult handler(void* cls, struct MHD_Connection* connection, const char* url, const char* method,
                  const char* /*version*/, const char* upload_data, size_t* upload_data_size, void** con_cls) {
    ConnInfo* ci = static_cast<ConnInfo*>(*con_cls);
    if (!ci) {
        ci = new ConnInfo{method, url, {}};
        *con_cls = ci;
        return MHD_YES;
    }

    if (*upload_data_size) {
        ci->body.append(upload_data, *upload_data_size);
        *upload_data_size = 0;
        return MHD_YES;
    }

    auto* router = static_cast<RelayRouter*>(cls);
    HttpRequest req;
    req.method = ci->method;
    req.path = ci->url;
    req.body = std::move(ci->body);
    req.query = connection_values(connection, MHD_GET_ARGUMENT_KIND, false);
    req.headers = connection_values(connection, MHD_HEADER_KIND, true);
    req.cookies = connection_values(connection, MHD_COOKIE_KIND, false);
    return send_response(connection, router->handle(req));
}

void request_completed(void* /*cls*/, struct MHD_Connection* /*connection*/, void** con_cls,
                       enum MHD_RequestTerminationCode /*toe*/) {
    delete static_cast<ConnInfo*>(*con_cls);
    *con_cls = nullptr;
}
}

int main(int argc, char** argv) {
    RelayConfig cfg;
    try {
        cfg = load_relay_config(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "[relay] " << e.what() << std::endl;
        return 2;
    }

    curl_global_init(CURL_GLOBAL_DEFAULT);

    std::unique_ptr<SessionStore> sessions;
    std::chrono::seconds idle(cfg.session_idle_timeout_s);
    try {
        if (cfg.session_db_path.empty()) sessions = std::make_unique<InMemorySessionStore>(idle);
        else sessions = std::make_unique<SqliteSessionStore>(cfg.session_db_path, idle);
    } catch (const std::exception& e) {
        std::cerr << "[relay] " << e.what() << std::endl;
        curl_global_cleanup();
        return 1;
    }

    A2AHttpClientFactory clients(cfg.a2a);
    RelayRouter router(*sessions, clients, push_callback_url(cfg));

    std::cout << "[relay] Starting HTTP server on port " << cfg.port << "...\n"
              << "[relay] Agents at " << cfg.a2a.endpoint << " (api-version " << cfg.a2a.api_version << ")\n"
              << "[relay] Push callbacks to " << push_callback_url(cfg) << "\n"
              << "[relay] Sessions " << (cfg.session_db_path.empty() ? std::string("in memory") : cfg.session_db_path)
              << ", idle timeout " << cfg.session_idle_timeout_s << "s" << std::endl;

    struct MHD_Daemon* d = MHD_start_daemon(
        MHD_USE_AUTO | MHD_USE_INTERNAL_POLLING_THREAD | MHD_USE_THREAD_PER_CONNECTION | MHD_USE_ERROR_LOG,
        (uint16_t)cfg.port, nullptr, nullptr, &handler, &router,
        MHD_OPTION_NOTIFY_COMPLETED, &request_completed, nullptr,
        MHD_OPTION_END);
    if (!d) {
        std::cerr << "[relay] Failed to start HTTP server" << std::endl;
        curl_global_cleanup();
        return 1;
    }

    std::signal(SIGTERM, [](int){ g_stop = 1; });
    std::signal(SIGINT, [](int){ g_stop = 1; });
    auto last_sweep = std::chrono::steady_clock::now();
    while (!g_stop) {
        std::this_thread::sleep_for(std::chrono::milliseconds(500));
        auto now = std::chrono::steady_clock::now();
        if (now - last_sweep < std::chrono::seconds(60)) continue;
        last_sweep = now;
        try {
            std::size_t n = sessions->purge_expired();
            if (n) std::cout << "[relay] Expired " << n << " idle session(s)" << std::endl;
        } catch (const std::exception& e) {
            std::cerr << "[relay] Session sweep failed: " << e.what() << std::endl;
        }
    }

    std::cout << "[relay] Stopping" << std::endl;
    MHD_stop_daemon(d);
    curl_global_cleanup();
    return 0;
}
