#include "router.hpp"
#include "errors.hpp"
#include <nlohmann/json.hpp>
#include <openssl/rand.h>
#include <cstdio>
#include <iostream>
#include <stdexcept>

using json = nlohmann::json;

const char* const kSessionCookie = "relay_session";

namespace {
HttpReply text(int status, const std::string& body) {
    HttpReply r;
    r.status = status;
    r.body = body;
    return r;
}

HttpReply json_reply(int status, const std::string& body) {
    HttpReply r;
    r.status = status;
    r.body = body;
    r.content_type = "application/json";
    return r;
}

std::string lookup(const std::map<std::string, std::string>& m, const std::string& key) {
    auto it = m.find(key);
    return it == m.end() ? std::string() : it->second;
}

// Header, then cookie, then query string. The push provider only keeps the
// query string we registered, browsers only keep the cookie.
std::string session_of(const HttpRequest& req) {
    std::string s = lookup(req.headers, "x-session-id");
    if (s.empty()) s = lookup(req.cookies, kSessionCookie);
    if (s.empty()) s = lookup(req.query, "session");
    return s;
}

// Model binding in the old MVC front-end was case-insensitive on the first letter.
std::string field(const json& j, const char* camel, const char* pascal) {
    if (j.contains(camel) && !j[camel].is_null()) return j[camel].get<std::string>();
    if (j.contains(pascal) && !j[pascal].is_null()) return j[pascal].get<std::string>();
    return {};
}

bool is_route(const std::string& path, const char* route, const char* legacy) {
    return path == route || path == legacy;
}
}

std::string new_session_token() {
    unsigned char bytes[16];
    if (RAND_bytes(bytes, sizeof(bytes)) != 1) throw std::runtime_error("RAND_bytes failed");
    char buf[33];
    for (int i = 0; i < 16; ++i) snprintf(buf + i * 2, 3, "%02x", bytes[i]);
    return std::string(buf, 32);
}

RelayRouter::RelayRouter(SessionStore& sessions, RemoteTaskClientFactory& clients, std::string callback_url)
    : sessions_(sessions), reconciler_(clients, std::move(callback_url)), callbacks_(reconciler_) {}

HttpReply RelayRouter::handle(const HttpRequest& req) {
    try {
        const std::string& p = req.path;
        if (is_route(p, "/task", "/Home/CreateTask")) {
            if (req.method == "POST") return create_task(req);
            return text(405, "Method not allowed.");
        }
        if (is_route(p, "/task-result", "/Home/GetTaskResult")) {
            if (req.method == "GET") return task_result(req);
            return text(405, "Method not allowed.");
        }
        if (is_route(p, "/push-callback", "/Home/PushCallBack")) {
            if (req.method == "GET") return verify_callback(req);
            if (req.method == "POST") return push_event(req);
            return text(405, "Method not allowed.");
        }
        return json_reply(404, json({{"error", "not found"}}).dump());
    } catch (const ValidationError& e) {
        return text(400, e.what());
    } catch (const UnknownTaskError& e) {
        return text(404, e.what());
    } catch (const NotFoundError& e) {
        return text(404, e.what());
    } catch (const json::exception& e) {
        return text(400, std::string("Malformed request body: ") + e.what());
    } catch (const std::exception& e) {
        std::cerr << "[relay] " << req.method << " " << req.path << " failed: " << e.what() << std::endl;
        return text(500, e.what());
    }
}

HttpReply RelayRouter::create_task(const HttpRequest& req) {
    std::string session = session_of(req);
    bool issued = false;
    if (session.empty()) {
        session = new_session_token();
        issued = true;
    }
    json body = req.body.empty() ? json::object() : json::parse(req.body);
    if (!body.is_object()) throw ValidationError("The request body must be a JSON object.");

    TaskStore store(sessions_, session);
    std::string id = reconciler_.create_task(store, field(body, "agentId", "AgentId"),
                                             field(body, "message", "Message"));
    HttpReply r = json_reply(200, json({{"task", id}}).dump());
    if (issued) {
        r.headers.emplace_back("Set-Cookie", std::string(kSessionCookie) + "=" + session + "; Path=/; HttpOnly");
    }
    return r;
}

HttpReply RelayRouter::task_result(const HttpRequest& req) {
    std::string task_id = lookup(req.query, "taskId");
    if (task_id.empty()) throw ValidationError("Please provide the task id.");
    std::string session = session_of(req);
    if (session.empty()) throw NotFoundError("The task " + task_id + " was not found.");
    TaskStore store(sessions_, session);
    return json_reply(200, record_to_response_json(results_.fetch_and_clear(store, task_id)));
}

HttpReply RelayRouter::verify_callback(const HttpRequest& req) {
    return text(200, callbacks_.verify(lookup(req.query, "validationToken")));
}

HttpReply RelayRouter::push_event(const HttpRequest& req) {
    StatusUpdateEvent ev = parse_status_update_event(req.body);
    std::string session = session_of(req);
    if (session.empty()) throw UnknownTaskError("The task " + ev.id + " was not found.");
    TaskStore store(sessions_, session);
    callbacks_.on_event(store, ev);
    return text(200, "");
}
