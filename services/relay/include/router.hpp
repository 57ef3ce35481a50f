#pragma once
#include "push_callback.hpp"
#include "reconciler.hpp"
#include "result_accessor.hpp"
#include "session_store.hpp"
#include <map>
#include <string>
#include <utility>
#include <vector>

struct HttpRequest {
    std::string method;
    std::string path;
    std::string body;
    std::map<std::string, std::string> query;
    std::map<std::string, std::string> headers; // keys lowercased
    std::map<std::string, std::string> cookies;
};

struct HttpReply {
    int status{200};
    std::string body;
    std::string content_type{"text/plain; charset=utf-8"};
    std::vector<std::pair<std::string, std::string>> headers;
};

extern const char* const kSessionCookie;

// 32 hex digits from the OpenSSL CSPRNG.
std::string new_session_token();

// Maps the relay's HTTP surface onto the task components and the error
// taxonomy onto status codes. Independent of the HTTP server library.
class RelayRouter {
public:
    RelayRouter(SessionStore& sessions, RemoteTaskClientFactory& clients, std::string callback_url);

    HttpReply handle(const HttpRequest& req);

private:
    HttpReply create_task(const HttpRequest& req);
    HttpReply task_result(const HttpRequest& req);
    HttpReply verify_callback(const HttpRequest& req);
    HttpReply push_event(const HttpRequest& req);

    SessionStore& sessions_;
    TaskReconciler reconciler_;
    PushCallbackHandler callbacks_;
    ResultAccessor results_;
};
