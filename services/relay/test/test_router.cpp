#include "router.hpp"
#include "fake_client.hpp"
#include <catch2/catch.hpp>
#include <nlohmann/json.hpp>
#include <chrono>

using json = nlohmann::json;
using namespace std::chrono_literals;

namespace {
HttpRequest request(const std::string& method, const std::string& path, const std::string& session = "s1") {
    HttpRequest r;
    r.method = method;
    r.path = path;
    if (!session.empty()) r.headers["x-session-id"] = session;
    return r;
}

std::string header(const HttpReply& r, const std::string& name) {
    for (const auto& h : r.headers) {
        if (h.first == name) return h.second;
    }
    return {};
}

struct RouterFixture {
    FakeClientFactory clients;
    InMemorySessionStore sessions{1200s};
    RelayRouter router{sessions, clients, "http://relay.test/push-callback"};

    HttpReply create(const std::string& body, const std::string& session = "s1") {
        auto r = request("POST", "/task", session);
        r.body = body;
        return router.handle(r);
    }
    HttpReply fetch(const std::string& task_id, const std::string& session = "s1") {
        auto r = request("GET", "/task-result", session);
        r.query["taskId"] = task_id;
        return router.handle(r);
    }
    HttpReply push(const std::string& body, const std::string& session) {
        auto r = request("POST", "/push-callback", "");
        r.query["session"] = session;
        r.body = body;
        return router.handle(r);
    }
};
}

TEST_CASE_METHOD(RouterFixture, "POST /task returns the task id") {
    clients.remote.submit_response = make_task("t1", TaskState::Completed, {"hello"});
    auto r = create(R"({"message":"hi","agentId":"a1"})");
    REQUIRE(r.status == 200);
    REQUIRE(r.content_type == "application/json");
    REQUIRE(json::parse(r.body) == json({{"task", "t1"}}));
    REQUIRE(header(r, "Set-Cookie").empty());

    SECTION("and the result is fetched once") {
        auto first = fetch("t1");
        REQUIRE(first.status == 200);
        REQUIRE(json::parse(first.body) == json({{"agentId", "a1"}, {"isFinal", true}, {"message", "hello"}}));
        REQUIRE(fetch("t1").status == 404);
    }
    SECTION("but not from another session") {
        REQUIRE(fetch("t1", "s2").status == 404);
        REQUIRE(fetch("t1").status == 200);
    }
}

TEST_CASE_METHOD(RouterFixture, "POST /task rejects bad input with 400") {
    REQUIRE(create(R"({"agentId":"a1"})").status == 400);
    REQUIRE(create(R"({"message":"hi"})").status == 400);
    REQUIRE(create("{oops").status == 400);
    REQUIRE(create("[1,2]").status == 400);
    REQUIRE(create(R"({"message":7,"agentId":"a1"})").status == 400);
    REQUIRE(clients.remote.total_calls() == 0);
}

TEST_CASE_METHOD(RouterFixture, "POST /task maps remote failures to 500") {
    SECTION("transport") {
        clients.remote.submit_throws = true;
        auto r = create(R"({"message":"hi","agentId":"a1"})");
        REQUIRE(r.status == 500);
        REQUIRE(r.body.find("connection refused") != std::string::npos);
    }
    SECTION("synchronous failure") {
        clients.remote.submit_response = make_task("t1", TaskState::Failed);
        auto r = create(R"({"message":"hi","agentId":"a1"})");
        REQUIRE(r.status == 500);
        REQUIRE(r.body == "The task has failed.");
    }
}

TEST_CASE_METHOD(RouterFixture, "legacy MVC routes and PascalCase fields are accepted") {
    clients.remote.submit_response = make_task("t1", TaskState::Completed, {"ok"});
    auto r = request("POST", "/Home/CreateTask");
    r.body = R"({"Message":"hi","AgentId":"a1"})";
    REQUIRE(router.handle(r).status == 200);

    auto g = request("GET", "/Home/GetTaskResult");
    g.query["taskId"] = "t1";
    REQUIRE(router.handle(g).status == 200);
}

TEST_CASE_METHOD(RouterFixture, "a caller without a session gets one issued") {
    clients.remote.submit_response = make_task("t1", TaskState::Completed, {"ok"});
    auto r = create(R"({"message":"hi","agentId":"a1"})", "");
    REQUIRE(r.status == 200);
    auto cookie = header(r, "Set-Cookie");
    REQUIRE(cookie.rfind("relay_session=", 0) == 0);
    std::string token = cookie.substr(14, 32);
    REQUIRE(token.size() == 32);

    auto g = request("GET", "/task-result", "");
    g.cookies[kSessionCookie] = token;
    g.query["taskId"] = "t1";
    REQUIRE(router.handle(g).status == 200);
}

TEST_CASE_METHOD(RouterFixture, "push callback flow over HTTP") {
    clients.remote.submit_response = make_task("t5", TaskState::Working);
    REQUIRE(create(R"({"message":"hi","agentId":"a1"})").status == 200);

    auto pending = fetch("t5");
    REQUIRE(pending.status == 200);
    REQUIRE(json::parse(pending.body) == json({{"agentId", "a1"}, {"isFinal", false}, {"message", nullptr}}));

    SECTION("an event for a consumed task is not found") {
        auto r = push(R"({"id":"t5","final":true,"status":{"state":"failed","message":"boom"}})", "s1");
        REQUIRE(r.status == 404);
    }
}

TEST_CASE_METHOD(RouterFixture, "POST /push-callback status mapping") {
    clients.remote.submit_response = make_task("t5", TaskState::Working);
    REQUIRE(create(R"({"message":"hi","agentId":"a1"})").status == 200);

    SECTION("failed event is applied") {
        auto r = push(R"({"id":"t5","final":true,"status":{"state":"failed","message":"boom"}})", "s1");
        REQUIRE(r.status == 200);
        auto got = fetch("t5");
        REQUIRE(json::parse(got.body) == json({{"agentId", "a1"}, {"isFinal", true}, {"message", "Error! Message: boom"}}));
    }
    SECTION("unknown id is 404 and changes nothing") {
        auto before = sessions.get("s1", "t5");
        REQUIRE(push(R"({"id":"nope","final":true,"status":{"state":"completed"}})", "s1").status == 404);
        REQUIRE(sessions.get("s1", "t5") == before);
        REQUIRE(clients.remote.get_calls.empty());
    }
    SECTION("wrong session is 404") {
        REQUIRE(push(R"({"id":"t5","final":true,"status":{"state":"completed"}})", "other").status == 404);
    }
    SECTION("malformed body is 400") {
        REQUIRE(push("{", "s1").status == 400);
    }
    SECTION("failed re-fetch is 500") {
        clients.remote.get_throws = true;
        REQUIRE(push(R"({"id":"t5","final":true,"status":{"state":"completed"}})", "s1").status == 500);
    }
}

TEST_CASE_METHOD(RouterFixture, "GET /push-callback echoes the validation token") {
    auto r = request("GET", "/push-callback", "");
    r.query["validationToken"] = "tok-1";
    auto reply = router.handle(r);
    REQUIRE(reply.status == 200);
    REQUIRE(reply.body == "tok-1");
    REQUIRE(reply.content_type.rfind("text/plain", 0) == 0);

    r.query.clear();
    REQUIRE(router.handle(r).status == 400);
    r.query["validationToken"] = "";
    REQUIRE(router.handle(r).status == 400);
}

TEST_CASE_METHOD(RouterFixture, "routing errors") {
    REQUIRE(router.handle(request("GET", "/nowhere")).status == 404);
    REQUIRE(router.handle(request("GET", "/task")).status == 405);
    REQUIRE(router.handle(request("DELETE", "/push-callback")).status == 405);
    REQUIRE(router.handle(request("GET", "/task-result")).status == 400);
    REQUIRE(fetch("never-created").status == 404);
}
