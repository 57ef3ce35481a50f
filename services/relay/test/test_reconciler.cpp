#include "reconciler.hpp"
#include "push_callback.hpp"
#include "result_accessor.hpp"
#include "errors.hpp"
#include "fake_client.hpp"
#include <catch2/catch.hpp>
#include <chrono>

using namespace std::chrono_literals;

namespace {
const char* kCallback = "http://relay.test/push-callback";

StatusUpdateEvent event(const std::string& id, TaskState state, bool final,
                        std::optional<std::string> message = std::nullopt) {
    StatusUpdateEvent ev;
    ev.id = id;
    ev.final = final;
    ev.status.state = state;
    ev.status.message = std::move(message);
    return ev;
}
}

TEST_CASE("create_task validates input before contacting the agent") {
    FakeClientFactory clients;
    InMemorySessionStore sessions(1200s);
    TaskStore store(sessions, "s1");
    TaskReconciler reconciler(clients, kCallback);

    REQUIRE_THROWS_AS(reconciler.create_task(store, "", "hi"), ValidationError);
    REQUIRE_THROWS_AS(reconciler.create_task(store, "a1", ""), ValidationError);
    REQUIRE(clients.remote.total_calls() == 0);
    REQUIRE(clients.remote.agents.empty());
}

TEST_CASE("create_task reports remote failures as errors") {
    FakeClientFactory clients;
    InMemorySessionStore sessions(1200s);
    TaskStore store(sessions, "s1");
    TaskReconciler reconciler(clients, kCallback);

    SECTION("transport failure surfaces the underlying message") {
        clients.remote.submit_throws = true;
        try {
            reconciler.create_task(store, "a1", "hi");
            FAIL("expected RemoteSubmissionError");
        } catch (const RemoteSubmissionError& e) {
            REQUIRE(std::string(e.what()).find("connection refused") != std::string::npos);
        }
    }
    SECTION("no response") {
        REQUIRE_THROWS_AS(reconciler.create_task(store, "a1", "hi"), RemoteSubmissionError);
    }
    SECTION("synchronous failure") {
        clients.remote.submit_response = make_task("t1", TaskState::Failed);
        REQUIRE_THROWS_AS(reconciler.create_task(store, "a1", "hi"), TaskFailedError);
        REQUIRE_FALSE(store.find("t1"));
    }
}

SCENARIO("a task answered synchronously is final at once") {
    GIVEN("an agent that completes immediately with 'hello'") {
        FakeClientFactory clients;
        clients.remote.submit_response = make_task("remote-1", TaskState::Completed, {"hello"});
        InMemorySessionStore sessions(1200s);
        TaskStore store(sessions, "s1");
        TaskReconciler reconciler(clients, kCallback);
        ResultAccessor results;

        WHEN("a1 is asked 'hi'") {
            auto id = reconciler.create_task(store, "a1", "hi");

            THEN("the remote-assigned id is returned and the record is final") {
                REQUIRE(id == "remote-1");
                REQUIRE(clients.remote.agents == std::vector<std::string>{"a1"});
                REQUIRE(clients.remote.submitted_messages == std::vector<std::string>{"hi"});
                REQUIRE(clients.remote.submitted_ids.at(0).size() == 32);
                REQUIRE(clients.remote.registrations.empty());

                auto r = results.fetch_and_clear(store, id);
                REQUIRE(r.agent_id == "a1");
                REQUIRE(r.is_final);
                REQUIRE(r.message == std::optional<std::string>("hello"));
            }
            THEN("the second fetch reports not found") {
                results.fetch_and_clear(store, id);
                REQUIRE_THROWS_AS(results.fetch_and_clear(store, id), NotFoundError);
            }
        }
    }
}

SCENARIO("a pending task completes through a push callback") {
    GIVEN("an agent that accepts the task without answering") {
        FakeClientFactory clients;
        clients.remote.submit_response = make_task("t9", TaskState::Submitted);
        InMemorySessionStore sessions(1200s);
        TaskStore store(sessions, "s1");
        TaskReconciler reconciler(clients, kCallback);
        PushCallbackHandler callbacks(reconciler);

        auto id = reconciler.create_task(store, "a1", "compute");

        THEN("the record is pending and the callback is registered for this session") {
            auto r = store.find(id);
            REQUIRE(r);
            REQUIRE_FALSE(r->is_final);
            REQUIRE_FALSE(r->message);
            REQUIRE(clients.remote.registrations.size() == 1);
            REQUIRE(clients.remote.registrations[0].first == "t9");
            REQUIRE(clients.remote.registrations[0].second == "http://relay.test/push-callback?session=s1");
        }

        WHEN("a final completed event arrives") {
            clients.remote.get_response = make_task("t9", TaskState::Completed, {"42"});
            callbacks.on_event(store, R"({"id":"t9","final":true,"status":{"state":"completed"}})");

            THEN("the result is re-fetched and stored") {
                REQUIRE(clients.remote.get_calls == std::vector<std::string>{"t9"});
                auto r = store.find(id);
                REQUIRE(r->is_final);
                REQUIRE(r->message == std::optional<std::string>("42"));
            }
            AND_WHEN("the same event is delivered again") {
                callbacks.on_event(store, R"({"id":"t9","final":true,"status":{"state":"completed"}})");

                THEN("the record is unchanged") {
                    auto r = store.find(id);
                    REQUIRE(r->is_final);
                    REQUIRE(r->message == std::optional<std::string>("42"));
                }
            }
        }

        WHEN("the re-fetch fails") {
            clients.remote.get_throws = true;

            THEN("the error propagates and the record stays pending") {
                REQUIRE_THROWS_AS(callbacks.on_event(store, event("t9", TaskState::Completed, true)), RemoteCallError);
                REQUIRE_FALSE(store.find(id)->is_final);
            }
        }
    }
}

TEST_CASE("push registration failure does not fail creation") {
    FakeClientFactory clients;
    clients.remote.submit_response = make_task("t1", TaskState::Working);
    clients.remote.register_throws = true;
    InMemorySessionStore sessions(1200s);
    TaskStore store(sessions, "s1");
    TaskReconciler reconciler(clients, kCallback);

    REQUIRE(reconciler.create_task(store, "a1", "hi") == "t1");
    REQUIRE(clients.remote.registrations.size() == 1);
    REQUIRE(store.find("t1"));
}

TEST_CASE("reconcile applies failed events") {
    FakeClientFactory clients;
    InMemorySessionStore sessions(1200s);
    TaskStore store(sessions, "s1");
    store.insert("t1", TaskRecord{"a1", false, std::nullopt});
    TaskReconciler reconciler(clients, kCallback);
    PushCallbackHandler callbacks(reconciler);

    SECTION("with a plain status message") {
        callbacks.on_event(store, R"({"id":"t1","final":true,"status":{"state":"failed","message":"boom"}})");
        auto r = store.find("t1");
        REQUIRE(r->is_final);
        REQUIRE(r->message == std::optional<std::string>("Error! Message: boom"));
    }
    SECTION("idempotently") {
        auto ev = event("t1", TaskState::Failed, true, std::string("boom"));
        reconciler.reconcile(store, ev);
        auto once = serialize_record(*store.find("t1"));
        reconciler.reconcile(store, ev);
        REQUIRE(serialize_record(*store.find("t1")) == once);
    }
    SECTION("non-final failure keeps the record open") {
        reconciler.reconcile(store, event("t1", TaskState::Failed, false, std::string("retrying")));
        REQUIRE_FALSE(store.find("t1")->is_final);
    }
    REQUIRE(clients.remote.total_calls() == 0);
}

TEST_CASE("input-required is rejected and canceled exactly once") {
    FakeClientFactory clients;
    InMemorySessionStore sessions(1200s);
    TaskStore store(sessions, "s1");
    store.insert("t1", TaskRecord{"a7", false, std::nullopt});
    TaskReconciler reconciler(clients, kCallback);

    bool cancel_fails = GENERATE(false, true);
    clients.remote.cancel_throws = cancel_fails;

    REQUIRE_NOTHROW(reconciler.reconcile(store, event("t1", TaskState::InputRequired, false)));
    auto r = store.find("t1");
    REQUIRE(r->is_final);
    REQUIRE(r->message == std::optional<std::string>(kInputRequiredMessage));
    REQUIRE(clients.remote.cancel_calls == std::vector<std::string>{"t1"});
    REQUIRE(clients.remote.agents == std::vector<std::string>{"a7"});
}

TEST_CASE("a synchronous input-required response is rejected too") {
    FakeClientFactory clients;
    clients.remote.submit_response = make_task("t1", TaskState::InputRequired);
    InMemorySessionStore sessions(1200s);
    TaskStore store(sessions, "s1");
    TaskReconciler reconciler(clients, kCallback);

    REQUIRE(reconciler.create_task(store, "a1", "hi") == "t1");
    auto r = store.find("t1");
    REQUIRE(r->is_final);
    REQUIRE(r->message == std::optional<std::string>(kInputRequiredMessage));
    REQUIRE(clients.remote.cancel_calls.size() == 1);
}

TEST_CASE("other states leave the record alone") {
    FakeClientFactory clients;
    InMemorySessionStore sessions(1200s);
    TaskStore store(sessions, "s1");
    store.insert("t1", TaskRecord{"a1", false, std::nullopt});
    TaskReconciler reconciler(clients, kCallback);

    auto state = GENERATE(TaskState::Working, TaskState::Submitted, TaskState::Canceled, TaskState::Unknown);
    auto before = serialize_record(*store.find("t1"));
    reconciler.reconcile(store, event("t1", state, true));
    REQUIRE(serialize_record(*store.find("t1")) == before);
    REQUIRE(clients.remote.total_calls() == 0);
}

TEST_CASE("events for unknown tasks are rejected without side effects") {
    FakeClientFactory clients;
    InMemorySessionStore sessions(1200s);
    TaskStore store(sessions, "s1");
    store.insert("t1", TaskRecord{"a1", false, std::nullopt});
    TaskReconciler reconciler(clients, kCallback);
    PushCallbackHandler callbacks(reconciler);

    auto state = GENERATE(TaskState::Completed, TaskState::Failed, TaskState::InputRequired);
    REQUIRE_THROWS_AS(callbacks.on_event(store, event("ghost", state, true)), UnknownTaskError);
    REQUIRE_THROWS_AS(reconciler.reconcile(store, event("ghost", state, true)), UnknownTaskError);
    REQUIRE_FALSE(store.find("ghost"));
    REQUIRE_FALSE(store.find("t1")->is_final);
    REQUIRE(clients.remote.total_calls() == 0);
}

TEST_CASE("a push after the result was fetched finds nothing") {
    FakeClientFactory clients;
    InMemorySessionStore sessions(1200s);
    TaskStore store(sessions, "s1");
    store.insert("t1", TaskRecord{"a1", false, std::nullopt});
    TaskReconciler reconciler(clients, kCallback);
    ResultAccessor results;

    auto r = results.fetch_and_clear(store, "t1");
    REQUIRE_FALSE(r.is_final);
    REQUIRE_THROWS_AS(reconciler.reconcile(store, event("t1", TaskState::Failed, true, std::string("late"))),
                      UnknownTaskError);
}

TEST_CASE("verification probe echoes the token") {
    FakeClientFactory clients;
    TaskReconciler reconciler(clients, kCallback);
    PushCallbackHandler callbacks(reconciler);

    REQUIRE(callbacks.verify("abc-123") == "abc-123");
    REQUIRE_THROWS_AS(callbacks.verify(""), ValidationError);
}

TEST_CASE("malformed status updates are validation errors") {
    REQUIRE_THROWS_AS(parse_status_update_event("not json"), ValidationError);
    REQUIRE_THROWS_AS(parse_status_update_event(R"({"final":true})"), ValidationError);
    REQUIRE_THROWS_AS(parse_status_update_event(R"({"id":""})"), ValidationError);

    auto ev = parse_status_update_event(R"({"id":"t1","status":{"state":"working"}})");
    REQUIRE(ev.id == "t1");
    REQUIRE_FALSE(ev.final);
    REQUIRE(ev.status.state == TaskState::Working);
}
