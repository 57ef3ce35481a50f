#include "../include/a2a_client.hpp"
#include "../include/http.hpp"
#include <nlohmann/json.hpp>
#include <random>
#include <cstdio>
#include <cstdint>

using json = nlohmann::json;

namespace {
const char* kStateNames[] = {
    "submitted", "working", "input-required", "completed", "canceled", "failed", "unknown"
};

// A2A has used both "type" and "kind" as the part discriminator.
std::string part_kind(const json& p) {
    if (p.contains("kind") && p["kind"].is_string()) return p["kind"].get<std::string>();
    return p.value("type", std::string("text"));
}

std::optional<Part> parse_part(const json& p) {
    std::string kind = part_kind(p);
    if (kind == "text") {
        return Part{TextPart{p.value("text", std::string())}};
    }
    if (kind == "file") {
        json f = p.value("file", json::object());
        FilePart fp;
        fp.name = f.value("name", std::string());
        fp.mime_type = f.value("mimeType", std::string());
        fp.uri = f.value("uri", std::string());
        return Part{fp};
    }
    if (kind == "data") {
        return Part{DataPart{p.value("data", json::object()).dump()}};
    }
    return std::nullopt;
}

std::string parts_text(const json& parts) {
    std::string out;
    if (!parts.is_array()) return out;
    for (const auto& p : parts) {
        if (part_kind(p) == "text") out += p.value("text", std::string());
    }
    return out;
}

TaskStatus status_from_json(const json& s) {
    TaskStatus st;
    st.state = task_state_from_string(s.value("state", std::string("unknown")));
    if (s.contains("message")) {
        const json& m = s["message"];
        if (m.is_string()) st.message = m.get<std::string>();
        else if (m.is_object()) st.message = parts_text(m.value("parts", json::array()));
    }
    return st;
}

RemoteTask task_from_json(const json& t) {
    RemoteTask task;
    task.id = t.at("id").get<std::string>();
    task.status = status_from_json(t.value("status", json::object()));
    if (t.contains("artifacts") && t["artifacts"].is_array()) {
        for (const auto& a : t["artifacts"]) {
            Artifact art;
            art.name = a.value("name", std::string());
            for (const auto& p : a.value("parts", json::array())) {
                if (auto part = parse_part(p)) art.parts.push_back(std::move(*part));
            }
            task.artifacts.push_back(std::move(art));
        }
    }
    return task;
}
}

std::string to_string(TaskState s) {
    return kStateNames[static_cast<int>(s)];
}

TaskState task_state_from_string(const std::string& s) {
    for (int i = 0; i <= static_cast<int>(TaskState::Unknown); ++i) {
        if (s == kStateNames[i]) return static_cast<TaskState>(i);
    }
    return TaskState::Unknown;
}

std::string concat_text(const std::vector<Artifact>& artifacts) {
    std::string out;
    for (const auto& a : artifacts) {
        for (const auto& p : a.parts) {
            if (const auto* t = std::get_if<TextPart>(&p)) out += t->text;
        }
    }
    return out;
}

std::string generate_id() {
    std::random_device rd;
    std::mt19937_64 rng(rd());
    std::uniform_int_distribution<uint64_t> dist;
    uint64_t a = dist(rng), b = dist(rng);
    char buf[33];
    snprintf(buf, sizeof(buf), "%016llx%016llx", (unsigned long long)a, (unsigned long long)b);
    return std::string(buf);
}

std::optional<RemoteTask> parse_task_response(const std::string& body) {
    json j;
    try {
        j = json::parse(body);
    } catch (const json::exception& e) {
        throw RemoteCallError(std::string("invalid JSON-RPC response: ") + e.what());
    }
    if (j.contains("error") && !j["error"].is_null()) {
        const json& err = j["error"];
        throw RemoteCallError("JSON-RPC error " + std::to_string(err.value("code", 0)) + ": " +
                              err.value("message", std::string("unknown")));
    }
    if (!j.contains("result") || j["result"].is_null()) return std::nullopt;
    try {
        return task_from_json(j["result"]);
    } catch (const json::exception& e) {
        throw RemoteCallError(std::string("malformed task in response: ") + e.what());
    }
}

TaskStatus parse_task_status(const std::string& status_json) {
    return status_from_json(json::parse(status_json));
}

A2AHttpClient::A2AHttpClient(const A2AClientConfig& cfg, const std::string& agent_id) : cfg_(cfg) {
    std::string base = cfg_.endpoint;
    if (!base.empty() && base.back() == '/') base.pop_back();
    url_ = base + "/workflows/a2a/agents/" + agent_id + "?api-version=" + cfg_.api_version;
}

std::string A2AHttpClient::call(const std::string& method, const std::string& params_json) {
    json req = {
        {"jsonrpc", "2.0"},
        {"id", generate_id()},
        {"method", method},
        {"params", json::parse(params_json)}
    };
    std::vector<std::string> headers;
    if (!cfg_.bearer_token.empty()) headers.push_back("Authorization: Bearer " + cfg_.bearer_token);
    HttpResponse r;
    try {
        r = http_post_json(url_, req.dump(), headers, cfg_.timeout_ms);
    } catch (const std::runtime_error& e) {
        throw RemoteCallError(method + ": " + e.what());
    }
    if (r.status < 200 || r.status >= 300) {
        throw RemoteCallError(method + " failed: status " + std::to_string(r.status));
    }
    return r.body;
}

std::optional<RemoteTask> A2AHttpClient::submit(const std::string& task_id, const std::string& message) {
    json params = {
        {"id", task_id},
        {"message", {
            {"role", "user"},
            {"parts", json::array({json{{"type", "text"}, {"text", message}}})}
        }}
    };
    return parse_task_response(call("tasks/send", params.dump()));
}

std::optional<RemoteTask> A2AHttpClient::get(const std::string& task_id) {
    return parse_task_response(call("tasks/get", json({{"id", task_id}}).dump()));
}

void A2AHttpClient::cancel(const std::string& task_id) {
    // Result is the canceled task; only errors matter here.
    parse_task_response(call("tasks/cancel", json({{"id", task_id}}).dump()));
}

void A2AHttpClient::register_push_callback(const std::string& task_id, const std::string& url) {
    json params = {
        {"id", task_id},
        {"pushNotificationConfig", {{"url", url}}}
    };
    auto body = call("tasks/pushNotification/set", params.dump());
    auto j = json::parse(body, nullptr, false);
    if (j.is_discarded()) throw RemoteCallError("tasks/pushNotification/set: invalid JSON-RPC response");
    if (j.contains("error") && !j["error"].is_null()) {
        throw RemoteCallError("tasks/pushNotification/set: " + j["error"].value("message", std::string("unknown")));
    }
    if (!j.contains("result") || j["result"].is_null()) {
        throw RemoteCallError("Unable to create a push notification for task.");
    }
}

A2AHttpClientFactory::A2AHttpClientFactory(A2AClientConfig cfg) : cfg_(std::move(cfg)) {}

std::unique_ptr<RemoteTaskClient> A2AHttpClientFactory::for_agent(const std::string& agent_id) {
    return std::make_unique<A2AHttpClient>(cfg_, agent_id);
}
