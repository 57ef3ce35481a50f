#include "task_record.hpp"
#include <nlohmann/json.hpp>

using json = nlohmann::json;

std::string serialize_record(const TaskRecord& r) {
    json j = {
        {"AgentId", r.agent_id},
        {"IsFinal", r.is_final},
        {"Message", r.message ? json(*r.message) : json(nullptr)}
    };
    return j.dump();
}

TaskRecord deserialize_record(const std::string& s) {
    auto j = json::parse(s);
    TaskRecord r;
    if (j.contains("AgentId") && j["AgentId"].is_string()) r.agent_id = j["AgentId"].get<std::string>();
    r.is_final = j.value("IsFinal", false);
    if (j.contains("Message") && j["Message"].is_string()) r.message = j["Message"].get<std::string>();
    return r;
}

std::string record_to_response_json(const TaskRecord& r) {
    json j = {
        {"agentId", r.agent_id},
        {"isFinal", r.is_final},
        {"message", r.message ? json(*r.message) : json(nullptr)}
    };
    return j.dump();
}
