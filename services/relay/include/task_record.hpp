#pragma once
#include <string>
#include <optional>

struct TaskRecord {
    std::string agent_id;
    bool is_final{false};
    std::optional<std::string> message; // result text or error description
};

// Session value layout: {"AgentId": ..., "IsFinal": ..., "Message": ... | null}
std::string serialize_record(const TaskRecord& r);
TaskRecord deserialize_record(const std::string& s);
// Response body for the result endpoint: {"agentId", "isFinal", "message"}
std::string record_to_response_json(const TaskRecord& r);
