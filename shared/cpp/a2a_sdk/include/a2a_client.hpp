#pragma once
#include <string>
#include <optional>
#include <vector>
#include <variant>
#include <memory>
#include <stdexcept>

enum class TaskState {
    Submitted,
    Working,
    InputRequired,
    Completed,
    Canceled,
    Failed,
    Unknown
};

std::string to_string(TaskState s);
TaskState task_state_from_string(const std::string& s); // unrecognised -> Unknown

struct TextPart {
    std::string text;
};

struct FilePart {
    std::string name;
    std::string mime_type; // image/png etc.
    std::string uri;       // empty when the payload is inline
};

struct DataPart {
    std::string json; // raw JSON object
};

using Part = std::variant<TextPart, FilePart, DataPart>;

struct Artifact {
    std::string name;
    std::vector<Part> parts;
};

struct TaskStatus {
    TaskState state{TaskState::Unknown};
    std::optional<std::string> message; // text of the status message, if any
};

struct RemoteTask {
    std::string id;
    TaskStatus status;
    std::vector<Artifact> artifacts;
};

// Concatenates the text parts of every artifact in order; other part kinds are skipped.
std::string concat_text(const std::vector<Artifact>& artifacts);

// Any failure talking to the remote agent: transport, HTTP status, bad body, JSON-RPC error.
class RemoteCallError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Parses a JSON-RPC response whose result is a task (or null). Throws RemoteCallError.
std::optional<RemoteTask> parse_task_response(const std::string& body);
// Parses a task status object; "message" may be a plain string or a message with parts.
TaskStatus parse_task_status(const std::string& status_json);

// 32 lowercase hex digits, used for task and request ids.
std::string generate_id();

// Client bound to a single remote agent.
class RemoteTaskClient {
public:
    virtual ~RemoteTaskClient() = default;
    virtual std::optional<RemoteTask> submit(const std::string& task_id, const std::string& message) = 0;
    virtual std::optional<RemoteTask> get(const std::string& task_id) = 0;
    virtual void cancel(const std::string& task_id) = 0;
    virtual void register_push_callback(const std::string& task_id, const std::string& url) = 0;
};

class RemoteTaskClientFactory {
public:
    virtual ~RemoteTaskClientFactory() = default;
    virtual std::unique_ptr<RemoteTaskClient> for_agent(const std::string& agent_id) = 0;
};

struct A2AClientConfig {
    std::string endpoint;    // service root, e.g. https://host/api
    std::string api_version;
    std::string bearer_token; // optional, sent as Authorization header
    long timeout_ms{120000};
};

// A2A over JSON-RPC 2.0 / HTTP, posting to <endpoint>/workflows/a2a/agents/<agent>?api-version=<v>.
class A2AHttpClient : public RemoteTaskClient {
public:
    A2AHttpClient(const A2AClientConfig& cfg, const std::string& agent_id);

    std::optional<RemoteTask> submit(const std::string& task_id, const std::string& message) override;
    std::optional<RemoteTask> get(const std::string& task_id) override;
    void cancel(const std::string& task_id) override;
    void register_push_callback(const std::string& task_id, const std::string& url) override;

    const std::string& url() const { return url_; }

private:
    std::string call(const std::string& method, const std::string& params_json);

    A2AClientConfig cfg_;
    std::string url_;
};

class A2AHttpClientFactory : public RemoteTaskClientFactory {
public:
    explicit A2AHttpClientFactory(A2AClientConfig cfg);
    std::unique_ptr<RemoteTaskClient> for_agent(const std::string& agent_id) override;

private:
    A2AClientConfig cfg_;
};
