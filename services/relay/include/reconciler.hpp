#pragma once
#include "task_store.hpp"
#include "../../../shared/cpp/a2a_sdk/include/a2a_client.hpp"
#include <string>

// Status update pushed by the remote agent for one task.
struct StatusUpdateEvent {
    std::string id;
    bool final{false};
    TaskStatus status;
};

extern const char* const kInputRequiredMessage;

// Drives a task from submission to a final record: creates it, then applies
// pushed status updates. Holds no per-task state of its own; everything lives
// in the TaskStore passed to each call.
class TaskReconciler {
public:
    // callback_url is where the remote agent should push updates; the caller's
    // session token is appended as ?session=<token>.
    TaskReconciler(RemoteTaskClientFactory& clients, std::string callback_url);

    // Throws ValidationError, RemoteSubmissionError or TaskFailedError.
    std::string create_task(TaskStore& store, const std::string& agent_id, const std::string& message);

    // Throws UnknownTaskError if the session does not track event.id. A failed
    // re-fetch of a completed task propagates as RemoteCallError.
    void reconcile(TaskStore& store, const StatusUpdateEvent& event);
    void reconcile(TaskStore& store, const StatusUpdateEvent& event, const TaskRecord& record);

private:
    void reject_input_required(TaskStore& store, const std::string& task_id, const std::string& agent_id);
    void try_register_callback(RemoteTaskClient& client, const std::string& task_id, const std::string& session_id);

    RemoteTaskClientFactory& clients_;
    std::string callback_url_;
};
