#include "reconciler.hpp"
#include "errors.hpp"
#include <iostream>
#include <utility>

const char* const kInputRequiredMessage =
    "Error! The task is in \"Input required\" state, it is not supported yet.";

namespace {
bool is_pending(TaskState s) {
    return s == TaskState::Submitted || s == TaskState::Working || s == TaskState::Unknown;
}
}

TaskReconciler::TaskReconciler(RemoteTaskClientFactory& clients, std::string callback_url)
    : clients_(clients), callback_url_(std::move(callback_url)) {}

std::string TaskReconciler::create_task(TaskStore& store, const std::string& agent_id, const std::string& message) {
    if (agent_id.empty()) throw ValidationError("The Agent Id is empty.");
    if (message.empty()) throw ValidationError("The Message is empty.");

    auto client = clients_.for_agent(agent_id);
    std::optional<RemoteTask> response;
    try {
        response = client->submit(generate_id(), message);
    } catch (const std::exception& e) {
        throw RemoteSubmissionError(e.what());
    }
    if (!response) throw RemoteSubmissionError("Unable to create task.");
    if (response->status.state == TaskState::Failed) throw TaskFailedError("The task has failed.");

    const std::string& id = response->id;
    TaskState state = response->status.state;
    std::cout << "[relay] Created task " << id << " for agent " << agent_id
              << " (" << to_string(state) << ")" << std::endl;

    if (state == TaskState::InputRequired) {
        store.insert(id, TaskRecord{agent_id, false, std::nullopt});
        reject_input_required(store, id, agent_id);
    } else if (is_pending(state)) {
        store.insert(id, TaskRecord{agent_id, false, std::nullopt});
        try_register_callback(*client, id, store.session_id());
    } else {
        // Answered synchronously; no push is expected.
        store.insert(id, TaskRecord{agent_id, true, concat_text(response->artifacts)});
    }
    return id;
}

void TaskReconciler::reconcile(TaskStore& store, const StatusUpdateEvent& event) {
    auto record = store.find(event.id);
    if (!record) throw UnknownTaskError("The task " + event.id + " was not found.");
    reconcile(store, event, *record);
}

void TaskReconciler::reconcile(TaskStore& store, const StatusUpdateEvent& event, const TaskRecord& record) {
    switch (event.status.state) {
    case TaskState::Completed: {
        // The push carries no artifacts, fetch them.
        auto client = clients_.for_agent(record.agent_id);
        auto task = client->get(event.id);
        std::string text = task ? concat_text(task->artifacts) : std::string();
        store.update(event.id, event.final, text);
        std::cout << "[relay] Task " << event.id << " completed" << (event.final ? "" : " (not final)") << std::endl;
        break;
    }
    case TaskState::Failed:
        store.update(event.id, event.final, "Error! Message: " + event.status.message.value_or(""));
        std::cout << "[relay] Task " << event.id << " failed" << std::endl;
        break;
    case TaskState::InputRequired:
        reject_input_required(store, event.id, record.agent_id);
        break;
    default:
        std::cout << "[relay] Task " << event.id << " is " << to_string(event.status.state)
                  << ", nothing to do" << std::endl;
        break;
    }
}

void TaskReconciler::reject_input_required(TaskStore& store, const std::string& task_id, const std::string& agent_id) {
    store.update(task_id, true, std::string(kInputRequiredMessage));
    try {
        clients_.for_agent(agent_id)->cancel(task_id);
        std::cout << "[relay] Canceled task " << task_id << " awaiting input" << std::endl;
    } catch (const RemoteCallError& e) {
        std::cerr << "[relay] Cancel of task " << task_id << " failed: " << e.what() << std::endl;
    }
}

void TaskReconciler::try_register_callback(RemoteTaskClient& client, const std::string& task_id,
                                           const std::string& session_id) {
    std::string url = callback_url_ + "?session=" + session_id;
    try {
        client.register_push_callback(task_id, url);
    } catch (const RemoteCallError& e) {
        std::cerr << "[relay] Push registration for task " << task_id << " failed: " << e.what() << std::endl;
    }
}
