#include "task_store.hpp"
#include <utility>

TaskStore::TaskStore(SessionStore& sessions, std::string session_id)
    : sessions_(sessions), session_id_(std::move(session_id)) {}

void TaskStore::insert(const std::string& task_id, const TaskRecord& record) {
    sessions_.set(session_id_, task_id, serialize_record(record));
}

std::optional<TaskRecord> TaskStore::find(const std::string& task_id) {
    auto v = sessions_.get(session_id_, task_id);
    if (!v || v->empty()) return std::nullopt;
    return deserialize_record(*v);
}

bool TaskStore::update(const std::string& task_id, bool is_final, const std::optional<std::string>& message) {
    auto r = find(task_id);
    if (!r) return false;
    r->is_final = r->is_final || is_final;
    r->message = message;
    insert(task_id, *r);
    return true;
}

std::optional<TaskRecord> TaskStore::take(const std::string& task_id) {
    auto v = sessions_.take(session_id_, task_id);
    if (!v || v->empty()) return std::nullopt;
    return deserialize_record(*v);
}
