#pragma once
#include "task_record.hpp"
#include "session_store.hpp"
#include <optional>
#include <string>

// View of one caller session as taskId -> TaskRecord. Cheap to construct per request.
class TaskStore {
public:
    TaskStore(SessionStore& sessions, std::string session_id);

    const std::string& session_id() const { return session_id_; }

    void insert(const std::string& task_id, const TaskRecord& record);
    std::optional<TaskRecord> find(const std::string& task_id);
    // Overwrites is_final/message of an existing record; is_final never goes back to false.
    // Returns false if the record is absent.
    bool update(const std::string& task_id, bool is_final, const std::optional<std::string>& message);
    // Destructive read.
    std::optional<TaskRecord> take(const std::string& task_id);

private:
    SessionStore& sessions_;
    std::string session_id_;
};
