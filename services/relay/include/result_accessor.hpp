#pragma once
#include "task_store.hpp"
#include <string>

class ResultAccessor {
public:
    // Returns the record and removes it from the session. Throws NotFoundError.
    TaskRecord fetch_and_clear(TaskStore& store, const std::string& task_id);
};
