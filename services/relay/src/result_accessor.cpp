#include "result_accessor.hpp"
#include "errors.hpp"

TaskRecord ResultAccessor::fetch_and_clear(TaskStore& store, const std::string& task_id) {
    auto record = store.take(task_id);
    if (!record) throw NotFoundError("The task " + task_id + " was not found.");
    return *record;
}
