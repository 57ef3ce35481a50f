#include "push_callback.hpp"
#include "errors.hpp"
#include <nlohmann/json.hpp>

using json = nlohmann::json;

StatusUpdateEvent parse_status_update_event(const std::string& body) {
    try {
        auto j = json::parse(body);
        StatusUpdateEvent ev;
        ev.id = j.at("id").get<std::string>();
        if (ev.id.empty()) throw ValidationError("The task id is empty.");
        ev.final = j.value("final", false);
        ev.status = parse_task_status(j.value("status", json::object()).dump());
        return ev;
    } catch (const json::exception& e) {
        throw ValidationError(std::string("Malformed status update: ") + e.what());
    }
}

PushCallbackHandler::PushCallbackHandler(TaskReconciler& reconciler) : reconciler_(reconciler) {}

std::string PushCallbackHandler::verify(const std::string& validation_token) const {
    if (validation_token.empty()) throw ValidationError("Please provide the validation token.");
    return validation_token;
}

void PushCallbackHandler::on_event(TaskStore& store, const StatusUpdateEvent& event) {
    auto record = store.find(event.id);
    if (!record) throw UnknownTaskError("The task " + event.id + " was not found.");
    reconciler_.reconcile(store, event, *record);
}

void PushCallbackHandler::on_event(TaskStore& store, const std::string& body) {
    on_event(store, parse_status_update_event(body));
}
