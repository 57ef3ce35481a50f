#pragma once
#include "reconciler.hpp"
#include <string>

// Parses {id, final, status:{state, message?}}. Throws ValidationError on malformed input.
StatusUpdateEvent parse_status_update_event(const std::string& body);

class PushCallbackHandler {
public:
    explicit PushCallbackHandler(TaskReconciler& reconciler);

    // Endpoint ownership probe: returns the token unchanged.
    std::string verify(const std::string& validation_token) const;

    void on_event(TaskStore& store, const StatusUpdateEvent& event);
    void on_event(TaskStore& store, const std::string& body);

private:
    TaskReconciler& reconciler_;
};
