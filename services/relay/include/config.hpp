#pragma once
#include "../../../shared/cpp/a2a_sdk/include/a2a_client.hpp"
#include <string>

struct RelayConfig {
    int port{5000};
    std::string public_url;      // base URL the remote agent can reach us on
    A2AClientConfig a2a;
    int session_idle_timeout_s{1200};
    std::string session_db_path; // empty -> sessions kept in memory
};

std::string getenv_or(const char* key, const std::string& def);
// Throws std::runtime_error naming the variable when it is unset or empty.
std::string getenv_or_throw(const char* key);

// Environment first, then command-line flags override. Throws std::runtime_error
// on missing required settings or malformed numbers.
RelayConfig load_relay_config(int argc, char** argv);

// <public_url>/push-callback
std::string push_callback_url(const RelayConfig& cfg);
