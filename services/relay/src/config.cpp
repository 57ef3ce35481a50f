#include "config.hpp"
#include <cstdlib>
#include <stdexcept>

std::string getenv_or(const char* key, const std::string& def) {
    const char* v = std::getenv(key);
    return v ? std::string(v) : def;
}

std::string getenv_or_throw(const char* key) {
    const char* v = std::getenv(key);
    if (!v || !*v) throw std::runtime_error(std::string("Please provide the environment variable ") + key);
    return v;
}

namespace {
int to_int(const std::string& name, const std::string& v) {
    try {
        return std::stoi(v);
    } catch (const std::exception&) {
        throw std::runtime_error("invalid number for " + name + ": " + v);
    }
}
}

RelayConfig load_relay_config(int argc, char** argv) {
    RelayConfig cfg;
    cfg.port = to_int("RELAY_PORT", getenv_or("RELAY_PORT", "5000"));
    cfg.public_url = getenv_or("RELAY_PUBLIC_URL", "");
    cfg.a2a.endpoint = getenv_or("ENDPOINT", "");
    cfg.a2a.api_version = getenv_or("API_VERSION", "");
    cfg.a2a.bearer_token = getenv_or("A2A_BEARER_TOKEN", "");
    cfg.a2a.timeout_ms = to_int("A2A_TIMEOUT_MS", getenv_or("A2A_TIMEOUT_MS", "120000"));
    cfg.session_idle_timeout_s = to_int("SESSION_IDLE_TIMEOUT_S", getenv_or("SESSION_IDLE_TIMEOUT_S", "1200"));
    cfg.session_db_path = getenv_or("SESSION_DB_PATH", "");

    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        if (a == "--port" && i + 1 < argc) cfg.port = to_int(a, argv[++i]);
        else if (a == "--public-url" && i + 1 < argc) cfg.public_url = argv[++i];
        else if (a == "--endpoint" && i + 1 < argc) cfg.a2a.endpoint = argv[++i];
        else if (a == "--api-version" && i + 1 < argc) cfg.a2a.api_version = argv[++i];
        else if (a == "--timeout-ms" && i + 1 < argc) cfg.a2a.timeout_ms = to_int(a, argv[++i]);
        else if (a == "--session-timeout" && i + 1 < argc) cfg.session_idle_timeout_s = to_int(a, argv[++i]);
        else if (a == "--session-db" && i + 1 < argc) cfg.session_db_path = argv[++i];
        else throw std::runtime_error("unknown argument: " + a);
    }

    if (cfg.a2a.endpoint.empty()) cfg.a2a.endpoint = getenv_or_throw("ENDPOINT");
    if (cfg.a2a.api_version.empty()) cfg.a2a.api_version = getenv_or_throw("API_VERSION");
    if (cfg.port <= 0 || cfg.port > 65535) throw std::runtime_error("port out of range: " + std::to_string(cfg.port));
    if (cfg.session_idle_timeout_s <= 0) throw std::runtime_error("session timeout must be positive");
    if (cfg.public_url.empty()) cfg.public_url = "http://localhost:" + std::to_string(cfg.port);
    while (!cfg.public_url.empty() && cfg.public_url.back() == '/') cfg.public_url.pop_back();
    return cfg;
}

std::string push_callback_url(const RelayConfig& cfg) {
    return cfg.public_url + "/push-callback";
}
