#include <iostream>
#include <cstdlib>
#include <string>
#include <curl/curl.h>
#include "../../../shared/cpp/a2a_sdk/include/a2a_client.hpp"

static std::string getenv_or(const char* k, const std::string& def) {
    const char* v = std::getenv(k);
    return v ? std::string(v) : def;
}

static void usage() {
    std::cerr << "a2a_send usage:\n"
              << "  a2a_send --agent <id> --message \"...\" [--endpoint <url>] [--api-version <v>] [--timeout-ms N]\n"
              << "  ENDPOINT, API_VERSION and A2A_BEARER_TOKEN are read from the environment.\n";
}

int main(int argc, char** argv) {
    A2AClientConfig cfg;
    cfg.endpoint = getenv_or("ENDPOINT", "");
    cfg.api_version = getenv_or("API_VERSION", "");
    cfg.bearer_token = getenv_or("A2A_BEARER_TOKEN", "");
    std::string agent;
    std::string message;
    try {
        for (int i = 1; i < argc; ++i) {
            std::string a = argv[i];
            if (a == "--agent" && i + 1 < argc) agent = argv[++i];
            else if (a == "--message" && i + 1 < argc) message = argv[++i];
            else if (a == "--endpoint" && i + 1 < argc) cfg.endpoint = argv[++i];
            else if (a == "--api-version" && i + 1 < argc) cfg.api_version = argv[++i];
            else if (a == "--timeout-ms" && i + 1 < argc) cfg.timeout_ms = std::stol(argv[++i]);
            else { usage(); return 1; }
        }
    } catch (const std::exception& e) {
        std::cerr << "[a2a-send] Bad argument: " << e.what() << "\n";
        return 1;
    }
    if (agent.empty() || message.empty() || cfg.endpoint.empty() || cfg.api_version.empty()) {
        usage();
        return 2;
    }

    curl_global_init(CURL_GLOBAL_DEFAULT);
    int rc = 0;
    try {
        A2AHttpClient client(cfg, agent);
        auto task = client.submit(generate_id(), message);
        if (!task) {
            std::cerr << "[a2a-send] Unable to create task.\n";
            rc = 1;
        } else if (task->status.state == TaskState::Failed) {
            std::cerr << "[a2a-send] Task " << task->id << " failed: " << task->status.message.value_or("") << "\n";
            rc = 1;
        } else {
            std::cerr << "[a2a-send] Task " << task->id << " is " << to_string(task->status.state) << "\n";
            std::cout << concat_text(task->artifacts) << std::endl;
        }
    } catch (const std::exception& e) {
        std::cerr << "[ERROR] " << e.what() << "\n";
        rc = 1;
    }
    curl_global_cleanup();
    return rc;
}
