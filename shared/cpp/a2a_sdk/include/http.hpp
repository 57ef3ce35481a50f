#pragma once
#include <string>
#include <vector>

struct HttpResponse {
    long status{0};
    std::string body;
};

// Throws std::runtime_error when the transfer itself fails; any HTTP status is returned.
HttpResponse http_post_json(const std::string& url, const std::string& json_body,
                            const std::vector<std::string>& extra_headers = {},
                            long timeout_ms = 30000);
