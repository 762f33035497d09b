#pragma once
#include <string>

struct HttpResponse {
    long status{0};
    std::string body;
};

// POSTs json_body with Content-Type application/json. Transport failures
// (including timeout_ms elapsing) throw std::runtime_error; any HTTP status,
// 4xx/5xx included, comes back in the response for the caller to judge.
HttpResponse http_post_json(const std::string& url, const std::string& json_body, long timeout_ms = 30000);
