#pragma once
#include <string>
#include <map>

struct HttpRequest {
    std::string method{"GET"};
    std::string url;
    std::map<std::string, std::string> headers;
    std::string body;
    long timeout_ms{30000};
};

struct HttpResponse {
    long status{0};
    std::string body;
    std::map<std::string, std::string> headers; // lower-cased names
};

// Throws BackendError: Timeout when the transfer exceeds timeout_ms,
// Unavailable for any other transport failure. HTTP status is not checked.
HttpResponse http_send(const HttpRequest& req);

HttpResponse http_post_json(const std::string& url, const std::string& json_body, long timeout_ms = 30000,
                            const std::map<std::string, std::string>& headers = {});
