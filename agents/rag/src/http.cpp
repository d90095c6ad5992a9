#include "../include/http.hpp"
#include "../include/errors.hpp"
#include "../include/util.hpp"
#include <curl/curl.h>

namespace {
size_t write_cb(void* contents, size_t size, size_t nmemb, void* userp) {
    size_t total = size * nmemb;
    std::string* s = static_cast<std::string*>(userp);
    s->append(static_cast<char*>(contents), total);
    return total;
}

size_t header_cb(char* buffer, size_t size, size_t nitems, void* userp) {
    size_t total = size * nitems;
    auto* headers = static_cast<std::map<std::string, std::string>*>(userp);
    std::string line(buffer, total);
    auto colon = line.find(':');
    if (colon != std::string::npos) {
        (*headers)[to_lower(trim(line.substr(0, colon)))] = trim(line.substr(colon + 1));
    }
    return total;
}

struct CurlHandle {
    CURL* h{nullptr};
    curl_slist* headers{nullptr};
    CurlHandle() {
        h = curl_easy_init();
        if (!h) throw BackendError(BackendErrorKind::Unavailable, "curl_easy_init failed");
    }
    ~CurlHandle() {
        if (headers) curl_slist_free_all(headers);
        if (h) curl_easy_cleanup(h);
    }
};
}

HttpResponse http_send(const HttpRequest& req) {
    CurlHandle c;
    for (const auto& kv : req.headers) {
        std::string line = kv.first + ": " + kv.second;
        c.headers = curl_slist_append(c.headers, line.c_str());
    }

    HttpResponse resp;
    curl_easy_setopt(c.h, CURLOPT_URL, req.url.c_str());
    curl_easy_setopt(c.h, CURLOPT_CUSTOMREQUEST, req.method.c_str());
    if (c.headers) curl_easy_setopt(c.h, CURLOPT_HTTPHEADER, c.headers);
    if (!req.body.empty() || req.method == "POST" || req.method == "PUT") {
        curl_easy_setopt(c.h, CURLOPT_POSTFIELDS, req.body.c_str());
        curl_easy_setopt(c.h, CURLOPT_POSTFIELDSIZE, (long)req.body.size());
    }
    curl_easy_setopt(c.h, CURLOPT_WRITEFUNCTION, write_cb);
    curl_easy_setopt(c.h, CURLOPT_WRITEDATA, &resp.body);
    curl_easy_setopt(c.h, CURLOPT_HEADERFUNCTION, header_cb);
    curl_easy_setopt(c.h, CURLOPT_HEADERDATA, &resp.headers);
    curl_easy_setopt(c.h, CURLOPT_TIMEOUT_MS, req.timeout_ms);
    curl_easy_setopt(c.h, CURLOPT_NOSIGNAL, 1L);

    CURLcode code = curl_easy_perform(c.h);
    if (code != CURLE_OK) {
        auto kind = code == CURLE_OPERATION_TIMEDOUT ? BackendErrorKind::Timeout : BackendErrorKind::Unavailable;
        throw BackendError(kind, req.method + " " + req.url + ": " + curl_easy_strerror(code));
    }
    curl_easy_getinfo(c.h, CURLINFO_RESPONSE_CODE, &resp.status);
    return resp;
}

HttpResponse http_post_json(const std::string& url, const std::string& json_body, long timeout_ms,
                            const std::map<std::string, std::string>& headers) {
    HttpRequest req;
    req.method = "POST";
    req.url = url;
    req.headers = headers;
    req.headers["Content-Type"] = "application/json";
    req.body = json_body;
    req.timeout_ms = timeout_ms;
    return http_send(req);
}
