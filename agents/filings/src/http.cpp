#include "../include/http.hpp"
#include <curl/curl.h>
#include <mutex>

namespace {
size_t write_cb(void* contents, size_t size, size_t nmemb, void* userp) {
    size_t total = size * nmemb;
    std::string* s = static_cast<std::string*>(userp);
    s->append(static_cast<char*>(contents), total);
    return total;
}

struct CurlHandle {
    CURL* h{nullptr};
    struct curl_slist* headers{nullptr};
    CurlHandle() { h = curl_easy_init(); if (!h) throw std::runtime_error("curl_easy_init failed"); }
    ~CurlHandle() {
        if (headers) curl_slist_free_all(headers);
        if (h) curl_easy_cleanup(h);
    }
};

HttpResponse perform(CurlHandle& c, std::string& buf) {
    curl_easy_setopt(c.h, CURLOPT_WRITEFUNCTION, write_cb);
    curl_easy_setopt(c.h, CURLOPT_WRITEDATA, &buf);
    curl_easy_setopt(c.h, CURLOPT_NOSIGNAL, 1L);
    CURLcode code = curl_easy_perform(c.h);
    if (code != CURLE_OK) {
        throw HttpTransportError(std::string("curl_easy_perform failed: ") + curl_easy_strerror(code),
                                 code == CURLE_OPERATION_TIMEDOUT);
    }
    HttpResponse resp;
    curl_easy_getinfo(c.h, CURLINFO_RESPONSE_CODE, &resp.status);
    char* ctype = nullptr;
    curl_easy_getinfo(c.h, CURLINFO_CONTENT_TYPE, &ctype);
    if (ctype) resp.content_type = ctype;
    resp.body = std::move(buf);
    return resp;
}
}

void http_global_init() {
    static std::once_flag once;
    std::call_once(once, []{ curl_global_init(CURL_GLOBAL_DEFAULT); });
}

HttpResponse http_post_json(const std::string& url, const std::string& json_body, long timeout_ms) {
    CurlHandle c;
    c.headers = curl_slist_append(c.headers, "Content-Type: application/json");
    std::string buf;
    curl_easy_setopt(c.h, CURLOPT_URL, url.c_str());
    curl_easy_setopt(c.h, CURLOPT_HTTPHEADER, c.headers);
    curl_easy_setopt(c.h, CURLOPT_POSTFIELDS, json_body.c_str());
    curl_easy_setopt(c.h, CURLOPT_POSTFIELDSIZE, (long)json_body.size());
    curl_easy_setopt(c.h, CURLOPT_TIMEOUT_MS, timeout_ms);
    return perform(c, buf);
}

HttpResponse http_get(const std::string& url, const std::string& user_agent, long timeout_ms) {
    CurlHandle c;
    std::string buf;
    curl_easy_setopt(c.h, CURLOPT_URL, url.c_str());
    curl_easy_setopt(c.h, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(c.h, CURLOPT_USERAGENT, user_agent.c_str());
    curl_easy_setopt(c.h, CURLOPT_ACCEPT_ENCODING, "");
    curl_easy_setopt(c.h, CURLOPT_TIMEOUT_MS, timeout_ms);
    return perform(c, buf);
}
