// src/utils/http_client.cpp
#include "utils/http_client.hpp"

#include <curl/curl.h>
#include <memory>
#include <sstream>
#include <utility>

namespace utils {
namespace {

struct CurlGlobal {
    CurlGlobal() {
        curl_global_init(CURL_GLOBAL_DEFAULT);
    }
    ~CurlGlobal() {
        curl_global_cleanup();
    }
};

size_t write_cb(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* out = static_cast<std::string*>(userdata);
    out->append(ptr, size * nmemb);
    return size * nmemb;
}

struct CurlDeleter {
    void operator()(CURL* c) const { curl_easy_cleanup(c); }
};

struct SlistDeleter {
    void operator()(curl_slist* l) const { curl_slist_free_all(l); }
};

std::string strip_trailing_slash(std::string url) {
    while (!url.empty() && url.back() == '/') url.pop_back();
    return url;
}

} // namespace

HttpClient::HttpClient(std::string base_url, long timeout_ms)
    : base_url_(strip_trailing_slash(std::move(base_url)))
    , timeout_ms_(timeout_ms) {
    static CurlGlobal curl_global_guard;
}

void HttpClient::set_header(std::string name, std::string value) {
    headers_.emplace_back(std::move(name), std::move(value));
}

std::string HttpClient::get(const std::string& path, const std::string& query) const {
    std::string url = base_url_;
    url += path;
    if (!query.empty()) {
        url += "?";
        url += query;
    }
    return perform("GET", url, nullptr, {});
}

std::string HttpClient::post(const std::string& path,
                             const std::string& body,
                             const Headers&     extra_headers) const {
    return perform("POST", base_url_ + path, &body, extra_headers);
}

std::string HttpClient::url_encode(const std::string& value) {
    std::unique_ptr<CURL, CurlDeleter> curl(curl_easy_init());
    if (!curl) {
        throw std::runtime_error("curl_easy_init() failed");
    }
    std::unique_ptr<char, decltype(&curl_free)> escaped(
        curl_easy_escape(curl.get(), value.c_str(), static_cast<int>(value.size())),
        &curl_free);
    if (!escaped) {
        throw std::runtime_error("curl_easy_escape() failed");
    }
    return std::string(escaped.get());
}

std::string HttpClient::perform(const std::string& method,
                                const std::string& url,
                                const std::string* body,
                                const Headers&     extra_headers) const {
    std::unique_ptr<CURL, CurlDeleter> curl(curl_easy_init());
    if (!curl) {
        throw std::runtime_error("curl_easy_init() failed");
    }

    curl_slist* raw_list = curl_slist_append(nullptr, "Accept: application/json");
    if (body) {
        raw_list = curl_slist_append(raw_list, "Content-Type: application/json");
    }
    for (const auto* hs : {&headers_, &extra_headers}) {
        for (const auto& [name, value] : *hs) {
            raw_list = curl_slist_append(raw_list, (name + ": " + value).c_str());
        }
    }
    std::unique_ptr<curl_slist, SlistDeleter> header_list(raw_list);

    std::string response;

    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, header_list.get());
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_cb);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response);
    curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, "mempool-copytrade/0.1");
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, timeout_ms_);
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
    if (body) {
        curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, body->c_str());
        curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE, static_cast<long>(body->size()));
    }

    CURLcode res = curl_easy_perform(curl.get());
    long http_code = 0;
    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &http_code);

    if (res != CURLE_OK) {
        throw std::runtime_error(
            std::string("curl_easy_perform() failed: ") +
            curl_easy_strerror(res));
    }
    if (http_code < 200 || http_code >= 300) {
        std::ostringstream oss;
        oss << "HTTP " << http_code << " for " << method << " " << url;
        if (!response.empty()) {
            oss << ": " << response.substr(0, 256);
        }
        throw HttpError(http_code, oss.str());
    }

    return response;
}

} // namespace utils
