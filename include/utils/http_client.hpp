// include/utils/http_client.hpp
#pragma once

#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace utils {

// Non-2xx response. status() lets callers decide whether to retry.
class HttpError : public std::runtime_error {
public:
    HttpError(long status, const std::string& what)
        : std::runtime_error(what)
        , status_(status)
    {}

    long status() const noexcept { return status_; }

private:
    long status_;
};

class HttpClient {
public:
    using Headers = std::vector<std::pair<std::string, std::string>>;

    // base_url like "https://gamma-api.polymarket.com"
    explicit HttpClient(std::string base_url, long timeout_ms = 8000);

    void set_header(std::string name, std::string value);

    // Simple GET: path like "/markets",
    // query like "clob_token_ids=123&limit=1" (optional).
    std::string get(const std::string& path, const std::string& query = "") const;

    // POST with a JSON body; extra headers are sent after the defaults.
    std::string post(const std::string& path,
                     const std::string& body,
                     const Headers&     extra_headers = {}) const;

    const std::string& base_url() const noexcept { return base_url_; }

    // "a b&c" -> "a%20b%26c"
    static std::string url_encode(const std::string& value);

private:
    std::string perform(const std::string& method,
                        const std::string& url,
                        const std::string* body,
                        const Headers&     extra_headers) const;

    std::string base_url_;
    long        timeout_ms_;
    Headers     headers_;
};

} // namespace utils
