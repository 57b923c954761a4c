// src/exchange/gamma_rest.cpp
#include "exchange/gamma_rest.hpp"
#include "utils/http_client.hpp"
#include "utils/log.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <utility>

using nlohmann::json;

namespace {

std::string trim(std::string s) {
    auto not_space = [](unsigned char c) { return !std::isspace(c); };
    s.erase(s.begin(), std::find_if(s.begin(), s.end(), not_space));
    s.erase(std::find_if(s.rbegin(), s.rend(), not_space).base(), s.end());
    return s;
}

// Array, JSON-encoded array string ("[\"Yes\",\"No\"]") or "a,b" -> strings.
std::vector<std::string> to_string_list(const json& v) {
    std::vector<std::string> out;
    if (v.is_null()) return out;

    json arr = v;
    if (v.is_string()) {
        const std::string s = trim(v.get<std::string>());
        if (!s.empty() && s.front() == '[') {
            arr = json::parse(s, nullptr, /*allow_exceptions=*/false);
        } else {
            std::size_t start = 0;
            while (start <= s.size()) {
                auto comma = s.find(',', start);
                if (comma == std::string::npos) comma = s.size();
                auto item = trim(s.substr(start, comma - start));
                if (!item.empty()) out.push_back(std::move(item));
                start = comma + 1;
            }
            return out;
        }
    }

    if (!arr.is_array()) return out;
    for (const auto& item : arr) {
        if (item.is_string()) {
            if (!item.get<std::string>().empty()) out.push_back(item.get<std::string>());
        } else if (item.is_number()) {
            out.push_back(item.dump());
        }
    }
    return out;
}

std::vector<double> to_number_list(const json& v) {
    std::vector<double> out;
    for (const auto& s : to_string_list(v)) {
        try {
            std::size_t used = 0;
            double d = std::stod(s, &used);
            if (used == s.size()) out.push_back(d);
        } catch (const std::exception&) {
            // non-numeric entries are dropped
        }
    }
    return out;
}

std::string string_field(const json& j, const char* key) {
    if (!j.contains(key)) return {};
    const auto& v = j.at(key);
    if (v.is_string()) return v.get<std::string>();
    if (v.is_number()) return v.dump();
    return {};
}

std::optional<bool> bool_field(const json& j, const char* key) {
    if (!j.contains(key) || !j.at(key).is_boolean()) return std::nullopt;
    return j.at(key).get<bool>();
}

} // namespace

namespace exchange {

GammaRest::GammaRest(std::string base_url, std::string api_key, long timeout_ms, int retries)
    : base_url_(std::move(base_url))
    , api_key_(std::move(api_key))
    , timeout_ms_(timeout_ms)
    , retries_(std::max(0, retries)) {}

bool GammaRest::should_retry(long status) noexcept {
    return status >= 500 || status == 429 || status == 408;
}

json GammaRest::fetch_json(const std::string& path, const std::string& query) const {
    utils::HttpClient client(base_url_, timeout_ms_);
    if (!api_key_.empty()) {
        client.set_header("Authorization", "Bearer " + api_key_);
        client.set_header("x-api-key", api_key_);
    }

    for (int attempt = 0;; ++attempt) {
        try {
            return json::parse(client.get(path, query));
        } catch (const utils::HttpError& ex) {
            if (attempt < retries_ && should_retry(ex.status())) {
                continue;
            }
            spdlog::debug("gamma fetch non-200 {}",
                          utils::fields({{"path", path}, {"status", ex.status()}, {"err", ex.what()}}));
            throw;
        } catch (const std::runtime_error&) {
            // transport failure (timeout, DNS, TLS)
            if (attempt < retries_) {
                continue;
            }
            throw;
        }
    }
}

Market GammaRest::parse_market(const json& j) {
    if (!j.is_object()) {
        throw std::runtime_error("Gamma market is not an object: " + j.dump());
    }

    Market m;
    m.id             = string_field(j, "id");
    m.slug           = string_field(j, "slug");
    m.question       = string_field(j, "question");
    m.condition_id   = string_field(j, "conditionId");
    m.closed         = bool_field(j, "closed");
    m.active         = bool_field(j, "active");
    m.outcomes       = to_string_list(j.value("outcomes", json()));
    m.outcome_prices = to_number_list(j.value("outcomePrices", json()));
    m.clob_token_ids = to_string_list(j.value("clobTokenIds", json()));
    return m;
}

std::optional<Market> GammaRest::get_market_by_token_id(const std::string& token_id) const {
    const std::string query = "clob_token_ids=" + utils::HttpClient::url_encode(token_id) +
                              "&limit=1";
    const json j = fetch_json("/markets", query);
    if (!j.is_array()) {
        throw std::runtime_error("Gamma /markets returned non-array: " + j.dump());
    }
    if (j.empty()) {
        return std::nullopt;
    }

    Market m = parse_market(j.at(0));
    if (std::find(m.clob_token_ids.begin(), m.clob_token_ids.end(), token_id) == m.clob_token_ids.end()) {
        m.clob_token_ids.push_back(token_id);
    }
    return m;
}

Market GammaRest::get_market_by_id(const std::string& id) const {
    return parse_market(fetch_json("/markets/" + utils::HttpClient::url_encode(id)));
}

Market GammaRest::get_market_by_slug(const std::string& slug) const {
    return parse_market(fetch_json("/markets/slug/" + utils::HttpClient::url_encode(slug)));
}

} // namespace exchange
