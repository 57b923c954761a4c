// src/copytrade/config.cpp
#include "copytrade/config.hpp"
#include "onchain/abi.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <limits>

namespace copytrade {

namespace {

std::string trim(const std::string& s)
{
    auto b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) return {};
    auto e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

std::optional<std::string> env_value(const EnvLookup& env, const std::string& name)
{
    auto v = env(name);
    if (!v) return std::nullopt;
    std::string t = trim(*v);
    if (t.empty()) return std::nullopt;
    return t;
}

bool parse_bool(const std::optional<std::string>& raw, bool def)
{
    if (!raw) return def;
    const std::string v = onchain::to_lower(*raw);
    return v == "1" || v == "true" || v == "yes" || v == "y";
}

// Integral value, clamped to `min`; anything unparsable gives `def`.
template <typename T>
T parse_number(const std::optional<std::string>& raw, T def, T min)
{
    if (!raw) return def;
    try {
        std::size_t used = 0;
        const long long n = std::stoll(*raw, &used);
        if (used != raw->size()) return def;
        if (n < static_cast<long long>(min)) return min;
        if (static_cast<unsigned long long>(n) > static_cast<unsigned long long>(std::numeric_limits<T>::max())) {
            return std::numeric_limits<T>::max();
        }
        return static_cast<T>(n);
    } catch (const std::exception&) {
        return def;
    }
}

OrderType parse_order_type(const std::optional<std::string>& raw)
{
    if (!raw) return OrderType::FAK;
    std::string v = *raw;
    std::transform(v.begin(), v.end(), v.begin(), [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    if (v == "FOK") return OrderType::FOK;
    if (v == "GTC") return OrderType::GTC;
    if (v == "GTD") return OrderType::GTD;
    return OrderType::FAK;
}

Ratio parse_scale(const std::optional<std::string>& raw)
{
    const Ratio def{1, 10};
    if (!raw) return def;
    if (raw->front() == '-') {
        // negative scales clamp to zero, which disables copying
        return parse_ratio(raw->substr(1)) ? Ratio{0, 1} : def;
    }
    auto r = parse_ratio(*raw);
    return r ? *r : def;
}

std::string require_address(const std::string& raw, const char* what)
{
    auto addr = onchain::normalize_address(raw);
    if (!addr) {
        throw ConfigError(std::string("Invalid ") + what + " address: " + raw);
    }
    return *addr;
}

std::vector<std::string> parse_targets(const std::optional<std::string>& raw)
{
    std::vector<std::string> out;
    if (!raw) return out;

    std::size_t start = 0;
    while (start <= raw->size()) {
        auto comma = raw->find(',', start);
        if (comma == std::string::npos) comma = raw->size();
        const std::string item = trim(raw->substr(start, comma - start));
        if (!item.empty()) {
            out.push_back(require_address(item, "TARGET"));
        }
        start = comma + 1;
    }
    return out;
}

// wss://host/path -> https://host/path
std::string http_from_wss(const std::string& wss)
{
    const std::string scheme = "wss://";
    if (wss.compare(0, scheme.size(), scheme) == 0) {
        return "https://" + wss.substr(scheme.size());
    }
    return wss;
}

} // namespace

onchain::WatcherConfig AppConfig::watcher_config() const
{
    onchain::WatcherConfig w;
    w.rpc_wss_url      = rpc_wss_url;
    w.mode             = use_alchemy_pending ? onchain::PendingMode::ProviderPush : onchain::PendingMode::Standard;
    w.targets          = targets;
    w.fee_module       = fee_module;
    w.trader           = trader;
    w.selector         = selector;
    w.heartbeat_blocks = heartbeat_blocks;
    w.recent_capacity  = recent_hash_capacity;
    return w;
}

RouterConfig AppConfig::router_config() const
{
    RouterConfig r;
    r.trader = trader;
    r.format = log_format;
    return r;
}

AppConfig load_config(const EnvLookup& env)
{
    AppConfig c;

    auto wss = env_value(env, "POLYGON_RPC_WSS");
    if (!wss) {
        throw ConfigError("Missing POLYGON_RPC_WSS (wss endpoint)");
    }
    c.rpc_wss_url  = *wss;
    c.rpc_http_url = env_value(env, "POLYGON_RPC_HTTP").value_or(http_from_wss(c.rpc_wss_url));

    const bool alchemy_host = c.rpc_wss_url.find("alchemy.com") != std::string::npos;
    c.use_alchemy_pending   = parse_bool(env_value(env, "USE_ALCHEMY_PENDING"), alchemy_host);

    c.targets    = parse_targets(env_value(env, "TARGET_ADDRESSES"));
    c.trader     = require_address(env_value(env, "TRADER_ADDRESS").value_or(std::string(onchain::kDefaultTrader)), "TRADER");
    c.fee_module = require_address(env_value(env, "FEE_MODULE_ADDRESS").value_or(std::string(onchain::kFeeModuleAddress)),
                                   "FEE_MODULE");

    c.selector = onchain::to_lower(env_value(env, "MATCH_SELECTOR").value_or(std::string(onchain::kMatchOrdersSelector)));
    const auto sel = onchain::from_hex(c.selector);
    if (c.selector.rfind("0x", 0) != 0 || !sel || sel->size() != 4) {
        throw ConfigError("Invalid MATCH_SELECTOR: " + c.selector);
    }

    c.heartbeat_blocks     = parse_number<std::uint64_t>(env_value(env, "HEARTBEAT_BLOCKS"), 1, 1);
    c.recent_hash_capacity = parse_number<std::size_t>(env_value(env, "RECENT_HASH_CAPACITY"),
                                                       onchain::RecentHashes::kDefaultCapacity, 1);

    c.market_cache_ttl = std::chrono::milliseconds(
        parse_number<long>(env_value(env, "MARKET_CACHE_TTL_MS"), 60000, 0));
    c.market_cache_negative_ttl = std::chrono::milliseconds(
        parse_number<long>(env_value(env, "MARKET_CACHE_NEGATIVE_TTL_MS"), 10000, 0));
    c.http_timeout_ms = parse_number<long>(env_value(env, "HTTP_TIMEOUT_MS"), 8000, 1);
    c.http_retries    = parse_number<int>(env_value(env, "HTTP_RETRIES"), 1, 0);

    c.copy.scale        = parse_scale(env_value(env, "COPY_SCALE"));
    c.copy.slippage_bps = parse_number<std::uint32_t>(env_value(env, "COPY_SLIPPAGE_BPS"), 500, 0);
    c.copy.allow_buy    = parse_bool(env_value(env, "COPY_ALLOW_BUY"), true);
    c.copy.allow_sell   = parse_bool(env_value(env, "COPY_ALLOW_SELL"), true);

    c.placer.order_type    = parse_order_type(env_value(env, "COPY_ORDER_TYPE"));
    c.placer.simulate_only = parse_bool(env_value(env, "COPY_SIMULATE_ONLY"), true);

    c.credentials.private_key     = env_value(env, "PRIVATE_KEY").value_or("");
    c.credentials.api_key         = env_value(env, "CLOB_API_KEY").value_or("");
    c.credentials.api_secret      = env_value(env, "CLOB_API_SECRET").value_or("");
    c.credentials.api_passphrase  = env_value(env, "CLOB_API_PASSPHRASE").value_or("");
    c.credentials.signature_type  = parse_number<int>(env_value(env, "SIGNATURE_TYPE"), 0, 0);
    if (auto funding = env_value(env, "FUNDING_ADDRESS")) {
        c.credentials.funding_address = require_address(*funding, "FUNDING");
    }

    c.clob_rest_url = env_value(env, "CLOB_REST_URL").value_or(c.clob_rest_url);
    c.gamma_api_url = env_value(env, "GAMMA_API_URL").value_or(c.gamma_api_url);
    c.gamma_api_key = env_value(env, "GAMMA_API_KEY").value_or("");

    c.log_format = onchain::to_lower(env_value(env, "LOG_FORMAT").value_or("json")) == "readable" ? LogFormat::Readable
                                                                                            : LogFormat::Json;
    c.debug = parse_bool(env_value(env, "DEBUG"), false);

    c.worker_threads   = parse_number<std::size_t>(env_value(env, "WORKER_THREADS"), 4, 1);
    c.max_pending_jobs = parse_number<std::size_t>(env_value(env, "MAX_PENDING_JOBS"), 256, 1);
    return c;
}

AppConfig load_config_from_env()
{
    return load_config([](const std::string& name) -> std::optional<std::string> {
        const char* v = std::getenv(name.c_str());
        if (v == nullptr) return std::nullopt;
        return std::string(v);
    });
}

} // namespace copytrade
