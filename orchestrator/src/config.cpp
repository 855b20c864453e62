#include "config.hpp"
#include "util.hpp"
#include <charconv>
#include <cstdlib>
#include <cstring>
#include <stdexcept>

namespace {

std::string get_env(const char* name, const std::string& default_val) {
    const char* value = std::getenv(name);
    return value ? value : default_val;
}

int get_env_int(const char* name, int default_val) {
    const char* value = std::getenv(name);
    if (value) {
        int int_val;
        auto result = std::from_chars(value, value + std::strlen(value), int_val);
        if (result.ec == std::errc()) {
            return int_val;
        }
    }
    return default_val;
}

double get_env_double(const char* name, double default_val) {
    const char* value = std::getenv(name);
    if (value) {
        return util::safe_parse_double(value, default_val);
    }
    return default_val;
}

bool get_env_bool(const char* name, bool default_val) {
    const char* value = std::getenv(name);
    if (!value) return default_val;
    std::string v = util::to_lower(value);
    return v == "1" || v == "true" || v == "yes";
}

} // namespace

void Config::load_from_env() {
    service_name = get_env("SERVICE_NAME", service_name);
    listen_addr = get_env("LISTEN_ADDR", listen_addr);
    listen_port = get_env_int("LISTEN_PORT", listen_port);
    log_level = get_env("LOG_LEVEL", log_level);

    pg_dsn = get_env("PG_DSN", pg_dsn);

    redis_url = get_env("REDIS_URL", redis_url);
    notification_stream = get_env("NOTIFICATION_STREAM", notification_stream);
    notification_queue_limit = get_env_int("NOTIFICATION_QUEUE_LIMIT", notification_queue_limit);

    catalog_file = get_env("CATALOG_FILE", catalog_file);
    template_dir = get_env("TEMPLATE_DIR", template_dir);

    audit_concurrency = get_env_int("AUDIT_CONCURRENCY", audit_concurrency);
    workflow_parallelism = get_env_int("WORKFLOW_PARALLELISM", workflow_parallelism);
    max_concurrent_executions = get_env_int("MAX_CONCURRENT_EXECUTIONS", max_concurrent_executions);
    device_timeout_seconds = get_env_int("DEVICE_TIMEOUT_SECONDS", device_timeout_seconds);
    step_timeout_seconds = get_env_int("STEP_TIMEOUT_SECONDS", step_timeout_seconds);
    run_retention_seconds = get_env_int("RUN_RETENTION_SECONDS", run_retention_seconds);
    max_retained_runs = get_env_int("MAX_RETAINED_RUNS", max_retained_runs);

    fetch_retry_count = get_env_int("FETCH_RETRY_COUNT", fetch_retry_count);
    request_timeout_ms = get_env_int("REQUEST_TIMEOUT_MS", request_timeout_ms);
    base_backoff_seconds = get_env_double("BASE_BACKOFF_SECONDS", base_backoff_seconds);
    max_backoff_seconds = get_env_double("MAX_BACKOFF_SECONDS", max_backoff_seconds);

    std::string vendors = get_env("MODEL_PATH_VENDORS", "");
    if (!vendors.empty()) {
        model_path_vendors.clear();
        for (const auto& v : util::split_string(vendors, ',')) {
            model_path_vendors.push_back(util::to_lower(util::trim(v)));
        }
    }
    netconf_endpoint = get_env("NETCONF_ENDPOINT", netconf_endpoint);
    restconf_root = get_env("RESTCONF_ROOT", restconf_root);
    device_scheme = get_env("DEVICE_SCHEME", device_scheme);
    verify_tls = get_env_bool("VERIFY_TLS", verify_tls);
}

void Config::validate() const {
    if (audit_concurrency <= 0) {
        throw std::invalid_argument("AUDIT_CONCURRENCY must be positive");
    }
    if (workflow_parallelism <= 0) {
        throw std::invalid_argument("WORKFLOW_PARALLELISM must be positive");
    }
    if (max_concurrent_executions <= 0) {
        throw std::invalid_argument("MAX_CONCURRENT_EXECUTIONS must be positive");
    }
    if (device_timeout_seconds <= 0 || step_timeout_seconds <= 0) {
        throw std::invalid_argument("Timeouts must be positive");
    }
    if (notification_queue_limit <= 0) {
        throw std::invalid_argument("NOTIFICATION_QUEUE_LIMIT must be positive");
    }
    if (run_retention_seconds < 0 || max_retained_runs <= 0) {
        throw std::invalid_argument("RUN_RETENTION_SECONDS must not be negative and MAX_RETAINED_RUNS must be positive");
    }
    if (fetch_retry_count < 0) {
        throw std::invalid_argument("FETCH_RETRY_COUNT must not be negative");
    }
}

bool Config::uses_model_path(const std::string& vendor) const {
    auto tag = util::to_lower(vendor);
    for (const auto& v : model_path_vendors) {
        if (v == tag) return true;
    }
    return false;
}
