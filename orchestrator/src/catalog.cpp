#include "catalog.hpp"
#include "errors.hpp"
#include "util.hpp"
#include "yaml_convert.hpp"
#include <cctype>
#include <fstream>
#include <sstream>
#include <pqxx/pqxx>
#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>

void MemoryCatalog::add_device(const Device& device) {
    std::lock_guard<std::mutex> lock(mutex_);
    devices_[device.id] = device;
}

void MemoryCatalog::add_rule(const Rule& rule) {
    std::lock_guard<std::mutex> lock(mutex_);
    rules_[rule.id] = rule;
}

void MemoryCatalog::add_workflow(const std::string& id, const std::string& definition) {
    std::lock_guard<std::mutex> lock(mutex_);
    workflows_[id] = definition;
}

std::optional<Device> MemoryCatalog::find_device(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = devices_.find(id);
    if (it == devices_.end()) return std::nullopt;
    return it->second;
}

std::optional<Rule> MemoryCatalog::find_rule(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = rules_.find(id);
    if (it == rules_.end()) return std::nullopt;
    return it->second;
}

std::optional<Workflow> MemoryCatalog::find_workflow(const std::string& id) {
    std::string definition;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = workflows_.find(id);
        if (it == workflows_.end()) return std::nullopt;
        definition = it->second;
    }
    return Workflow::parse(definition, id);
}

size_t MemoryCatalog::device_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return devices_.size();
}

size_t MemoryCatalog::rule_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return rules_.size();
}

size_t MemoryCatalog::workflow_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return workflows_.size();
}

FileCatalog::FileCatalog(const std::string& path) : path_(path) {}

bool FileCatalog::load() {
    YAML::Node root;
    try {
        root = YAML::LoadFile(path_);
    } catch (const YAML::Exception& e) {
        spdlog::error("Failed to load catalog {}: {}", path_, e.what());
        return false;
    }

    for (const auto& node : root["devices"]) {
        try {
            add_device(Device::from_json(yaml_to_json(node)));
        } catch (const std::exception& e) {
            spdlog::error("Skipping device in {}: {}", path_, e.what());
        }
    }

    for (const auto& node : root["rules"]) {
        try {
            add_rule(Rule::from_json(yaml_to_json(node)));
        } catch (const std::exception& e) {
            spdlog::error("Skipping rule in {}: {}", path_, e.what());
        }
    }

    // Workflows keep their YAML text; they are validated when requested
    auto workflows = root["workflows"];
    if (workflows.IsMap()) {
        for (const auto& entry : workflows) {
            YAML::Emitter out;
            out << entry.second;
            add_workflow(entry.first.as<std::string>(), out.c_str());
        }
    } else if (workflows.IsSequence()) {
        for (const auto& node : workflows) {
            auto id = node["id"] ? node["id"].as<std::string>()
                                 : (node["name"] ? node["name"].as<std::string>() : std::string());
            if (id.empty()) {
                spdlog::error("Skipping workflow without id or name in {}", path_);
                continue;
            }
            YAML::Emitter out;
            out << node;
            add_workflow(id, out.c_str());
        }
    }

    spdlog::info("Catalog {} loaded: {} devices, {} rules, {} workflows",
                 path_, device_count(), rule_count(), workflow_count());
    return true;
}

class PgCatalog::Impl {
public:
    explicit Impl(const Config& config) : config_(config) {}

    template <typename Func>
    auto with_connection(Func fn, const std::string& operation) -> decltype(fn(std::declval<pqxx::connection&>())) {
        std::lock_guard<std::mutex> lock(mutex_);
        try {
            if (!conn_ || !conn_->is_open()) {
                conn_ = std::make_unique<pqxx::connection>(config_.pg_dsn);
            }
            return fn(*conn_);
        } catch (const pqxx::broken_connection& e) {
            spdlog::error("Database connection error during {}: {}", operation, e.what());
            conn_.reset();
        } catch (const pqxx::sql_error& e) {
            spdlog::error("SQL error during {}: {}", operation, e.what());
        }
        return std::nullopt;
    }

    std::optional<Device> find_device(const std::string& id) {
        return with_connection([&](pqxx::connection& conn) -> std::optional<Device> {
            pqxx::work txn(conn);
            auto rows = txn.exec_params(
                "SELECT id, hostname, address, port, vendor, credential_ref "
                "FROM devices WHERE id = $1", id);
            if (rows.empty()) return std::nullopt;
            const auto& row = rows[0];
            Device device;
            device.id = row["id"].as<std::string>();
            device.hostname = row["hostname"].as<std::string>("");
            device.address = row["address"].as<std::string>("");
            device.port = row["port"].as<int>(830);
            device.vendor = util::to_lower(row["vendor"].as<std::string>(""));
            device.credential_ref = row["credential_ref"].as<std::string>("");
            return device;
        }, "find_device");
    }

    std::optional<Rule> find_rule(const std::string& id) {
        auto record = with_connection([&](pqxx::connection& conn) -> std::optional<nlohmann::json> {
            pqxx::work txn(conn);
            auto rows = txn.exec_params(
                "SELECT id, name, severity, vendors, checks FROM audit_rules WHERE id = $1", id);
            if (rows.empty()) return std::nullopt;
            const auto& row = rows[0];
            nlohmann::json j = {
                {"id", row["id"].as<std::string>()},
                {"name", row["name"].as<std::string>("")},
                {"severity", row["severity"].as<std::string>("medium")},
                {"vendors", nlohmann::json::parse(row["vendors"].as<std::string>("[]"))},
                {"checks", nlohmann::json::parse(row["checks"].as<std::string>("[]"))}
            };
            return j;
        }, "find_rule");
        if (!record) return std::nullopt;
        return Rule::from_json(*record);
    }

    std::optional<Workflow> find_workflow(const std::string& id) {
        auto definition = with_connection([&](pqxx::connection& conn) -> std::optional<std::string> {
            pqxx::work txn(conn);
            auto rows = txn.exec_params("SELECT definition FROM workflows WHERE id = $1", id);
            if (rows.empty()) return std::nullopt;
            return rows[0]["definition"].as<std::string>();
        }, "find_workflow");
        if (!definition) return std::nullopt;
        return Workflow::parse(*definition, id);
    }

    bool check_health() {
        auto ok = with_connection([](pqxx::connection& conn) -> std::optional<bool> {
            pqxx::work txn(conn);
            txn.exec1("SELECT 1");
            return true;
        }, "health check");
        return ok.value_or(false);
    }

private:
    const Config& config_;
    std::mutex mutex_;
    std::unique_ptr<pqxx::connection> conn_;
};

PgCatalog::PgCatalog(const Config& config) : impl_(std::make_unique<Impl>(config)) {}
PgCatalog::~PgCatalog() = default;

std::optional<Device> PgCatalog::find_device(const std::string& id) { return impl_->find_device(id); }
std::optional<Rule> PgCatalog::find_rule(const std::string& id) { return impl_->find_rule(id); }
std::optional<Workflow> PgCatalog::find_workflow(const std::string& id) { return impl_->find_workflow(id); }
bool PgCatalog::check_health() { return impl_->check_health(); }

std::string EnvCredentialResolver::variable_prefix(const std::string& reference) {
    std::string prefix = "CRED_";
    for (char c : reference) {
        prefix += std::isalnum(static_cast<unsigned char>(c))
                      ? static_cast<char>(std::toupper(static_cast<unsigned char>(c)))
                      : '_';
    }
    return prefix;
}

Credentials EnvCredentialResolver::resolve(const Device& device) {
    auto reference = device.credential_ref.empty() ? std::string("default") : device.credential_ref;
    auto prefix = variable_prefix(reference);

    Credentials credentials;
    credentials.username = util::get_env_var(prefix + "_USERNAME");
    credentials.password = util::get_env_var(prefix + "_PASSWORD");
    credentials.token = util::get_env_var(prefix + "_TOKEN");

    if (credentials.username.empty() && credentials.token.empty()) {
        throw PermanentConnectorError("no credentials configured for reference '" + reference +
                                      "' (device " + device.id + ")");
    }
    return credentials;
}
