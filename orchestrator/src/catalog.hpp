#pragma once

#include "config.hpp"
#include "types.hpp"
#include "workflow.hpp"
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

// Source of devices, rules and workflow definitions
class Catalog {
public:
    virtual ~Catalog() = default;

    virtual std::optional<Device> find_device(const std::string& id) = 0;
    virtual std::optional<Rule> find_rule(const std::string& id) = 0;

    // Throws DefinitionError when the stored definition is invalid
    virtual std::optional<Workflow> find_workflow(const std::string& id) = 0;

    virtual bool check_health() { return true; }
};

class MemoryCatalog : public Catalog {
public:
    void add_device(const Device& device);
    void add_rule(const Rule& rule);
    void add_workflow(const std::string& id, const std::string& definition);

    std::optional<Device> find_device(const std::string& id) override;
    std::optional<Rule> find_rule(const std::string& id) override;
    std::optional<Workflow> find_workflow(const std::string& id) override;

    size_t device_count() const;
    size_t rule_count() const;
    size_t workflow_count() const;

private:
    mutable std::mutex mutex_;
    std::map<std::string, Device> devices_;
    std::map<std::string, Rule> rules_;
    std::map<std::string, std::string> workflows_;
};

// YAML file with "devices", "rules" and "workflows" sections
class FileCatalog : public MemoryCatalog {
public:
    explicit FileCatalog(const std::string& path);

    // Returns false when the file cannot be read or parsed
    bool load();

private:
    std::string path_;
};

// Tables devices, audit_rules (checks as JSON) and workflows (YAML definition)
class PgCatalog : public Catalog {
public:
    explicit PgCatalog(const Config& config);
    ~PgCatalog() override;

    std::optional<Device> find_device(const std::string& id) override;
    std::optional<Rule> find_rule(const std::string& id) override;
    std::optional<Workflow> find_workflow(const std::string& id) override;
    bool check_health() override;

    PgCatalog(const PgCatalog&) = delete;
    PgCatalog& operator=(const PgCatalog&) = delete;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

// Turns a device's opaque credential reference into credentials at
// session-open time
class CredentialResolver {
public:
    virtual ~CredentialResolver() = default;

    // Throws PermanentConnectorError when nothing is configured
    virtual Credentials resolve(const Device& device) = 0;
};

// Reference "core-routers" reads CRED_CORE_ROUTERS_USERNAME, _PASSWORD, _TOKEN
class EnvCredentialResolver : public CredentialResolver {
public:
    Credentials resolve(const Device& device) override;

    static std::string variable_prefix(const std::string& reference);
};
