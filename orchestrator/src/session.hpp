#pragma once

#include "config.hpp"
#include "connector.hpp"
#include "http_client.hpp"
#include <condition_variable>
#include <memory>
#include <mutex>
#include <set>
#include <string>

class CredentialResolver;

// Builds the connector variant a device's vendor tag maps to
class ConnectorFactory {
public:
    virtual ~ConnectorFactory() = default;
    virtual std::unique_ptr<VendorConnector> create(const Device& device) = 0;
};

class DeviceConnectorFactory : public ConnectorFactory {
public:
    DeviceConnectorFactory(const Config& config, std::shared_ptr<CredentialResolver> credentials,
                           std::shared_ptr<HttpClient> http);

    std::unique_ptr<VendorConnector> create(const Device& device) override;

private:
    const Config& config_;
    std::shared_ptr<CredentialResolver> credentials_;
    std::shared_ptr<HttpClient> http_;
};

// Tracks which devices have an open session. At most one per device.
class SessionRegistry {
public:
    // Waits while another lease holds the device. Returns false if the
    // deadline passes first.
    bool acquire(const std::string& device_id, Deadline deadline);
    void release(const std::string& device_id);

    size_t open_count() const;
    size_t peak_count() const;

private:
    mutable std::mutex mutex_;
    std::condition_variable released_cv_;
    std::set<std::string> held_;
    size_t peak_ = 0;
};

// Scoped session on one device. Opens on first use, serializes calls and
// closes when destroyed, whatever the outcome of the work done with it.
class SessionLease : public VendorConnector {
public:
    SessionLease(SessionRegistry& registry, ConnectorFactory& factory, Device device);
    ~SessionLease() override;

    std::string protocol() const override;

    void open_session() override;
    FetchResult fetch(const Selector& selector) override;
    PushResult push(const ConfigEdit& edit) override;
    void close_session() override;
    void set_deadline(Deadline deadline) override;
    FetchResult fetch_within(const Selector& selector, Deadline deadline) override;
    PushResult push_within(const ConfigEdit& edit, Deadline deadline) override;

    const Device& device() const { return device_; }
    bool is_open() const;

    SessionLease(const SessionLease&) = delete;
    SessionLease& operator=(const SessionLease&) = delete;

private:
    void open_locked();
    void close_locked();

    SessionRegistry& registry_;
    ConnectorFactory& factory_;
    Device device_;
    Deadline deadline_;

    mutable std::mutex call_mutex_;
    std::unique_ptr<VendorConnector> connector_;
    bool held_ = false;
    bool open_ = false;
};
