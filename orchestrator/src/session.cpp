#include "session.hpp"
#include "catalog.hpp"
#include "errors.hpp"
#include "netconf_connector.hpp"
#include "restconf_connector.hpp"
#include <algorithm>
#include <spdlog/spdlog.h>

DeviceConnectorFactory::DeviceConnectorFactory(const Config& config,
                                               std::shared_ptr<CredentialResolver> credentials,
                                               std::shared_ptr<HttpClient> http)
    : config_(config), credentials_(std::move(credentials)), http_(std::move(http)) {}

std::unique_ptr<VendorConnector> DeviceConnectorFactory::create(const Device& device) {
    auto credentials = credentials_->resolve(device);
    if (config_.uses_model_path(device.vendor)) {
        return std::make_unique<RestconfConnector>(device, std::move(credentials), config_, http_);
    }
    return std::make_unique<NetconfConnector>(device, std::move(credentials), config_, http_);
}

bool SessionRegistry::acquire(const std::string& device_id, Deadline deadline) {
    std::unique_lock<std::mutex> lock(mutex_);
    auto free = [&] { return held_.count(device_id) == 0; };
    if (deadline) {
        if (!released_cv_.wait_until(lock, *deadline, free)) return false;
    } else {
        released_cv_.wait(lock, free);
    }
    held_.insert(device_id);
    peak_ = std::max(peak_, held_.size());
    return true;
}

void SessionRegistry::release(const std::string& device_id) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        held_.erase(device_id);
    }
    released_cv_.notify_all();
}

size_t SessionRegistry::open_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return held_.size();
}

size_t SessionRegistry::peak_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return peak_;
}

SessionLease::SessionLease(SessionRegistry& registry, ConnectorFactory& factory, Device device)
    : registry_(registry), factory_(factory), device_(std::move(device)) {}

SessionLease::~SessionLease() {
    std::lock_guard<std::mutex> lock(call_mutex_);
    try {
        close_locked();
    } catch (const std::exception& e) {
        spdlog::warn("[{}] Session close failed: {}", device_.id, e.what());
    }
}

std::string SessionLease::protocol() const {
    std::lock_guard<std::mutex> lock(call_mutex_);
    return connector_ ? connector_->protocol() : std::string("unopened");
}

bool SessionLease::is_open() const {
    std::lock_guard<std::mutex> lock(call_mutex_);
    return open_;
}

void SessionLease::set_deadline(Deadline deadline) {
    std::lock_guard<std::mutex> lock(call_mutex_);
    deadline_ = deadline;
    if (connector_) connector_->set_deadline(deadline);
}

void SessionLease::open_session() {
    std::lock_guard<std::mutex> lock(call_mutex_);
    open_locked();
}

FetchResult SessionLease::fetch(const Selector& selector) {
    std::lock_guard<std::mutex> lock(call_mutex_);
    open_locked();
    return connector_->fetch(selector);
}

PushResult SessionLease::push(const ConfigEdit& edit) {
    std::lock_guard<std::mutex> lock(call_mutex_);
    open_locked();
    return connector_->push(edit);
}

FetchResult SessionLease::fetch_within(const Selector& selector, Deadline deadline) {
    std::lock_guard<std::mutex> lock(call_mutex_);
    deadline_ = deadline;
    open_locked();
    connector_->set_deadline(deadline);
    return connector_->fetch(selector);
}

PushResult SessionLease::push_within(const ConfigEdit& edit, Deadline deadline) {
    std::lock_guard<std::mutex> lock(call_mutex_);
    deadline_ = deadline;
    open_locked();
    connector_->set_deadline(deadline);
    return connector_->push(edit);
}

void SessionLease::close_session() {
    std::lock_guard<std::mutex> lock(call_mutex_);
    close_locked();
}

void SessionLease::open_locked() {
    if (open_) return;

    if (!held_) {
        if (!registry_.acquire(device_.id, deadline_)) {
            throw TransientConnectorError("timed out waiting for a session on " + device_.id);
        }
        held_ = true;
    }

    try {
        if (!connector_) {
            connector_ = factory_.create(device_);
        }
        connector_->set_deadline(deadline_);
        connector_->open_session();
    } catch (const std::exception&) {
        registry_.release(device_.id);
        held_ = false;
        throw;
    }
    open_ = true;
}

void SessionLease::close_locked() {
    if (!held_) return;

    bool was_open = open_;
    open_ = false;
    held_ = false;

    if (was_open && connector_) {
        // Closing must not be cut short by an expired work deadline
        connector_->set_deadline(std::nullopt);
        try {
            connector_->close_session();
        } catch (...) {
            registry_.release(device_.id);
            throw;
        }
        spdlog::debug("[{}] Session closed", device_.id);
    }
    registry_.release(device_.id);
}
