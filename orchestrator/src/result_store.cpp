#include "result_store.hpp"
#include "util.hpp"
#include "tree.hpp"
#include <algorithm>
#include <cmath>
#include <thread>
#include <pqxx/pqxx>
#include <spdlog/spdlog.h>

MemoryResultStore::MemoryResultStore(size_t max_completed_runs)
    : max_completed_runs_(max_completed_runs) {}

bool MemoryResultStore::create_run(const std::string& run_id, const std::string& kind, const nlohmann::json& summary) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& run = runs_[run_id];
    run.kind = kind;
    run.summary = summary;
    return true;
}

bool MemoryResultStore::append_record(const std::string& run_id, const std::string& kind, const nlohmann::json& record) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = runs_.find(run_id);
    if (it == runs_.end()) {
        spdlog::warn("Record for unknown run {}", run_id);
        return false;
    }
    it->second.records.emplace_back(kind, record);
    return true;
}

bool MemoryResultStore::complete_run(const std::string& run_id, const std::string& state, const nlohmann::json& summary) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = runs_.find(run_id);
    if (it == runs_.end()) return false;
    it->second.state = state;
    it->second.summary = summary;

    completed_.push_back(run_id);
    while (max_completed_runs_ > 0 && completed_.size() > max_completed_runs_) {
        runs_.erase(completed_.front());
        completed_.pop_front();
    }
    return true;
}

size_t MemoryResultStore::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return runs_.size();
}

std::optional<MemoryResultStore::RunRecord> MemoryResultStore::run(const std::string& run_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = runs_.find(run_id);
    if (it == runs_.end()) return std::nullopt;
    return it->second;
}

class PgResultStore::Impl {
public:
    explicit Impl(const Config& config) : config_(config) {}

    bool initialize_schema() {
        return execute_with_retry([](pqxx::work& txn) {
            txn.exec(R"(
                CREATE TABLE IF NOT EXISTS compliance_runs (
                    id TEXT PRIMARY KEY,
                    kind TEXT NOT NULL,
                    state TEXT NOT NULL,
                    summary JSONB,
                    started_at TIMESTAMP WITH TIME ZONE DEFAULT NOW(),
                    finished_at TIMESTAMP WITH TIME ZONE
                )
            )");
            txn.exec(R"(
                CREATE TABLE IF NOT EXISTS run_records (
                    id BIGSERIAL PRIMARY KEY,
                    run_id TEXT NOT NULL REFERENCES compliance_runs(id),
                    kind TEXT NOT NULL,
                    record JSONB NOT NULL,
                    created_at TIMESTAMP WITH TIME ZONE DEFAULT NOW()
                )
            )");
            txn.exec("CREATE INDEX IF NOT EXISTS idx_run_records_run ON run_records(run_id, id)");
        }, "initialize_schema");
    }

    bool create_run(const std::string& run_id, const std::string& kind, const nlohmann::json& summary) {
        return execute_with_retry([&](pqxx::work& txn) {
            txn.exec_params(
                "INSERT INTO compliance_runs (id, kind, state, summary) VALUES ($1, $2, 'running', $3::jsonb) "
                "ON CONFLICT (id) DO NOTHING",
                run_id, kind, tree::dump(summary));
        }, "create_run");
    }

    bool append_record(const std::string& run_id, const std::string& kind, const nlohmann::json& record) {
        return execute_with_retry([&](pqxx::work& txn) {
            txn.exec_params(
                "INSERT INTO run_records (run_id, kind, record) VALUES ($1, $2, $3::jsonb)",
                run_id, kind, tree::dump(record));
        }, "append_record");
    }

    bool complete_run(const std::string& run_id, const std::string& state, const nlohmann::json& summary) {
        return execute_with_retry([&](pqxx::work& txn) {
            txn.exec_params(
                "UPDATE compliance_runs SET state = $2, summary = $3::jsonb, finished_at = NOW() WHERE id = $1",
                run_id, state, tree::dump(summary));
        }, "complete_run");
    }

    bool check_health() {
        std::lock_guard<std::mutex> lock(mutex_);
        try {
            auto& conn = connection();
            pqxx::work txn(conn);
            txn.exec1("SELECT 1");
            return true;
        } catch (const std::exception& e) {
            spdlog::error("Database health check failed: {}", e.what());
            conn_.reset();
            return false;
        }
    }

private:
    pqxx::connection& connection() {
        if (!conn_ || !conn_->is_open()) {
            conn_ = std::make_unique<pqxx::connection>(config_.pg_dsn);
        }
        return *conn_;
    }

    template <typename Func>
    bool execute_with_retry(Func body, const std::string& operation_name, int max_retries = 3) {
        std::lock_guard<std::mutex> lock(mutex_);
        int attempts = 0;

        while (attempts < max_retries) {
            try {
                pqxx::work txn(connection());
                body(txn);
                txn.commit();
                return true;
            } catch (const pqxx::broken_connection& e) {
                spdlog::error("Database connection error during {}: {}", operation_name, e.what());
                conn_.reset();
            } catch (const pqxx::sql_error& e) {
                spdlog::error("SQL error during {}: {}", operation_name, e.what());
            } catch (const std::exception& e) {
                spdlog::error("Error during {}: {}", operation_name, e.what());
            }

            ++attempts;
            if (attempts >= max_retries) {
                spdlog::error("Max retry attempts reached for {}", operation_name);
                return false;
            }

            // Exponential backoff with jitter
            double backoff_seconds = util::random_jitter(
                std::min(config_.base_backoff_seconds * std::pow(2.0, attempts - 1), config_.max_backoff_seconds), 0.2);
            spdlog::info("Retrying {} in {:.2f} seconds (attempt {}/{})",
                         operation_name, backoff_seconds, attempts + 1, max_retries);
            std::this_thread::sleep_for(std::chrono::milliseconds(static_cast<long long>(backoff_seconds * 1000)));
        }
        return false;
    }

    const Config& config_;
    std::mutex mutex_;
    std::unique_ptr<pqxx::connection> conn_;
};

PgResultStore::PgResultStore(const Config& config) : impl_(std::make_unique<Impl>(config)) {}
PgResultStore::~PgResultStore() = default;

bool PgResultStore::initialize_schema() { return impl_->initialize_schema(); }

bool PgResultStore::create_run(const std::string& run_id, const std::string& kind, const nlohmann::json& summary) {
    return impl_->create_run(run_id, kind, summary);
}

bool PgResultStore::append_record(const std::string& run_id, const std::string& kind, const nlohmann::json& record) {
    return impl_->append_record(run_id, kind, record);
}

bool PgResultStore::complete_run(const std::string& run_id, const std::string& state, const nlohmann::json& summary) {
    return impl_->complete_run(run_id, state, summary);
}

bool PgResultStore::check_health() { return impl_->check_health(); }
