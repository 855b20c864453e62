#include "rule_evaluator.hpp"
#include "errors.hpp"
#include "tree.hpp"
#include <thread>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace {

constexpr size_t kMaxActualLength = 4096;

// Cuts on a code point boundary so the excerpt stays valid UTF-8
std::string excerpt(const std::string& s) {
    if (s.size() <= kMaxActualLength) return s;
    size_t cut = kMaxActualLength;
    while (cut > 0 && (static_cast<unsigned char>(s[cut]) & 0xC0) == 0x80) --cut;
    return s.substr(0, cut) + "...";
}

// Entries at a path: list items, or one for a single present value
size_t element_count(const nlohmann::json& value) {
    if (value.is_array()) return value.size();
    return tree::is_empty_value(value) ? 0 : 1;
}

bool deadline_passed(Deadline deadline) {
    return deadline && std::chrono::steady_clock::now() >= *deadline;
}

Finding make_finding(const Rule& rule, const Check& check, size_t index, const Device& device) {
    Finding f;
    f.device_id = device.id;
    f.rule_id = rule.id;
    f.rule_name = rule.name;
    f.check_name = check.name;
    f.check_index = static_cast<int>(index);
    f.severity = rule.severity;
    f.timestamp = std::chrono::system_clock::now();
    return f;
}

std::string failure_message(const Check& check, const nlohmann::json& value, const std::string& actual) {
    if (!check.error_message.empty()) return check.error_message;
    const auto expected = check.expected.value_or("");
    switch (check.op) {
        case CheckOperator::Exists:      return "value is empty";
        case CheckOperator::NotExists:   return "value is present";
        case CheckOperator::Contains:    return fmt::format("value does not contain '{}'", expected);
        case CheckOperator::NotContains: return fmt::format("value contains '{}'", expected);
        case CheckOperator::Equals:      return fmt::format("expected '{}', got '{}'", expected, excerpt(actual));
        case CheckOperator::Regex:       return fmt::format("value does not match /{}/", expected);
        case CheckOperator::Count:
            return fmt::format("found {} entries, expected at least {}", element_count(value), expected);
    }
    return "check failed";
}

} // namespace

bool RuleOutcome::passed() const {
    if (aborted || findings.empty()) return false;
    for (const auto& f : findings) {
        if (f.status != FindingStatus::Pass) return false;
    }
    return true;
}

RuleEvaluator::RuleEvaluator(const Config& config, BackoffManager& backoff)
    : config_(config), backoff_(backoff) {}

bool RuleEvaluator::compare(CheckOperator op, const nlohmann::json& actual,
                            const std::optional<std::string>& expected, const Pattern* pattern) {
    auto text = tree::canonical_string(actual);
    const auto& want = expected.value_or("");
    switch (op) {
        case CheckOperator::Exists:      return !tree::is_empty_value(actual);
        case CheckOperator::NotExists:   return tree::is_empty_value(actual);
        case CheckOperator::Contains:    return text.find(want) != std::string::npos;
        case CheckOperator::NotContains: return text.find(want) == std::string::npos;
        case CheckOperator::Equals:      return text == want;
        case CheckOperator::Regex:
            if (pattern) return pattern->search(text);
            return Pattern(want).search(text);
        case CheckOperator::Count: {
            auto minimum = parse_count(want);
            return minimum && static_cast<long long>(element_count(actual)) >= *minimum;
        }
    }
    return false;
}

std::vector<Finding> RuleEvaluator::error_findings(const Rule& rule, const Device& device,
                                                   size_t from, const std::string& message) {
    std::vector<Finding> out;
    for (size_t i = from; i < rule.checks.size(); ++i) {
        auto f = make_finding(rule, rule.checks[i], i, device);
        f.status = FindingStatus::Error;
        f.message = message;
        out.push_back(std::move(f));
    }
    return out;
}

FetchResult RuleEvaluator::fetch_with_retry(VendorConnector& connector, const Device& device,
                                            const Selector& selector, Deadline deadline) {
    int attempt = 0;
    while (true) {
        try {
            auto result = connector.fetch_within(selector, deadline);
            backoff_.record_success(device.id);
            return result;
        } catch (const ConnectorError& e) {
            if (!e.transient()) throw;

            backoff_.record_failure(device.id);
            if (attempt >= config_.fetch_retry_count || deadline_passed(deadline)) throw;

            auto delay = backoff_.get_delay(device.id);
            if (deadline && std::chrono::steady_clock::now() + delay >= *deadline) throw;

            ++attempt;
            spdlog::warn("[{}] Fetch of {} failed ({}), retry {}/{} in {}ms", device.id, selector.describe(),
                         e.what(), attempt, config_.fetch_retry_count, delay.count());
            std::this_thread::sleep_for(delay);
        }
    }
}

RuleOutcome RuleEvaluator::evaluate(const Rule& rule, VendorConnector& connector, const Device& device,
                                    Deadline deadline, const FindingCallback& on_finding) {
    RuleOutcome outcome;
    auto emit = [&](Finding f) {
        if (on_finding) on_finding(f);
        outcome.findings.push_back(std::move(f));
    };

    for (size_t i = 0; i < rule.checks.size(); ++i) {
        const auto& check = rule.checks[i];

        if (deadline_passed(deadline)) {
            outcome.aborted = true;
            outcome.timed_out = true;
            outcome.abort_reason = "device audit timed out";
            for (auto& f : error_findings(rule, device, i, outcome.abort_reason)) emit(std::move(f));
            break;
        }

        FetchResult result;
        try {
            result = fetch_with_retry(connector, device, check.selector, deadline);
        } catch (const ConnectorError& e) {
            outcome.aborted = true;
            outcome.timed_out = deadline_passed(deadline);
            outcome.abort_reason = outcome.timed_out ? std::string("device audit timed out") : std::string(e.what());
            spdlog::error("[{}] Rule '{}' aborted at check '{}': {}", device.id, rule.name, check.name, e.what());
            for (auto& f : error_findings(rule, device, i, outcome.abort_reason)) emit(std::move(f));
            break;
        } catch (const std::exception& e) {
            // Session setup failures (credentials, factory) end up here
            outcome.aborted = true;
            outcome.abort_reason = e.what();
            spdlog::error("[{}] Rule '{}' aborted at check '{}': {}", device.id, rule.name, check.name, e.what());
            for (auto& f : error_findings(rule, device, i, outcome.abort_reason)) emit(std::move(f));
            break;
        }

        auto finding = make_finding(rule, check, i, device);
        if (!result.found) {
            if (check.op == CheckOperator::NotExists ||
                (check.op == CheckOperator::Count && compare(check.op, nullptr, check.expected))) {
                finding.status = FindingStatus::Pass;
                finding.message = check.success_message.empty() ? "path not present" : check.success_message;
            } else {
                finding.status = FindingStatus::Fail;
                finding.message = "path not found: " + check.selector.describe();
            }
            emit(std::move(finding));
            continue;
        }

        finding.actual = excerpt(tree::canonical_string(result.value));
        if (compare(check.op, result.value, check.expected, check.pattern.get())) {
            finding.status = FindingStatus::Pass;
            finding.message = check.success_message.empty() ? "check passed" : check.success_message;
        } else {
            finding.status = FindingStatus::Fail;
            finding.message = failure_message(check, result.value, finding.actual);
        }
        emit(std::move(finding));
    }

    spdlog::debug("[{}] Rule '{}': {}", device.id, rule.name,
                  outcome.aborted ? "aborted" : (outcome.passed() ? "pass" : "fail"));
    return outcome;
}
