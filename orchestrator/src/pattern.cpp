#include "pattern.hpp"
#include "errors.hpp"
#include <vector>
#include <fmt/format.h>
#include <re2/re2.h>

Pattern::Pattern(const std::string& text, bool ignore_case) : text_(text) {
    re2::RE2::Options options;
    options.set_case_sensitive(!ignore_case);
    options.set_log_errors(false);
    re_ = std::make_unique<re2::RE2>(text, options);
    if (!re_->ok()) {
        throw DefinitionError(fmt::format("invalid regex /{}/: {}", text, re_->error()));
    }
}

Pattern::~Pattern() = default;

bool Pattern::search(const std::string& subject) const {
    return re2::RE2::PartialMatch(subject, *re_);
}

std::optional<std::string> Pattern::extract(const std::string& subject, int group) const {
    if (group < 0 || group > re_->NumberOfCapturingGroups()) return std::nullopt;

    std::vector<re2::StringPiece> captures(static_cast<size_t>(group) + 1);
    if (!re_->Match(subject, 0, subject.size(), re2::RE2::UNANCHORED, captures.data(),
                    static_cast<int>(captures.size()))) {
        return std::nullopt;
    }
    const auto& hit = captures[static_cast<size_t>(group)];
    if (hit.data() == nullptr) return std::nullopt;
    return std::string(hit.data(), hit.size());
}

int Pattern::groups() const {
    return re_->NumberOfCapturingGroups();
}
