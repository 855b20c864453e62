#pragma once

#include <memory>
#include <optional>
#include <string>

namespace re2 {
class RE2;
}

// Compiled RE2 pattern. Matching is linear in the subject, so whole running
// configs can be searched without bounding their size.
class Pattern {
public:
    // Throws DefinitionError when the pattern does not compile
    explicit Pattern(const std::string& text, bool ignore_case = true);
    ~Pattern();

    Pattern(const Pattern&) = delete;
    Pattern& operator=(const Pattern&) = delete;

    // Unanchored search
    bool search(const std::string& subject) const;

    // Capture group of the first match; group 0 is the whole match
    std::optional<std::string> extract(const std::string& subject, int group = 0) const;

    int groups() const;
    const std::string& text() const { return text_; }

private:
    std::string text_;
    std::unique_ptr<re2::RE2> re_;
};
