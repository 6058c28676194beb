#pragma once

#include <optional>
#include <string>
#include <vector>

namespace modelcat {

// Move default_code to the front, keeping the order of the other codes.
std::vector<std::string> orderLanguageCodes(const std::vector<std::string>& codes,
                                            const std::string& default_code);

// Parse Accept-Language header into tags ordered by descending quality.
std::vector<std::string> parseAcceptLanguage(const std::string& header);

// Immutable language negotiation table built from a model's supported codes.
// The first supported code is the fallback.
class LanguageMatcher {
public:
    struct Match {
        std::string code;
        size_t index{0};
        bool exact{false};
    };

    LanguageMatcher() = default;
    explicit LanguageMatcher(std::vector<std::string> supported);

    std::optional<Match> match(const std::vector<std::string>& preferred) const;

    const std::vector<std::string>& supported() const { return supported_; }
    bool empty() const { return supported_.empty(); }

private:
    std::vector<std::string> supported_;
    std::vector<std::string> normalized_;
    std::vector<std::string> base_;
};

}  // namespace modelcat
