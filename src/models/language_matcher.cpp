#include "models/language_matcher.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <sstream>

namespace modelcat {

namespace {

std::string trim(const std::string& value) {
    size_t start = 0;
    size_t end = value.size();
    while (start < end && std::isspace(static_cast<unsigned char>(value[start]))) ++start;
    while (end > start && std::isspace(static_cast<unsigned char>(value[end - 1]))) --end;
    return value.substr(start, end - start);
}

// en_CA, EN-ca -> en-ca
std::string normalize_tag(const std::string& tag) {
    std::string out = trim(tag);
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
        if (c == '_') return '-';
        return static_cast<char>(std::tolower(c));
    });
    return out;
}

std::string base_language(const std::string& normalized) {
    auto pos = normalized.find('-');
    return pos == std::string::npos ? normalized : normalized.substr(0, pos);
}

}  // namespace

std::vector<std::string> orderLanguageCodes(const std::vector<std::string>& codes,
                                            const std::string& default_code) {
    std::vector<std::string> out;
    out.reserve(codes.size());
    for (const auto& code : codes) {
        if (code == default_code) {
            out.insert(out.begin(), code);
        } else {
            out.push_back(code);
        }
    }
    return out;
}

std::vector<std::string> parseAcceptLanguage(const std::string& header) {
    struct Item {
        std::string tag;
        double q{1.0};
    };
    std::vector<Item> items;

    std::stringstream ss(header);
    std::string part;
    while (std::getline(ss, part, ',')) {
        part = trim(part);
        if (part.empty()) continue;

        Item item;
        auto semi = part.find(';');
        item.tag = trim(part.substr(0, semi));
        if (semi != std::string::npos) {
            std::string param = trim(part.substr(semi + 1));
            if (param.size() > 2 && (param[0] == 'q' || param[0] == 'Q') && param[1] == '=') {
                char* end = nullptr;
                double q = std::strtod(param.c_str() + 2, &end);
                if (end != param.c_str() + 2) item.q = q;
            }
        }
        if (item.tag.empty() || item.tag == "*" || item.q <= 0.0) continue;
        items.push_back(std::move(item));
    }

    std::stable_sort(items.begin(), items.end(),
                     [](const Item& a, const Item& b) { return a.q > b.q; });

    std::vector<std::string> out;
    out.reserve(items.size());
    for (auto& item : items) {
        out.push_back(std::move(item.tag));
    }
    return out;
}

LanguageMatcher::LanguageMatcher(std::vector<std::string> supported)
    : supported_(std::move(supported)) {
    normalized_.reserve(supported_.size());
    base_.reserve(supported_.size());
    for (const auto& code : supported_) {
        normalized_.push_back(normalize_tag(code));
        base_.push_back(base_language(normalized_.back()));
    }
}

std::optional<LanguageMatcher::Match> LanguageMatcher::match(const std::vector<std::string>& preferred) const {
    if (supported_.empty()) return std::nullopt;

    for (const auto& tag : preferred) {
        const auto norm = normalize_tag(tag);
        for (size_t k = 0; k < normalized_.size(); ++k) {
            if (normalized_[k] == norm) {
                return Match{supported_[k], k, true};
            }
        }
    }

    // fr-CA requested, fr or fr-FR supported
    for (const auto& tag : preferred) {
        const auto base = base_language(normalize_tag(tag));
        if (base.empty()) continue;
        for (size_t k = 0; k < base_.size(); ++k) {
            if (base_[k] == base) {
                return Match{supported_[k], k, false};
            }
        }
    }

    return Match{supported_.front(), 0, false};
}

}  // namespace modelcat
