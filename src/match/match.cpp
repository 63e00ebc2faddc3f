// ==============================================================================
// match.cpp - StringMatcher / NumberMatcher
// ==============================================================================

#include <algorithm>
#include <cctype>
#include <midimacro/match.hpp>
#include <regex>
#include <stdexcept>

namespace midimacro::match {

// ============================================================================
// Utility functions
// ============================================================================

std::string ascii_lowercase(std::string_view str) {
    std::string result;
    result.reserve(str.size());
    for (char c : str) {
        result += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return result;
}

bool iequals(std::string_view a, std::string_view b) {
    if (a.size() != b.size())
        return false;
    for (std::size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) !=
            std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

bool icontains(std::string_view haystack, std::string_view needle) {
    if (needle.empty())
        return true;
    if (haystack.size() < needle.size())
        return false;

    auto it = std::search(haystack.begin(), haystack.end(), needle.begin(), needle.end(),
                          [](char a, char b) {
                              return std::tolower(static_cast<unsigned char>(a)) ==
                                     std::tolower(static_cast<unsigned char>(b));
                          });
    return it != haystack.end();
}

bool istarts_with(std::string_view str, std::string_view prefix) {
    if (str.size() < prefix.size())
        return false;
    return iequals(str.substr(0, prefix.size()), prefix);
}

bool iends_with(std::string_view str, std::string_view suffix) {
    if (str.size() < suffix.size())
        return false;
    return iequals(str.substr(str.size() - suffix.size()), suffix);
}

// ============================================================================
// StringMatcher
// ============================================================================

StringMatcher::StringMatcher(StringPattern pattern, bool ignore_case)
    : pattern_(std::move(pattern)), ignore_case_(ignore_case) {}

StringMatcher StringMatcher::equals(std::string value, bool ignore_case) {
    return StringMatcher(StringEquals{std::move(value)}, ignore_case);
}

StringMatcher StringMatcher::contains(std::string value, bool ignore_case) {
    return StringMatcher(StringContains{std::move(value)}, ignore_case);
}

StringMatcher StringMatcher::starts_with(std::string value, bool ignore_case) {
    return StringMatcher(StringStartsWith{std::move(value)}, ignore_case);
}

StringMatcher StringMatcher::ends_with(std::string value, bool ignore_case) {
    return StringMatcher(StringEndsWith{std::move(value)}, ignore_case);
}

StringMatcher StringMatcher::any() {
    return StringMatcher(StringAny{}, false);
}

StringMatcher StringMatcher::regex(std::string pattern, bool ignore_case) {
    auto flags = std::regex::ECMAScript;
    if (ignore_case) {
        flags |= std::regex::icase;
    }
    StringRegex re;
    try {
        re.regex = std::regex(pattern, flags);
    } catch (const std::regex_error& e) {
        throw std::invalid_argument("invalid regex '" + pattern + "': " + e.what());
    }
    re.pattern = std::move(pattern);
    return StringMatcher(std::move(re), ignore_case);
}

bool StringMatcher::matches(std::string_view candidate) const {
    return std::visit(
        [this, candidate](const auto& pat) -> bool {
            using T = std::decay_t<decltype(pat)>;

            if constexpr (std::is_same_v<T, StringEquals>) {
                return ignore_case_ ? iequals(candidate, pat.value) : candidate == pat.value;
            } else if constexpr (std::is_same_v<T, StringContains>) {
                return ignore_case_ ? icontains(candidate, pat.value)
                                    : candidate.find(pat.value) != std::string_view::npos;
            } else if constexpr (std::is_same_v<T, StringStartsWith>) {
                return ignore_case_ ? istarts_with(candidate, pat.value)
                                    : candidate.compare(0, pat.value.size(), pat.value) == 0;
            } else if constexpr (std::is_same_v<T, StringEndsWith>) {
                if (ignore_case_) {
                    return iends_with(candidate, pat.value);
                }
                if (candidate.size() < pat.value.size())
                    return false;
                return candidate.compare(candidate.size() - pat.value.size(), pat.value.size(),
                                         pat.value) == 0;
            } else if constexpr (std::is_same_v<T, StringRegex>) {
                // Сложные шаблоны на длинных заголовках могут исчерпать
                // ресурсы движка; такое окно считается несовпавшим
                try {
                    return std::regex_search(candidate.begin(), candidate.end(), pat.regex);
                } catch (const std::regex_error&) {
                    return false;
                }
            } else {
                return true;
            }
        },
        pattern_);
}

std::string StringMatcher::describe() const {
    std::string text = std::visit(
        [](const auto& pat) -> std::string {
            using T = std::decay_t<decltype(pat)>;

            if constexpr (std::is_same_v<T, StringEquals>) {
                return "is \"" + pat.value + "\"";
            } else if constexpr (std::is_same_v<T, StringContains>) {
                return "contains \"" + pat.value + "\"";
            } else if constexpr (std::is_same_v<T, StringStartsWith>) {
                return "starts with \"" + pat.value + "\"";
            } else if constexpr (std::is_same_v<T, StringEndsWith>) {
                return "ends with \"" + pat.value + "\"";
            } else if constexpr (std::is_same_v<T, StringRegex>) {
                return "matches /" + pat.pattern + "/";
            } else {
                return "any";
            }
        },
        pattern_);

    if (ignore_case_) {
        text += " (ignore case)";
    }
    return text;
}

// ============================================================================
// NumberMatcher
// ============================================================================

bool NumberMatcher::matches(std::int64_t candidate) const {
    return std::visit(
        [candidate](const auto& pat) -> bool {
            using T = std::decay_t<decltype(pat)>;

            if constexpr (std::is_same_v<T, NumberVal>) {
                return candidate == pat.value;
            } else if constexpr (std::is_same_v<T, NumberRange>) {
                return candidate >= pat.min && candidate <= pat.max;
            } else {
                return true;
            }
        },
        pattern_);
}

std::string NumberMatcher::describe() const {
    return std::visit(
        [](const auto& pat) -> std::string {
            using T = std::decay_t<decltype(pat)>;

            if constexpr (std::is_same_v<T, NumberVal>) {
                return std::to_string(pat.value);
            } else if constexpr (std::is_same_v<T, NumberRange>) {
                return std::to_string(pat.min) + ".." + std::to_string(pat.max);
            } else {
                return "any";
            }
        },
        pattern_);
}

bool NumberMatcher::operator==(const NumberMatcher& other) const {
    if (pattern_.index() != other.pattern_.index()) {
        return false;
    }
    if (const auto* v = std::get_if<NumberVal>(&pattern_)) {
        return v->value == std::get<NumberVal>(other.pattern_).value;
    }
    if (const auto* r = std::get_if<NumberRange>(&pattern_)) {
        const auto& o = std::get<NumberRange>(other.pattern_);
        return r->min == o.min && r->max == o.max;
    }
    return true;
}

}  // namespace midimacro::match
