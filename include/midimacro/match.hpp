// ==============================================================================
// midimacro/match.hpp - Проверки соответствия скаляров (StringMatcher/NumberMatcher)
// ==============================================================================
//
// Назначение:
// - StringMatcher: Equals / Contains / StartsWith / EndsWith / Regex / Any
// - NumberMatcher: Val / Range (включительно) / Any
// - ASCII case-folding утилиты
//
// Проверки ничего не знают о событиях, макросах и состоянии: это чистые
// предикаты над неизменяемыми данными, переиспользуемые любым полем.
//
// ==============================================================================

#ifndef MIDIMACRO_MATCH_HPP
#define MIDIMACRO_MATCH_HPP

#include <cstdint>
#include <regex>
#include <string>
#include <string_view>
#include <variant>

namespace midimacro::match {

// ============================================================================
// Строковые паттерны
// ============================================================================

/// Точное совпадение строки
struct StringEquals {
    std::string value;
};

/// Подстрока
struct StringContains {
    std::string value;
};

/// Префикс
struct StringStartsWith {
    std::string value;
};

/// Суффикс
struct StringEndsWith {
    std::string value;
};

/// ECMAScript regex (поиск, не полное совпадение)
struct StringRegex {
    std::regex regex;
    std::string pattern;  // оригинальный паттерн для описания
};

/// Любая строка
struct StringAny {};

using StringPattern = std::variant<StringEquals, StringContains, StringStartsWith, StringEndsWith,
                                   StringRegex, StringAny>;

/// Проверка строки. Чувствительность к регистру фиксируется при создании.
class StringMatcher {
public:
    static StringMatcher equals(std::string value, bool ignore_case = false);
    static StringMatcher contains(std::string value, bool ignore_case = false);
    static StringMatcher starts_with(std::string value, bool ignore_case = false);
    static StringMatcher ends_with(std::string value, bool ignore_case = false);
    static StringMatcher any();

    /// @throw std::invalid_argument если паттерн не компилируется
    static StringMatcher regex(std::string pattern, bool ignore_case = false);

    bool matches(std::string_view candidate) const;

    const StringPattern& pattern() const { return pattern_; }
    bool ignore_case() const { return ignore_case_; }

    /// Описание для диагностики, например: contains "Mozilla" (ignore case)
    std::string describe() const;

private:
    StringMatcher(StringPattern pattern, bool ignore_case);

    StringPattern pattern_;
    bool ignore_case_ = false;
};

// ============================================================================
// Числовые паттерны
// ============================================================================

struct NumberVal {
    std::int64_t value;
};

/// Диапазон [min, max], обе границы включительно
struct NumberRange {
    std::int64_t min;
    std::int64_t max;
};

struct NumberAny {};

using NumberPattern = std::variant<NumberVal, NumberRange, NumberAny>;

class NumberMatcher {
public:
    static NumberMatcher val(std::int64_t value) { return NumberMatcher(NumberVal{value}); }
    static NumberMatcher range(std::int64_t min, std::int64_t max) {
        return NumberMatcher(NumberRange{min, max});
    }
    static NumberMatcher any() { return NumberMatcher(NumberAny{}); }

    bool matches(std::int64_t candidate) const;

    const NumberPattern& pattern() const { return pattern_; }

    /// "7", "0..63", "any"
    std::string describe() const;

    bool operator==(const NumberMatcher& other) const;
    bool operator!=(const NumberMatcher& other) const { return !(*this == other); }

private:
    explicit NumberMatcher(NumberPattern pattern) : pattern_(pattern) {}

    NumberPattern pattern_;
};

// ============================================================================
// Utility functions
// ============================================================================

/// ASCII lowercase
std::string ascii_lowercase(std::string_view str);

bool iequals(std::string_view a, std::string_view b);

bool icontains(std::string_view haystack, std::string_view needle);

bool istarts_with(std::string_view str, std::string_view prefix);

bool iends_with(std::string_view str, std::string_view suffix);

}  // namespace midimacro::match

#endif  // MIDIMACRO_MATCH_HPP
