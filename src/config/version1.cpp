// ==============================================================================
// version1.cpp - Резолвер схемы конфигурации версии 1
// ==============================================================================
//
// Каждая функция resolve_* разбирает одно поле документа и бросает
// std::runtime_error("<путь>: <ошибка>") при отсутствии обязательного поля,
// неверной форме или недопустимом значении. Отсутствующее необязательное поле
// (или явный null) заменяется документированным значением по умолчанию.
//
// ==============================================================================

#include <algorithm>
#include <cstdio>
#include <cstdlib>
#include <midimacro/config.hpp>
#include <midimacro/match.hpp>
#include <midimacro/midi.hpp>
#include <midimacro/precondition.hpp>
#include <stdexcept>
#include <string>
#include <vector>

namespace midimacro::config {

namespace {

using match::NumberMatcher;
using match::StringMatcher;

// ----------------------------------------------------------------------------
// Пути полей и базовые проверки формы
// ----------------------------------------------------------------------------

[[noreturn]] void fail(const std::string& path, const std::string& message) {
    throw std::runtime_error(path.empty() ? message : path + ": " + message);
}

std::string field_path(const std::string& path, const std::string& key) {
    return path.empty() ? key : path + "." + key;
}

std::string index_path(const std::string& path, std::size_t index) {
    return path + "[" + std::to_string(index) + "]";
}

std::string found(const Value& v) {
    return std::string("found ") + type_name(v.type());
}

const Value::Object& require_map(const Value& v, const std::string& path) {
    const auto* obj = v.get_object();
    if (obj == nullptr) {
        fail(path, "should be a map, " + found(v));
    }
    return *obj;
}

const Value::Array& require_list(const Value& v, const std::string& path) {
    const auto* arr = v.get_array();
    if (arr == nullptr) {
        fail(path, "should be a list, " + found(v));
    }
    return *arr;
}

const std::string& require_string(const Value& v, const std::string& path) {
    const auto* s = v.get_string();
    if (s == nullptr) {
        fail(path, "should be a string, " + found(v));
    }
    return *s;
}

std::int64_t require_int(const Value& v, const std::string& path) {
    const auto* i = v.get_int();
    if (i == nullptr) {
        fail(path, "should be an integer, " + found(v));
    }
    return *i;
}

bool require_bool(const Value& v, const std::string& path) {
    const auto* b = v.get_bool();
    if (b == nullptr) {
        fail(path, "should be a boolean, " + found(v));
    }
    return *b;
}

/// Поле карты; nullptr если отсутствует или null
const Value* optional_field(const Value& map, const std::string& key) {
    const Value* v = map.get(key);
    if (v == nullptr || v->is_null()) {
        return nullptr;
    }
    return v;
}

const Value& required_field(const Value& map, const std::string& key, const std::string& path) {
    const Value* v = optional_field(map, key);
    if (v == nullptr) {
        fail(path, "missing required field '" + key + "'");
    }
    return *v;
}

/// Ключи, не входящие в allowed, считаются опечатками
void reject_unknown_fields(const Value& map, const std::vector<std::string>& allowed,
                           const std::string& path) {
    std::vector<std::string> unknown;
    for (const auto& [key, value] : require_map(map, path)) {
        if (std::find(allowed.begin(), allowed.end(), key) == allowed.end()) {
            unknown.push_back(key);
        }
    }
    if (unknown.empty()) {
        return;
    }
    std::sort(unknown.begin(), unknown.end());
    fail(path, "unknown field '" + unknown.front() + "'");
}

// ----------------------------------------------------------------------------
// Match checkers
// ----------------------------------------------------------------------------

NumberMatcher resolve_number_matcher(const Value& v, const std::string& path) {
    if (const auto* i = v.get_int()) {
        return NumberMatcher::val(*i);
    }
    if (const auto* s = v.get_string()) {
        if (*s == "any") {
            return NumberMatcher::any();
        }
        fail(path, "the only string allowed for a number matcher is 'any', found '" + *s + "'");
    }
    if (v.is_object()) {
        reject_unknown_fields(v, {"min", "max"}, path);
        std::int64_t min = require_int(required_field(v, "min", path), field_path(path, "min"));
        std::int64_t max = require_int(required_field(v, "max", path), field_path(path, "max"));
        if (min > max) {
            fail(path, "min (" + std::to_string(min) + ") should not be greater than max (" +
                           std::to_string(max) + ")");
        }
        return NumberMatcher::range(min, max);
    }
    fail(path, "number matcher should be an integer, 'any' or {min, max}, " + found(v));
}

std::optional<NumberMatcher> resolve_optional_number(const Value& map, const std::string& key,
                                                     const std::string& path) {
    const Value* v = optional_field(map, key);
    if (v == nullptr) {
        return std::nullopt;
    }
    return resolve_number_matcher(*v, field_path(path, key));
}

StringMatcher resolve_string_matcher(const Value& v, const std::string& path) {
    if (const auto* s = v.get_string()) {
        return StringMatcher::equals(*s);
    }
    if (!v.is_object()) {
        fail(path, "string matcher should be a string or a map, " + found(v));
    }

    static const std::vector<std::string> kinds = {"is",       "equals",    "contains",
                                                   "starts_with", "ends_with", "regex", "any"};
    std::vector<std::string> allowed = kinds;
    allowed.push_back("ignore_case");
    reject_unknown_fields(v, allowed, path);

    bool ignore_case = false;
    if (const Value* ic = optional_field(v, "ignore_case")) {
        ignore_case = require_bool(*ic, field_path(path, "ignore_case"));
    }

    const std::string* kind = nullptr;
    for (const auto& k : kinds) {
        if (v.has(k)) {
            if (kind != nullptr) {
                fail(path, "string matcher should have exactly one of is, equals, contains, "
                           "starts_with, ends_with, regex, any; found both '" +
                               *kind + "' and '" + k + "'");
            }
            kind = &k;
        }
    }
    if (kind == nullptr) {
        fail(path, "string matcher should have one of is, equals, contains, starts_with, "
                   "ends_with, regex, any");
    }

    const std::string sub_path = field_path(path, *kind);
    const Value& arg = *v.get(*kind);

    if (*kind == "any") {
        if (!require_bool(arg, sub_path)) {
            fail(sub_path, "'any' can only be true");
        }
        return StringMatcher::any();
    }

    std::string text = require_string(arg, sub_path);
    if (*kind == "is" || *kind == "equals") {
        return StringMatcher::equals(std::move(text), ignore_case);
    }
    if (*kind == "contains") {
        return StringMatcher::contains(std::move(text), ignore_case);
    }
    if (*kind == "starts_with") {
        return StringMatcher::starts_with(std::move(text), ignore_case);
    }
    if (*kind == "ends_with") {
        return StringMatcher::ends_with(std::move(text), ignore_case);
    }
    try {
        return StringMatcher::regex(std::move(text), ignore_case);
    } catch (const std::invalid_argument& e) {
        fail(sub_path, e.what());
    }
}

// ----------------------------------------------------------------------------
// Event matchers
// ----------------------------------------------------------------------------

rule::MidiEventMatcher resolve_midi_event_matcher(const Value& data, const std::string& path) {
    require_map(data, path);

    const std::string kind_path = field_path(path, "message_type");
    const std::string& kind_name = require_string(required_field(data, "message_type", path),
                                                  kind_path);
    auto kind = midi::parse_message_kind(kind_name);
    if (!kind) {
        fail(kind_path, "unknown message_type '" + kind_name + "'");
    }

    auto field = [&](const char* key) { return resolve_optional_number(data, key, path); };

    using rule::MidiEventMatcher;
    switch (*kind) {
    case midi::MessageKind::NoteOn:
        reject_unknown_fields(data, {"message_type", "channel", "note", "velocity"}, path);
        return MidiEventMatcher::note_on(field("channel"), field("note"), field("velocity"));
    case midi::MessageKind::NoteOff:
        reject_unknown_fields(data, {"message_type", "channel", "note", "velocity"}, path);
        return MidiEventMatcher::note_off(field("channel"), field("note"), field("velocity"));
    case midi::MessageKind::KeyPressure:
        reject_unknown_fields(data, {"message_type", "channel", "note", "value"}, path);
        return MidiEventMatcher::key_pressure(field("channel"), field("note"), field("value"));
    case midi::MessageKind::ControlChange:
        reject_unknown_fields(data, {"message_type", "channel", "control", "value"}, path);
        return MidiEventMatcher::control_change(field("channel"), field("control"),
                                                field("value"));
    case midi::MessageKind::ProgramChange:
        reject_unknown_fields(data, {"message_type", "channel", "program"}, path);
        return MidiEventMatcher::program_change(field("channel"), field("program"));
    case midi::MessageKind::ChannelPressure:
        reject_unknown_fields(data, {"message_type", "channel", "value"}, path);
        return MidiEventMatcher::channel_pressure(field("channel"), field("value"));
    case midi::MessageKind::PitchBend:
        reject_unknown_fields(data, {"message_type", "channel", "value"}, path);
        return MidiEventMatcher::pitch_bend(field("channel"), field("value"));
    }
    fail(kind_path, "unknown message_type '" + kind_name + "'");
}

rule::EventMatcher resolve_event_matcher(const Value& v, const std::string& path) {
    require_map(v, path);
    reject_unknown_fields(v, {"type", "data"}, path);

    const std::string& type = require_string(required_field(v, "type", path),
                                             field_path(path, "type"));
    if (type == "midi") {
        return resolve_midi_event_matcher(required_field(v, "data", path),
                                          field_path(path, "data"));
    }
    fail(field_path(path, "type"), "unknown event type '" + type + "'");
}

std::vector<rule::EventMatcher> resolve_event_matchers(const Value& v, const std::string& path) {
    const auto& list = require_list(v, path);
    if (list.empty()) {
        fail(path, "should contain at least one event matcher");
    }
    std::vector<rule::EventMatcher> matchers;
    matchers.reserve(list.size());
    for (std::size_t i = 0; i < list.size(); ++i) {
        matchers.push_back(resolve_event_matcher(list[i], index_path(path, i)));
    }
    return matchers;
}

// ----------------------------------------------------------------------------
// Preconditions и scope
// ----------------------------------------------------------------------------

rule::Condition resolve_midi_condition(const Value& data, const std::string& path) {
    require_map(data, path);

    const std::string type_path = field_path(path, "condition_type");
    const std::string& type = require_string(required_field(data, "condition_type", path),
                                             type_path);

    auto channel = resolve_optional_number(data, "channel", path);
    auto number_or_any = [&](const char* key) {
        auto m = resolve_optional_number(data, key, path);
        return m ? *m : NumberMatcher::any();
    };

    if (type == "control_value") {
        reject_unknown_fields(data, {"condition_type", "channel", "control", "value"}, path);
        const std::string control_path = field_path(path, "control");
        std::int64_t control = require_int(required_field(data, "control", path), control_path);
        if (control < 0 || control > 127) {
            fail(control_path, "control should be between 0 and 127, found " +
                                   std::to_string(control));
        }
        return rule::ControlValueCondition{channel, static_cast<std::uint8_t>(control),
                                           number_or_any("value")};
    }
    if (type == "note_active") {
        reject_unknown_fields(data, {"condition_type", "channel", "note"}, path);
        return rule::NoteActiveCondition{channel, number_or_any("note")};
    }
    if (type == "program") {
        reject_unknown_fields(data, {"condition_type", "channel", "program"}, path);
        return rule::ProgramCondition{channel, number_or_any("program")};
    }
    if (type == "pitch_bend") {
        reject_unknown_fields(data, {"condition_type", "channel", "value"}, path);
        return rule::PitchBendCondition{channel, number_or_any("value")};
    }
    fail(type_path, "unknown condition_type '" + type + "'");
}

rule::Precondition resolve_precondition(const Value& v, const std::string& path) {
    require_map(v, path);
    reject_unknown_fields(v, {"type", "invert", "data"}, path);

    const std::string& type = require_string(required_field(v, "type", path),
                                             field_path(path, "type"));
    if (type != "midi") {
        fail(field_path(path, "type"), "unknown precondition type '" + type + "'");
    }

    bool invert = false;
    if (const Value* inv = optional_field(v, "invert")) {
        invert = require_bool(*inv, field_path(path, "invert"));
    }

    return rule::Precondition(
        resolve_midi_condition(required_field(v, "data", path), field_path(path, "data")),
        invert);
}

rule::Scope resolve_scope(const Value& v, const std::string& path) {
    require_map(v, path);
    reject_unknown_fields(v, {"window_class", "window_name"}, path);

    rule::Scope scope;
    if (const Value* wc = optional_field(v, "window_class")) {
        scope.window_class = resolve_string_matcher(*wc, field_path(path, "window_class"));
    }
    if (const Value* wn = optional_field(v, "window_name")) {
        scope.window_name = resolve_string_matcher(*wn, field_path(path, "window_name"));
    }
    return scope;
}

// ----------------------------------------------------------------------------
// Actions
// ----------------------------------------------------------------------------

std::size_t resolve_count(const Value& data, const std::string& path) {
    const Value* v = optional_field(data, "count");
    if (v == nullptr) {
        return 1;
    }
    const std::string count_path = field_path(path, "count");
    std::int64_t count = require_int(*v, count_path);
    if (count < 0) {
        fail(count_path, "count should be 0 or more, found " + std::to_string(count));
    }
    return static_cast<std::size_t>(count);
}

/// data: строка или {<text_key>: строка, count: целое}
std::pair<std::string, std::size_t> resolve_repeated_text(const Value& data,
                                                          const char* text_key,
                                                          const std::string& path) {
    if (const auto* s = data.get_string()) {
        return {*s, 1};
    }
    if (!data.is_object()) {
        fail(path, "should be either a string or a map, " + found(data));
    }
    reject_unknown_fields(data, {text_key, "count"}, path);
    std::string text = require_string(required_field(data, text_key, path),
                                      field_path(path, text_key));
    return {std::move(text), resolve_count(data, path)};
}

std::string stringify_scalar(const Value& v, const std::string& path) {
    if (const auto* s = v.get_string()) {
        return *s;
    }
    if (const auto* i = v.get_int()) {
        return std::to_string(*i);
    }
    if (const auto* b = v.get_bool()) {
        return *b ? "true" : "false";
    }
    if (const auto* d = v.get_double()) {
        // Кратчайшая запись, которая читается обратно в то же число
        char buf[32];
        for (int precision = 15; precision <= 17; ++precision) {
            std::snprintf(buf, sizeof(buf), "%.*g", precision, *d);
            if (std::strtod(buf, nullptr) == *d) {
                break;
            }
        }
        return buf;
    }
    fail(path, "should be a string, number or boolean, " + found(v));
}

action::Action resolve_shell(const Value& data, const std::string& path) {
    require_map(data, path);
    reject_unknown_fields(data, {"command", "args", "env_vars"}, path);

    std::string command = require_string(required_field(data, "command", path),
                                         field_path(path, "command"));

    std::optional<std::vector<std::string>> args;
    if (const Value* a = optional_field(data, "args")) {
        const std::string args_path = field_path(path, "args");
        const auto& list = require_list(*a, args_path);
        args.emplace();
        for (std::size_t i = 0; i < list.size(); ++i) {
            args->push_back(require_string(list[i], index_path(args_path, i)));
        }
    }

    std::optional<action::EnvVars> env_vars;
    if (const Value* e = optional_field(data, "env_vars")) {
        const std::string env_path = field_path(path, "env_vars");
        env_vars.emplace();
        for (const auto& [key, value] : require_map(*e, env_path)) {
            env_vars->emplace_back(key, stringify_scalar(value, field_path(env_path, key)));
        }
        // Порядок ключей карты не определён; сортируем для воспроизводимости
        std::sort(env_vars->begin(), env_vars->end());
    }

    return action::Action::shell(std::move(command), std::move(args), std::move(env_vars));
}

action::ActionVec resolve_actions(const Value& v, const std::string& path);

action::Action resolve_action(const Value& v, const std::string& path) {
    require_map(v, path);
    reject_unknown_fields(v, {"type", "data"}, path);

    const std::string type_path = field_path(path, "type");
    const std::string& type = require_string(required_field(v, "type", path), type_path);
    const std::string data_path = field_path(path, "data");

    if (type == "key_sequence") {
        auto [sequence, count] =
            resolve_repeated_text(required_field(v, "data", path), "sequence", data_path);
        return action::Action::key_sequence(std::move(sequence), count);
    }
    if (type == "enter_text") {
        auto [text, count] =
            resolve_repeated_text(required_field(v, "data", path), "text", data_path);
        return action::Action::enter_text(std::move(text), count);
    }
    if (type == "shell") {
        return resolve_shell(required_field(v, "data", path), data_path);
    }
    if (type == "combination") {
        return action::Action::combination(
            resolve_actions(required_field(v, "data", path), data_path));
    }
    fail(type_path, "unknown action type '" + type + "'");
}

action::ActionVec resolve_actions(const Value& v, const std::string& path) {
    const auto& list = require_list(v, path);
    action::ActionVec actions;
    actions.reserve(list.size());
    for (std::size_t i = 0; i < list.size(); ++i) {
        actions.push_back(resolve_action(list[i], index_path(path, i)));
    }
    return actions;
}

// ----------------------------------------------------------------------------
// Macro и global
// ----------------------------------------------------------------------------

rule::Macro resolve_macro(const Value& v, const std::string& path) {
    require_map(v, path);
    reject_unknown_fields(
        v, {"name", "match_events", "required_preconditions", "scope", "actions"}, path);

    auto builder = rule::MacroBuilder::from_event_matchers(resolve_event_matchers(
        required_field(v, "match_events", path), field_path(path, "match_events")));

    if (const Value* name = optional_field(v, "name")) {
        builder.set_name(require_string(*name, field_path(path, "name")));
    }

    if (const Value* pre = optional_field(v, "required_preconditions")) {
        const std::string pre_path = field_path(path, "required_preconditions");
        const auto& list = require_list(*pre, pre_path);
        std::vector<rule::Precondition> preconditions;
        preconditions.reserve(list.size());
        for (std::size_t i = 0; i < list.size(); ++i) {
            preconditions.push_back(resolve_precondition(list[i], index_path(pre_path, i)));
        }
        builder.set_preconditions(std::move(preconditions));
    }

    if (const Value* scope = optional_field(v, "scope")) {
        builder.set_scope(resolve_scope(*scope, field_path(path, "scope")));
    }

    builder.set_actions(
        resolve_actions(required_field(v, "actions", path), field_path(path, "actions")));

    return builder.build();
}

Settings resolve_global(const Value& v, const std::string& path) {
    require_map(v, path);
    reject_unknown_fields(v, {"midi_port", "key_delay_us", "stop_event"}, path);

    Settings settings;
    if (const Value* port = optional_field(v, "midi_port")) {
        settings.midi_port = require_string(*port, field_path(path, "midi_port"));
    }
    if (const Value* delay = optional_field(v, "key_delay_us")) {
        const std::string delay_path = field_path(path, "key_delay_us");
        std::int64_t us = require_int(*delay, delay_path);
        if (us < 0) {
            fail(delay_path, "key_delay_us should be 0 or more, found " + std::to_string(us));
        }
        settings.key_delay = std::chrono::microseconds(us);
    }
    if (const Value* stop = optional_field(v, "stop_event")) {
        settings.stop_event = resolve_event_matcher(*stop, field_path(path, "stop_event"));
    }
    return settings;
}

// ----------------------------------------------------------------------------
// Version1Resolver
// ----------------------------------------------------------------------------

class Version1Resolver : public Resolver {
public:
    const char* version() const override { return "1"; }

    Config resolve(const Value& document) const override {
        require_map(document, "");
        reject_unknown_fields(document, {"version", "global", "macros"}, "");

        Config config;
        if (const Value* global = optional_field(document, "global")) {
            config.settings = resolve_global(*global, "global");
        }

        const auto& list = require_list(required_field(document, "macros", ""), "macros");
        config.macros.reserve(list.size());
        for (std::size_t i = 0; i < list.size(); ++i) {
            config.macros.push_back(resolve_macro(list[i], index_path("macros", i)));
        }
        return config;
    }
};

}  // namespace

std::unique_ptr<Resolver> make_version1_resolver() {
    return std::make_unique<Version1Resolver>();
}

}  // namespace midimacro::config
