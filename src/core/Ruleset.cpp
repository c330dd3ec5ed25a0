#include "core/Ruleset.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>

namespace modtris::core {

namespace {

bool isIdentifier(const std::string& name) noexcept {
    if (name.empty()) {
        return false;
    }
    if (!(std::isalpha(static_cast<unsigned char>(name.front())) || name.front() == '_')) {
        return false;
    }
    return std::all_of(name.begin(), name.end(), [](char c) {
        return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
    });
}

} // namespace

RuleType ruleTypeOf(const RuleValue& value) noexcept {
    switch (value.index()) {
    case 1: return RuleType::Bool;
    case 2: return RuleType::Int;
    case 3: return RuleType::String;
    case 4: return RuleType::BoardSize;
    default: return RuleType::None;
    }
}

const char* ruleTypeName(RuleType type) noexcept {
    switch (type) {
    case RuleType::None:      return "none";
    case RuleType::Bool:      return "bool";
    case RuleType::Int:       return "int";
    case RuleType::String:    return "string";
    case RuleType::BoardSize: return "board size";
    }
    return "unknown";
}

bool Rule::allows(const RuleValue& value) const noexcept {
    return std::find(accepts.begin(), accepts.end(), ruleTypeOf(value)) != accepts.end();
}

Ruleset::Ruleset(std::vector<Rule> rules, std::string name)
    : rules_{}
    , name_{std::move(name)}
{
    if (!name_.empty() && !isIdentifier(name_)) {
        throw std::invalid_argument("'" + name_ + "' is not a valid ruleset name");
    }

    for (auto& rule : rules) {
        if (!isIdentifier(rule.name)) {
            throw std::invalid_argument("'" + rule.name + "' is not a valid rule name");
        }
        if (rules_.count(rule.name) != 0) {
            throw std::invalid_argument("duplicate rule '" + rule.name + "'");
        }
        if (!rule.allows(rule.defaultValue)) {
            throw std::invalid_argument("default for rule '" + rule.name
                                        + "' has incompatible type "
                                        + ruleTypeName(ruleTypeOf(rule.defaultValue)));
        }
        RuleValue initial = rule.defaultValue;
        std::string key = rule.name;
        rules_.emplace(std::move(key), Entry{std::move(rule), std::move(initial)});
    }
}

bool Ruleset::contains(const std::string& name) const noexcept {
    return rules_.count(name) != 0;
}

std::vector<std::string> Ruleset::names() const {
    std::vector<std::string> out;
    out.reserve(rules_.size());
    for (const auto& [key, e] : rules_) {
        out.push_back(key);
    }
    return out;
}

const Ruleset::Entry& Ruleset::entry(const std::string& name) const {
    auto it = rules_.find(name);
    if (it == rules_.end()) {
        throw std::out_of_range("Ruleset has no rule '" + name + "'");
    }
    return it->second;
}

const RuleValue& Ruleset::value(const std::string& name) const {
    return entry(name).value;
}

void Ruleset::set(const std::string& name, RuleValue newValue) {
    auto it = rules_.find(name);
    if (it == rules_.end()) {
        throw std::out_of_range("Ruleset has no rule '" + name + "'");
    }
    if (!it->second.rule.allows(newValue)) {
        throw std::invalid_argument(std::string{ruleTypeName(ruleTypeOf(newValue))}
                                    + " value has incompatible type for rule '" + name + "'");
    }
    it->second.value = std::move(newValue);
}

void Ruleset::override(const RuleOverrides& overrides) {
    for (const auto& [name, v] : overrides) {
        if (!contains(name)) {
            std::cerr << "Ruleset: ignoring override for unknown rule '" << name << "'\n";
            continue;
        }
        set(name, v);
    }
}

void Ruleset::registerRules(const Ruleset& sub) {
    if (sub.name_.empty()) {
        throw std::invalid_argument("attempted to register an unnamed ruleset");
    }

    const std::string prefix = sub.name_ + "_";
    for (const auto& [key, e] : sub.rules_) {
        if (contains(prefix + key)) {
            throw std::logic_error("conflicting rule name '" + prefix + key + "'");
        }
    }
    for (const auto& [key, e] : sub.rules_) {
        Entry merged = e;
        merged.rule.name = prefix + key;
        rules_.emplace(prefix + key, std::move(merged));
    }
}

} // namespace modtris::core
