#pragma once

#include "Types.hpp"

#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

namespace modtris::core {

// Closed set of value types a rule may hold. std::monostate is "unset".
using RuleValue = std::variant<std::monostate, bool, int, std::string, BoardSize>;

enum class RuleType : std::uint8_t {
    None,
    Bool,
    Int,
    String,
    BoardSize
};

RuleType ruleTypeOf(const RuleValue& value) noexcept;
const char* ruleTypeName(RuleType type) noexcept;

// Rule name -> value, as handed to Ruleset::override
using RuleOverrides = std::map<std::string, RuleValue>;

struct Rule {
    std::string name;
    std::vector<RuleType> accepts; // accepted value types
    RuleValue defaultValue;

    bool allows(const RuleValue& value) const noexcept;
};

// Named registry of typed rules.
//
// Assigning a value of a type the rule does not accept throws
// std::invalid_argument. Sub-rulesets owned by engine parts are merged in
// with their name as prefix ("gravity" + "lock_delay" -> "gravity_lock_delay").
class Ruleset {
public:
    explicit Ruleset(std::vector<Rule> rules = {}, std::string name = {});

    const std::string& name() const noexcept { return name_; }

    bool contains(const std::string& name) const noexcept;
    std::vector<std::string> names() const;

    const RuleValue& value(const std::string& name) const;

    template <typename T>
    const T& get(const std::string& name) const {
        const RuleValue& v = value(name);
        if (const T* typed = std::get_if<T>(&v)) {
            return *typed;
        }
        throw std::invalid_argument("rule '" + name + "' holds a "
                                    + ruleTypeName(ruleTypeOf(v)) + " value");
    }

    bool isSet(const std::string& name) const {
        return !std::holds_alternative<std::monostate>(value(name));
    }

    void set(const std::string& name, RuleValue newValue);

    // Apply overrides; unknown names are reported and skipped
    void override(const RuleOverrides& overrides);

    // Merge a named sub-ruleset under its prefix
    void registerRules(const Ruleset& sub);

private:
    struct Entry {
        Rule rule;
        RuleValue value;
    };

    std::map<std::string, Entry> rules_;
    std::string name_;

    const Entry& entry(const std::string& name) const;
};

} // namespace modtris::core
