#include "cmdschema/schema/value_coercion.hpp"

#include <boost/algorithm/string/predicate.hpp>
#include <cctype>
#include <charconv>

#include "cmdschema/errors/errors.hpp"

namespace cmdschema::schema {

std::optional<bool> parse_bool(const std::string& raw) {
    if (boost::algorithm::iequals(raw, "true")) return true;
    if (boost::algorithm::iequals(raw, "false")) return false;
    return std::nullopt;
}

std::optional<std::int64_t> parse_integer(const std::string& raw) {
    const char* first = raw.data();
    const char* last = raw.data() + raw.size();
    if (first != last && *first == '+') {
        ++first;
        // from_chars would otherwise accept "+-1"
        if (first == last ||
            !std::isdigit(static_cast<unsigned char>(*first))) {
            return std::nullopt;
        }
    }
    if (first == last) return std::nullopt;

    std::int64_t value = 0;
    auto [ptr, ec] = std::from_chars(first, last, value, 10);
    if (ec != std::errc() || ptr != last) return std::nullopt;
    return value;
}

ArgumentValue coerce_value(const ArgumentSpec& spec, const std::string& raw) {
    switch (spec.type) {
        case ArgumentType::Boolean: {
            if (auto b = parse_bool(raw)) return *b;
            throw errors::TypeCoercionError(spec.name, raw, "boolean");
        }
        case ArgumentType::Integer: {
            if (auto i = parse_integer(raw)) return *i;
            throw errors::TypeCoercionError(spec.name, raw, "integer");
        }
        case ArgumentType::Choice: {
            if (spec.has_choice(raw)) return raw;
            throw errors::InvalidChoiceError(spec.name, raw, spec.choices);
        }
        case ArgumentType::String:
            break;
    }
    return raw;
}

}  // namespace cmdschema::schema
