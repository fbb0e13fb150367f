/**
 * @file Parse.cpp
 * @brief Implementation of string parsing helpers
 */

#include "mergeguard/Parse.hpp"
#include "mergeguard/Errors.hpp"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <regex>
#include <vector>

namespace mergeguard {

namespace {

std::string to_lower(const std::string& str) {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return result;
}

std::string trim(const std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

std::vector<std::string> split_list(const std::string& str) {
    std::vector<std::string> items;
    std::string current;
    for (char c : str) {
        if (c == ',') {
            items.push_back(trim(current));
            current.clear();
        } else {
            current += c;
        }
    }
    items.push_back(trim(current));
    return items;
}

const std::regex& integer_pattern() {
    static const std::regex re("^-?[0-9]+$");
    return re;
}

const std::regex& float_pattern() {
    static const std::regex re("^-?[0-9]+\\.[0-9]+([eE][+-]?[0-9]+)?$");
    return re;
}

} // anonymous namespace

Value parse_value(const std::string& str) {
    if (str.empty()) {
        return "";
    }

    const std::string lower = to_lower(str);
    if (lower == "true") return true;
    if (lower == "false") return false;
    if (lower == "null") return nullptr;

    if (std::regex_match(str, integer_pattern())) {
        try {
            size_t pos = 0;
            const long long val = std::stoll(str, &pos);
            if (pos == str.size()) {
                return static_cast<std::int64_t>(val);
            }
        } catch (const std::out_of_range&) {
            // too large for int64, keep as string
        }
        return str;
    }

    if (std::regex_match(str, float_pattern())) {
        try {
            size_t pos = 0;
            const double val = std::stod(str, &pos);
            if (pos == str.size()) {
                return val;
            }
        } catch (const std::out_of_range&) {
            // keep as string
        }
        return str;
    }

    const bool compound = (str.front() == '{' && str.back() == '}') ||
                          (str.front() == '[' && str.back() == ']');
    const bool quoted = str.size() >= 2 && str.front() == '"' && str.back() == '"';
    if (compound || quoted) {
        Value parsed = Value::parse(str, nullptr, false);
        if (!parsed.is_discarded() && (compound || parsed.is_string())) {
            return parsed;
        }
    }

    return str;
}

std::optional<ValueKind> parse_kind(const std::string& name) {
    const std::string lower = to_lower(trim(name));
    if (lower == "null") return ValueKind::Null;
    if (lower == "boolean" || lower == "bool") return ValueKind::Boolean;
    if (lower == "number" || lower == "integer" || lower == "float") return ValueKind::Number;
    if (lower == "string") return ValueKind::String;
    if (lower == "sequence" || lower == "array") return ValueKind::Sequence;
    if (lower == "mapping" || lower == "object") return ValueKind::Mapping;
    return std::nullopt;
}

std::set<std::string> parse_key_list(const std::string& str) {
    std::set<std::string> keys;
    for (auto& item : split_list(str)) {
        if (!item.empty()) {
            keys.insert(std::move(item));
        }
    }
    return keys;
}

FieldSchema parse_schema_list(const std::string& str) {
    FieldSchema schema;
    std::vector<std::string> problems;

    for (const auto& item : split_list(str)) {
        if (item.empty()) continue;

        const auto colon = item.rfind(':');
        if (colon == std::string::npos || colon == 0) {
            problems.push_back("schema entry '" + item + "' must look like field:type");
            continue;
        }
        const std::string field = trim(item.substr(0, colon));
        const auto kind = parse_kind(item.substr(colon + 1));
        if (!kind) {
            problems.push_back("schema entry '" + item + "' has unknown type");
            continue;
        }
        schema[field] = *kind;
    }

    if (!problems.empty()) {
        throw PolicyError(std::move(problems));
    }
    return schema;
}

} // namespace mergeguard
