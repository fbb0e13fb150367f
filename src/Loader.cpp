/**
 * @file Loader.cpp
 * @brief JSON / TOML document loading
 */

#include "mergeguard/Loader.hpp"
#include "mergeguard/Errors.hpp"

#include <nlohmann/json.hpp>
#include <toml++/toml.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

namespace mergeguard {

namespace {

bool file_exists(const std::string& path) {
    std::error_code ec;
    return fs::exists(path, ec) && fs::is_regular_file(path, ec);
}

std::string read_file(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw FileNotFoundError(path);
    }

    std::ostringstream ss;
    ss << file.rdbuf();
    return ss.str();
}

// Dates and times have no Value counterpart; keep their TOML spelling.
template <typename T>
Value spelled(const T& temporal) {
    std::ostringstream ss;
    ss << temporal;
    return Value(ss.str());
}

Value toml_to_value(const toml::node& node) {
    switch (node.type()) {
        case toml::node_type::string:
            return Value(node.as_string()->get());

        case toml::node_type::integer:
            return Value(node.as_integer()->get());

        case toml::node_type::floating_point:
            return Value(node.as_floating_point()->get());

        case toml::node_type::boolean:
            return Value(node.as_boolean()->get());

        case toml::node_type::date:
            return spelled(node.as_date()->get());

        case toml::node_type::time:
            return spelled(node.as_time()->get());

        case toml::node_type::date_time:
            return spelled(node.as_date_time()->get());

        case toml::node_type::array: {
            Value seq = Value::array();
            for (const auto& elem : *node.as_array()) {
                seq.push_back(toml_to_value(elem));
            }
            return seq;
        }

        case toml::node_type::table: {
            Value map = Value::object();
            for (const auto& [key, val] : *node.as_table()) {
                map[std::string(key.str())] = toml_to_value(val);
            }
            return map;
        }

        default:
            return Value(nullptr);
    }
}

} // anonymous namespace

Value load_json_file(const std::string& path) {
    if (!file_exists(path)) {
        throw FileNotFoundError(path);
    }

    const std::string content = read_file(path);
    try {
        return nlohmann::json::parse(content);
    } catch (const nlohmann::json::parse_error& e) {
        throw DocumentParseError(path, e.what());
    }
}

Value load_toml_file(const std::string& path) {
    if (!file_exists(path)) {
        throw FileNotFoundError(path);
    }

    try {
        toml::table table = toml::parse_file(path);
        return toml_to_value(table);
    } catch (const toml::parse_error& e) {
        std::ostringstream details;
        details << "line " << e.source().begin.line
                << ", column " << e.source().begin.column
                << ": " << e.description();
        throw DocumentParseError(path, details.str());
    }
}

Value load_document(const std::string& path) {
    const std::string ext = get_file_extension(path);
    spdlog::debug("Loading document '{}'", path);

    if (ext == ".json") {
        return load_json_file(path);
    }
    if (ext == ".toml") {
        return load_toml_file(path);
    }
    if (!file_exists(path)) {
        throw FileNotFoundError(path);
    }
    throw DocumentParseError(path, "unsupported file extension '" + ext +
                                   "' (expected .json or .toml)");
}

void write_json_file(const std::string& path, const Value& value, int indent) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        throw MergeGuardError("Cannot open '" + path + "' for writing");
    }
    out << value.dump(indent) << '\n';
    if (!out) {
        throw MergeGuardError("Failed writing '" + path + "'");
    }
}

std::string get_file_extension(const std::string& path) {
    std::string ext = fs::path(path).extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return ext;
}

} // namespace mergeguard
