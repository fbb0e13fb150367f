/**
 * @file DotPath.cpp
 * @brief Implementation of dot-path utilities
 */

#include "mergeguard/DotPath.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>

namespace mergeguard {

namespace {

// Digits only, no leading zeros except "0" itself.
bool is_sequence_index(const std::string& segment) {
    if (segment.empty()) return false;
    if (segment[0] == '0' && segment.size() > 1) return false;
    return std::all_of(segment.begin(), segment.end(),
                       [](unsigned char c) { return std::isdigit(c); });
}

} // anonymous namespace

std::vector<std::string> split_dot_path(const std::string& path) {
    std::vector<std::string> segments;
    std::string current;

    for (char c : path) {
        if (c == '.') {
            if (!current.empty()) {
                segments.push_back(current);
                current.clear();
            }
        } else {
            current += c;
        }
    }

    if (!current.empty()) {
        segments.push_back(current);
    }

    return segments;
}

std::string join_dot_path(const std::vector<std::string>& segments) {
    std::ostringstream oss;
    for (size_t i = 0; i < segments.size(); ++i) {
        if (i > 0) oss << '.';
        oss << segments[i];
    }
    return oss.str();
}

const Value* get_by_dot(const Value& data, const std::string& path) {
    const Value* current = &data;

    for (const auto& seg : split_dot_path(path)) {
        if (current->is_object()) {
            auto it = current->find(seg);
            if (it == current->end()) {
                throw KeyError(path, seg);
            }
            current = &*it;
        } else if (current->is_array()) {
            if (!is_sequence_index(seg)) {
                throw KeyError(path, seg + " (not a valid sequence index)");
            }
            const size_t idx = std::stoull(seg);
            if (idx >= current->size()) {
                throw KeyError(path, seg + " (index out of range)");
            }
            current = &(*current)[idx];
        } else {
            throw TypeError(path, "mapping or sequence", type_name(*current));
        }
    }

    return current;
}

void set_by_dot(Value& data, const std::string& path, const Value& value) {
    const auto segments = split_dot_path(path);
    if (segments.empty()) {
        data = value;
        return;
    }

    Value* current = &data;
    for (const auto& seg : segments) {
        if (!current->is_object()) {
            *current = Value::object();
        }
        current = &(*current)[seg];
    }
    *current = value;
}

} // namespace mergeguard
