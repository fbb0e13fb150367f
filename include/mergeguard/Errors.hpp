/**
 * @file Errors.hpp
 * @brief Exception types for mergeguard
 *
 * Merge-time problems with untrusted input are never thrown; they are
 * reported as Violation records inside a MergeOutcome. The exceptions
 * below cover configuration and process-level failures:
 * - MergeGuardError: Base class
 * - AmbientFrozenError: Write to the installed ambient namespace
 * - PolicyError: Malformed policy document or arguments
 * - FileNotFoundError: Policy or document file not found
 * - DocumentParseError: JSON/TOML syntax errors
 * - KeyError: Dot-path segment not found
 * - TypeError: Traversal into non-container
 */

#ifndef MERGEGUARD_ERRORS_HPP
#define MERGEGUARD_ERRORS_HPP

#include <stdexcept>
#include <string>
#include <vector>
#include <sstream>

namespace mergeguard {

/**
 * @brief Base class for all mergeguard exceptions
 */
class MergeGuardError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief Attempt to write to the ambient namespace after install()
 *
 * Signals a logic bug in the host process, not adversarial input.
 */
class AmbientFrozenError : public MergeGuardError {
public:
    /**
     * @param key The slot that something tried to write
     */
    explicit AmbientFrozenError(std::string key)
        : MergeGuardError("Ambient namespace is frozen; refusing to write '" + key + "'")
        , key_(std::move(key))
    {}

    const std::string& key() const noexcept {
        return key_;
    }

private:
    std::string key_;
};

/**
 * @brief Invalid policy document or policy arguments
 *
 * Contains every problem found, not just the first.
 */
class PolicyError : public MergeGuardError {
public:
    explicit PolicyError(std::vector<std::string> problems)
        : MergeGuardError(format_message(problems))
        , problems_(std::move(problems))
    {}

    explicit PolicyError(const std::string& problem)
        : PolicyError(std::vector<std::string>{problem})
    {}

    const std::vector<std::string>& problems() const noexcept {
        return problems_;
    }

private:
    std::vector<std::string> problems_;

    static std::string format_message(const std::vector<std::string>& problems) {
        std::ostringstream oss;
        oss << "Invalid merge policy: [";
        for (size_t i = 0; i < problems.size(); ++i) {
            if (i > 0) oss << ", ";
            oss << "'" << problems[i] << "'";
        }
        oss << "]";
        return oss.str();
    }
};

/**
 * @brief Policy or document file not found
 */
class FileNotFoundError : public MergeGuardError {
public:
    explicit FileNotFoundError(std::string path)
        : MergeGuardError("File not found: " + path)
        , path_(std::move(path))
    {}

    const std::string& path() const noexcept {
        return path_;
    }

private:
    std::string path_;
};

/**
 * @brief File parse error (JSON/TOML syntax)
 */
class DocumentParseError : public MergeGuardError {
public:
    /**
     * @param file Path to the file with parse error
     * @param details Detailed error message from parser
     */
    DocumentParseError(std::string file, std::string details)
        : MergeGuardError("Parse error in '" + file + "': " + details)
        , file_(std::move(file))
        , details_(std::move(details))
    {}

    const std::string& file() const noexcept {
        return file_;
    }

    const std::string& details() const noexcept {
        return details_;
    }

private:
    std::string file_;
    std::string details_;
};

/**
 * @brief Key not found during dot-path traversal
 */
class KeyError : public MergeGuardError {
public:
    /**
     * @param path Full dot-path being accessed (e.g., "database.host")
     * @param segment The specific segment that doesn't exist (e.g., "host")
     */
    KeyError(std::string path, std::string segment)
        : MergeGuardError("Key not found: '" + segment + "' in path '" + path + "'")
        , path_(std::move(path))
        , segment_(std::move(segment))
    {}

    const std::string& path() const noexcept {
        return path_;
    }

    const std::string& segment() const noexcept {
        return segment_;
    }

private:
    std::string path_;
    std::string segment_;
};

/**
 * @brief Traversal into a non-container during dot-path lookup
 */
class TypeError : public MergeGuardError {
public:
    TypeError(std::string path, std::string expected, std::string actual)
        : MergeGuardError("Cannot traverse into " + actual +
                          " (expected " + expected + ") at path '" + path + "'")
        , path_(std::move(path))
        , expected_(std::move(expected))
        , actual_(std::move(actual))
    {}

    const std::string& path() const noexcept {
        return path_;
    }

    const std::string& expected() const noexcept {
        return expected_;
    }

    const std::string& actual() const noexcept {
        return actual_;
    }

private:
    std::string path_;
    std::string expected_;
    std::string actual_;
};

} // namespace mergeguard

#endif // MERGEGUARD_ERRORS_HPP
