/**
 * @file Loader.hpp
 * @brief Loading JSON and TOML documents from disk
 *
 * Used for policy files and, in the CLI, for target and source documents.
 * Format is picked by extension (.json, .toml).
 */

#ifndef MERGEGUARD_LOADER_HPP
#define MERGEGUARD_LOADER_HPP

#include "mergeguard/Value.hpp"
#include <string>

namespace mergeguard {

/**
 * @brief Load a JSON file
 *
 * @throws FileNotFoundError if file doesn't exist
 * @throws DocumentParseError if JSON syntax is invalid
 */
Value load_json_file(const std::string& path);

/**
 * @brief Load a TOML file
 *
 * Tables become mappings, arrays become sequences, dates and times become
 * strings in their TOML spelling.
 *
 * @throws FileNotFoundError if file doesn't exist
 * @throws DocumentParseError if TOML syntax is invalid
 */
Value load_toml_file(const std::string& path);

/**
 * @brief Load a document, picking the format by extension
 *
 * @throws FileNotFoundError if file doesn't exist
 * @throws DocumentParseError on syntax errors or unsupported extension
 */
Value load_document(const std::string& path);

/**
 * @brief Write a Value as pretty-printed JSON
 *
 * @throws MergeGuardError if the file cannot be opened
 */
void write_json_file(const std::string& path, const Value& value, int indent = 2);

/**
 * @brief Get file extension (lowercase), including the dot
 */
std::string get_file_extension(const std::string& path);

} // namespace mergeguard

#endif // MERGEGUARD_LOADER_HPP
