/**
 * @file Loader.hpp
 * @brief Loading documents and compositions from files
 *
 * Supported formats, chosen by file extension:
 * - .json (using nlohmann::json)
 * - .toml (using toml++); dates and times become strings
 */

#ifndef PATCHWORK_LOADER_HPP
#define PATCHWORK_LOADER_HPP

#include "patchwork/Types.hpp"
#include "patchwork/Value.hpp"
#include <optional>
#include <string>

namespace patchwork {

// ============================================================================
// Documents
// ============================================================================

/**
 * @brief Load a document from a JSON file
 *
 * @param path Path to the JSON file
 * @return Parsed document
 * @throws FileNotFoundError if the file doesn't exist
 * @throws ParseError if the JSON syntax is invalid
 */
Value load_json_file(const std::string& path);

/**
 * @brief Load a document from a TOML file
 *
 * @param path Path to the TOML file
 * @return Document with one object per TOML table
 * @throws FileNotFoundError if the file doesn't exist
 * @throws ParseError (with line and column) if the TOML syntax is invalid
 */
Value load_toml_file(const std::string& path);

/**
 * @brief Load a document, detecting the format from the file extension
 *
 * @throws FileNotFoundError if the file doesn't exist
 * @throws ParseError if the file cannot be parsed
 * @throws SchemaError if the extension is neither .json nor .toml
 */
Value load_document_file(const std::string& path);

/**
 * @brief Lowercased extension including the dot (".json"), or ""
 */
std::string get_file_extension(const std::string& path);

// ============================================================================
// Rules
// ============================================================================

/**
 * @brief Load and decode a composition (patch sets and resource templates)
 *
 * @throws FileNotFoundError, ParseError from loading
 * @throws SchemaError, InvalidPatchType, TransformError, CombineConfigMissing
 *         from decoding
 */
Composition load_composition_file(const std::string& path);

// ============================================================================
// Environment
// ============================================================================

/**
 * @brief Get an environment variable
 * @return Value, or nullopt if not set
 */
std::optional<std::string> get_env_var(const std::string& name);

} // namespace patchwork

#endif // PATCHWORK_LOADER_HPP
