#pragma once

#include <export.hpp>
#include <schema/key_declaration.hpp>
#include <nlohmann/json.hpp>
#include <string>

namespace YangKeys {

using json = nlohmann::ordered_json;

/**
 * @brief JSON object in mapping order: "Foo": "bar" or "Foo": ["bar", "baz"]
 */
YANGKEYS_API json to_json(const ResultMapping& mapping);

/**
 * @brief Inverse of to_json.
 * @throws std::invalid_argument if the document is not an object of strings / string arrays
 */
YANGKEYS_API ResultMapping mapping_from_json(const json& document);

/**
 * @brief Serialize with 2-space indentation and non-ASCII escaped as \uXXXX.
 */
YANGKEYS_API std::string dump_mapping(const ResultMapping& mapping);

/**
 * @brief Parse text written by dump_mapping.
 * @throws nlohmann::json::parse_error, std::invalid_argument
 */
YANGKEYS_API ResultMapping parse_mapping(const std::string& text);

} // namespace YangKeys
