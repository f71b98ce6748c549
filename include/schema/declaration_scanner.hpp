/**
 * @file declaration_scanner.hpp
 * @brief Shallow scanner for YANG list declarations and their key clauses
 *
 * The text is treated as a flat character stream. A declaration is recognized as:
 *
 *   list <ws>+ <word-chars>+ <anything but '{'>* '{' <anything but '{'>* key <ws>+ "<non-quote>+"
 *
 * Word characters and whitespace are classified per Unicode code point
 * (see utils/unicode.hpp), so "list café" names the entity "café".
 *
 * Scanning rules:
 * - "list" is not word-bounded, so the tail of "leaf-list" also starts a candidate.
 * - The key clause is the first one after the opening brace that is reached
 *   before any further '{'.
 * - After a match, scanning resumes behind the closing quote; after a failed
 *   candidate, one character past the start of its "list".
 *
 * Known limitation: braces are not balanced. A list whose body opens a nested
 * block before its key clause yields no key, and a list without a key clause
 * of its own picks up a key clause that follows its closing brace, if no '{'
 * comes first.
 */

#pragma once

#include <export.hpp>
#include <schema/key_declaration.hpp>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace YangKeys {

/**
 * @brief A matched declaration before its key clause is split
 */
struct RawDeclaration {
    std::string entity;
    std::string key_clause;  // Text between the quotes, untrimmed
    size_t begin = 0;        // Offset of "list"
    size_t end = 0;          // Offset just past the closing quote
};

class YANGKEYS_API DeclarationScanner {
public:
    /// The text must outlive the scanner.
    explicit DeclarationScanner(const std::string& text);

    /**
     * @brief Next declaration in text order, or nullopt at the end.
     */
    std::optional<RawDeclaration> next();

private:
    std::optional<RawDeclaration> match_at(size_t list_pos) const;
    std::optional<std::pair<std::string, size_t>> match_key_clause(size_t pos) const;

    const std::string& text_;
    size_t pos_ = 0;
};

/**
 * @brief Trim and split a key clause on Unicode whitespace.
 */
YANGKEYS_API std::vector<std::string> split_key_clause(const std::string& clause);

/**
 * @brief Declarations with at least one key field, in text order (duplicates kept).
 */
YANGKEYS_API std::vector<KeyDeclaration> scan_key_declarations(const std::string& text);

/**
 * @brief Every list declaration with a usable key clause, later duplicates overwriting earlier ones.
 */
YANGKEYS_API ResultMapping extract_key_declarations(const std::string& text);

/**
 * @brief Read a schema file and extract its declarations.
 *
 * Ill-formed UTF-8 is replaced with U+FFFD. A file that cannot be read is
 * logged and yields an empty mapping.
 */
YANGKEYS_API ResultMapping extract_keys_from_file(const std::filesystem::path& path);

} // namespace YangKeys
