/**
 * @file declaration_scanner.cpp
 * @brief List/key declaration scanning
 */

#include <schema/declaration_scanner.hpp>
#include <utils/logger.hpp>
#include <utils/unicode.hpp>
#include <fstream>
#include <sstream>

namespace YangKeys {

namespace {

// Offset of the first code point at or after i that fails the predicate
template <typename Predicate>
size_t skip_while(const std::string& s, size_t i, Predicate pred) {
    while (i < s.size()) {
        char32_t cp = 0;
        size_t len = decode_utf8_at(s, i, cp);
        if (!pred(cp)) break;
        i += len;
    }
    return i;
}

size_t skip_space(const std::string& s, size_t i) {
    return skip_while(s, i, is_space_codepoint);
}

size_t skip_word(const std::string& s, size_t i) {
    return skip_while(s, i, is_word_codepoint);
}

} // namespace

DeclarationScanner::DeclarationScanner(const std::string& text) : text_(text) {}

std::optional<RawDeclaration> DeclarationScanner::next() {
    while (pos_ < text_.size()) {
        size_t list_pos = text_.find("list", pos_);
        if (list_pos == std::string::npos) break;

        if (auto match = match_at(list_pos)) {
            pos_ = match->end;
            return match;
        }
        pos_ = list_pos + 1;
    }
    pos_ = text_.size();
    return std::nullopt;
}

std::optional<RawDeclaration> DeclarationScanner::match_at(size_t list_pos) const {
    const size_t n = text_.size();
    size_t i = list_pos + 4;

    // list <ws>+
    size_t name_start = skip_space(text_, i);
    if (name_start == i) return std::nullopt;

    // <word-chars>+
    i = skip_word(text_, name_start);
    if (i == name_start) return std::nullopt;

    // Anything up to the first '{'
    size_t brace = text_.find('{', i);
    if (brace == std::string::npos) return std::nullopt;

    // First key clause before another '{'
    for (size_t j = brace + 1; j < n; ++j) {
        if (text_[j] == '{') return std::nullopt;
        if (text_.compare(j, 3, "key") != 0) continue;

        if (auto clause = match_key_clause(j)) {
            RawDeclaration decl;
            decl.entity = text_.substr(name_start, i - name_start);
            decl.key_clause = std::move(clause->first);
            decl.begin = list_pos;
            decl.end = clause->second;
            return decl;
        }
    }
    return std::nullopt;
}

std::optional<std::pair<std::string, size_t>> DeclarationScanner::match_key_clause(size_t pos) const {
    const size_t n = text_.size();
    size_t after_key = pos + 3;

    size_t i = skip_space(text_, after_key);
    if (i == after_key) return std::nullopt;

    if (i >= n || text_[i] != '"') return std::nullopt;
    size_t close = text_.find('"', i + 1);
    if (close == std::string::npos || close == i + 1) return std::nullopt;

    return std::make_pair(text_.substr(i + 1, close - i - 1), close + 1);
}

std::vector<std::string> split_key_clause(const std::string& clause) {
    std::vector<std::string> tokens;
    size_t i = 0;
    while (i < clause.size()) {
        size_t start = skip_space(clause, i);
        i = skip_while(clause, start, [](char32_t cp) { return !is_space_codepoint(cp); });
        if (i > start) tokens.push_back(clause.substr(start, i - start));
    }
    return tokens;
}

std::vector<KeyDeclaration> scan_key_declarations(const std::string& text) {
    std::vector<KeyDeclaration> declarations;
    DeclarationScanner scanner(text);

    while (auto raw = scanner.next()) {
        auto fields = split_key_clause(raw->key_clause);
        if (fields.empty()) {
            Logger::debug("Ignoring list " + raw->entity + ": blank key clause at offset " +
                          std::to_string(raw->begin));
            continue;
        }
        declarations.push_back(KeyDeclaration{std::move(raw->entity), std::move(fields)});
    }
    return declarations;
}

ResultMapping extract_key_declarations(const std::string& text) {
    ResultMapping mapping;
    for (auto& decl : scan_key_declarations(text)) {
        KeyRepresentation key = make_key_representation(std::move(decl.fields));
        Logger::debug("Found table: " + decl.entity + ", key(s): " + describe(key));
        mapping.assign(decl.entity, std::move(key));
    }
    return mapping;
}

ResultMapping extract_keys_from_file(const std::filesystem::path& path) {
    ResultMapping mapping;
    std::string file_name = path.filename().string();

    std::ifstream file(path, std::ios::binary);
    if (!file) {
        Logger::error("Error parsing " + path.string() + ": could not open file");
        Logger::info("Extracted 0 tables from " + file_name);
        return mapping;
    }

    try {
        std::ostringstream buffer;
        buffer << file.rdbuf();

        size_t replaced = 0;
        std::string content = sanitize_utf8(buffer.str(), &replaced);
        if (replaced > 0) {
            Logger::debug("Replaced " + std::to_string(replaced) + " undecodable byte sequence(s) in " + file_name);
        }

        mapping = extract_key_declarations(content);
    } catch (const std::exception& e) {
        Logger::error("Error parsing " + path.string() + ": " + e.what());
    }

    Logger::info("Extracted " + std::to_string(mapping.size()) + " tables from " + file_name);
    return mapping;
}

} // namespace YangKeys
