/**
 * @file key_declaration.hpp
 * @brief Entity → primary key mapping types
 *
 * A key is either a single field name or an ordered list of field names,
 * depending on how many fields the declaration names.
 */

#pragma once

#include <export.hpp>
#include <functional>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

namespace YangKeys {

/**
 * @brief Single field name, or several in declared order
 */
using KeyRepresentation = std::variant<std::string, std::vector<std::string>>;

/**
 * @brief Build the representation for a list of key fields.
 *
 * One field gives the scalar form, more than one the sequence form.
 */
YANGKEYS_API KeyRepresentation make_key_representation(std::vector<std::string> fields);

/**
 * @brief Key fields in declared order, whichever form the key has.
 */
YANGKEYS_API std::vector<std::string> key_fields(const KeyRepresentation& key);

/**
 * @brief Human-readable form for log messages: bar or [bar, baz]
 */
YANGKEYS_API std::string describe(const KeyRepresentation& key);

/**
 * @brief A list declaration with its key clause
 */
struct KeyDeclaration {
    std::string entity;
    std::vector<std::string> fields;
};

/**
 * @brief Entity name → key, unique by name.
 *
 * Assigning an existing name replaces its key and keeps its position;
 * iteration follows first insertion.
 */
class YANGKEYS_API ResultMapping {
public:
    using Entry = std::pair<std::string, KeyRepresentation>;
    using OverwriteCallback = std::function<void(const std::string& entity,
                                                 const KeyRepresentation& previous,
                                                 const KeyRepresentation& replacement)>;

    /**
     * @brief Insert or replace.
     * @return The key previously held by the entity, if any
     */
    std::optional<KeyRepresentation> assign(const std::string& entity, KeyRepresentation key);

    /**
     * @brief Assign every entry of other in its order (later wins).
     * @param on_overwrite Called when an entity already present gets a different key
     */
    void merge(const ResultMapping& other, const OverwriteCallback& on_overwrite = nullptr);

    const KeyRepresentation* find(const std::string& entity) const;
    bool contains(const std::string& entity) const { return index_.count(entity) != 0; }

    size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }

    const std::vector<Entry>& entries() const { return entries_; }
    std::vector<Entry>::const_iterator begin() const { return entries_.begin(); }
    std::vector<Entry>::const_iterator end() const { return entries_.end(); }

    /// Same names with equal keys; order is not compared.
    bool operator==(const ResultMapping& other) const;
    bool operator!=(const ResultMapping& other) const { return !(*this == other); }

private:
    std::vector<Entry> entries_;
    std::unordered_map<std::string, size_t> index_;
};

} // namespace YangKeys
