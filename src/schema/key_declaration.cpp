#include <schema/key_declaration.hpp>

namespace YangKeys {

KeyRepresentation make_key_representation(std::vector<std::string> fields) {
    if (fields.size() == 1) {
        return KeyRepresentation(std::in_place_index<0>, std::move(fields.front()));
    }
    return KeyRepresentation(std::in_place_index<1>, std::move(fields));
}

std::vector<std::string> key_fields(const KeyRepresentation& key) {
    if (const auto* single = std::get_if<std::string>(&key)) {
        return {*single};
    }
    return std::get<std::vector<std::string>>(key);
}

std::string describe(const KeyRepresentation& key) {
    if (const auto* single = std::get_if<std::string>(&key)) {
        return *single;
    }
    std::string out = "[";
    const auto& fields = std::get<std::vector<std::string>>(key);
    for (size_t i = 0; i < fields.size(); ++i) {
        if (i) out += ", ";
        out += fields[i];
    }
    out += "]";
    return out;
}

std::optional<KeyRepresentation> ResultMapping::assign(const std::string& entity, KeyRepresentation key) {
    auto it = index_.find(entity);
    if (it == index_.end()) {
        index_.emplace(entity, entries_.size());
        entries_.emplace_back(entity, std::move(key));
        return std::nullopt;
    }
    KeyRepresentation previous = std::move(entries_[it->second].second);
    entries_[it->second].second = std::move(key);
    return previous;
}

void ResultMapping::merge(const ResultMapping& other, const OverwriteCallback& on_overwrite) {
    for (const auto& [entity, key] : other.entries_) {
        auto previous = assign(entity, key);
        if (previous && on_overwrite && *previous != key) {
            on_overwrite(entity, *previous, key);
        }
    }
}

const KeyRepresentation* ResultMapping::find(const std::string& entity) const {
    auto it = index_.find(entity);
    return it == index_.end() ? nullptr : &entries_[it->second].second;
}

bool ResultMapping::operator==(const ResultMapping& other) const {
    if (entries_.size() != other.entries_.size()) return false;
    for (const auto& [entity, key] : entries_) {
        const KeyRepresentation* theirs = other.find(entity);
        if (!theirs || *theirs != key) return false;
    }
    return true;
}

} // namespace YangKeys
