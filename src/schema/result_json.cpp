#include <schema/result_json.hpp>
#include <stdexcept>

namespace YangKeys {

json to_json(const ResultMapping& mapping) {
    json document = json::object();
    for (const auto& [entity, key] : mapping) {
        if (const auto* single = std::get_if<std::string>(&key)) {
            document[entity] = *single;
        } else {
            document[entity] = std::get<std::vector<std::string>>(key);
        }
    }
    return document;
}

ResultMapping mapping_from_json(const json& document) {
    if (!document.is_object()) {
        throw std::invalid_argument("Expected a JSON object of entity keys, got " + std::string(document.type_name()));
    }

    ResultMapping mapping;
    for (auto& [entity, value] : document.items()) {
        if (value.is_string()) {
            mapping.assign(entity, KeyRepresentation(std::in_place_index<0>, value.get<std::string>()));
        } else if (value.is_array()) {
            std::vector<std::string> fields;
            for (const auto& field : value) {
                if (!field.is_string()) {
                    throw std::invalid_argument("Key of '" + entity + "' contains a non-string field");
                }
                fields.push_back(field.get<std::string>());
            }
            mapping.assign(entity, KeyRepresentation(std::in_place_index<1>, std::move(fields)));
        } else {
            throw std::invalid_argument("Key of '" + entity + "' must be a string or an array of strings");
        }
    }
    return mapping;
}

std::string dump_mapping(const ResultMapping& mapping) {
    return to_json(mapping).dump(2, ' ', true);
}

ResultMapping parse_mapping(const std::string& text) {
    return mapping_from_json(json::parse(text));
}

} // namespace YangKeys
