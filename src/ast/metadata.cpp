#include <ast/metadata.hpp>
#include <utils/strings.hpp>

namespace Polydoc {

namespace {

struct StringField {
    const char* key;
    std::optional<std::string> DocumentMetadata::* member;
};

constexpr StringField kStringFields[] = {
    {"title", &DocumentMetadata::title},
    {"author", &DocumentMetadata::author},
    {"subject", &DocumentMetadata::subject},
    {"creation_date", &DocumentMetadata::creation_date},
    {"modification_date", &DocumentMetadata::modification_date},
    {"creator", &DocumentMetadata::creator},
    {"producer", &DocumentMetadata::producer},
    {"category", &DocumentMetadata::category},
    {"language", &DocumentMetadata::language},
};

bool is_known_key(const std::string& key) {
    if (key == "keywords") return true;
    for (const auto& f : kStringFields)
        if (key == f.key) return true;
    return false;
}

} // namespace

DocumentMetadata DocumentMetadata::from_json(const json& metadata) {
    DocumentMetadata meta;
    if (!metadata.is_object()) return meta;

    for (const auto& f : kStringFields) {
        auto it = metadata.find(f.key);
        if (it == metadata.end() || it->is_null()) continue;
        meta.*(f.member) = it->is_string() ? it->get<std::string>() : it->dump();
    }

    if (auto it = metadata.find("keywords"); it != metadata.end()) {
        if (it->is_array()) {
            for (const auto& k : *it)
                if (k.is_string()) meta.keywords.push_back(k.get<std::string>());
        } else if (it->is_string()) {
            for (auto& part : split(it->get<std::string>(), ',')) {
                std::string kw = trim(part);
                if (!kw.empty()) meta.keywords.push_back(std::move(kw));
            }
        }
    }

    if (auto it = metadata.find("custom"); it != metadata.end() && it->is_object())
        meta.custom = *it;

    for (auto& [key, value] : metadata.items()) {
        if (key != "custom" && !is_known_key(key)) meta.custom[key] = value;
    }
    return meta;
}

json DocumentMetadata::to_json() const {
    json j = json::object();
    for (const auto& f : kStringFields)
        if (this->*(f.member)) j[f.key] = *(this->*(f.member));
    if (!keywords.empty()) j["keywords"] = keywords;
    if (custom.is_object()) {
        for (auto& [key, value] : custom.items())
            if (!j.contains(key)) j[key] = value;
    }
    return j;
}

bool DocumentMetadata::empty() const {
    return to_json().empty();
}

void DocumentMetadata::apply_to(Document& doc) const {
    if (!doc.metadata.is_object()) doc.metadata = json::object();
    for (auto& [key, value] : to_json().items()) doc.metadata[key] = value;
}

} // namespace Polydoc
