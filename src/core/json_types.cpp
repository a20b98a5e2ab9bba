#include <codenexus/core/json_types.h>

#include <nlohmann/json.hpp>

namespace codenexus {

void to_json(nlohmann::json& j, const Relation& r) {
    j = nlohmann::json{{"target", r.target}, {"description", r.description}};
}

void from_json(const nlohmann::json& j, Relation& r) {
    j.at("target").get_to(r.target);
    j.at("description").get_to(r.description);
}

void to_json(nlohmann::json& j, const IncomingRelation& r) {
    j = nlohmann::json{{"source", r.source}, {"description", r.description}};
}

void from_json(const nlohmann::json& j, IncomingRelation& r) {
    j.at("source").get_to(r.source);
    j.at("description").get_to(r.description);
}

} // namespace codenexus
