#pragma once

#include <codenexus/core/types.h>

#include <nlohmann/json_fwd.hpp>

namespace codenexus {

// nlohmann ADL hooks shared by the snapshot files and the MCP payloads
void to_json(nlohmann::json& j, const Relation& r);
void from_json(const nlohmann::json& j, Relation& r);

void to_json(nlohmann::json& j, const IncomingRelation& r);
void from_json(const nlohmann::json& j, IncomingRelation& r);

} // namespace codenexus
