#pragma once

#include <nlohmann/json.hpp>

#include "model/aggregates.hpp"
#include "model/node_info.hpp"

namespace monitoring_server::model {

void to_json(nlohmann::json& out, const NodeInfo& node);
void from_json(const nlohmann::json& in, NodeInfo& node);

void to_json(nlohmann::json& out, const ContainerInfo& container);
void from_json(const nlohmann::json& in, ContainerInfo& container);

void to_json(nlohmann::json& out, const ContainerList& list);
void from_json(const nlohmann::json& in, ContainerList& list);

void to_json(nlohmann::json& out, const SocInfo& soc);
void from_json(const nlohmann::json& in, SocInfo& soc);

void to_json(nlohmann::json& out, const BoardInfo& board);
void from_json(const nlohmann::json& in, BoardInfo& board);

}  // namespace monitoring_server::model
