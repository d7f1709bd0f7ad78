#pragma once
#include <string>
#include <vector>
#include <optional>
#include <nlohmann/json.hpp>
#include "RoutingTable.hpp"

// Immutable copy of the routing state handed to reporters
struct RouteSnapshot
{
    std::string destination;
    Cost cost;
    std::optional<std::string> nextHop;
};

struct NodeSnapshot
{
    std::string nodeId;
    std::vector<RouteSnapshot> routes;
};

using NetworkSnapshot = std::vector<NodeSnapshot>;

std::string formatCost(Cost cost);

// Infinite costs are written as the string "inf", missing next hops as null
void to_json(nlohmann::json &j, const RouteSnapshot &route);
void from_json(const nlohmann::json &j, RouteSnapshot &route);
void to_json(nlohmann::json &j, const NodeSnapshot &node);
void from_json(const nlohmann::json &j, NodeSnapshot &node);
