#include "RoutingSnapshot.hpp"

using json = nlohmann::json;

std::string formatCost(Cost cost)
{
    return isInfinite(cost) ? "inf" : std::to_string(cost);
}

void to_json(json &j, const RouteSnapshot &route)
{
    j = json{{"destination", route.destination}};
    if (isInfinite(route.cost))
        j["cost"] = "inf";
    else
        j["cost"] = route.cost;

    if (route.nextHop)
        j["next_hop"] = *route.nextHop;
    else
        j["next_hop"] = nullptr;
}

void from_json(const json &j, RouteSnapshot &route)
{
    route.destination = j.at("destination").get<std::string>();

    const auto &cost = j.at("cost");
    if (cost.is_string() && cost.get<std::string>() == "inf")
        route.cost = INFINITE_COST;
    else
        route.cost = cost.get<Cost>();

    const auto &hop = j.at("next_hop");
    if (hop.is_null())
        route.nextHop.reset();
    else
        route.nextHop = hop.get<std::string>();
}

void to_json(json &j, const NodeSnapshot &node)
{
    j = json{{"node", node.nodeId}, {"routes", node.routes}};
}

void from_json(const json &j, NodeSnapshot &node)
{
    node.nodeId = j.at("node").get<std::string>();
    node.routes = j.at("routes").get<std::vector<RouteSnapshot>>();
}
