// RouterNode.cpp
#include "RouterNode.hpp"
#include "NetworkError.hpp"

RouterNode::RouterNode(const std::string &name) : name(name)
{
    routingTable.table[name] = RouteEntry{0, name};
}

bool RouterNode::updateRoutingTable(const std::string &neighborName, const RoutingTable &neighborTable)
{
    auto link = neighborCosts.find(neighborName);
    if (link == neighborCosts.end())
    {
        throw NetworkError(NetworkErrorKind::UnknownNodeId,
                           "Node " + name + " has no neighbor " + neighborName);
    }

    bool updated = false;
    for (const auto &[destination, advertised] : neighborTable.table)
    {
        if (destination == name)
            continue;

        Cost candidate = addCost(link->second, advertised.cost);
        if (candidate < routingTable.costTo(destination))
        {
            routingTable.table[destination] = RouteEntry{candidate, neighborName};
            updated = true;
        }
    }
    return updated;
}

const RoutingTable &RouterNode::shareTable() const
{
    return routingTable;
}

void RouterNode::disconnectNeighbor(const std::string &neighborName)
{
    auto it = neighborCosts.find(neighborName);
    if (it == neighborCosts.end())
        return;

    it->second = INFINITE_COST;
    routingTable.table[neighborName] = RouteEntry{INFINITE_COST, std::nullopt};
}

void RouterNode::connectNeighbor(const std::string &neighborName, Cost cost)
{
    if (neighborName == name)
    {
        throw NetworkError(NetworkErrorKind::SelfLink, "Node " + name + " cannot be linked to itself");
    }
    if (cost < 0)
    {
        throw NetworkError(NetworkErrorKind::NegativeCost,
                           "Negative link cost " + std::to_string(cost) + " between " + name + " and " + neighborName);
    }

    neighborCosts[neighborName] = cost;
    if (isInfinite(cost))
        routingTable.table[neighborName] = RouteEntry{INFINITE_COST, std::nullopt};
    else
        routingTable.table[neighborName] = RouteEntry{cost, neighborName};
}

bool RouterNode::hasNeighbor(const std::string &neighborName) const
{
    return neighborCosts.count(neighborName) > 0;
}

const std::map<std::string, Cost> &RouterNode::getNeighborCosts() const
{
    return neighborCosts;
}

std::string RouterNode::getName() const
{
    return name;
}
