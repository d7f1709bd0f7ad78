// RouterNode.hpp
#pragma once
#include <string>
#include <map>
#include "RoutingTable.hpp"

class RouterNode
{
public:
    RouterNode(const std::string &name);

    // Bellman-Ford relaxation against one neighbor's advertised table.
    // Only strict improvements are taken. Returns true if any entry changed.
    bool updateRoutingTable(const std::string &neighborName, const RoutingTable &neighborTable);

    const RoutingTable &shareTable() const;

    // Link goes down: neighbor cost and the direct route become infinite.
    // Routes learned through the neighbor are left untouched.
    void disconnectNeighbor(const std::string &neighborName);

    void connectNeighbor(const std::string &neighborName, Cost cost);

    bool hasNeighbor(const std::string &neighborName) const;
    const std::map<std::string, Cost> &getNeighborCosts() const;
    std::string getName() const;

private:
    std::string name;
    RoutingTable routingTable;
    std::map<std::string, Cost> neighborCosts;
};
