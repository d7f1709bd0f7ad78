#include "Network.hpp"

void Network::addNode(const std::string &name)
{
    if (nodes.count(name))
    {
        throw NetworkError(NetworkErrorKind::DuplicateNodeId, "Node " + name + " already exists in the network");
    }
    nodes.emplace(name, RouterNode(name));
    state = NetworkState::Built;
}

void Network::connectNodes(const std::string &node1, const std::string &node2, Cost cost)
{
    RouterNode &first = requireNode(node1);
    RouterNode &second = requireNode(node2);

    if (node1 == node2)
    {
        throw NetworkError(NetworkErrorKind::SelfLink, "Node " + node1 + " cannot be linked to itself");
    }
    if (cost < 0)
    {
        throw NetworkError(NetworkErrorKind::NegativeCost,
                           "Negative link cost " + std::to_string(cost) + " between " + node1 + " and " + node2);
    }

    first.connectNeighbor(node2, cost);
    second.connectNeighbor(node1, cost);
    state = NetworkState::Built;
}

bool Network::runIteration()
{
    // Tables as of the start of the round
    std::map<std::string, RoutingTable> advertised;
    for (const auto &[name, node] : nodes)
    {
        advertised.emplace(name, node.shareTable());
    }

    bool updated = false;
    for (auto &[name, node] : nodes)
    {
        for (const auto &[neighborName, cost] : node.getNeighborCosts())
        {
            auto it = advertised.find(neighborName);
            if (it == advertised.end())
                continue;
            if (node.updateRoutingTable(neighborName, it->second))
                updated = true;
        }
    }

    state = updated ? NetworkState::Converging : NetworkState::Converged;
    return updated;
}

ConvergenceResult Network::converge(int maxRounds, const RoundObserver &observer)
{
    ConvergenceResult result;
    state = NetworkState::Converging;

    while (result.roundsUsed < maxRounds)
    {
        bool updated = runIteration();
        ++result.roundsUsed;
        if (observer)
            observer(result.roundsUsed, updated);
        if (!updated)
        {
            result.converged = true;
            return result;
        }
    }

    state = NetworkState::RoundCapReached;
    return result;
}

void Network::simulateFailure(const std::string &node1, const std::string &node2)
{
    RouterNode &first = requireNode(node1);
    RouterNode &second = requireNode(node2);

    first.disconnectNeighbor(node2);
    second.disconnectNeighbor(node1);
    state = NetworkState::Converging;
}

NetworkSnapshot Network::snapshot() const
{
    NetworkSnapshot result;
    result.reserve(nodes.size());
    for (const auto &[name, node] : nodes)
    {
        NodeSnapshot nodeSnapshot{name, {}};
        for (const auto &[destination, entry] : node.shareTable().table)
        {
            nodeSnapshot.routes.push_back({destination, entry.cost, entry.nextHop});
        }
        result.push_back(std::move(nodeSnapshot));
    }
    return result;
}

bool Network::hasNode(const std::string &name) const
{
    return nodes.count(name) > 0;
}

const RouterNode &Network::getNode(const std::string &name) const
{
    auto it = nodes.find(name);
    if (it == nodes.end())
    {
        throw NetworkError(NetworkErrorKind::UnknownNodeId, "Node " + name + " does not exist in the network");
    }
    return it->second;
}

std::vector<std::string> Network::getNodeNames() const
{
    std::vector<std::string> names;
    for (const auto &[name, node] : nodes)
    {
        names.push_back(name);
    }
    return names;
}

RouterNode &Network::requireNode(const std::string &name)
{
    auto it = nodes.find(name);
    if (it == nodes.end())
    {
        throw NetworkError(NetworkErrorKind::UnknownNodeId, "Node " + name + " does not exist in the network");
    }
    return it->second;
}

const char *toString(NetworkState state)
{
    switch (state)
    {
    case NetworkState::Uninitialized:
        return "uninitialized";
    case NetworkState::Built:
        return "built";
    case NetworkState::Converging:
        return "converging";
    case NetworkState::Converged:
        return "converged";
    case NetworkState::RoundCapReached:
        return "round cap reached";
    }
    return "unknown";
}
