#pragma once
#include <string>
#include <map>
#include <vector>
#include <functional>
#include "RouterNode.hpp"
#include "RoutingSnapshot.hpp"
#include "NetworkError.hpp"

enum class NetworkState
{
    Uninitialized,
    Built,
    Converging,
    Converged,
    RoundCapReached
};

struct ConvergenceResult
{
    int roundsUsed = 0;
    bool converged = false;
};

// Called after every round with the 1-based round number and whether it changed a table
using RoundObserver = std::function<void(int round, bool updated)>;

class Network
{
public:
    static constexpr int DEFAULT_MAX_ROUNDS = 100;

    void addNode(const std::string &name);
    void connectNodes(const std::string &node1, const std::string &node2, Cost cost);

    // One synchronous round. Every node reads the tables as they were at the
    // start of the round, so node order never changes the outcome.
    bool runIteration();

    ConvergenceResult converge(int maxRounds = DEFAULT_MAX_ROUNDS,
                               const RoundObserver &observer = nullptr);

    // Disconnects both ends of the link; reconvergence is left to the caller
    void simulateFailure(const std::string &node1, const std::string &node2);

    NetworkSnapshot snapshot() const;

    bool hasNode(const std::string &name) const;
    const RouterNode &getNode(const std::string &name) const;
    std::vector<std::string> getNodeNames() const;
    size_t size() const { return nodes.size(); }
    NetworkState getState() const { return state; }

private:
    RouterNode &requireNode(const std::string &name);

    std::map<std::string, RouterNode> nodes;
    NetworkState state = NetworkState::Uninitialized;
};

const char *toString(NetworkState state);
