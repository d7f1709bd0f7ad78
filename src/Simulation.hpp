#pragma once
#include <string>
#include <vector>
#include <utility>
#include "Network.hpp"
#include "Reporter.hpp"
#include "SimulationResult.hpp"
#include "utils.hpp"

class Simulation
{
public:
    Simulation(Network &network, Reporter &reporter, int maxRounds = Network::DEFAULT_MAX_ROUNDS,
               bool verbose = false);

    void reportInitialState();
    PhaseResult convergePhase(const std::string &label);
    void injectFailure(const std::string &node1, const std::string &node2);

    // Initial convergence, then one failure + reconvergence per entry
    SimulationResult run(const std::vector<std::pair<std::string, std::string>> &failures);

private:
    Network &network;
    Reporter &reporter;
    int maxRounds;
    bool verbose;
};

Network buildNetwork(const SimulationConfig &config);
