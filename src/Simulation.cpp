#include "Simulation.hpp"
#include <chrono>
#include <iostream>

Simulation::Simulation(Network &network, Reporter &reporter, int maxRounds, bool verbose)
    : network(network), reporter(reporter), maxRounds(maxRounds), verbose(verbose)
{
}

void Simulation::reportInitialState()
{
    reporter.report(network.snapshot(), "Initial network state");
}

PhaseResult Simulation::convergePhase(const std::string &label)
{
    auto start = std::chrono::steady_clock::now();

    ConvergenceResult convergence = network.converge(maxRounds, [this, &label](int round, bool updated)
                                                     {
        if (verbose)
        {
            std::cout << "DEBUG: round " << round << " (" << label << ") "
                      << (updated ? "updated routing tables" : "no change") << std::endl;
        }
        reporter.report(network.snapshot(), "Iteration " + std::to_string(round) + " (" + label + ")"); });

    PhaseResult phase;
    phase.label = label;
    phase.roundsUsed = convergence.roundsUsed;
    phase.converged = convergence.converged;
    phase.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);

    if (!phase.converged)
    {
        std::cerr << "Warning: network did not converge after " << phase.roundsUsed
                  << " iterations (" << label << ")" << std::endl;
    }

    reporter.phaseFinished(phase);
    return phase;
}

void Simulation::injectFailure(const std::string &node1, const std::string &node2)
{
    network.simulateFailure(node1, node2);
    if (verbose)
    {
        std::cout << "DEBUG: link " << node1 << "-" << node2 << " is down" << std::endl;
    }
    reporter.report(network.snapshot(), "Failure between " + node1 + " and " + node2);
}

SimulationResult Simulation::run(const std::vector<std::pair<std::string, std::string>> &failures)
{
    SimulationResult result;

    reportInitialState();
    result.phases.push_back(convergePhase("initial"));

    for (const auto &[node1, node2] : failures)
    {
        injectFailure(node1, node2);
        result.phases.push_back(convergePhase("after failure " + node1 + "-" + node2));
    }

    reporter.simulationFinished(result);
    return result;
}

Network buildNetwork(const SimulationConfig &config)
{
    Network network;
    for (const auto &node : config.nodes)
    {
        network.addNode(node);
    }
    for (const auto &link : config.links)
    {
        network.connectNodes(link.node1, link.node2, link.cost);
    }
    return network;
}
