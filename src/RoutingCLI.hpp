#pragma once
#include "Network.hpp"
#include "Reporter.hpp"
#include <iostream>
#include <string>

class RoutingCLI {
public:
    RoutingCLI(Network network, int maxRounds = Network::DEFAULT_MAX_ROUNDS,
               std::istream &in = std::cin, std::ostream &out = std::cout);
    void run();
    void handleCommand(const std::string& command);

    const Network &getNetwork() const { return network; }

private:
    void printHelp();

    Network network;
    int maxRounds;
    int roundsRun = 0;
    std::istream &in;
    std::ostream &out;
    ConsoleReporter console;
};
