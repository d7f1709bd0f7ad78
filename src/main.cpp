#include "Network.hpp"
#include "Reporter.hpp"
#include "RoutingCLI.hpp"
#include "Simulation.hpp"
#include "utils.hpp"
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>

static SimulationConfig loadConfig(const std::string &configFile)
{
    if (!configFile.empty())
        return parseSimulationConfig(configFile);

    const std::string defaultConfigFile = "config/simulation.conf";
    if (std::filesystem::exists(defaultConfigFile))
        return parseSimulationConfig(defaultConfigFile);

    return defaultSimulationConfig();
}

int main(int argc, char *argv[])
{
    bool interactive = false;
    std::string configFile;

    for (int i = 1; i < argc; ++i)
    {
        std::string arg = argv[i];
        if (arg == "--cli")
        {
            interactive = true;
        }
        else if (arg == "-h" || arg == "--help")
        {
            std::cout << "Usage: " << argv[0] << " [--cli] [config]" << std::endl;
            return 0;
        }
        else
        {
            configFile = arg;
        }
    }

    try
    {
        SimulationConfig config = loadConfig(configFile);
        Network network = buildNetwork(config);

        if (interactive)
        {
            RoutingCLI cli(std::move(network), config.maxRounds);
            cli.run();
            return 0;
        }

        CompositeReporter reporter;
        if (config.console)
            reporter.add(std::make_unique<ConsoleReporter>());
        if (!config.logFile.empty())
            reporter.add(std::make_unique<LogFileReporter>(config.logFile));
        if (!config.jsonLogFile.empty())
            reporter.add(std::make_unique<JsonLinesReporter>(config.jsonLogFile, config.signingKey));

        Simulation simulation(network, reporter, config.maxRounds, config.verbose);
        simulation.run(config.failures);
    }
    catch (const std::exception &e)
    {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
