#include "RoutingCLI.hpp"
#include "utils.hpp"
#include <sstream>

RoutingCLI::RoutingCLI(Network network, int maxRounds, std::istream &in, std::ostream &out)
    : network(std::move(network)), maxRounds(maxRounds), in(in), out(out), console(out)
{
}

void RoutingCLI::run()
{
    out << "RIP Simulator CLI" << std::endl;
    out << "Type 'help' for available commands" << std::endl;

    std::string line;
    while (true)
    {
        out << "ripsim> ";
        if (!std::getline(in, line))
        {
            break;
        }

        if (line.empty())
            continue;

        if (line == "quit" || line == "exit")
        {
            break;
        }

        handleCommand(line);
    }
}

void RoutingCLI::handleCommand(const std::string &command)
{
    std::istringstream iss(command);
    std::string cmd;
    iss >> cmd;

    try
    {
        if (cmd == "help")
        {
            printHelp();
        }
        else if (cmd == "node")
        {
            std::string id;
            if (iss >> id)
            {
                network.addNode(id);
                out << "Node " << id << " added" << std::endl;
            }
            else
            {
                out << "Usage: node <id>" << std::endl;
            }
        }
        else if (cmd == "link")
        {
            std::string node1, node2, costStr;
            if (iss >> node1 >> node2 >> costStr)
            {
                Cost cost = parseCost(costStr, "link command");
                network.connectNodes(node1, node2, cost);
                out << "Link " << node1 << "-" << node2 << " added with cost " << formatCost(cost) << std::endl;
            }
            else
            {
                out << "Usage: link <a> <b> <cost>" << std::endl;
                out << "Example: link A B 1" << std::endl;
            }
        }
        else if (cmd == "step")
        {
            bool updated = network.runIteration();
            ++roundsRun;
            console.report(network.snapshot(), "Iteration " + std::to_string(roundsRun));
            out << (updated ? "Routing tables changed" : "No change, network is converged") << std::endl;
        }
        else if (cmd == "converge")
        {
            int rounds = maxRounds;
            std::string roundsStr;
            if (iss >> roundsStr)
            {
                try
                {
                    rounds = parseInt(roundsStr, "converge");
                }
                catch (const std::runtime_error &)
                {
                    out << "Invalid round count" << std::endl;
                    return;
                }
                if (rounds <= 0)
                {
                    out << "Round count must be positive" << std::endl;
                    return;
                }
            }

            ConvergenceResult result = network.converge(rounds);
            roundsRun += result.roundsUsed;
            if (result.converged)
                out << "Network converged after " << result.roundsUsed << " iterations" << std::endl;
            else
                out << "Warning: network did not converge after " << result.roundsUsed << " iterations" << std::endl;
        }
        else if (cmd == "fail")
        {
            std::string node1, node2;
            if (iss >> node1 >> node2)
            {
                network.simulateFailure(node1, node2);
                console.report(network.snapshot(), "Failure between " + node1 + " and " + node2);
            }
            else
            {
                out << "Usage: fail <a> <b>" << std::endl;
            }
        }
        else if (cmd == "tables" || cmd == "routes")
        {
            console.report(network.snapshot(), "Routing tables");
        }
        else if (cmd == "status")
        {
            out << "Network state: " << toString(network.getState()) << std::endl;
            out << "Nodes (" << network.size() << "): ";
            for (const auto &name : network.getNodeNames())
            {
                out << name << " ";
            }
            out << std::endl;
            out << "Rounds run: " << roundsRun << std::endl;
        }
        else
        {
            out << "Unknown command: " << cmd << std::endl;
            out << "Type 'help' for available commands" << std::endl;
        }
    }
    catch (const std::runtime_error &e)
    {
        out << "Error: " << e.what() << std::endl;
    }
}

void RoutingCLI::printHelp()
{
    out << "Available commands:" << std::endl;
    out << "  node <id>           - Add a node" << std::endl;
    out << "  link <a> <b> <cost> - Connect two nodes (cost may be inf)" << std::endl;
    out << "  step                - Run a single round" << std::endl;
    out << "  converge [max]      - Run rounds until no table changes" << std::endl;
    out << "  fail <a> <b>        - Take the link between two nodes down" << std::endl;
    out << "  tables/routes       - Show all routing tables" << std::endl;
    out << "  status              - Show network state" << std::endl;
    out << "  help                - Show this help message" << std::endl;
    out << "  quit/exit           - Exit the CLI" << std::endl;
}
