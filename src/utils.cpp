#include "utils.hpp"
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <ctime>

std::vector<std::string> split(const std::string &str, char delimiter)
{
    std::vector<std::string> tokens;
    std::string token;
    std::istringstream tokenStream(str);
    while (std::getline(tokenStream, token, delimiter))
    {
        token = trim(token);
        if (!token.empty())
            tokens.push_back(token);
    }
    return tokens;
}

std::string trim(const std::string &str)
{
    size_t first = str.find_first_not_of(" \t\r\n");
    if (first == std::string::npos)
        return "";
    size_t last = str.find_last_not_of(" \t\r\n");
    return str.substr(first, last - first + 1);
}

// A '#' starts a comment at the beginning of the line or after whitespace,
// elsewhere it belongs to the value
static std::string stripComment(const std::string &line)
{
    for (size_t i = 0; i < line.size(); ++i)
    {
        if (line[i] == '#' && (i == 0 || line[i - 1] == ' ' || line[i - 1] == '\t'))
            return line.substr(0, i);
    }
    return line;
}

Cost parseCost(const std::string &value, const std::string &context)
{
    if (value == "inf")
        return INFINITE_COST;

    size_t consumed = 0;
    long long cost = 0;
    try
    {
        cost = std::stoll(value, &consumed);
    }
    catch (const std::exception &)
    {
        throw std::runtime_error("Invalid cost '" + value + "' in " + context);
    }
    if (consumed != value.size())
    {
        throw std::runtime_error("Invalid cost '" + value + "' in " + context);
    }
    return cost;
}

int parseInt(const std::string &value, const std::string &key)
{
    size_t consumed = 0;
    int result = 0;
    try
    {
        result = std::stoi(value, &consumed);
    }
    catch (const std::exception &)
    {
        throw std::runtime_error("Invalid integer for " + key + ": " + value);
    }
    if (consumed != value.size())
    {
        throw std::runtime_error("Invalid integer for " + key + ": " + value);
    }
    return result;
}

static bool parseBool(const std::string &value, const std::string &key)
{
    if (value == "true" || value == "yes" || value == "1")
        return true;
    if (value == "false" || value == "no" || value == "0")
        return false;
    throw std::runtime_error("Invalid boolean for " + key + ": " + value);
}

std::pair<std::string, std::string> parseNodePair(const std::string &text)
{
    size_t dash = text.find('-');
    if (dash == std::string::npos)
    {
        throw std::runtime_error("Expected <node>-<node>, got '" + text + "'");
    }
    std::string node1 = trim(text.substr(0, dash));
    std::string node2 = trim(text.substr(dash + 1));
    if (node1.empty() || node2.empty())
    {
        throw std::runtime_error("Expected <node>-<node>, got '" + text + "'");
    }
    return {node1, node2};
}

LinkConfig parseLink(const std::string &text)
{
    size_t colon = text.rfind(':');
    if (colon == std::string::npos)
    {
        throw std::runtime_error("Expected <node>-<node>:<cost>, got '" + text + "'");
    }
    auto [node1, node2] = parseNodePair(text.substr(0, colon));
    return LinkConfig{node1, node2, parseCost(trim(text.substr(colon + 1)), "link " + text)};
}

SimulationConfig parseSimulationConfig(std::istream &input)
{
    SimulationConfig config;
    std::string line;
    std::string currentSection;

    while (std::getline(input, line))
    {
        line = trim(stripComment(line));

        if (line.empty() || (line.size() > 1 && line[0] == '/' && line[1] == '/'))
            continue;

        if (line.front() == '[' && line.back() == ']')
        {
            currentSection = trim(line.substr(1, line.size() - 2));
            continue;
        }

        size_t equalsPos = line.find('=');
        if (equalsPos == std::string::npos)
            continue;

        std::string key = trim(line.substr(0, equalsPos));
        std::string value = trim(line.substr(equalsPos + 1));

        if (currentSection == "simulation")
        {
            if (key == "max_rounds")
                config.maxRounds = parseInt(value, key);
            else if (key == "log_file")
                config.logFile = value;
            else if (key == "json_log")
                config.jsonLogFile = value;
            else if (key == "signing_key")
                config.signingKey = value;
            else if (key == "console")
                config.console = parseBool(value, key);
            else if (key == "verbose")
                config.verbose = parseBool(value, key);
        }
        else if (currentSection == "topology")
        {
            if (key == "nodes")
            {
                config.nodes = split(value, ',');
            }
            else if (key == "links")
            {
                config.links.clear();
                for (const auto &link : split(value, ','))
                    config.links.push_back(parseLink(link));
            }
            else if (key == "failures")
            {
                config.failures.clear();
                for (const auto &failure : split(value, ','))
                    config.failures.push_back(parseNodePair(failure));
            }
        }
    }

    if (config.maxRounds < 1)
    {
        throw std::runtime_error("max_rounds must be at least 1");
    }
    return config;
}

SimulationConfig parseSimulationConfig(const std::string &configFile)
{
    std::ifstream file(configFile);
    if (!file)
    {
        throw std::runtime_error("Cannot open config file " + configFile);
    }
    return parseSimulationConfig(file);
}

SimulationConfig defaultSimulationConfig()
{
    SimulationConfig config;
    config.logFile = "networkLog.txt";
    config.nodes = {"A", "B", "C"};
    config.links = {{"A", "B", 1}, {"B", "C", 1}, {"A", "C", 4}};
    config.failures = {{"A", "B"}};
    return config;
}

std::string currentTimestamp()
{
    std::time_t now = std::time(nullptr);
    std::tm local{};
    localtime_r(&now, &local);
    std::ostringstream oss;
    oss << std::put_time(&local, "%Y-%m-%d %H:%M:%S");
    return oss.str();
}
