#pragma once
#include <string>
#include <vector>
#include <utility>
#include <openssl/hmac.h>
#include <sstream>
#include <iomanip>
#include "RoutingTable.hpp"

struct LinkConfig
{
    std::string node1;
    std::string node2;
    Cost cost;
};

struct SimulationConfig
{
    int maxRounds = 100;
    std::string logFile;
    std::string jsonLogFile;
    std::string signingKey;
    bool console = true;
    bool verbose = false;

    std::vector<std::string> nodes;
    std::vector<LinkConfig> links;
    std::vector<std::pair<std::string, std::string>> failures;
};

SimulationConfig parseSimulationConfig(const std::string &configFile);
SimulationConfig parseSimulationConfig(std::istream &input);

// Three nodes A, B, C with A-B=1, B-C=1, A-C=4 and the A-B link failing
SimulationConfig defaultSimulationConfig();

std::vector<std::string> split(const std::string &str, char delimiter);
std::string trim(const std::string &str);

// "A-B:4" -> {A, B, 4}
LinkConfig parseLink(const std::string &text);
// "A-B" -> {A, B}
std::pair<std::string, std::string> parseNodePair(const std::string &text);

// Whole-string parses; "inf" is accepted as INFINITE_COST.
// Both throw std::runtime_error on trailing garbage or out-of-range values.
Cost parseCost(const std::string &value, const std::string &context);
int parseInt(const std::string &value, const std::string &key);

// Local time as "YYYY-mm-dd HH:MM:SS"
std::string currentTimestamp();

inline std::string computeHMAC(const std::string &data, const std::string &key)
{
    unsigned char result[EVP_MAX_MD_SIZE];
    unsigned int len = 0;
    HMAC(EVP_sha256(), key.data(), static_cast<int>(key.size()),
         reinterpret_cast<const unsigned char *>(data.data()), data.size(), result, &len);
    return std::string(reinterpret_cast<char *>(result), len);
}

inline std::string toHex(const std::string &input)
{
    std::ostringstream oss;
    for (unsigned char c : input)
    {
        oss << std::hex << std::setw(2) << std::setfill('0') << (int)c;
    }
    return oss.str();
}
