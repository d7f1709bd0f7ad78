#pragma once
#include <string>
#include <map>
#include <optional>
#include <limits>

using Cost = long long;

// Unreachable marker; never produced by arithmetic overflow
constexpr Cost INFINITE_COST = std::numeric_limits<Cost>::max();

inline bool isInfinite(Cost cost)
{
    return cost == INFINITE_COST;
}

// Saturating addition, anything plus infinity stays infinity
inline Cost addCost(Cost a, Cost b)
{
    if (isInfinite(a) || isInfinite(b) || a > INFINITE_COST - b)
        return INFINITE_COST;
    return a + b;
}

struct RouteEntry
{
    Cost cost = INFINITE_COST;
    std::optional<std::string> nextHop;

    bool operator==(const RouteEntry &other) const
    {
        return cost == other.cost && nextHop == other.nextHop;
    }
    bool operator!=(const RouteEntry &other) const { return !(*this == other); }
};

class RoutingTable
{
public:
    std::map<std::string, RouteEntry> table;

    // Cost towards destination, INFINITE_COST when the destination is unknown
    Cost costTo(const std::string &destination) const
    {
        auto it = table.find(destination);
        return it == table.end() ? INFINITE_COST : it->second.cost;
    }

    bool contains(const std::string &destination) const
    {
        return table.count(destination) > 0;
    }

    bool operator==(const RoutingTable &other) const { return table == other.table; }
    bool operator!=(const RoutingTable &other) const { return table != other.table; }
};
