#include "RouterNode.hpp"
#include "NetworkError.hpp"
#include "gtest/gtest.h"

static RoutingTable tableOf(std::initializer_list<std::pair<const std::string, RouteEntry>> entries)
{
    RoutingTable table;
    table.table = entries;
    return table;
}

// Construction ***************************************************************
TEST(RouterNode, StartsWithSelfRouteOnly)
{
    RouterNode node("A");
    const auto &table = node.shareTable().table;
    ASSERT_EQ(1u, table.size());
    EXPECT_EQ((RouteEntry{0, std::string("A")}), table.at("A"));
    EXPECT_TRUE(node.getNeighborCosts().empty());
}

TEST(RouterNode, ConnectSeedsDirectRoute)
{
    RouterNode node("A");
    node.connectNeighbor("B", 3);
    EXPECT_EQ(3, node.getNeighborCosts().at("B"));
    EXPECT_EQ((RouteEntry{3, std::string("B")}), node.shareTable().table.at("B"));
}

TEST(RouterNode, ConnectRejectsSelfAndNegativeCost)
{
    RouterNode node("A");
    try
    {
        node.connectNeighbor("A", 1);
        FAIL() << "self link accepted";
    }
    catch (const NetworkError &e)
    {
        EXPECT_EQ(NetworkErrorKind::SelfLink, e.kind());
    }
    try
    {
        node.connectNeighbor("B", -2);
        FAIL() << "negative cost accepted";
    }
    catch (const NetworkError &e)
    {
        EXPECT_EQ(NetworkErrorKind::NegativeCost, e.kind());
    }
    EXPECT_FALSE(node.hasNeighbor("B"));
}

// updateRoutingTable *********************************************************
TEST(UpdateRoutingTable, LearnsUnknownDestination)
{
    RouterNode node("A");
    node.connectNeighbor("B", 2);

    auto advertised = tableOf({{"B", {0, std::string("B")}}, {"C", {5, std::string("C")}}});
    EXPECT_TRUE(node.updateRoutingTable("B", advertised));
    EXPECT_EQ((RouteEntry{7, std::string("B")}), node.shareTable().table.at("C"));
}

TEST(UpdateRoutingTable, TakesStrictImprovementOnly)
{
    RouterNode node("A");
    node.connectNeighbor("B", 1);
    node.connectNeighbor("C", 4);

    // Via B: 1 + 3 = 4, a tie with the direct route
    auto tie = tableOf({{"B", {0, std::string("B")}}, {"C", {3, std::string("C")}}});
    EXPECT_FALSE(node.updateRoutingTable("B", tie));
    EXPECT_EQ((RouteEntry{4, std::string("C")}), node.shareTable().table.at("C"));

    auto better = tableOf({{"B", {0, std::string("B")}}, {"C", {1, std::string("C")}}});
    EXPECT_TRUE(node.updateRoutingTable("B", better));
    EXPECT_EQ((RouteEntry{2, std::string("B")}), node.shareTable().table.at("C"));
}

TEST(UpdateRoutingTable, NeverWorsensARoute)
{
    RouterNode node("A");
    node.connectNeighbor("B", 1);
    node.connectNeighbor("C", 2);

    auto worse = tableOf({{"C", {10, std::string("C")}}});
    EXPECT_FALSE(node.updateRoutingTable("B", worse));
    EXPECT_EQ(2, node.shareTable().costTo("C"));
}

TEST(UpdateRoutingTable, IgnoresRoutesToSelf)
{
    RouterNode node("A");
    node.connectNeighbor("B", 1);

    // A neighbor can never make the self route cheaper or move its next hop
    auto advertised = tableOf({{"A", {0, std::string("A")}}, {"B", {0, std::string("B")}}});
    EXPECT_FALSE(node.updateRoutingTable("B", advertised));
    EXPECT_EQ((RouteEntry{0, std::string("A")}), node.shareTable().table.at("A"));
}

TEST(UpdateRoutingTable, InfiniteAdvertisementStaysInfinite)
{
    RouterNode node("A");
    node.connectNeighbor("B", 1);

    auto advertised = tableOf({{"D", {INFINITE_COST, std::nullopt}}});
    EXPECT_FALSE(node.updateRoutingTable("B", advertised));
    EXPECT_FALSE(node.shareTable().contains("D"));
}

TEST(UpdateRoutingTable, DownLinkNeverImproves)
{
    RouterNode node("A");
    node.connectNeighbor("B", 1);
    node.disconnectNeighbor("B");

    auto advertised = tableOf({{"B", {0, std::string("B")}}, {"C", {1, std::string("C")}}});
    EXPECT_FALSE(node.updateRoutingTable("B", advertised));
    EXPECT_EQ(INFINITE_COST, node.shareTable().costTo("B"));
}

TEST(UpdateRoutingTable, UnknownNeighborIsAnError)
{
    RouterNode node("A");
    auto advertised = tableOf({{"B", {0, std::string("B")}}});
    EXPECT_THROW(node.updateRoutingTable("B", advertised), NetworkError);
}

// disconnectNeighbor *********************************************************
TEST(DisconnectNeighbor, WipesDirectRouteOnly)
{
    RouterNode node("A");
    node.connectNeighbor("B", 1);
    node.connectNeighbor("C", 4);
    auto viaB = tableOf({{"B", {0, std::string("B")}}, {"C", {1, std::string("C")}}, {"D", {1, std::string("D")}}});
    ASSERT_TRUE(node.updateRoutingTable("B", viaB));

    node.disconnectNeighbor("B");

    EXPECT_EQ(INFINITE_COST, node.getNeighborCosts().at("B"));
    EXPECT_EQ((RouteEntry{INFINITE_COST, std::nullopt}), node.shareTable().table.at("B"));
    // Stale routes through B survive
    EXPECT_EQ((RouteEntry{2, std::string("B")}), node.shareTable().table.at("C"));
    EXPECT_EQ((RouteEntry{2, std::string("B")}), node.shareTable().table.at("D"));
}

TEST(DisconnectNeighbor, UnknownNeighborIsNoOp)
{
    RouterNode node("A");
    node.disconnectNeighbor("Z");
    EXPECT_FALSE(node.hasNeighbor("Z"));
    EXPECT_EQ(1u, node.shareTable().table.size());
}

// Cost arithmetic ************************************************************
TEST(Cost, AdditionSaturatesAtInfinity)
{
    EXPECT_EQ(5, addCost(2, 3));
    EXPECT_EQ(INFINITE_COST, addCost(INFINITE_COST, 1));
    EXPECT_EQ(INFINITE_COST, addCost(1, INFINITE_COST));
    EXPECT_EQ(INFINITE_COST, addCost(INFINITE_COST - 1, 5));
}
