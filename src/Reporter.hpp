#pragma once
#include <string>
#include <vector>
#include <memory>
#include <fstream>
#include <iostream>
#include "RoutingSnapshot.hpp"
#include "SimulationResult.hpp"

// Receives routing state from the simulation. All presentation lives here.
class Reporter
{
public:
    virtual ~Reporter() = default;

    virtual void report(const NetworkSnapshot &snapshot, const std::string &event) = 0;
    virtual void phaseFinished(const PhaseResult &phase) = 0;
    virtual void simulationFinished(const SimulationResult &result) = 0;
};

// Text tables in the layout used on the console and in the log file
void writeRoutingTables(std::ostream &out, const NetworkSnapshot &snapshot);
std::string describePhase(const PhaseResult &phase);

class ConsoleReporter : public Reporter
{
public:
    explicit ConsoleReporter(std::ostream &out = std::cout);

    void report(const NetworkSnapshot &snapshot, const std::string &event) override;
    void phaseFinished(const PhaseResult &phase) override;
    void simulationFinished(const SimulationResult &result) override;

private:
    std::ostream &out;
};

class LogFileReporter : public Reporter
{
public:
    explicit LogFileReporter(const std::string &filename);

    void report(const NetworkSnapshot &snapshot, const std::string &event) override;
    void phaseFinished(const PhaseResult &phase) override;
    void simulationFinished(const SimulationResult &result) override;

private:
    void writeEvent(const std::string &event);

    std::string filename;
    std::ofstream logFile;
};

// One JSON object per line, optionally signed with HMAC-SHA256
class JsonLinesReporter : public Reporter
{
public:
    explicit JsonLinesReporter(const std::string &filename, const std::string &signingKey = "");

    void report(const NetworkSnapshot &snapshot, const std::string &event) override;
    void phaseFinished(const PhaseResult &phase) override;
    void simulationFinished(const SimulationResult &result) override;

private:
    void writeRecord(nlohmann::json record);

    std::ofstream out;
    std::string signingKey;
};

class CompositeReporter : public Reporter
{
public:
    void add(std::unique_ptr<Reporter> reporter);
    bool empty() const { return reporters.empty(); }

    void report(const NetworkSnapshot &snapshot, const std::string &event) override;
    void phaseFinished(const PhaseResult &phase) override;
    void simulationFinished(const SimulationResult &result) override;

private:
    std::vector<std::unique_ptr<Reporter>> reporters;
};

// Recomputes the hmac field of a signed JSON-lines record
bool verifyRecord(const nlohmann::json &record, const std::string &signingKey);
