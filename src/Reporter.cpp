#include "Reporter.hpp"
#include "utils.hpp"
#include <filesystem>
#include <iomanip>
#include <stdexcept>

using json = nlohmann::json;

void writeRoutingTables(std::ostream &out, const NetworkSnapshot &snapshot)
{
    for (const auto &node : snapshot)
    {
        out << "Routing Table for Node " << node.nodeId << ":\n";
        out << std::left << std::setw(12) << "Destination" << " "
            << std::setw(10) << "Cost" << " "
            << std::setw(10) << "Next Hop" << "\n";
        out << std::string(34, '-') << "\n";
        for (const auto &route : node.routes)
        {
            out << std::left << std::setw(12) << route.destination << " "
                << std::setw(10) << formatCost(route.cost) << " "
                << std::setw(10) << route.nextHop.value_or("N/A") << "\n";
        }
        out << std::string(40, '-') << "\n";
    }
}

std::string describePhase(const PhaseResult &phase)
{
    std::ostringstream oss;
    if (phase.converged)
        oss << "Network converged after " << phase.roundsUsed << " iterations";
    else
        oss << "Warning: network did not converge after " << phase.roundsUsed << " iterations";
    oss << " (" << phase.label << ", " << phase.elapsed.count() << " ms)";
    return oss.str();
}

static std::string formatSeconds(std::chrono::milliseconds elapsed)
{
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2) << elapsed.count() / 1000.0;
    return oss.str();
}

// ---------------------------------------------------------------------------

ConsoleReporter::ConsoleReporter(std::ostream &out) : out(out) {}

void ConsoleReporter::report(const NetworkSnapshot &snapshot, const std::string &event)
{
    out << "\n" << std::string(40, '=') << "\n" << event << ":\n";
    writeRoutingTables(out, snapshot);
}

void ConsoleReporter::phaseFinished(const PhaseResult &phase)
{
    out << describePhase(phase) << std::endl;
}

void ConsoleReporter::simulationFinished(const SimulationResult &result)
{
    for (const auto &phase : result.phases)
    {
        out << "Convergence time (" << phase.label << "): " << formatSeconds(phase.elapsed) << " seconds\n";
    }
    out << "Total simulation time: " << formatSeconds(result.totalElapsed()) << " seconds\n";
    std::ostringstream average;
    average << std::fixed << std::setprecision(2) << result.averageConvergenceTime();
    out << "Average convergence time: " << average.str() << " ms" << std::endl;
}

// ---------------------------------------------------------------------------

LogFileReporter::LogFileReporter(const std::string &filename) : filename(filename)
{
    bool fileExists = std::filesystem::exists(filename);
    logFile.open(filename, std::ios::app);
    if (!logFile)
    {
        throw std::runtime_error("Cannot open log file " + filename);
    }

    if (!fileExists)
    {
        logFile << "RIP Protocol Simulation Log\n";
        logFile << std::string(40, '=') << "\n";
        logFile << "This file contains the routing tables and the events recorded during the simulation.\n";
        logFile << "Every entry carries a timestamp and a description of the event.\n";
        logFile << std::string(40, '=') << "\n\n";
    }
}

void LogFileReporter::writeEvent(const std::string &event)
{
    logFile << "\n[" << currentTimestamp() << "] " << event << "\n";
}

void LogFileReporter::report(const NetworkSnapshot &snapshot, const std::string &event)
{
    writeEvent(event);
    logFile << std::string(40, '-') << "\n";
    writeRoutingTables(logFile, snapshot);
    logFile.flush();
}

void LogFileReporter::phaseFinished(const PhaseResult &phase)
{
    writeEvent(describePhase(phase));
    logFile.flush();
}

void LogFileReporter::simulationFinished(const SimulationResult &result)
{
    writeEvent("Total simulation time: " + formatSeconds(result.totalElapsed()) + " seconds");
    logFile.flush();
}

// ---------------------------------------------------------------------------

JsonLinesReporter::JsonLinesReporter(const std::string &filename, const std::string &signingKey)
    : out(filename, std::ios::app), signingKey(signingKey)
{
    if (!out)
    {
        throw std::runtime_error("Cannot open JSON log " + filename);
    }
}

void JsonLinesReporter::writeRecord(json record)
{
    record["timestamp"] = currentTimestamp();
    if (!signingKey.empty())
    {
        std::string unsignedRecord = record.dump();
        record["hmac"] = toHex(computeHMAC(unsignedRecord, signingKey));
    }
    out << record.dump() << "\n";
    out.flush();
}

void JsonLinesReporter::report(const NetworkSnapshot &snapshot, const std::string &event)
{
    writeRecord({{"type", "snapshot"},
                 {"event", event},
                 {"nodes", snapshot}});
}

void JsonLinesReporter::phaseFinished(const PhaseResult &phase)
{
    writeRecord({{"type", "phase"},
                 {"label", phase.label},
                 {"rounds", phase.roundsUsed},
                 {"converged", phase.converged},
                 {"elapsed_ms", phase.elapsed.count()}});
}

void JsonLinesReporter::simulationFinished(const SimulationResult &result)
{
    writeRecord({{"type", "summary"},
                 {"phases", result.phases.size()},
                 {"all_converged", result.allConverged()},
                 {"total_elapsed_ms", result.totalElapsed().count()},
                 {"average_convergence_ms", result.averageConvergenceTime()}});
}

bool verifyRecord(const json &record, const std::string &signingKey)
{
    if (!record.contains("hmac"))
        return false;

    json unsignedRecord = record;
    unsignedRecord.erase("hmac");
    return record["hmac"].get<std::string>() == toHex(computeHMAC(unsignedRecord.dump(), signingKey));
}

// ---------------------------------------------------------------------------

void CompositeReporter::add(std::unique_ptr<Reporter> reporter)
{
    reporters.push_back(std::move(reporter));
}

void CompositeReporter::report(const NetworkSnapshot &snapshot, const std::string &event)
{
    for (auto &reporter : reporters)
        reporter->report(snapshot, event);
}

void CompositeReporter::phaseFinished(const PhaseResult &phase)
{
    for (auto &reporter : reporters)
        reporter->phaseFinished(phase);
}

void CompositeReporter::simulationFinished(const SimulationResult &result)
{
    for (auto &reporter : reporters)
        reporter->simulationFinished(result);
}
