#pragma once
#include <string>
#include <vector>
#include <chrono>

struct PhaseResult
{
    std::string label;
    int roundsUsed = 0;
    bool converged = false;
    std::chrono::milliseconds elapsed{0};
};

struct SimulationResult
{
    std::vector<PhaseResult> phases;

    bool allConverged() const
    {
        for (const auto &phase : phases)
        {
            if (!phase.converged)
                return false;
        }
        return true;
    }

    std::chrono::milliseconds totalElapsed() const
    {
        std::chrono::milliseconds total{0};
        for (const auto &phase : phases)
            total += phase.elapsed;
        return total;
    }

    double averageConvergenceTime() const
    {
        if (phases.empty())
            return 0.0;
        return static_cast<double>(totalElapsed().count()) / phases.size();
    }
};
