#pragma once
#include <vector>
#include <string>
#include "VisualizerSettings.h"
#include "Pathfinder.h"
#include "Grid.h"

// statistics for a single algorithm in the comparison
struct AlgorithmStats {
    VisualizerSettings::Algos algorithm;
    std::string name;

    SearchOutcome outcome = SearchOutcome::NotFound;
    int nodesExpanded = 0;        // nodes expanded (last trial, the search is deterministic)
    int steps = 0;                // onStep rounds
    int pathLength = 0;           // cells on the path, end included, start excluded
    double avgComputeTimeMs = 0.0;

    // rank by path length among the algorithms that found one (1 = shortest)
    int rank = 0;
};

// runs every strategy headless on copies of a grid so they can be compared
// side by side without touching what is on screen
class BenchmarkManager {
public:
    explicit BenchmarkManager(int trials = 3);

    const std::vector<AlgorithmStats>& runComparison(const Grid& grid);
    const std::vector<AlgorithmStats>& getStats() const { return stats_; }
    void reset() { stats_.clear(); }

    void setTrials(int trials);
    int getTrials() const { return trials_; }

    // fixed width table for console and HUD
    std::string formatReport() const;

private:
    Pathfinder pathfinder_;
    std::vector<AlgorithmStats> stats_;
    int trials_;

    void updateRankings();
};
