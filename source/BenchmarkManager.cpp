#include "BenchmarkManager.h"
#include <algorithm>
#include <sstream>
#include <iomanip>

BenchmarkManager::BenchmarkManager(int trials)
    : trials_(std::max(1, trials))
{
}

void BenchmarkManager::setTrials(int trials)
{
    trials_ = std::max(1, trials);
}

const std::vector<AlgorithmStats> &BenchmarkManager::runComparison(const Grid &grid)
{
    stats_.clear();
    NullObserver observer;

    for (auto algo : VisualizerSettings::allAlgos())
    {
        AlgorithmStats stats;
        stats.algorithm = algo;
        stats.name = VisualizerSettings::algoNames(algo);

        // every trial gets a fresh copy so the live grid keeps its tags
        double totalMs = 0.0;
        for (int t = 0; t < trials_; ++t)
        {
            Grid scratch = grid;
            scratch.clearSearchState();
            SearchResult res = pathfinder_.findPath(algo, scratch, observer);
            totalMs += res.computeTimeMs;

            stats.outcome = res.outcome;
            stats.nodesExpanded = res.nodesExpanded;
            stats.steps = res.steps;
            stats.pathLength = static_cast<int>(res.path.size());

            // nothing to time when start/end are missing
            if (res.outcome == SearchOutcome::InvalidInput)
                break;
        }
        stats.avgComputeTimeMs = totalMs / trials_;
        stats_.push_back(stats);
    }

    updateRankings();
    return stats_;
}

void BenchmarkManager::updateRankings()
{
    std::vector<AlgorithmStats *> finished;
    for (auto &s : stats_)
    {
        s.rank = 0;
        if (s.outcome == SearchOutcome::Found)
            finished.push_back(&s);
    }

    // shorter path first, fewer expansions breaks ties
    std::stable_sort(finished.begin(), finished.end(), [](const AlgorithmStats *a, const AlgorithmStats *b) {
        if (a->pathLength != b->pathLength)
            return a->pathLength < b->pathLength;
        return a->nodesExpanded < b->nodesExpanded;
    });

    int rank = 1;
    for (auto *s : finished)
    {
        s->rank = rank++;
    }
}

std::string BenchmarkManager::formatReport() const
{
    std::ostringstream oss;
    oss << std::left << std::setw(6) << "Algo"
        << std::setw(15) << "Outcome"
        << std::right << std::setw(9) << "Expanded"
        << std::setw(7) << "Steps"
        << std::setw(6) << "Path"
        << std::setw(11) << "Time(ms)"
        << std::setw(6) << "Rank" << "\n";

    for (const auto &s : stats_)
    {
        oss << std::left << std::setw(6) << s.name
            << std::setw(15) << searchOutcomeName(s.outcome)
            << std::right << std::setw(9) << s.nodesExpanded
            << std::setw(7) << s.steps
            << std::setw(6) << s.pathLength
            << std::setw(11) << std::fixed << std::setprecision(3) << s.avgComputeTimeMs
            << std::setw(6);
        if (s.rank > 0)
            oss << s.rank;
        else
            oss << "--";
        oss << "\n";
    }
    return oss.str();
}
