#pragma once
#include <vector>
#include <queue>
#include <unordered_map>
#include <unordered_set>
#include <optional>
#include <chrono>
#include "Grid.h"
#include "SearchObserver.h"
#include "VisualizerSettings.h"

enum class SearchOutcome {
    Found,
    NotFound,       // frontier exhausted, not an error
    Cancelled,      // cancellation token seen at a round boundary
    InvalidInput    // start/end unset, outside the grid or identical. nothing was touched
};

const char* searchOutcomeName(SearchOutcome outcome);

// result of a pathfinding operation
struct SearchResult {
    SearchOutcome outcome = SearchOutcome::NotFound;
    std::vector<GridCell> path;          // end first, start-adjacent last, start excluded
    int nodesExpanded = 0;               // number of nodes expanded during search
    int steps = 0;                       // number of onStep rounds
    double computeTimeMs = 0.0;          // time taken including observer callbacks

    bool found() const { return outcome == SearchOutcome::Found; }
};

using PredecessorMap = std::unordered_map<GridCell, GridCell, GridCellHash>;

class Pathfinder {
public:
    // every strategy recomputes the grid adjacency first, then mutates cell
    // tags as it explores and reports each round to the observer
    SearchResult findPathBFS(Grid& grid, const std::optional<GridCell>& start,
                             const std::optional<GridCell>& end, SearchObserver& observer,
                             const CancellationToken* cancel = nullptr) const;
    SearchResult findPathDFS(Grid& grid, const std::optional<GridCell>& start,
                             const std::optional<GridCell>& end, SearchObserver& observer,
                             const CancellationToken* cancel = nullptr) const;
    SearchResult findPathAStar(Grid& grid, const std::optional<GridCell>& start,
                               const std::optional<GridCell>& end, SearchObserver& observer,
                               const CancellationToken* cancel = nullptr) const;

    // generic pathfinding dispatcher
    SearchResult findPath(VisualizerSettings::Algos algo, Grid& grid,
                          const std::optional<GridCell>& start, const std::optional<GridCell>& end,
                          SearchObserver& observer, const CancellationToken* cancel = nullptr) const;
    // uses the start/end designated on the grid
    SearchResult findPath(VisualizerSettings::Algos algo, Grid& grid, SearchObserver& observer,
                          const CancellationToken* cancel = nullptr) const;

    // walks back from end, tags intermediate cells Path. throws std::logic_error
    // when the chain never reaches start
    std::vector<GridCell> reconstructPath(Grid& grid, const PredecessorMap& cameFrom,
                                          const GridCell& start, const GridCell& end) const;

    // utility
    int heuristic(const GridCell& a, const GridCell& b) const { return manhattanDistance(a, b); }
    static int manhattanDistance(const GridCell& a, const GridCell& b);
    static bool isValidInput(const Grid& grid, const std::optional<GridCell>& start,
                             const std::optional<GridCell>& end);

private:
    static bool isCancelled(const CancellationToken* cancel) {
        return cancel != nullptr && cancel->isCancelled();
    }

    // shared success tail: reconstruct, notify, stamp the result
    void finishFound(SearchResult& result, Grid& grid, const PredecessorMap& cameFrom,
                     const GridCell& start, const GridCell& end, SearchObserver& observer) const;
};
