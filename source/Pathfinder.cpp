#include "Pathfinder.h"
#include <limits>
#include <tuple>
#include <stdexcept>
#include <functional>
#include <cstdlib>

const char* searchOutcomeName(SearchOutcome outcome) {
    switch (outcome) {
        case SearchOutcome::Found:
            return "Found";
        case SearchOutcome::NotFound:
            return "No path";
        case SearchOutcome::Cancelled:
            return "Cancelled";
        case SearchOutcome::InvalidInput:
            return "Invalid input";
        default:
            return "Unknown";
    }
}

int Pathfinder::manhattanDistance(const GridCell& a, const GridCell& b) {
    // admissible and consistent for unit cost 4-way moves
    return std::abs(a.row - b.row) + std::abs(a.col - b.col);
}

bool Pathfinder::isValidInput(const Grid& grid, const std::optional<GridCell>& start,
                              const std::optional<GridCell>& end) {
    if (!start || !end) return false;
    if (!grid.contains(*start) || !grid.contains(*end)) return false;
    return *start != *end;
}

std::vector<GridCell> Pathfinder::reconstructPath(Grid& grid, const PredecessorMap& cameFrom,
                                                  const GridCell& start, const GridCell& end) const {
    std::vector<GridCell> path;
    path.push_back(end);

    // walking backwards through the parent map from end toward start.
    // a chain longer than the grid means a cycle, which the visited sets rule out
    auto it = cameFrom.find(end);
    int guard = grid.getCellCount();
    while (it != cameFrom.end() && it->second != start) {
        GridCell current = it->second;
        if (--guard < 0) {
            throw std::logic_error("predecessor map contains a cycle");
        }
        grid.setState(current, CellState::Path);
        path.push_back(current);
        it = cameFrom.find(current);
    }

    if (it == cameFrom.end()) {
        throw std::logic_error("predecessor chain does not reach the start cell");
    }
    return path;
}

void Pathfinder::finishFound(SearchResult& result, Grid& grid, const PredecessorMap& cameFrom,
                             const GridCell& start, const GridCell& end, SearchObserver& observer) const {
    result.outcome = SearchOutcome::Found;
    result.path = reconstructPath(grid, cameFrom, start, end);
    observer.onSuccess(result.path);
}


// Breadth first search
SearchResult Pathfinder::findPathBFS(Grid& grid, const std::optional<GridCell>& startCell,
                                     const std::optional<GridCell>& endCell, SearchObserver& observer,
                                     const CancellationToken* cancel) const {
    auto startTime = std::chrono::high_resolution_clock::now();
    SearchResult result;

    if (!isValidInput(grid, startCell, endCell)) {
        result.outcome = SearchOutcome::InvalidInput;
        return result;
    }
    const GridCell start = *startCell;
    const GridCell end = *endCell;
    grid.recomputeAdjacency();

    // fifo frontier, a cell is marked visited the moment it is discovered
    std::queue<GridCell> frontier;
    std::unordered_set<GridCell, GridCellHash> visited;
    PredecessorMap cameFrom;

    frontier.push(start);
    visited.insert(start);

    while (!frontier.empty()) {
        if (isCancelled(cancel)) {
            result.outcome = SearchOutcome::Cancelled;
            break;
        }

        GridCell current = frontier.front();
        frontier.pop();
        result.nodesExpanded++;

        if (current == end) {
            finishFound(result, grid, cameFrom, start, end, observer);
            break;
        }

        for (const GridCell& neighbor : grid.neighborsOf(current)) {
            if (visited.count(neighbor)) continue;

            frontier.push(neighbor);
            cameFrom[neighbor] = current;
            visited.insert(neighbor);
            if (neighbor != end) grid.setState(neighbor, CellState::Frontier);
        }

        observer.onStep();
        result.steps++;

        if (current != start) grid.setState(current, CellState::Visited);
    }

    auto endTime = std::chrono::high_resolution_clock::now();
    result.computeTimeMs = std::chrono::duration<double, std::milli>(endTime - startTime).count();

    return result;
}


// Depth first search with an explicit frame stack. it backtracks like the
// recursive version would but depth is only bounded by memory
SearchResult Pathfinder::findPathDFS(Grid& grid, const std::optional<GridCell>& startCell,
                                     const std::optional<GridCell>& endCell, SearchObserver& observer,
                                     const CancellationToken* cancel) const {
    auto startTime = std::chrono::high_resolution_clock::now();
    SearchResult result;

    if (!isValidInput(grid, startCell, endCell)) {
        result.outcome = SearchOutcome::InvalidInput;
        return result;
    }
    const GridCell start = *startCell;
    const GridCell end = *endCell;
    grid.recomputeAdjacency();

    struct Frame {
        GridCell cell;
        size_t nextNeighbor;
    };

    std::vector<Frame> stack;
    stack.reserve(static_cast<size_t>(grid.getCellCount()));
    std::unordered_set<GridCell, GridCellHash> visited;
    PredecessorMap cameFrom;

    if (isCancelled(cancel)) {
        result.outcome = SearchOutcome::Cancelled;
    } else {
        visited.insert(start);
        stack.push_back({start, 0});
        result.nodesExpanded++;
    }

    while (!stack.empty()) {
        // copy out, push_back below may reallocate
        const GridCell current = stack.back().cell;
        const std::vector<GridCell>& neighbors = grid.neighborsOf(current);

        if (stack.back().nextNeighbor >= neighbors.size()) {
            stack.pop_back();   // dead end, backtrack
            continue;
        }
        const GridCell neighbor = neighbors[stack.back().nextNeighbor++];

        if (visited.count(neighbor)) {
            // re-encountered cells get the closed tag again, which also
            // closes dead ends that were left as frontier on backtrack
            if (neighbor != start) grid.setState(neighbor, CellState::Visited);
            continue;
        }

        cameFrom[neighbor] = current;
        if (current != start) grid.setState(current, CellState::Visited);

        if (neighbor == end) {
            finishFound(result, grid, cameFrom, start, end, observer);
            break;
        }

        observer.onStep();
        result.steps++;

        // descend
        if (isCancelled(cancel)) {
            result.outcome = SearchOutcome::Cancelled;
            break;
        }
        visited.insert(neighbor);
        grid.setState(neighbor, CellState::Frontier);
        stack.push_back({neighbor, 0});
        result.nodesExpanded++;
    }

    auto endTime = std::chrono::high_resolution_clock::now();
    result.computeTimeMs = std::chrono::duration<double, std::milli>(endTime - startTime).count();

    return result;
}


// A* algorithm
SearchResult Pathfinder::findPathAStar(Grid& grid, const std::optional<GridCell>& startCell,
                                       const std::optional<GridCell>& endCell, SearchObserver& observer,
                                       const CancellationToken* cancel) const {
    auto startTime = std::chrono::high_resolution_clock::now();
    SearchResult result;

    if (!isValidInput(grid, startCell, endCell)) {
        result.outcome = SearchOutcome::InvalidInput;
        return result;
    }
    const GridCell start = *startCell;
    const GridCell end = *endCell;
    grid.recomputeAdjacency();

    const int INF = std::numeric_limits<int>::max();

    // (f score, insertion order, cell). the insertion order makes equal f
    // scores pop oldest first so expansion order is reproducible
    using PQElement = std::tuple<int, long, GridCell>;
    std::priority_queue<PQElement, std::vector<PQElement>, std::greater<PQElement>> frontier;
    std::unordered_map<GridCell, int, GridCellHash> gScore;   // missing = infinity
    std::unordered_map<GridCell, int, GridCellHash> fScore;
    std::unordered_set<GridCell, GridCellHash> openSet;
    PredecessorMap cameFrom;

    auto scoreOf = [INF](const std::unordered_map<GridCell, int, GridCellHash>& scores, const GridCell& cell) {
        auto it = scores.find(cell);
        return it == scores.end() ? INF : it->second;
    };

    long insertionOrder = 0;
    gScore[start] = 0;
    fScore[start] = heuristic(start, end);
    frontier.push({fScore[start], insertionOrder, start});
    openSet.insert(start);

    // main A* loop: pop lowest f score cell expand neighbors
    while (!frontier.empty()) {
        if (isCancelled(cancel)) {
            result.outcome = SearchOutcome::Cancelled;
            break;
        }

        GridCell current = std::get<2>(frontier.top());
        frontier.pop();
        openSet.erase(current);
        result.nodesExpanded++;

        if (current == end) {
            finishFound(result, grid, cameFrom, start, end, observer);
            break;
        }

        for (const GridCell& neighbor : grid.neighborsOf(current)) {
            int tentative = scoreOf(gScore, current) + 1;   // every move costs 1

            if (tentative < scoreOf(gScore, neighbor)) {
                gScore[neighbor] = tentative;
                fScore[neighbor] = tentative + heuristic(neighbor, end);   // f = g + h
                cameFrom[neighbor] = current;

                if (!openSet.count(neighbor)) {
                    frontier.push({fScore[neighbor], ++insertionOrder, neighbor});
                    openSet.insert(neighbor);
                    if (neighbor != end) grid.setState(neighbor, CellState::Frontier);
                }
            }
        }

        observer.onStep();
        result.steps++;

        if (current != start) grid.setState(current, CellState::Visited);
    }

    auto endTime = std::chrono::high_resolution_clock::now();
    result.computeTimeMs = std::chrono::duration<double, std::milli>(endTime - startTime).count();

    return result;
}


// generic dispatcher
SearchResult Pathfinder::findPath(VisualizerSettings::Algos algo, Grid& grid,
                                  const std::optional<GridCell>& start, const std::optional<GridCell>& end,
                                  SearchObserver& observer, const CancellationToken* cancel) const {
    switch (algo) {
        case VisualizerSettings::Algos::BFS:
            return findPathBFS(grid, start, end, observer, cancel);
        case VisualizerSettings::Algos::DFS:
            return findPathDFS(grid, start, end, observer, cancel);
        case VisualizerSettings::Algos::AStar:
        default:
            return findPathAStar(grid, start, end, observer, cancel);
    }
}

SearchResult Pathfinder::findPath(VisualizerSettings::Algos algo, Grid& grid, SearchObserver& observer,
                                  const CancellationToken* cancel) const {
    return findPath(algo, grid, grid.startCell(), grid.endCell(), observer, cancel);
}
