#include "Grid.h"
#include <algorithm>

const char* cellStateName(CellState state) {
    switch (state) {
        case CellState::Free:
            return "Free";
        case CellState::Obstacle:
            return "Obstacle";
        case CellState::Start:
            return "Start";
        case CellState::End:
            return "End";
        case CellState::Frontier:
            return "Frontier";
        case CellState::Visited:
            return "Visited";
        case CellState::Path:
            return "Path";
        default:
            return "Unknown";
    }
}

Grid::Grid(int rows, int cols) {
    initialize(rows, cols);
}

void Grid::initialize(int rows, int cols) {
    rows_ = std::max(0, rows);
    cols_ = std::max(0, cols);
    if (rows_ == 0 || cols_ == 0) {
        rows_ = 0;
        cols_ = 0;
    }

    states_.assign(static_cast<size_t>(rows_) * cols_, CellState::Free);
    adjacency_.assign(states_.size(), {});
    adjacencyStale_ = true;
    start_.reset();
    end_.reset();
}

bool Grid::contains(const GridCell& cell) const {
    return cell.row >= 0 && cell.row < rows_ && cell.col >= 0 && cell.col < cols_;
}

CellState Grid::stateAt(const GridCell& cell) const {
    // outside the grid behaves like a wall
    if (!contains(cell)) return CellState::Obstacle;
    return states_[getIndex(cell)];
}

int Grid::countState(CellState state) const {
    return static_cast<int>(std::count(states_.begin(), states_.end(), state));
}

void Grid::assign(const GridCell& cell, CellState state) {
    int index = getIndex(cell);
    CellState previous = states_[index];
    if (previous == state) return;

    if (previous == CellState::Start && start_ && *start_ == cell) start_.reset();
    if (previous == CellState::End && end_ && *end_ == cell) end_.reset();

    // only one start and one end per grid, the old one goes back to free
    if (state == CellState::Start) {
        if (start_) states_[getIndex(*start_)] = CellState::Free;
        start_ = cell;
    } else if (state == CellState::End) {
        if (end_) states_[getIndex(*end_)] = CellState::Free;
        end_ = cell;
    }

    if ((previous == CellState::Obstacle) != (state == CellState::Obstacle)) {
        adjacencyStale_ = true;
    }
    states_[index] = state;
}

bool Grid::markStart(const GridCell& cell) {
    if (!contains(cell)) return false;
    assign(cell, CellState::Start);
    return true;
}

bool Grid::markEnd(const GridCell& cell) {
    if (!contains(cell)) return false;
    assign(cell, CellState::End);
    return true;
}

bool Grid::markObstacle(const GridCell& cell) {
    if (!contains(cell)) return false;
    // start and end can't be painted over, reset them first
    if (isStart(cell) || isEnd(cell)) return false;
    assign(cell, CellState::Obstacle);
    return true;
}

bool Grid::reset(const GridCell& cell) {
    if (!contains(cell)) return false;
    assign(cell, CellState::Free);
    return true;
}

void Grid::clear() {
    std::fill(states_.begin(), states_.end(), CellState::Free);
    start_.reset();
    end_.reset();
    adjacencyStale_ = true;
}

void Grid::clearSearchState() {
    for (auto& state : states_) {
        if (state == CellState::Frontier || state == CellState::Visited || state == CellState::Path) {
            state = CellState::Free;
        }
    }
}

void Grid::setState(const GridCell& cell, CellState state) {
    if (!contains(cell)) return;
    assign(cell, state);
}

std::vector<GridCell> Grid::computeNeighbors(const GridCell& cell) const {
    std::vector<GridCell> neighbors;
    if (!contains(cell) || isObstacle(cell)) return neighbors;
    neighbors.reserve(4);

    // direction offsets: down, up, right, left. this order decides BFS/DFS tie breaking
    const int dr[] = {1, -1, 0, 0};
    const int dc[] = {0, 0, 1, -1};

    for (int i = 0; i < 4; i++) {
        GridCell next{cell.row + dr[i], cell.col + dc[i]};
        if (contains(next) && !isObstacle(next)) {
            neighbors.push_back(next);
        }
    }
    return neighbors;
}

void Grid::recomputeAdjacency() {
    adjacency_.assign(states_.size(), {});
    for (int r = 0; r < rows_; r++) {
        for (int c = 0; c < cols_; c++) {
            adjacency_[getIndex(r, c)] = computeNeighbors({r, c});
        }
    }
    adjacencyStale_ = false;
}

const std::vector<GridCell>& Grid::neighborsOf(const GridCell& cell) {
    static const std::vector<GridCell> none;
    if (!contains(cell)) return none;
    if (adjacencyStale_) recomputeAdjacency();
    return adjacency_[getIndex(cell)];
}
