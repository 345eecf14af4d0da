#pragma once
#include <vector>
#include <optional>
#include <functional>
#include <cstddef>

// grid cell coordinates (identity only, the state tag lives in the Grid)
struct GridCell {
    int row, col;

    bool operator==(const GridCell& other) const {
        return row == other.row && col == other.col;
    }

    bool operator!=(const GridCell& other) const {
        return !(*this == other);
    }

    // required for priority queue with std::greater on tuples holding a GridCell
    bool operator<(const GridCell& other) const {
        if (row != other.row) return row < other.row;
        return col < other.col;
    }

    bool operator>(const GridCell& other) const {
        return other < *this;
    }
};

// hash function for GridCell (for use in unordered_map/set)
struct GridCellHash {
    size_t operator()(const GridCell& cell) const {
        return std::hash<int>()(cell.row) ^ (std::hash<int>()(cell.col) << 16);
    }
};

// traversal state tag, exactly one per cell
enum class CellState {
    Free,
    Obstacle,
    Start,
    End,
    Frontier,   // discovered, not yet expanded
    Visited,    // expanded
    Path
};

const char* cellStateName(CellState state);

class Grid {
public:
    Grid() = default;
    Grid(int rows, int cols);

    // (re)allocates rows x cols free cells and drops start/end
    void initialize(int rows, int cols);

    int getRows() const { return rows_; }
    int getCols() const { return cols_; }
    int getCellCount() const { return rows_ * cols_; }
    bool contains(const GridCell& cell) const;

    // state queries
    CellState stateAt(const GridCell& cell) const;
    bool isObstacle(const GridCell& cell) const { return stateAt(cell) == CellState::Obstacle; }
    bool isStart(const GridCell& cell) const { return stateAt(cell) == CellState::Start; }
    bool isEnd(const GridCell& cell) const { return stateAt(cell) == CellState::End; }
    int countState(CellState state) const;

    std::optional<GridCell> startCell() const { return start_; }
    std::optional<GridCell> endCell() const { return end_; }

    // user actions (outside a run)
    // marking a new start/end resets the previous one to Free
    bool markStart(const GridCell& cell);
    bool markEnd(const GridCell& cell);
    bool markObstacle(const GridCell& cell);
    bool reset(const GridCell& cell);
    void clear();
    void clearSearchState();   // Frontier/Visited/Path back to Free

    // used by the search engine while a run is in progress
    void setState(const GridCell& cell, CellState state);

    // adjacency: in bounds, non obstacle, ordered down, up, right, left
    void recomputeAdjacency();
    bool isAdjacencyStale() const { return adjacencyStale_; }
    const std::vector<GridCell>& neighborsOf(const GridCell& cell);
    std::vector<GridCell> computeNeighbors(const GridCell& cell) const;

private:
    int rows_ = 0;
    int cols_ = 0;

    std::vector<CellState> states_;
    std::vector<std::vector<GridCell>> adjacency_;
    bool adjacencyStale_ = true;

    std::optional<GridCell> start_;
    std::optional<GridCell> end_;

    // helper to get the flat index from grid coordinates
    int getIndex(int row, int col) const { return row * cols_ + col; }
    int getIndex(const GridCell& cell) const { return cell.row * cols_ + cell.col; }

    // single write path keeping start_/end_ and the obstacle dirty flag in sync
    void assign(const GridCell& cell, CellState state);
};
