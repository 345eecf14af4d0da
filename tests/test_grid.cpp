// Google Test for Grid (cells, start/end designation, adjacency)
#include <gtest/gtest.h>
#include <algorithm>
#include <vector>

#include "Grid.h"

TEST(GridTest, InitializeAllocatesFreeCells) {
    Grid grid(3, 4);

    EXPECT_EQ(grid.getRows(), 3);
    EXPECT_EQ(grid.getCols(), 4);
    EXPECT_EQ(grid.getCellCount(), 12);
    EXPECT_EQ(grid.countState(CellState::Free), 12);
    EXPECT_FALSE(grid.startCell().has_value());
    EXPECT_FALSE(grid.endCell().has_value());

    EXPECT_TRUE(grid.contains({2, 3}));
    EXPECT_FALSE(grid.contains({3, 0}));
    EXPECT_FALSE(grid.contains({0, -1}));
}

TEST(GridTest, NonPositiveDimensionsGiveEmptyGrid) {
    Grid grid(0, 5);
    EXPECT_EQ(grid.getCellCount(), 0);
    EXPECT_FALSE(grid.contains({0, 0}));
    EXPECT_TRUE(grid.neighborsOf({0, 0}).empty());
}

TEST(GridTest, CellIdentityIgnoresState) {
    Grid grid(2, 2);
    GridCell a{1, 0};
    GridCell b{1, 0};
    grid.markObstacle(a);

    EXPECT_EQ(a, b);
    EXPECT_EQ(GridCellHash()(a), GridCellHash()(b));
    EXPECT_NE(a, (GridCell{0, 1}));
}

TEST(GridTest, NeighborOrderIsDownUpRightLeft) {
    Grid grid(3, 3);
    std::vector<GridCell> expected = {{2, 1}, {0, 1}, {1, 2}, {1, 0}};
    EXPECT_EQ(grid.neighborsOf({1, 1}), expected);

    std::vector<GridCell> corner = {{1, 0}, {0, 1}};
    EXPECT_EQ(grid.neighborsOf({0, 0}), corner);

    std::vector<GridCell> farCorner = {{1, 2}, {2, 1}};
    EXPECT_EQ(grid.neighborsOf({2, 2}), farCorner);
}

TEST(GridTest, ObstaclesLeaveTheAdjacency) {
    Grid grid(3, 3);
    grid.recomputeAdjacency();
    EXPECT_FALSE(grid.isAdjacencyStale());

    ASSERT_TRUE(grid.markObstacle({1, 1}));
    EXPECT_TRUE(grid.isAdjacencyStale());

    // obstacle has no outgoing neighbors and is nobody's neighbor
    EXPECT_TRUE(grid.neighborsOf({1, 1}).empty());
    std::vector<GridCell> above = {{0, 2}, {0, 0}};
    EXPECT_EQ(grid.neighborsOf({0, 1}), above);

    // symmetric among the remaining cells
    for (int r = 0; r < 3; r++) {
        for (int c = 0; c < 3; c++) {
            for (const GridCell& n : grid.neighborsOf({r, c})) {
                const auto& back = grid.neighborsOf(n);
                EXPECT_NE(std::find(back.begin(), back.end(), GridCell{r, c}), back.end());
            }
        }
    }
}

TEST(GridTest, RecomputeAdjacencyIsIdempotent) {
    Grid grid(4, 5);
    grid.markObstacle({1, 2});
    grid.markObstacle({2, 2});
    grid.markObstacle({3, 0});

    grid.recomputeAdjacency();
    std::vector<std::vector<GridCell>> first;
    for (int r = 0; r < 4; r++)
        for (int c = 0; c < 5; c++)
            first.push_back(grid.neighborsOf({r, c}));

    grid.recomputeAdjacency();
    std::vector<std::vector<GridCell>> second;
    for (int r = 0; r < 4; r++)
        for (int c = 0; c < 5; c++)
            second.push_back(grid.neighborsOf({r, c}));

    EXPECT_EQ(first, second);
}

TEST(GridTest, SingleStartAndEnd) {
    Grid grid(3, 3);
    ASSERT_TRUE(grid.markStart({0, 0}));
    ASSERT_TRUE(grid.markStart({1, 1}));

    EXPECT_EQ(grid.countState(CellState::Start), 1);
    EXPECT_EQ(grid.stateAt({0, 0}), CellState::Free);
    ASSERT_TRUE(grid.startCell().has_value());
    EXPECT_EQ(*grid.startCell(), (GridCell{1, 1}));

    ASSERT_TRUE(grid.markEnd({2, 2}));
    ASSERT_TRUE(grid.markEnd({2, 0}));
    EXPECT_EQ(grid.countState(CellState::End), 1);
    EXPECT_EQ(*grid.endCell(), (GridCell{2, 0}));

    // moving the start onto the end takes the end designation away
    ASSERT_TRUE(grid.markStart({2, 0}));
    EXPECT_FALSE(grid.endCell().has_value());
    EXPECT_EQ(grid.countState(CellState::End), 0);
    EXPECT_EQ(grid.countState(CellState::Start), 1);
}

TEST(GridTest, ObstacleCannotCoverStartOrEnd) {
    Grid grid(2, 2);
    grid.markStart({0, 0});
    grid.markEnd({1, 1});

    EXPECT_FALSE(grid.markObstacle({0, 0}));
    EXPECT_FALSE(grid.markObstacle({1, 1}));
    EXPECT_TRUE(grid.isStart({0, 0}));
    EXPECT_TRUE(grid.isEnd({1, 1}));

    EXPECT_TRUE(grid.markObstacle({0, 1}));
    EXPECT_TRUE(grid.isObstacle({0, 1}));
}

TEST(GridTest, ResetClearsDesignation) {
    Grid grid(2, 2);
    grid.markStart({0, 0});
    grid.markEnd({1, 1});

    ASSERT_TRUE(grid.reset({0, 0}));
    EXPECT_FALSE(grid.startCell().has_value());
    EXPECT_EQ(grid.stateAt({0, 0}), CellState::Free);
    EXPECT_TRUE(grid.endCell().has_value());
}

TEST(GridTest, ClearAndClearSearchState) {
    Grid grid(3, 3);
    grid.markStart({0, 0});
    grid.markEnd({2, 2});
    grid.markObstacle({1, 1});
    grid.setState({0, 1}, CellState::Frontier);
    grid.setState({1, 0}, CellState::Visited);
    grid.setState({2, 1}, CellState::Path);

    grid.clearSearchState();
    EXPECT_EQ(grid.countState(CellState::Frontier), 0);
    EXPECT_EQ(grid.countState(CellState::Visited), 0);
    EXPECT_EQ(grid.countState(CellState::Path), 0);
    EXPECT_TRUE(grid.isStart({0, 0}));
    EXPECT_TRUE(grid.isEnd({2, 2}));
    EXPECT_TRUE(grid.isObstacle({1, 1}));

    grid.clear();
    EXPECT_EQ(grid.countState(CellState::Free), 9);
    EXPECT_FALSE(grid.startCell().has_value());
    EXPECT_FALSE(grid.endCell().has_value());
    EXPECT_TRUE(grid.isAdjacencyStale());
}

TEST(GridTest, OutOfBoundsIsRejected) {
    Grid grid(2, 2);
    EXPECT_FALSE(grid.markStart({2, 0}));
    EXPECT_FALSE(grid.markEnd({0, 5}));
    EXPECT_FALSE(grid.markObstacle({-1, 0}));
    EXPECT_FALSE(grid.reset({9, 9}));
    EXPECT_EQ(grid.stateAt({5, 5}), CellState::Obstacle);
    EXPECT_TRUE(grid.neighborsOf({5, 5}).empty());
    EXPECT_EQ(grid.countState(CellState::Free), 4);
}

TEST(GridTest, StateNames) {
    EXPECT_STREQ(cellStateName(CellState::Frontier), "Frontier");
    EXPECT_STREQ(cellStateName(CellState::Path), "Path");
}
