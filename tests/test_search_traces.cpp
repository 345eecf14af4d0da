// Google Test for exact exploration order, tagging and determinism
#include <gtest/gtest.h>
#include <vector>

#include "Grid.h"
#include "Pathfinder.h"
#include "SearchObserver.h"

namespace {

std::vector<CellState> snapshot(const Grid& grid) {
    std::vector<CellState> states;
    for (int r = 0; r < grid.getRows(); r++)
        for (int c = 0; c < grid.getCols(); c++)
            states.push_back(grid.stateAt({r, c}));
    return states;
}

Grid makeMaze() {
    Grid grid(8, 8);
    grid.markStart({0, 0});
    grid.markEnd({7, 6});
    const GridCell walls[] = {{1, 1}, {1, 2}, {1, 3}, {1, 4}, {3, 0}, {3, 1}, {3, 2},
                              {3, 4}, {3, 5}, {3, 6}, {5, 2}, {5, 3}, {6, 5}, {5, 7}};
    for (const GridCell& wall : walls) grid.markObstacle(wall);
    return grid;
}

} // namespace

TEST(SearchTraceTest, BFSSingleRow) {
    Grid grid(1, 3);
    grid.markStart({0, 0});
    grid.markEnd({0, 2});
    Pathfinder pathfinder;

    std::vector<std::vector<CellState>> rounds;
    CallbackObserver observer([&]() { rounds.push_back(snapshot(grid)); });
    SearchResult result = pathfinder.findPathBFS(grid, grid.startCell(), grid.endCell(), observer);

    ASSERT_TRUE(result.found());
    EXPECT_EQ(result.steps, 2);
    EXPECT_EQ(result.nodesExpanded, 3);
    std::vector<GridCell> expected = {{0, 2}, {0, 1}};
    EXPECT_EQ(result.path, expected);

    // round one: the only neighbor joins the frontier, start keeps its tag
    ASSERT_EQ(rounds.size(), 2u);
    std::vector<CellState> first = {CellState::Start, CellState::Frontier, CellState::End};
    EXPECT_EQ(rounds[0], first);

    EXPECT_EQ(grid.stateAt({0, 1}), CellState::Path);
}

TEST(SearchTraceTest, BFSNeighborOrderDecidesPredecessor) {
    Grid grid(3, 3);
    grid.markStart({1, 1});
    grid.markEnd({0, 0});
    Pathfinder pathfinder;

    std::vector<int> frontierSizes;
    CallbackObserver observer([&]() { frontierSizes.push_back(grid.countState(CellState::Frontier)); });
    SearchResult result = pathfinder.findPathBFS(grid, grid.startCell(), grid.endCell(), observer);

    ASSERT_TRUE(result.found());
    // (0,1) comes off the queue before (1,0), so it is the end's predecessor
    std::vector<GridCell> expected = {{0, 0}, {0, 1}};
    EXPECT_EQ(result.path, expected);
    EXPECT_EQ(result.steps, 8);
    EXPECT_EQ(result.nodesExpanded, 9);
    ASSERT_FALSE(frontierSizes.empty());
    EXPECT_EQ(frontierSizes.front(), 4);
}

TEST(SearchTraceTest, DFSStopsWhenEndIsDiscovered) {
    Grid grid(2, 2);
    grid.markStart({0, 0});
    grid.markEnd({1, 1});
    Pathfinder pathfinder;
    NullObserver observer;

    SearchResult result = pathfinder.findPathDFS(grid, grid.startCell(), grid.endCell(), observer);

    ASSERT_TRUE(result.found());
    EXPECT_EQ(result.steps, 1);
    EXPECT_EQ(result.nodesExpanded, 2);
    std::vector<GridCell> expected = {{1, 1}, {1, 0}};
    EXPECT_EQ(result.path, expected);
    EXPECT_EQ(grid.stateAt({1, 0}), CellState::Path);
    EXPECT_EQ(grid.stateAt({0, 1}), CellState::Free);
}

TEST(SearchTraceTest, DFSBacktracksOutOfDeadEnd) {
    // start (0,1) goes down first, walks around to the dead end (0,2),
    // backs up and reaches the end through (1,0)
    Grid grid(2, 3);
    grid.markStart({0, 1});
    grid.markEnd({0, 0});
    Pathfinder pathfinder;
    NullObserver observer;

    SearchResult result = pathfinder.findPathDFS(grid, grid.startCell(), grid.endCell(), observer);

    ASSERT_TRUE(result.found());
    std::vector<GridCell> expected = {{0, 0}, {1, 0}, {1, 1}};
    EXPECT_EQ(result.path, expected);
    EXPECT_EQ(result.steps, 4);
    EXPECT_EQ(result.nodesExpanded, 5);

    EXPECT_EQ(grid.stateAt({1, 2}), CellState::Visited);
    EXPECT_EQ(grid.stateAt({0, 2}), CellState::Frontier);   // dead end never seen again
    EXPECT_EQ(grid.stateAt({1, 0}), CellState::Path);
    EXPECT_EQ(grid.stateAt({1, 1}), CellState::Path);
}

TEST(SearchTraceTest, DFSRetagsDeadEndWhenReencountered) {
    // 2x2 open block cut off from the end by a wall in column 2
    Grid grid(2, 4);
    grid.markStart({0, 0});
    grid.markEnd({0, 3});
    grid.markObstacle({0, 2});
    grid.markObstacle({1, 2});
    Pathfinder pathfinder;

    std::vector<CellState> deadEndTags;
    CallbackObserver observer([&]() { deadEndTags.push_back(grid.stateAt({0, 1})); });
    SearchResult result = pathfinder.findPathDFS(grid, grid.startCell(), grid.endCell(), observer);

    EXPECT_EQ(result.outcome, SearchOutcome::NotFound);
    EXPECT_EQ(result.steps, 3);

    // (0,1) is reached last through (1,1) and left as frontier, the start's
    // second neighbor closes it on the way out
    ASSERT_EQ(deadEndTags.size(), 3u);
    EXPECT_EQ(deadEndTags[2], CellState::Free);
    EXPECT_EQ(grid.stateAt({0, 1}), CellState::Visited);
    EXPECT_EQ(grid.countState(CellState::Frontier), 0);
    EXPECT_EQ(grid.countState(CellState::Visited), 3);
    EXPECT_TRUE(grid.isEnd({0, 3}));
}

TEST(SearchTraceTest, DFSHandlesDeepGrids) {
    // the snake through a 200x200 open grid is far deeper than a call stack would like
    Grid grid(200, 200);
    grid.markStart({0, 0});
    grid.markEnd({199, 199});
    Pathfinder pathfinder;
    NullObserver observer;

    SearchResult result = pathfinder.findPathDFS(grid, grid.startCell(), grid.endCell(), observer);

    ASSERT_TRUE(result.found());
    // columns 0..198 walked in full, then the end
    EXPECT_EQ(result.path.size(), 39800u);
    EXPECT_EQ(result.path.front(), (GridCell{199, 199}));
    EXPECT_EQ(result.path.back(), (GridCell{1, 0}));
}

TEST(SearchTraceTest, AStarSingleRow) {
    Grid grid(1, 3);
    grid.markStart({0, 0});
    grid.markEnd({0, 2});
    Pathfinder pathfinder;
    NullObserver observer;

    SearchResult result = pathfinder.findPathAStar(grid, grid.startCell(), grid.endCell(), observer);

    ASSERT_TRUE(result.found());
    EXPECT_EQ(result.steps, 2);
    std::vector<GridCell> expected = {{0, 2}, {0, 1}};
    EXPECT_EQ(result.path, expected);
}

TEST(SearchTraceTest, AStarBreaksTiesOldestFirst) {
    // every cell on a monotone route has f = 4, so insertion order decides
    Grid grid(3, 3);
    grid.markStart({0, 0});
    grid.markEnd({2, 2});
    Pathfinder pathfinder;
    NullObserver observer;

    SearchResult result = pathfinder.findPathAStar(grid, grid.startCell(), grid.endCell(), observer);

    ASSERT_TRUE(result.found());
    std::vector<GridCell> expected = {{2, 2}, {2, 1}, {2, 0}, {1, 0}};
    EXPECT_EQ(result.path, expected);
    EXPECT_EQ(result.steps, 8);
    EXPECT_EQ(result.nodesExpanded, 9);
}

TEST(SearchTraceTest, AStarIsDeterministic) {
    Pathfinder pathfinder;

    Grid first = makeMaze();
    std::vector<std::vector<CellState>> firstRounds;
    CallbackObserver firstObserver([&]() { firstRounds.push_back(snapshot(first)); });
    SearchResult a = pathfinder.findPathAStar(first, first.startCell(), first.endCell(), firstObserver);

    Grid second = makeMaze();
    std::vector<std::vector<CellState>> secondRounds;
    CallbackObserver secondObserver([&]() { secondRounds.push_back(snapshot(second)); });
    SearchResult b = pathfinder.findPathAStar(second, second.startCell(), second.endCell(), secondObserver);

    ASSERT_TRUE(a.found());
    ASSERT_TRUE(b.found());
    EXPECT_EQ(a.path, b.path);
    EXPECT_EQ(a.nodesExpanded, b.nodesExpanded);
    EXPECT_EQ(firstRounds, secondRounds);
    EXPECT_EQ(snapshot(first), snapshot(second));
}

TEST(SearchTraceTest, RerunAfterClearSearchStateRepeatsTrace) {
    Grid grid = makeMaze();
    Pathfinder pathfinder;
    NullObserver observer;

    SearchResult a = pathfinder.findPathBFS(grid, grid.startCell(), grid.endCell(), observer);
    std::vector<CellState> afterFirst = snapshot(grid);

    grid.clearSearchState();
    SearchResult b = pathfinder.findPathBFS(grid, grid.startCell(), grid.endCell(), observer);

    EXPECT_EQ(a.outcome, b.outcome);
    EXPECT_EQ(a.path, b.path);
    EXPECT_EQ(a.steps, b.steps);
    EXPECT_EQ(afterFirst, snapshot(grid));
}
