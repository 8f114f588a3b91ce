// Google Test for MazeSolver
#include <gtest/gtest.h>
#include <set>
#include <vector>

#include "core/MazeSolver.hpp"
#include "maze_test_util.hpp"

static std::vector<Point> Pts(std::initializer_list<Point> pts) { return pts; }

TEST(MazeSolver, RightFirstTwoByTwoPath) {
    ScriptedChooser script(RightFirstScript());
    MazeGenerator gen(2, 2, script.chooser());
    gen.run();

    MazeSolver solver(gen);
    solver.findPath();
    EXPECT_EQ(solver.pathPoints(), Pts({ {0, 0}, {1, 0}, {1, 1} }));
}

TEST(MazeSolver, UpFirstTwoByTwoPath) {
    ScriptedChooser script(UpFirstScript());
    MazeGenerator gen(2, 2, script.chooser());
    gen.run();

    MazeSolver solver(gen);
    solver.findPath();
    EXPECT_EQ(solver.pathPoints(), Pts({ {0, 0}, {0, 1}, {1, 1} }));
}

TEST(MazeSolver, PathWalksOpenPassagesFromStartToEnd) {
    MazeGenerator gen(30, 30, SeededChooser(77));
    gen.run();

    MazeSolver solver(gen);
    const auto& path = solver.findPath();
    const Grid& g = gen.grid();

    ASSERT_GE(path.size(), 2u);
    EXPECT_EQ(path.front(), gen.startIndex());
    EXPECT_EQ(path.back(), gen.endIndex());

    for (size_t i = 1; i < path.size(); ++i)
        EXPECT_TRUE(g.hasPassage(path[i - 1], path[i])) << "step " << i;

    // simple path and as short as an independent BFS says
    EXPECT_EQ(std::set<uint32_t>(path.begin(), path.end()).size(), path.size());
    EXPECT_EQ((int)path.size() - 1, Distance(g, gen.startIndex(), gen.endIndex()));
}

TEST(MazeSolver, PaintsEverythingButTheCorners) {
    MazeGenerator gen(8, 8, SeededChooser(4));
    gen.run();

    MazeSolver solver(gen);
    solver.run();
    ASSERT_TRUE(solver.finished());

    const Grid& g = gen.grid();
    const auto& path = solver.path();
    const std::set<uint32_t> onPath(path.begin(), path.end());

    EXPECT_EQ(g.state(gen.startIndex()), CellState::StartOfMaze);
    EXPECT_EQ(g.state(gen.endIndex()), CellState::EndOfMaze);
    EXPECT_EQ(solver.painted(), path.size() - 2);

    for (uint32_t i = 0; i < g.cellCount(); ++i) {
        if (i == gen.startIndex() || i == gen.endIndex()) continue;
        if (onPath.count(i))
            EXPECT_EQ(g.state(i), CellState::Solution) << "cell " << i;
        else
            EXPECT_EQ(g.state(i), CellState::Completed) << "cell " << i;
    }
}

TEST(MazeSolver, ResolvingGivesTheSamePath) {
    MazeGenerator gen(15, 11, SeededChooser(19));
    gen.run();

    MazeSolver first(gen);
    first.run();
    const std::vector<uint32_t> once = first.path();

    // painted cells must not change the result
    MazeSolver second(gen);
    second.run();
    EXPECT_EQ(second.path(), once);

    EXPECT_EQ(second.findPath(), once);
}

TEST(MazeSolver, UpdateSearchesFirstThenPaintsOneCellAtATime) {
    MazeGenerator gen(6, 6, SeededChooser(2));
    gen.run();

    std::vector<Point> painted;
    MazeListener l;
    l.onCellState = [&](Point p, CellState s) {
        if (s == CellState::Solution) painted.push_back(p);
    };
    gen.grid().setListener(l);

    MazeSolver solver(gen);
    EXPECT_EQ(solver.state(), SolveState::START);

    solver.update();
    EXPECT_TRUE(painted.empty());
    const size_t len = solver.path().size();
    ASSERT_GT(len, 2u);

    size_t updates = 1;
    while (!solver.finished()) {
        solver.update();
        ++updates;
        EXPECT_EQ(painted.size(), updates - 1);
    }
    EXPECT_EQ(updates, 1 + (len - 2));

    // painted in walking order
    const auto pts = solver.pathPoints();
    EXPECT_EQ(painted, std::vector<Point>(pts.begin() + 1, pts.end() - 1));
}

TEST(MazeSolver, RunCallsBackAfterEveryUpdate) {
    MazeGenerator gen(5, 5, SeededChooser(6));
    gen.run();

    MazeSolver solver(gen);
    size_t calls = 0;
    solver.run([&](const MazeSolver&) { ++calls; });
    EXPECT_EQ(calls, 1 + solver.painted());
}

TEST(MazeSolver, SolveBeforeFinalizedIsRejected) {
    MazeGenerator gen(5, 5, SeededChooser(1));
    try {
        MazeSolver solver(gen);
        FAIL() << "solver accepted an unstarted maze";
    } catch (const MazeError& e) {
        EXPECT_EQ(e.kind(), MazeErrorKind::SolveBeforeFinalized);
    }

    for (int i = 0; i < 10; ++i) gen.step();
    ASSERT_EQ(gen.state(), GenerationState::InProgress);
    try {
        MazeSolver solver(gen);
        FAIL() << "solver accepted a maze in progress";
    } catch (const MazeError& e) {
        EXPECT_EQ(e.kind(), MazeErrorKind::SolveBeforeFinalized);
    }
}

TEST(MazeSolver, CorruptedGridRaisesDisconnectedGraph) {
    ScriptedChooser script(RightFirstScript());
    MazeGenerator gen(2, 2, script.chooser());
    gen.run();

    // cut 1-3: {0,1} and {2,3} fall apart
    gen.grid().restoreWallPair(1, 3, Direction::Top);

    MazeSolver solver(gen);
    try {
        solver.findPath();
        FAIL() << "returned a path through a wall";
    } catch (const MazeError& e) {
        EXPECT_EQ(e.kind(), MazeErrorKind::DisconnectedGraph);
    }
    EXPECT_TRUE(solver.path().empty());

    MazeSolver stepwise(gen);
    EXPECT_THROW(stepwise.update(), MazeError);
}

TEST(MazeSolver, UncarvedGridIsDisconnected) {
    Grid g(3, 3);
    MazeSolver solver(g, 0, 8);
    EXPECT_THROW(solver.findPath(), MazeError);
}

TEST(MazeSolver, ArbitraryEndpointsOnAHandBuiltGrid) {
    // 3x1 corridor
    Grid g(3, 1);
    g.removeWallPair(0, 1, Direction::Right);
    g.removeWallPair(1, 2, Direction::Right);

    MazeSolver forward(g, 0, 2);
    EXPECT_EQ(forward.findPath(), (std::vector<uint32_t>{ 0, 1, 2 }));

    // parents of the previous solve are gone
    MazeSolver backward(g, 2, 0);
    EXPECT_EQ(backward.findPath(), (std::vector<uint32_t>{ 2, 1, 0 }));

    EXPECT_THROW(MazeSolver(g, 0, 3), std::out_of_range);
}

TEST(MazeSolver, SearchStopsOnceStartIsReached) {
    // 8 9 10 11 12 13 14 15
    //           |
    // 0-1-2-3-4-5-6-7
    Grid g(8, 2);
    for (uint32_t i = 0; i < 7; ++i) {
        g.removeWallPair(i, i + 1, Direction::Right);
        g.removeWallPair(8 + i, 9 + i, Direction::Right);
    }
    g.removeWallPair(5, 13, Direction::Top);

    // from 1: 2 and 0 are queued, 2 then queues 3, then 0 ends the search
    MazeSolver solver(g, 0, 1);
    EXPECT_EQ(solver.findPath(), (std::vector<uint32_t>{ 0, 1 }));
    EXPECT_EQ(solver.visitedCount(), 4u);
    EXPECT_LT(solver.visitedCount(), g.cellCount());

    // cells past the stop point got no parent
    EXPECT_FALSE(g.parent(4).has_value());
    EXPECT_FALSE(g.parent(13).has_value());
}

TEST(MazeSolver, SingleCellMaze) {
    MazeGenerator gen(1, 1, SeededChooser(0));
    gen.run();

    MazeSolver solver(gen);
    solver.run();
    EXPECT_EQ(solver.pathPoints(), Pts({ {0, 0} }));
    EXPECT_EQ(solver.painted(), 0u);
    EXPECT_EQ(gen.grid().state(0), CellState::EndOfMaze);
}
