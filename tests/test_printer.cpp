// Google Test for MazePrinter
#include <gtest/gtest.h>
#include <string>

#include "core/MazePrinter.hpp"
#include "core/MazeSolver.hpp"
#include "maze_test_util.hpp"

TEST(MazePrinter, FreshGridIsClosedBoxes) {
    Grid g(2, 1);
    EXPECT_EQ(MazePrinter::ToAscii(g),
              "+---+---+\n"
              "|   |   |\n"
              "+---+---+\n");
}

TEST(MazePrinter, RightFirstTwoByTwo) {
    ScriptedChooser script(RightFirstScript());
    MazeGenerator gen(2, 2, script.chooser());
    gen.run();

    EXPECT_EQ(MazePrinter::ToAscii(gen.grid()),
              "+---+---+\n"
              "|     E  \n"
              "+---+   +\n"
              "  S     |\n"
              "+---+---+\n");

    MazeSolver solver(gen);
    solver.run();
    EXPECT_EQ(MazePrinter::ToAscii(gen.grid()),
              "+---+---+\n"
              "|     E  \n"
              "+---+   +\n"
              "  S   * |\n"
              "+---+---+\n");
}

TEST(MazePrinter, ShapeFollowsDimensions) {
    MazeGenerator gen(7, 4, SeededChooser(9));
    gen.run();
    const std::string text = MazePrinter::ToAscii(gen.grid());

    // two text rows per maze row plus the bottom frame
    size_t lines = 0;
    size_t pos = 0;
    while ((pos = text.find('\n', pos)) != std::string::npos) { ++lines; ++pos; }
    EXPECT_EQ(lines, 2u * 4u + 1u);
    EXPECT_EQ(text.find('\n'), 7u * 4u + 1u);
}
