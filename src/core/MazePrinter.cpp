#include "core/MazePrinter.hpp"

#include <sstream>

static char stateGlyph(CellState s)
{
    switch (s)
    {
    case CellState::StartOfMaze: return 'S';
    case CellState::EndOfMaze:   return 'E';
    case CellState::Solution:    return '*';
    case CellState::Current:     return '.';
    default:                     return ' ';
    }
}

std::string MazePrinter::ToAscii(const Grid& grid)
{
    const int32_t W = grid.width();
    const int32_t H = grid.height();

    std::ostringstream out;

    auto horizontal = [&](int32_t y, Direction side) {
        for (int32_t x = 0; x < W; ++x)
            out << '+' << (grid.hasWall(grid.indexOf(x, y), side) ? "---" : "   ");
        out << "+\n";
    };

    for (int32_t y = H - 1; y >= 0; --y)
    {
        horizontal(y, Direction::Top);

        for (int32_t x = 0; x < W; ++x)
        {
            const uint32_t i = grid.indexOf(x, y);
            out << (grid.hasWall(i, Direction::Left) ? '|' : ' ')
                << ' ' << stateGlyph(grid.state(i)) << ' ';
        }
        out << (grid.hasWall(grid.indexOf(W - 1, y), Direction::Right) ? '|' : ' ') << '\n';
    }

    horizontal(0, Direction::Bottom);
    return out.str();
}
