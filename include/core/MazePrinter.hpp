#pragma once
#include "core/Common.hpp"
#include "core/Grid.hpp"

class MazePrinter
{
public:
    // Text picture of the grid, highest row first.
    //   S start, E end, * solution, . current, blank otherwise
    static std::string ToAscii(const Grid& grid);
};
