#pragma once
#include "core/Common.hpp"

struct Point
{
    int32_t x;
    int32_t y;

    bool operator==(const Point& other) const
    {
        return x == other.x && y == other.y;
    }

    bool operator!=(const Point& other) const
    {
        return !(*this == other);
    }
};

// wall index order of every cell: 0 = right, 1 = left, 2 = top, 3 = bottom
enum class Direction : uint8_t
{
    Right = 0,
    Left = 1,
    Top = 2,
    Bottom = 3
};

constexpr std::array<Direction, 4> kDirections = {
    Direction::Right, Direction::Left, Direction::Top, Direction::Bottom
};

inline Direction Opposite(Direction d)
{
    switch (d)
    {
    case Direction::Right:  return Direction::Left;
    case Direction::Left:   return Direction::Right;
    case Direction::Top:    return Direction::Bottom;
    case Direction::Bottom: return Direction::Top;
    }
    return d;
}

inline const char* ToString(Direction d)
{
    switch (d)
    {
    case Direction::Right:  return "Right";
    case Direction::Left:   return "Left";
    case Direction::Top:    return "Top";
    case Direction::Bottom: return "Bottom";
    }
    return "?";
}

// drives presentation only (floor color of a cell)
enum class CellState : uint8_t
{
    Untouched,
    Current,
    Completed,
    StartOfMaze,
    EndOfMaze,
    Solution
};

inline const char* ToString(CellState s)
{
    switch (s)
    {
    case CellState::Untouched:   return "Untouched";
    case CellState::Current:     return "Current";
    case CellState::Completed:   return "Completed";
    case CellState::StartOfMaze: return "StartOfMaze";
    case CellState::EndOfMaze:   return "EndOfMaze";
    case CellState::Solution:    return "Solution";
    }
    return "?";
}

struct Cell
{
    std::array<bool, 4> walls{ true, true, true, true };
    CellState state{ CellState::Untouched };

    // BFS back-link, only meaningful between two solves
    std::optional<uint32_t> parent{};

    bool hasWall(Direction d) const { return walls[static_cast<size_t>(d)]; }
};

// Core -> presentation event stream. Either sink may be left empty.
struct MazeListener
{
    std::function<void(Point, CellState)> onCellState;
    std::function<void(Point, Direction)> onWallRemoved;
};

enum class MazeErrorKind
{
    InvalidDimension,
    DisconnectedGraph,
    SolveBeforeFinalized
};

inline const char* ToString(MazeErrorKind k)
{
    switch (k)
    {
    case MazeErrorKind::InvalidDimension:     return "InvalidDimension";
    case MazeErrorKind::DisconnectedGraph:    return "DisconnectedGraph";
    case MazeErrorKind::SolveBeforeFinalized: return "SolveBeforeFinalized";
    }
    return "?";
}

class MazeError : public std::runtime_error
{
public:
    MazeError(MazeErrorKind kind, const std::string& what)
        : std::runtime_error(std::string(ToString(kind)) + ": " + what), kind_(kind)
    {
    }

    MazeErrorKind kind() const noexcept { return kind_; }

private:
    MazeErrorKind kind_;
};
