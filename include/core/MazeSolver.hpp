#pragma once
#include "core/Common.hpp"
#include "core/Grid.hpp"
#include "core/MazeGenerator.hpp"

enum class SolveState
{
    START,
    PAINT,
    END
};

// Breadth-first search from the exit back to the entrance, so following the
// parent links from the entrance reads the path in walking order.
class MazeSolver
{
public:
    using StepCallback = std::function<void(const MazeSolver&)>;

    // throws MazeError(SolveBeforeFinalized) unless generator.finished()
    explicit MazeSolver(MazeGenerator& generator);
    MazeSolver(Grid& grid, uint32_t start, uint32_t end);

    // BFS + reconstruction only, no painting.
    // throws MazeError(DisconnectedGraph) if start is unreachable from end
    const std::vector<uint32_t>& findPath();

    // first call searches, every later call paints one solution cell
    void update();
    void run(const StepCallback& onStep = {});

    SolveState state() const { return state_; }
    bool finished() const { return state_ == SolveState::END; }

    const std::vector<uint32_t>& path() const { return path_; }
    std::vector<Point> pathPoints() const;

    size_t painted() const { return painted_; }
    uint32_t visitedCount() const { return visitedCount_; }

    uint32_t start() const { return start_; }
    uint32_t end() const { return end_; }

private:
    bool paintable_(uint32_t index) const { return index != start_ && index != end_; }

    Grid& grid_;
    uint32_t start_;
    uint32_t end_;

    SolveState state_{ SolveState::START };
    std::vector<uint32_t> path_;
    size_t cursor_{ 0 };
    size_t painted_{ 0 };
    uint32_t visitedCount_{ 0 };
};
