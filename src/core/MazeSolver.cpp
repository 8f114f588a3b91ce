#include "core/MazeSolver.hpp"

#include <queue>
#include <unordered_set>

static Grid& finalizedGrid(MazeGenerator& generator)
{
    if (!generator.finished())
    {
        throw MazeError(MazeErrorKind::SolveBeforeFinalized,
                        std::string("maze generation is ") + ToString(generator.state()));
    }
    return generator.grid();
}

MazeSolver::MazeSolver(MazeGenerator& generator)
    : grid_(finalizedGrid(generator)), start_(generator.startIndex()), end_(generator.endIndex())
{
}

MazeSolver::MazeSolver(Grid& grid, uint32_t start, uint32_t end)
    : grid_(grid), start_(start), end_(end)
{
    if (start >= grid.cellCount() || end >= grid.cellCount())
        throw std::out_of_range("solve endpoints outside grid");
}

const std::vector<uint32_t>& MazeSolver::findPath()
{
    path_.clear();
    grid_.clearParents();

    std::queue<uint32_t> frontier;
    std::unordered_set<uint32_t> visited;

    frontier.push(end_);
    visited.insert(end_);

    bool reached = false;
    while (!frontier.empty())
    {
        const uint32_t cur = frontier.front();
        frontier.pop();

        if (cur == start_)
        {
            reached = true;
            break;
        }

        for (Direction dir : kDirections)
        {
            const auto next = grid_.neighborIndex(cur, dir);
            if (!next) continue;
            if (!grid_.hasPassage(cur, *next)) continue;
            if (visited.count(*next)) continue;

            visited.insert(*next);
            grid_.setParent(*next, cur);
            frontier.push(*next);
        }
    }

    visitedCount_ = static_cast<uint32_t>(visited.size());

    if (!reached)
    {
        const Point s = grid_.pointOf(start_);
        const Point e = grid_.pointOf(end_);
        throw MazeError(MazeErrorKind::DisconnectedGraph,
                        "no passage from (" + std::to_string(s.x) + "," + std::to_string(s.y) + ") to (" +
                            std::to_string(e.x) + "," + std::to_string(e.y) + ")");
    }

    // walk parents from start; the end cell is the only one without a parent
    uint32_t cur = start_;
    path_.push_back(cur);
    while (auto p = grid_.parent(cur))
    {
        cur = *p;
        path_.push_back(cur);
        if (path_.size() > grid_.cellCount())
            throw std::logic_error("parent links form a cycle");
    }

    return path_;
}

void MazeSolver::update()
{
    if (state_ == SolveState::START)
    {
        findPath();
        cursor_ = 0;
        painted_ = 0;
        state_ = SolveState::PAINT;
    }
    else if (state_ == SolveState::PAINT)
    {
        // corners keep their own tags and cost no step
        while (cursor_ < path_.size() && !paintable_(path_[cursor_]))
            ++cursor_;

        if (cursor_ < path_.size())
        {
            grid_.setState(path_[cursor_++], CellState::Solution);
            ++painted_;
        }
    }
    else
    {
        return;
    }

    if (state_ == SolveState::PAINT)
    {
        while (cursor_ < path_.size() && !paintable_(path_[cursor_]))
            ++cursor_;
        if (cursor_ >= path_.size())
            state_ = SolveState::END;
    }
}

void MazeSolver::run(const StepCallback& onStep)
{
    while (!finished())
    {
        update();
        if (onStep) onStep(*this);
    }
}

std::vector<Point> MazeSolver::pathPoints() const
{
    std::vector<Point> out;
    out.reserve(path_.size());
    for (uint32_t i : path_)
        out.push_back(grid_.pointOf(i));
    return out;
}
