#include "core/MazeGenerator.hpp"

#include <memory>
#include <random>

static Chooser chooserFrom(std::shared_ptr<std::mt19937> rng)
{
    return [rng](uint32_t candidateCount) -> uint32_t {
        std::uniform_int_distribution<uint32_t> pick(0, candidateCount - 1);
        return pick(*rng);
    };
}

Chooser RandomChooser()
{
    std::random_device rd;
    return chooserFrom(std::make_shared<std::mt19937>(rd()));
}

Chooser SeededChooser(uint32_t seed)
{
    return chooserFrom(std::make_shared<std::mt19937>(seed));
}

MazeGenerator::MazeGenerator(int32_t width, int32_t height, Chooser chooser)
    : grid_(width, height), chooser_(std::move(chooser))
{
    if (!chooser_)
        chooser_ = RandomChooser();

    path_.reserve(grid_.cellCount());
}

uint32_t MazeGenerator::choose_(uint32_t candidateCount)
{
    const uint32_t picked = chooser_(candidateCount);
    if (picked >= candidateCount)
    {
        throw std::out_of_range("chooser returned " + std::to_string(picked) + " for " +
                                std::to_string(candidateCount) + " candidates");
    }
    return picked;
}

void MazeGenerator::step()
{
    switch (state_)
    {
    case GenerationState::NotStarted:
        begin_();
        break;
    case GenerationState::InProgress:
        carveOrBacktrack_();
        break;
    case GenerationState::Finalized:
        return;
    }
    ++steps_;
}

void MazeGenerator::run(const StepCallback& onStep)
{
    while (!finished())
    {
        step();
        if (onStep) onStep(*this);
    }
}

void MazeGenerator::begin_()
{
    path_.clear();
    onPath_.clear();
    completed_.clear();

    const uint32_t first = choose_(grid_.cellCount());
    path_.push_back(first);
    onPath_.insert(first);
    grid_.setState(first, CellState::Current);

    state_ = GenerationState::InProgress;
}

void MazeGenerator::carveOrBacktrack_()
{
    const uint32_t cur = path_.back();

    std::array<std::pair<Direction, uint32_t>, 4> candidates{};
    uint32_t n = 0;

    for (Direction dir : kDirections)
    {
        const auto next = grid_.neighborIndex(cur, dir);
        if (!next) continue;
        if (completed_.count(*next) || onPath_.count(*next)) continue;
        candidates[n++] = { dir, *next };
    }

    if (n > 0)
    {
        const auto [dir, next] = candidates[choose_(n)];

        grid_.removeWallPair(cur, next, dir);
        path_.push_back(next);
        onPath_.insert(next);
        grid_.setState(next, CellState::Current);
        return;
    }

    // dead end
    path_.pop_back();
    onPath_.erase(cur);
    completed_.insert(cur);
    grid_.setState(cur, CellState::Completed);

    if (completed_.size() == grid_.cellCount())
        finalize_();
}

void MazeGenerator::finalize_()
{
    const uint32_t start = startIndex();
    grid_.setState(start, CellState::StartOfMaze);
    grid_.removeBoundaryWall(start, Direction::Left);

    // on a 1x1 grid the exit shares the start cell and wins the tag
    const uint32_t end = endIndex();
    grid_.setState(end, CellState::EndOfMaze);
    grid_.removeBoundaryWall(end, Direction::Right);

    state_ = GenerationState::Finalized;
}
