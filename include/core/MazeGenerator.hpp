#pragma once
#include "core/Common.hpp"
#include "core/Grid.hpp"

#include <unordered_set>

enum class GenerationState
{
    NotStarted,
    InProgress,
    Finalized
};

inline const char* ToString(GenerationState s)
{
    switch (s)
    {
    case GenerationState::NotStarted: return "NotStarted";
    case GenerationState::InProgress: return "InProgress";
    case GenerationState::Finalized:  return "Finalized";
    }
    return "?";
}

// Picks one of candidateCount options, result must be in [0, candidateCount).
using Chooser = std::function<uint32_t(uint32_t candidateCount)>;

// mt19937 seeded from std::random_device
Chooser RandomChooser();
Chooser SeededChooser(uint32_t seed);

// Randomized depth-first search ("recursive backtracking") carving a perfect maze.
//
// step() does one unit of work: place the start cell, carve into one random
// unvisited neighbour, or backtrack from a dead end. The last backtrack also
// opens the entrance at (0,0) and the exit at (width-1, height-1).
// run() is the same loop without a pause between steps.
class MazeGenerator
{
public:
    using StepCallback = std::function<void(const MazeGenerator&)>;

    MazeGenerator(int32_t width, int32_t height, Chooser chooser = RandomChooser());

    void step();
    void run(const StepCallback& onStep = {});

    GenerationState state() const { return state_; }
    bool finished() const { return state_ == GenerationState::Finalized; }

    const Grid& grid() const { return grid_; }
    Grid& grid() { return grid_; }

    const std::vector<uint32_t>& pathStack() const { return path_; }
    uint32_t completedCount() const { return static_cast<uint32_t>(completed_.size()); }
    uint64_t stepCount() const { return steps_; }

    uint32_t startIndex() const { return 0; }
    uint32_t endIndex() const { return grid_.cellCount() - 1; }

private:
    uint32_t choose_(uint32_t candidateCount);
    void begin_();
    void carveOrBacktrack_();
    void finalize_();

    Grid grid_;
    Chooser chooser_;
    GenerationState state_{ GenerationState::NotStarted };

    std::vector<uint32_t> path_;              // LIFO, start cell at the bottom
    std::unordered_set<uint32_t> onPath_;
    std::unordered_set<uint32_t> completed_;
    uint64_t steps_{ 0 };
};
