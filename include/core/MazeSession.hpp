#pragma once
#include "core/Common.hpp"
#include "core/MazeGenerator.hpp"
#include "core/MazeSolver.hpp"

#include <memory>

// Owns the current maze and whichever process (generation or solve) is
// working on it. A new generate() throws all previous state away.
class MazeSession
{
public:
    MazeSession() = default;

    // chooser factory used for every new maze; default RandomChooser
    explicit MazeSession(std::function<Chooser()> makeChooser);

    MazeSession(const MazeSession&) = delete;
    MazeSession& operator=(const MazeSession&) = delete;

    void setListener(MazeListener listener);

    void generate(int32_t width, int32_t height, bool stepwise);

    // stepwise mode: advance one step, returns true while work remains
    bool tick();

    // throws MazeError(SolveBeforeFinalized) while no finalized maze exists
    const std::vector<uint32_t>& solve();

    bool hasMaze() const { return generator_ != nullptr; }
    bool generating() const { return generator_ && !generator_->finished(); }
    bool solving() const { return solver_ && !solver_->finished(); }
    bool solved() const { return solver_ && solver_->finished(); }

    const MazeGenerator& generator() const;
    const Grid& grid() const { return generator().grid(); }

    // empty until a solve has searched
    std::vector<Point> solution() const;

private:
    std::function<Chooser()> makeChooser_{};
    MazeListener listener_{};
    bool stepwise_{ false };

    std::unique_ptr<MazeGenerator> generator_{};
    std::unique_ptr<MazeSolver> solver_{};
};
