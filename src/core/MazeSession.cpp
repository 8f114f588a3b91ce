#include "core/MazeSession.hpp"

MazeSession::MazeSession(std::function<Chooser()> makeChooser)
    : makeChooser_(std::move(makeChooser))
{
}

void MazeSession::setListener(MazeListener listener)
{
    listener_ = std::move(listener);
    if (generator_)
        generator_->grid().setListener(listener_);
}

void MazeSession::generate(int32_t width, int32_t height, bool stepwise)
{
    // drop the old maze first; the solver refers to its grid
    solver_.reset();
    generator_.reset();

    Chooser chooser = makeChooser_ ? makeChooser_() : RandomChooser();
    auto gen = std::make_unique<MazeGenerator>(width, height, std::move(chooser));
    gen->grid().setListener(listener_);

    stepwise_ = stepwise;
    generator_ = std::move(gen);

    if (!stepwise_)
        generator_->run();
}

bool MazeSession::tick()
{
    if (generating())
    {
        generator_->step();
        return generating() || solving();
    }

    if (solving())
    {
        solver_->update();
        return solving();
    }

    return false;
}

const std::vector<uint32_t>& MazeSession::solve()
{
    if (!generator_)
        throw MazeError(MazeErrorKind::SolveBeforeFinalized, "no maze has been generated");

    // a running solve is replaced, never run side by side
    solver_.reset();
    auto solver = std::make_unique<MazeSolver>(*generator_);

    if (stepwise_)
        solver->update(); // search now so a broken grid fails here
    else
        solver->run();

    solver_ = std::move(solver);
    return solver_->path();
}

const MazeGenerator& MazeSession::generator() const
{
    if (!generator_)
        throw std::logic_error("no maze has been generated");
    return *generator_;
}

std::vector<Point> MazeSession::solution() const
{
    if (!solver_) return {};
    return solver_->pathPoints();
}
