#include "core/Common.hpp"
#include "core/MazeConfig.hpp"
#include "core/MazePrinter.hpp"
#include "core/MazeSession.hpp"
#include "Viewer/core.hpp"

void runApp(const MazeConfig& cfg)
{
    auto& viewer = Viewer::getInstance();
    viewer.run(cfg);
}

// text mode: always immediate, nothing to animate
int runConsole(const MazeConfig& cfg)
{
    MazeSession session([&cfg] { return cfg.seed ? SeededChooser(*cfg.seed) : RandomChooser(); });

    session.generate(cfg.width, cfg.height, false);

    if (cfg.solve)
    {
        const auto& path = session.solve();
        std::cout << MazePrinter::ToAscii(session.grid());
        std::cout << "solution: " << path.size() << " cells\n";
    }
    else
    {
        std::cout << MazePrinter::ToAscii(session.grid());
    }
    return 0;
}
