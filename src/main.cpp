#include "core/Common.hpp"
#include "core/DataStruct.hpp"
#include "core/MazeConfig.hpp"

void runApp(const MazeConfig& cfg);
int runConsole(const MazeConfig& cfg);

int main(int argc, char** argv)
{
    MazeConfig cfg;
    std::string error;
    if (!ParseArgs(argc, argv, cfg, error))
    {
        std::cerr << error << "\n" << Usage(argv[0]);
        return 2;
    }

    if (cfg.showHelp)
    {
        std::cout << Usage(argv[0]);
        return 0;
    }

    try
    {
        if (cfg.console)
            return runConsole(cfg);

        runApp(cfg);
    }
    catch (const MazeError& e)
    {
        std::cerr << "maze error: " << e.what() << std::endl;
        return 1;
    }
    catch (const std::exception& e)
    {
        std::cerr << "fatal: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
