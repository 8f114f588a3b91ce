#include "core/MazeConfig.hpp"

#include <limits>
#include <sstream>

static bool parseInt(const std::string& s, long long lo, long long hi, long long& out)
{
    if (s.empty()) return false;

    size_t used = 0;
    long long v = 0;
    try { v = std::stoll(s, &used); }
    catch (const std::exception&) { return false; }

    if (used != s.size()) return false;
    if (v < lo || v > hi) return false;

    out = v;
    return true;
}

bool ParseArgs(int argc, const char* const* argv, MazeConfig& out, std::string& outError)
{
    MazeConfig cfg{};
    outError.clear();

    for (int i = 1; i < argc; ++i)
    {
        const std::string arg = argv[i];

        auto value = [&](long long lo, long long hi, long long& v) -> bool {
            if (i + 1 >= argc)
            {
                outError = arg + " needs a value";
                return false;
            }
            const std::string s = argv[++i];
            if (!parseInt(s, lo, hi, v))
            {
                outError = "invalid value for " + arg + ": '" + s + "'";
                return false;
            }
            return true;
        };

        long long v = 0;
        constexpr long long kIntMax = std::numeric_limits<int32_t>::max();
        constexpr long long kIntMin = std::numeric_limits<int32_t>::min();

        if (arg == "--width" || arg == "-w")
        {
            // range is checked later by the grid (InvalidDimension)
            if (!value(kIntMin, kIntMax, v)) return false;
            cfg.width = (int32_t)v;
        }
        else if (arg == "--height" || arg == "-H")
        {
            if (!value(kIntMin, kIntMax, v)) return false;
            cfg.height = (int32_t)v;
        }
        else if (arg == "--seed")
        {
            if (!value(0, std::numeric_limits<uint32_t>::max(), v)) return false;
            cfg.seed = (uint32_t)v;
        }
        else if (arg == "--delay")
        {
            if (!value(0, 10000, v)) return false;
            cfg.stepDelayMs = (int32_t)v;
        }
        else if (arg == "--instant")  { cfg.stepwise = false; }
        else if (arg == "--stepwise") { cfg.stepwise = true; }
        else if (arg == "--console")  { cfg.console = true; }
        else if (arg == "--solve")    { cfg.solve = true; }
        else if (arg == "--help" || arg == "-h") { cfg.showHelp = true; }
        else
        {
            outError = "unknown option: " + arg;
            return false;
        }
    }

    out = cfg;
    return true;
}

std::string Usage(const std::string& program)
{
    std::ostringstream os;
    os << "usage: " << program << " [options]\n"
       << "  -w, --width N     maze width in cells (default 10, practical "
       << kMinPracticalSize << "-" << kMaxPracticalSize << ")\n"
       << "  -H, --height N    maze height in cells (default 10)\n"
       << "  --stepwise        animate generation and solution (default)\n"
       << "  --instant         generate and solve without animation\n"
       << "  --seed N          reproducible maze\n"
       << "  --delay MS        delay between animation steps (default 25)\n"
       << "  --console         print the maze as text instead of opening a window\n"
       << "  --solve           console mode: also print the solution\n"
       << "  -h, --help        show this text\n"
       << "keys: G new maze, S solve, A toggle animation, arrows resize, Esc quit\n";
    return os.str();
}
