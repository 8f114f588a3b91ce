#pragma once
#include "core/Common.hpp"

struct MazeConfig
{
    int32_t width{ 10 };
    int32_t height{ 10 };
    bool stepwise{ true };

    std::optional<uint32_t> seed{};
    int32_t stepDelayMs{ 25 };

    bool console{ false };
    bool solve{ false };
    bool showHelp{ false };
};

// practical size range offered by the viewer, not an algorithm limit
constexpr int32_t kMinPracticalSize = 5;
constexpr int32_t kMaxPracticalSize = 30;

// false + outError on unknown options or bad numbers
bool ParseArgs(int argc, const char* const* argv, MazeConfig& out, std::string& outError);

std::string Usage(const std::string& program);
