#pragma once

#include "core/Common.hpp"
#include "core/DataStruct.hpp"
#include "core/MazeConfig.hpp"
#include "core/MazeSession.hpp"

#include <chrono>

enum class UI
{
    None,
    Width,
    Height,
    Seed,
    DelayMs
};

// Window front end: draws the grid of the current session and drives its
// stepwise processes from the frame loop, one step per delay period.
class Viewer {
public:
    static Viewer& getInstance();
    void run(const MazeConfig& config);
    void onFramebufferResized(int width, int height);

private:
    Viewer();
    ~Viewer();

private:
    // window/gl
    void initWindowAndGL();
    void shutdownGL();
    void initUiCallbacks();
    void updateWindowTitle();

    void applyEdit();

    // render
    void drawMaze();
    void renderUi();
    void rebuildMeshFromGrid(const Grid& g);
    void rebuildMeshIfDirty();

    // work
    void generateMaze();
    void solveMaze();
    void tickSteps_();
    void resize(int dw, int dh);

private:
    // -------- window / gl state --------
    void* window = nullptr;
    int fbW = 900;
    int fbH = 600;

    uint32_t program = 0;
    uint32_t vao = 0;
    uint32_t vbo = 0;
    uint32_t uiVao = 0;
    uint32_t uiVbo = 0;

    int vertexCount = 0;
    int uiVertexCount = 0;

    int meshBuiltFbW = 0;
    int meshBuiltFbH = 0;

    // -------- maze state shared with renderer --------
    MazeSession session;
    bool mazeDirty = false;
    std::chrono::steady_clock::time_point lastStep{};

    // -------- UI state --------
    UI uiFocus = UI::None;
    std::string uiEdit;
    int uiWidth = 10;
    int uiHeight = 10;
    bool uiStepwise = true;
    int uiDelayMs = 25;
    std::optional<uint32_t> uiSeed;

    // results shown in the "path info" box
    int lastPathLen = 0;
    std::string lastError;
};
