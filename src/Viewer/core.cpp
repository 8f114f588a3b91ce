#include "Viewer/core.hpp"
#include "Viewer/ViewerInternal.hpp"

#include <stdexcept>
#include <algorithm>

Viewer& Viewer::getInstance()
{
    static Viewer inst;
    return inst;
}

Viewer::Viewer()
    : session([this] { return uiSeed ? SeededChooser(*uiSeed) : RandomChooser(); })
{
    MazeListener listener;
    listener.onCellState = [this](Point, CellState) { mazeDirty = true; };
    listener.onWallRemoved = [this](Point, Direction) { mazeDirty = true; };
    session.setListener(std::move(listener));
}

Viewer::~Viewer()
{
    shutdownGL();
}

void Viewer::tickSteps_()
{
    if (!session.generating() && !session.solving()) return;

    const auto now = std::chrono::steady_clock::now();

    const auto period = std::chrono::milliseconds(uiDelayMs);
    if (uiDelayMs > 0 && now - lastStep < period) return;

    // delay 0: run a batch per frame so large mazes still finish quickly
    const int batch = (uiDelayMs <= 0) ? 64 : 1;

    lastStep = now;
    try
    {
        for (int i = 0; i < batch && session.tick(); ++i) {}
    }
    catch (const std::exception& e)
    {
        lastError = e.what();
        std::cerr << "step failed: " << e.what() << "\n";
    }
    updateWindowTitle();
}

void Viewer::run(const MazeConfig& config)
{
    uiWidth = config.width;
    uiHeight = config.height;
    uiStepwise = config.stepwise;
    uiDelayMs = config.stepDelayMs;
    uiSeed = config.seed;

    initWindowAndGL();

    // 初始生成一个迷宫，避免空白
    generateMaze();

    auto* win = static_cast<GLFWwindow*>(window);
    while (win && !glfwWindowShouldClose(win))
    {
        tickSteps_();

        // clear
        glClearColor(0.08f, 0.08f, 0.09f, 1.0f);
        glClear(GL_COLOR_BUFFER_BIT);

        // render
        drawMaze();
        renderUi();

        glfwSwapBuffers(win);
        glfwPollEvents();
    }

    shutdownGL();
}

void Viewer::updateWindowTitle()
{
    if (!window) return;

    std::string title = "Perfect Maze  |  " + std::to_string(uiWidth) + "x" + std::to_string(uiHeight);
    title += uiStepwise ? "  |  animated" : "  |  instant";
    if (uiSeed) title += "  |  seed=" + std::to_string(*uiSeed);

    if (session.hasMaze())
    {
        if (session.generating())
            title += "  |  generating, step " + std::to_string(session.generator().stepCount());
        else if (session.solving())
            title += "  |  solving";
        else if (session.solved())
            title += "  |  path " + std::to_string(lastPathLen);
    }

    if (!lastError.empty()) title += "  |  " + lastError;

    glfwSetWindowTitle(static_cast<GLFWwindow*>(window), title.c_str());
}

void Viewer::generateMaze()
{
    lastError.clear();
    lastPathLen = 0;

    try
    {
        session.generate(uiWidth, uiHeight, uiStepwise);
    }
    catch (const std::exception& e)
    {
        lastError = e.what();
        std::cerr << "generate failed: " << e.what() << "\n";
    }

    lastStep = std::chrono::steady_clock::now();
    mazeDirty = true;
    updateWindowTitle();
}

void Viewer::solveMaze()
{
    lastError.clear();

    try
    {
        lastPathLen = (int)session.solve().size();
    }
    catch (const std::exception& e)
    {
        // SolveBeforeFinalized while animating is normal, just report it
        lastError = e.what();
        std::cerr << "solve failed: " << e.what() << "\n";
    }

    lastStep = std::chrono::steady_clock::now();
    updateWindowTitle();
}

void Viewer::resize(int dw, int dh)
{
    uiWidth = std::clamp(uiWidth + dw, kMinPracticalSize, kMaxPracticalSize);
    uiHeight = std::clamp(uiHeight + dh, kMinPracticalSize, kMaxPracticalSize);
    updateWindowTitle();
}

void Viewer::onFramebufferResized(int width, int height)
{
    fbW = std::max(1, width);
    fbH = std::max(1, height);
    // 不需要在这里 rebuild mesh；drawMaze() 每帧都会按 fbW/fbH 设 viewport
}
