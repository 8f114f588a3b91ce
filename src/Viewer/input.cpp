#include "Viewer/core.hpp"
#include "Viewer/ViewerInternal.hpp"

#include <algorithm>

void Viewer::applyEdit()
{
    auto parseInt = [&](int& dst) -> bool
    {
        if (uiEdit.empty() || uiEdit == "-")
            return false;
        try { dst = std::stoi(uiEdit); }
        catch (const std::exception&)
        {
            std::cerr << "ignored input '" << uiEdit << "'\n";
            return false;
        }
        return true;
    };

    int v = 0;
    switch (uiFocus)
    {
    case UI::Width:
        if (parseInt(v)) uiWidth = std::clamp(v, kMinPracticalSize, kMaxPracticalSize);
        break;
    case UI::Height:
        if (parseInt(v)) uiHeight = std::clamp(v, kMinPracticalSize, kMaxPracticalSize);
        break;
    case UI::Seed:
        // empty seed box = random mazes again
        if (parseInt(v) && v >= 0) uiSeed = (uint32_t)v;
        else uiSeed.reset();
        break;
    case UI::DelayMs:
        if (parseInt(v)) uiDelayMs = std::clamp(v, 0, 10000);
        break;
    default: break;
    }
}

void Viewer::initUiCallbacks()
{
    GLFWwindow *win = static_cast<GLFWwindow *>(window);
    glfwSetWindowUserPointer(win, this);

    glfwSetCharCallback(win, [](GLFWwindow *w, unsigned int codepoint)
    {
        auto* self = static_cast<Viewer*>(glfwGetWindowUserPointer(w));
        if (!self) return;
        if (self->uiFocus == UI::None) return;

        if (codepoint > 127) return;
        const char ch = (char)codepoint;

        if (ch >= '0' && ch <= '9')
        {
            // sizes are at most 2 digits, seed / delay up to 9
            const size_t limit = (self->uiFocus == UI::Width || self->uiFocus == UI::Height) ? 2 : 9;
            if (self->uiEdit.size() < limit) self->uiEdit.push_back(ch);
        }
    });

    glfwSetKeyCallback(win, [](GLFWwindow *w, int key, int /*scancode*/, int action, int /*mods*/)
    {
        auto* self = static_cast<Viewer*>(glfwGetWindowUserPointer(w));
        if (!self) return;
        if (action != GLFW_PRESS && action != GLFW_REPEAT) return;

        if (self->uiFocus != UI::None)
        {
            if (key == GLFW_KEY_ESCAPE) {
                self->uiFocus = UI::None;
                self->uiEdit.clear();
            } else if (key == GLFW_KEY_BACKSPACE) {
                if (!self->uiEdit.empty()) self->uiEdit.pop_back();
            } else if (key == GLFW_KEY_ENTER || key == GLFW_KEY_KP_ENTER) {
                self->applyEdit();
                self->uiFocus = UI::None;
                self->uiEdit.clear();
            }
            self->updateWindowTitle();
            return;
        }

        switch (key)
        {
        case GLFW_KEY_ESCAPE: glfwSetWindowShouldClose(w, GLFW_TRUE); break;
        case GLFW_KEY_G:      self->generateMaze(); break;
        case GLFW_KEY_S:      self->solveMaze(); break;
        case GLFW_KEY_A:
            // takes effect with the next maze
            self->uiStepwise = !self->uiStepwise;
            self->updateWindowTitle();
            break;
        case GLFW_KEY_LEFT:   self->resize(-1, 0); break;
        case GLFW_KEY_RIGHT:  self->resize(+1, 0); break;
        case GLFW_KEY_DOWN:   self->resize(0, -1); break;
        case GLFW_KEY_UP:     self->resize(0, +1); break;
        default: break;
        }
    });

    glfwSetMouseButtonCallback(win, [](GLFWwindow *w, int button, int action, int /*mods*/)
    {
        auto* self = static_cast<Viewer*>(glfwGetWindowUserPointer(w));
        if (!self) return;
        if (button != GLFW_MOUSE_BUTTON_LEFT || action != GLFW_PRESS) return;

        double px = 0, py = 0;
        glfwGetCursorPos(w, &px, &py);

        int winW = 1, winH = 1;
        glfwGetWindowSize(w, &winW, &winH);

        // window coords -> NDC; same ratio as framebuffer coords on HiDPI
        const float mx = (float)(px / std::max(1, winW) * 2.0 - 1.0);
        const float my = (float)(1.0 - py / std::max(1, winH) * 2.0);

        const UiLayout L = ComputeUiLayout(self->fbW, self->fbH);

        auto focus = [&](UI field, const std::string& text) {
            self->uiFocus = field;
            self->uiEdit = text;
            self->updateWindowTitle();
        };

        // any click leaves a half typed box without applying it
        self->uiFocus = UI::None;
        self->uiEdit.clear();

        if (Hit(mx, my, L.generate))    { self->generateMaze(); return; }
        if (Hit(mx, my, L.solve))       { self->solveMaze(); return; }
        if (Hit(mx, my, L.widthMinus))  { self->resize(-1, 0); return; }
        if (Hit(mx, my, L.widthPlus))   { self->resize(+1, 0); return; }
        if (Hit(mx, my, L.heightMinus)) { self->resize(0, -1); return; }
        if (Hit(mx, my, L.heightPlus))  { self->resize(0, +1); return; }

        if (Hit(mx, my, L.widthBox))  { focus(UI::Width, std::to_string(self->uiWidth)); return; }
        if (Hit(mx, my, L.heightBox)) { focus(UI::Height, std::to_string(self->uiHeight)); return; }
        if (Hit(mx, my, L.seedBox))
        {
            focus(UI::Seed, self->uiSeed ? std::to_string(*self->uiSeed) : std::string());
            return;
        }
        if (Hit(mx, my, L.delayBox))  { focus(UI::DelayMs, std::to_string(self->uiDelayMs)); return; }

        if (Hit(mx, my, L.anim))
        {
            self->uiStepwise = !self->uiStepwise;
            self->updateWindowTitle();
            return;
        }
    });
}
