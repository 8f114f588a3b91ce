#include "Viewer/core.hpp"
#include "Viewer/ViewerInternal.hpp"

#include <array>
#include <string_view>

namespace
{
    // only the characters the panel labels use
    std::array<uint8_t, 7> Glyph5x7(char c)
    {
        if (c >= 'a' && c <= 'z') c = (char)(c - 'a' + 'A');
        switch (c)
        {
        case '-': return {0b00000,0b00000,0b00000,0b11111,0b00000,0b00000,0b00000};
        case '+': return {0b00000,0b00100,0b00100,0b11111,0b00100,0b00100,0b00000};
        case '0': return {0b01110,0b10001,0b10011,0b10101,0b11001,0b10001,0b01110};
        case '1': return {0b00100,0b01100,0b00100,0b00100,0b00100,0b00100,0b01110};
        case '2': return {0b01110,0b10001,0b00001,0b00010,0b00100,0b01000,0b11111};
        case '3': return {0b01110,0b10001,0b00001,0b00110,0b00001,0b10001,0b01110};
        case '4': return {0b00010,0b00110,0b01010,0b10010,0b11111,0b00010,0b00010};
        case '5': return {0b11111,0b10000,0b11110,0b00001,0b00001,0b10001,0b01110};
        case '6': return {0b00110,0b01000,0b10000,0b11110,0b10001,0b10001,0b01110};
        case '7': return {0b11111,0b00001,0b00010,0b00100,0b01000,0b01000,0b01000};
        case '8': return {0b01110,0b10001,0b10001,0b01110,0b10001,0b10001,0b01110};
        case '9': return {0b01110,0b10001,0b10001,0b01111,0b00001,0b00010,0b11100};
        case 'A': return {0b01110,0b10001,0b10001,0b11111,0b10001,0b10001,0b10001};
        case 'D': return {0b11110,0b10001,0b10001,0b10001,0b10001,0b10001,0b11110};
        case 'E': return {0b11111,0b10000,0b10000,0b11110,0b10000,0b10000,0b11111};
        case 'F': return {0b11111,0b10000,0b10000,0b11110,0b10000,0b10000,0b10000};
        case 'G': return {0b01110,0b10001,0b10000,0b10111,0b10001,0b10001,0b01110};
        case 'H': return {0b10001,0b10001,0b10001,0b11111,0b10001,0b10001,0b10001};
        case 'I': return {0b11111,0b00100,0b00100,0b00100,0b00100,0b00100,0b11111};
        case 'L': return {0b10000,0b10000,0b10000,0b10000,0b10000,0b10000,0b11111};
        case 'M': return {0b10001,0b11011,0b10101,0b10101,0b10001,0b10001,0b10001};
        case 'N': return {0b10001,0b11001,0b10101,0b10011,0b10001,0b10001,0b10001};
        case 'O': return {0b01110,0b10001,0b10001,0b10001,0b10001,0b10001,0b01110};
        case 'P': return {0b11110,0b10001,0b10001,0b11110,0b10000,0b10000,0b10000};
        case 'R': return {0b11110,0b10001,0b10001,0b11110,0b10100,0b10010,0b10001};
        case 'S': return {0b01111,0b10000,0b10000,0b01110,0b00001,0b00001,0b11110};
        case 'T': return {0b11111,0b00100,0b00100,0b00100,0b00100,0b00100,0b00100};
        case 'V': return {0b10001,0b10001,0b10001,0b10001,0b01010,0b01010,0b00100};
        case 'W': return {0b10001,0b10001,0b10001,0b10101,0b10101,0b10101,0b01010};
        case 'Y': return {0b10001,0b01010,0b00100,0b00100,0b00100,0b00100,0b00100};
        default:  return {0,0,0,0,0,0,0};
        }
    }

    // 使用 5x7 点阵字体绘制文本：按像素大小生成小矩形并压入顶点数组
    void PushText5x7(std::vector<Vertex>& out,
                     std::string_view text,
                     float x, float y,
                     float pix,
                     float r, float g, float b)
    {
        float cx = x;
        for (char ch : text)
        {
            const auto g7 = Glyph5x7(ch);
            for (int row = 0; row < 7; ++row)
            {
                for (int col = 0; col < 5; ++col)
                {
                    if ((g7[row] & (1u << (4 - col))) == 0) continue;

                    const float x0 = cx + col * pix;
                    const float y0 = y  + (6 - row) * pix;
                    PushRect(out, x0, y0, x0 + pix, y0 + pix, r, g, b);
                }
            }
            cx += 6.0f * pix;
        }
    }

    float TextWidth5x7(std::string_view text, float pix)
    {
        return (float)text.size() * 6.0f * pix;
    }

    void DrawCentered(std::vector<Vertex>& out, std::string_view label, const Rect& rc,
                      float pix, float r = 0.08f, float g = 0.08f, float b = 0.08f)
    {
        const float tx = (rc.x0 + rc.x1) * 0.5f - TextWidth5x7(label, pix) * 0.5f;
        const float ty = (rc.y0 + rc.y1) * 0.5f - 7.0f * pix * 0.5f;
        PushText5x7(out, label, tx, ty, pix, r, g, b);
    }
}

UiLayout ComputeUiLayout(int fbW, int fbH)
{
    UiLayout L{};

    const float sidePx = (fbW > 0 && fbH > 0) ? (float)std::min(fbW, fbH) : 0.0f;
    const float splitX = (fbW > 0) ? (1.0f - 2.0f * (sidePx / (float)fbW)) : -0.25f;

    L.panel = { -1.0f, -1.0f, splitX, 1.0f };

    const float padX = 0.05f;
    const float padY = 0.05f;
    const float gap  = 0.02f;

    const float x0 = L.panel.x0 + padX;
    const float x1 = L.panel.x1 - padX;
    const float availW = std::max(0.01f, x1 - x0);

    L.labelPix = 0.0080f;
    const float labelH = 7.0f * L.labelPix + 0.012f;

    float y = L.panel.y1 - padY;

    const float buildH = std::min(0.22f, std::max(0.10f, availW * 0.22f));
    L.generate = { x0, y - buildH, x1, y };
    y = L.generate.y0 - gap;

    // label above every input row
    auto spinRow = [&](Rect& minus, Rect& box, Rect& plus) {
        const float h = 0.12f;
        y -= labelH;
        minus = { x0, y - h, x0 + h, y };
        plus = { x1 - h, y - h, x1, y };
        box = { minus.x1 + 0.012f, y - h, plus.x0 - 0.012f, y };
        y -= h + gap;
    };
    auto boxRow = [&](Rect& box) {
        const float h = 0.12f;
        y -= labelH;
        box = { x0, y - h, x1, y };
        y -= h + gap;
    };

    spinRow(L.widthMinus, L.widthBox, L.widthPlus);
    spinRow(L.heightMinus, L.heightBox, L.heightPlus);
    boxRow(L.seedBox);
    boxRow(L.delayBox);

    L.anim = { x0, y - 0.11f, x1, y };
    y = L.anim.y0 - gap;

    L.result = { x0, y - 0.11f, x1, y };

    const float bottomY0 = L.panel.y0 + padY;
    L.solve = { x0, bottomY0, x1, bottomY0 + 0.14f };

    return L;
}

// 渲染左侧 UI 面板：按钮、输入框与结果展示，并上传顶点到 OpenGL 绘制
void Viewer::renderUi()
{
    std::vector<Vertex> ui;
    ui.reserve(6000);

    const UiLayout L = ComputeUiLayout(fbW, fbH);
    const float pix = L.labelPix;

    // panel bg
    PushRect(ui, L.panel, 0.12f, 0.12f, 0.12f);

    auto drawBox = [&](const Rect& rc, bool focused)
    {
        const float br = focused ? 0.95f : 0.35f;
        const float bg = focused ? 0.85f : 0.35f;
        const float bb = focused ? 0.20f : 0.35f;
        PushRect(ui, rc.x0 - 0.005f, rc.y0 - 0.005f, rc.x1 + 0.005f, rc.y1 + 0.005f, br, bg, bb);
        PushRect(ui, rc, 0.18f, 0.18f, 0.18f);
    };

    auto label = [&](std::string_view text, const Rect& below)
    {
        PushText5x7(ui, text, L.panel.x0 + 0.05f, below.y1 + 0.012f, pix, 0.92f, 0.92f, 0.92f);
    };

    // while a box has focus it previews the text being typed
    auto shown = [&](UI field, const std::string& value) -> std::string
    {
        return (uiFocus == field) ? (uiEdit.empty() ? std::string("-") : uiEdit) : value;
    };

    PushRect(ui, L.generate, 0.75f, 0.75f, 0.75f);
    DrawCentered(ui, "GENERATE", L.generate, 0.0105f);

    label("WIDTH", L.widthBox);
    PushRect(ui, L.widthMinus, 0.35f, 0.35f, 0.35f);
    PushRect(ui, L.widthPlus, 0.35f, 0.35f, 0.35f);
    DrawCentered(ui, "-", L.widthMinus, 0.012f, 0.92f, 0.92f, 0.92f);
    DrawCentered(ui, "+", L.widthPlus, 0.012f, 0.92f, 0.92f, 0.92f);
    drawBox(L.widthBox, uiFocus == UI::Width);
    DrawCentered(ui, shown(UI::Width, std::to_string(uiWidth)), L.widthBox, 0.012f, 0.92f, 0.92f, 0.92f);

    label("HEIGHT", L.heightBox);
    PushRect(ui, L.heightMinus, 0.35f, 0.35f, 0.35f);
    PushRect(ui, L.heightPlus, 0.35f, 0.35f, 0.35f);
    DrawCentered(ui, "-", L.heightMinus, 0.012f, 0.92f, 0.92f, 0.92f);
    DrawCentered(ui, "+", L.heightPlus, 0.012f, 0.92f, 0.92f, 0.92f);
    drawBox(L.heightBox, uiFocus == UI::Height);
    DrawCentered(ui, shown(UI::Height, std::to_string(uiHeight)), L.heightBox, 0.012f, 0.92f, 0.92f, 0.92f);

    label("SEED", L.seedBox);
    drawBox(L.seedBox, uiFocus == UI::Seed);
    DrawCentered(ui, shown(UI::Seed, uiSeed ? std::to_string(*uiSeed) : std::string("RANDOM")),
                 L.seedBox, 0.010f, 0.92f, 0.92f, 0.92f);

    label("DELAY MS", L.delayBox);
    drawBox(L.delayBox, uiFocus == UI::DelayMs);
    DrawCentered(ui, shown(UI::DelayMs, std::to_string(uiDelayMs)), L.delayBox, 0.012f, 0.92f, 0.92f, 0.92f);

    if (uiStepwise) PushRect(ui, L.anim, 0.95f, 0.20f, 0.20f);
    else            PushRect(ui, L.anim, 0.35f, 0.35f, 0.35f);
    DrawCentered(ui, uiStepwise ? "ANIM ON" : "ANIM OFF", L.anim, 0.0095f);

    drawBox(L.result, false);
    {
        std::string text;
        if (session.generating())
            text = "STEP " + std::to_string(session.generator().stepCount());
        else
            text = "LEN " + std::to_string(std::max(0, lastPathLen));
        DrawCentered(ui, text, L.result, 0.0090f, 0.92f, 0.92f, 0.92f);
    }

    // solve is only useful once the maze is finalized
    const bool canSolve = session.hasMaze() && !session.generating();
    if (canSolve) PushRect(ui, L.solve, 1.00f, 0.55f, 0.05f);
    else          PushRect(ui, L.solve, 0.35f, 0.35f, 0.35f);
    DrawCentered(ui, "SOLVE", L.solve, 0.0105f);

    glBindBuffer(GL_ARRAY_BUFFER, uiVbo);
    glBufferData(GL_ARRAY_BUFFER, (GLsizeiptr)(ui.size() * sizeof(Vertex)), ui.data(), GL_DYNAMIC_DRAW);
    glBindBuffer(GL_ARRAY_BUFFER, 0);

    uiVertexCount = (int)ui.size();
    if (uiVertexCount > 0)
    {
        glUseProgram(program);
        glBindVertexArray(uiVao);
        glDrawArrays(GL_TRIANGLES, 0, uiVertexCount);
        glBindVertexArray(0);
        glUseProgram(0);
    }
}
