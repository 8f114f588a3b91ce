#pragma once
#include "core/Common.hpp"

#include <glad/glad.h>
#include <GLFW/glfw3.h>

struct Vertex
{
    float x, y;
    float r, g, b, a;
};

struct Rect
{
    float x0, y0, x1, y1;
};

// 向顶点数组添加一个矩形
inline void PushRect(std::vector<Vertex>& out,
                      float x0, float y0, float x1, float y1,
                      float r, float g, float b,
                      float a = 1.0f)
{
    out.push_back({x0, y0, r, g, b, a});
    out.push_back({x1, y0, r, g, b, a});
    out.push_back({x1, y1, r, g, b, a});

    out.push_back({x0, y0, r, g, b, a});
    out.push_back({x1, y1, r, g, b, a});
    out.push_back({x0, y1, r, g, b, a});
}

inline void PushRect(std::vector<Vertex>& out, const Rect& rc, float r, float g, float b, float a = 1.0f)
{
    PushRect(out, rc.x0, rc.y0, rc.x1, rc.y1, r, g, b, a);
}

// 判断点 (mx, my) 是否在矩形
inline bool Hit(float mx, float my, const Rect& rc)
{
    return mx >= rc.x0 && mx <= rc.x1 && my >= rc.y0 && my <= rc.y1;
}

// Side panel geometry in NDC, shared by ui.cpp (drawing) and input.cpp (clicks).
struct UiLayout
{
    Rect panel;
    Rect generate;
    Rect widthBox, widthMinus, widthPlus;
    Rect heightBox, heightMinus, heightPlus;
    Rect seedBox;
    Rect delayBox;
    Rect anim;
    Rect result;
    Rect solve;

    float labelPix;
};

UiLayout ComputeUiLayout(int fbW, int fbH);
