#include "Viewer/core.hpp"
#include "Viewer/ViewerInternal.hpp"

#include <algorithm>

namespace
{
    struct Rgb { float r, g, b; };

    Rgb FloorColor(CellState s)
    {
        switch (s)
        {
        case CellState::Untouched:   return { 0.22f, 0.22f, 0.24f };
        case CellState::Current:     return { 0.95f, 0.20f, 0.20f };
        case CellState::Completed:   return { 0.95f, 0.95f, 0.95f };
        case CellState::StartOfMaze: return { 0.20f, 0.85f, 0.25f };
        case CellState::EndOfMaze:   return { 0.20f, 0.55f, 1.00f };
        case CellState::Solution:    return { 1.00f, 0.55f, 0.05f };
        }
        return { 1.0f, 0.0f, 1.0f };
    }
}

void Viewer::rebuildMeshIfDirty()
{
    if (!session.hasMaze()) { vertexCount = 0; return; }

    const bool fbChanged = (meshBuiltFbW != fbW) || (meshBuiltFbH != fbH);
    if (!mazeDirty && !fbChanged) return;

    mazeDirty = false;
    meshBuiltFbW = fbW;
    meshBuiltFbH = fbH;

    rebuildMeshFromGrid(session.grid());
}

void Viewer::rebuildMeshFromGrid(const Grid& g)
{
    const int cols = g.width();
    const int rows = g.height();

    std::vector<Vertex> verts;
    // floor + up to 4 walls per cell
    verts.reserve((size_t)rows * (size_t)cols * 6 * 5);

    // keep one cell of margin so the entrance/exit gaps are visible
    const float cell = 2.0f / (float)(std::max(rows, cols) + 2);
    const float wall = std::max(cell * 0.10f, 0.004f);

    const float totalW = cell * (float)cols;
    const float totalH = cell * (float)rows;

    // (0,0) at the lower left
    const float startX = -totalW * 0.5f;
    const float startY = -totalH * 0.5f;

    const float wallR = 0.05f, wallG = 0.05f, wallB = 0.05f;

    for (int y = 0; y < rows; ++y)
    {
        for (int x = 0; x < cols; ++x)
        {
            const uint32_t i = g.indexOf(x, y);

            const float x0 = startX + (float)x * cell;
            const float y0 = startY + (float)y * cell;
            const float x1 = x0 + cell;
            const float y1 = y0 + cell;

            const Rgb c = FloorColor(g.state(i));
            PushRect(verts, x0, y0, x1, y1, c.r, c.g, c.b);

            // walls straddle the cell edge, shared walls come from both cells
            const float h = wall * 0.5f;
            if (g.hasWall(i, Direction::Right))  PushRect(verts, x1 - h, y0 - h, x1 + h, y1 + h, wallR, wallG, wallB);
            if (g.hasWall(i, Direction::Left))   PushRect(verts, x0 - h, y0 - h, x0 + h, y1 + h, wallR, wallG, wallB);
            if (g.hasWall(i, Direction::Top))    PushRect(verts, x0 - h, y1 - h, x1 + h, y1 + h, wallR, wallG, wallB);
            if (g.hasWall(i, Direction::Bottom)) PushRect(verts, x0 - h, y0 - h, x1 + h, y0 + h, wallR, wallG, wallB);
        }
    }

    glBindBuffer(GL_ARRAY_BUFFER, vbo);
    glBufferData(GL_ARRAY_BUFFER, (GLsizeiptr)(verts.size() * sizeof(Vertex)), verts.data(), GL_DYNAMIC_DRAW);
    glBindBuffer(GL_ARRAY_BUFFER, 0);

    vertexCount = (int)verts.size();
}

void Viewer::drawMaze()
{
    rebuildMeshIfDirty();

    if (vertexCount <= 0) return;

    // square viewport on the right, the panel takes the rest
    const int sidePx = std::min(fbW, fbH);
    const int vpX = std::max(0, fbW - sidePx);
    const int vpY = 0;

    glViewport(vpX, vpY, sidePx, sidePx);

    glUseProgram(program);
    glBindVertexArray(vao);
    glDrawArrays(GL_TRIANGLES, 0, vertexCount);
    glBindVertexArray(0);
    glUseProgram(0);

    glViewport(0, 0, fbW, fbH);
}
