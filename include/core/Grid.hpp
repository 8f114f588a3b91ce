#pragma once
#include "core/Common.hpp"
#include "core/DataStruct.hpp"

#include <limits>

// Rectangular cell grid, row-major: index = y * width + x.
// (0,0) is the lower-left cell, Top points towards larger y.
class Grid
{
public:
    // cell indices are uint32_t
    static constexpr uint64_t kMaxCellCount = std::numeric_limits<uint32_t>::max();

    // throws MazeError(InvalidDimension) if width < 1, height < 1 or
    // width * height exceeds kMaxCellCount
    Grid(int32_t width, int32_t height);

    int32_t width() const { return width_; }
    int32_t height() const { return height_; }
    uint32_t cellCount() const { return static_cast<uint32_t>(cells_.size()); }

    bool inBounds(int32_t x, int32_t y) const
    {
        return x >= 0 && y >= 0 && x < width_ && y < height_;
    }

    uint32_t indexOf(int32_t x, int32_t y) const;
    Point pointOf(uint32_t index) const;

    static std::optional<uint32_t> neighborIndex(uint32_t index, Direction dir,
                                                 int32_t width, int32_t height);
    std::optional<uint32_t> neighborIndex(uint32_t index, Direction dir) const
    {
        return neighborIndex(index, dir, width_, height_);
    }

    const Cell& cell(uint32_t index) const { return cells_.at(index); }

    bool hasWall(uint32_t index, Direction dir) const { return cell(index).hasWall(dir); }

    // clears a's wall facing dir and b's opposite wall together
    void removeWallPair(uint32_t a, uint32_t b, Direction dir);
    void restoreWallPair(uint32_t a, uint32_t b, Direction dir);

    // outward facing wall on the grid frame (entrance / exit)
    void removeBoundaryWall(uint32_t index, Direction dir);

    // false for non adjacent cells
    bool hasPassage(uint32_t a, uint32_t b) const;

    uint32_t openPassageCount() const;

    CellState state(uint32_t index) const { return cell(index).state; }
    void setState(uint32_t index, CellState s);

    std::optional<uint32_t> parent(uint32_t index) const { return cell(index).parent; }
    void setParent(uint32_t index, uint32_t parentIndex);
    void clearParents();

    void setListener(MazeListener listener) { listener_ = std::move(listener); }

private:
    Cell& mutableCell(uint32_t index) { return cells_.at(index); }
    void checkNeighbor_(uint32_t a, uint32_t b, Direction dir) const;
    void notifyWall_(uint32_t index, Direction dir) const;

    int32_t width_{};
    int32_t height_{};
    std::vector<Cell> cells_{};
    MazeListener listener_{};
};
