#include "core/Grid.hpp"

static size_t wallSlot(Direction d) { return static_cast<size_t>(d); }

Grid::Grid(int32_t width, int32_t height)
{
    if (width < 1 || height < 1)
    {
        throw MazeError(MazeErrorKind::InvalidDimension,
                        "grid must be at least 1x1, got " + std::to_string(width) + "x" + std::to_string(height));
    }

    const uint64_t count = static_cast<uint64_t>(width) * static_cast<uint64_t>(height);
    if (count > kMaxCellCount)
    {
        throw MazeError(MazeErrorKind::InvalidDimension,
                        "grid " + std::to_string(width) + "x" + std::to_string(height) + " has too many cells");
    }

    width_ = width;
    height_ = height;
    cells_.assign(static_cast<size_t>(width) * static_cast<size_t>(height), Cell{});
}

uint32_t Grid::indexOf(int32_t x, int32_t y) const
{
    if (!inBounds(x, y))
        throw std::out_of_range("cell (" + std::to_string(x) + "," + std::to_string(y) + ") outside grid");
    return static_cast<uint32_t>(y) * static_cast<uint32_t>(width_) + static_cast<uint32_t>(x);
}

Point Grid::pointOf(uint32_t index) const
{
    if (index >= cellCount())
        throw std::out_of_range("cell index " + std::to_string(index) + " outside grid");
    const uint32_t W = static_cast<uint32_t>(width_);
    return { static_cast<int32_t>(index % W), static_cast<int32_t>(index / W) };
}

std::optional<uint32_t> Grid::neighborIndex(uint32_t index, Direction dir, int32_t width, int32_t height)
{
    if (width < 1 || height < 1) return std::nullopt;

    const uint32_t W = static_cast<uint32_t>(width);
    const uint32_t H = static_cast<uint32_t>(height);
    const uint64_t count = static_cast<uint64_t>(W) * H;
    if (count > kMaxCellCount || index >= count) return std::nullopt;

    const uint32_t x = index % W;
    const uint32_t y = index / W;

    switch (dir)
    {
    case Direction::Right:
        if (x + 1 >= W) return std::nullopt;
        return index + 1;
    case Direction::Left:
        if (x == 0) return std::nullopt;
        return index - 1;
    case Direction::Top:
        if (y + 1 >= H) return std::nullopt;
        return index + W;
    case Direction::Bottom:
        if (y == 0) return std::nullopt;
        return index - W;
    }
    return std::nullopt;
}

void Grid::checkNeighbor_(uint32_t a, uint32_t b, Direction dir) const
{
    const auto n = neighborIndex(a, dir);
    if (!n || *n != b)
    {
        throw std::invalid_argument("cell " + std::to_string(b) + " is not the " + ToString(dir) +
                                    " neighbor of cell " + std::to_string(a));
    }
}

void Grid::notifyWall_(uint32_t index, Direction dir) const
{
    if (listener_.onWallRemoved)
        listener_.onWallRemoved(pointOf(index), dir);
}

void Grid::removeWallPair(uint32_t a, uint32_t b, Direction dir)
{
    checkNeighbor_(a, b, dir);

    const Direction back = Opposite(dir);
    mutableCell(a).walls[wallSlot(dir)] = false;
    mutableCell(b).walls[wallSlot(back)] = false;

    // both sides are already consistent before anyone is told
    notifyWall_(a, dir);
    notifyWall_(b, back);
}

void Grid::restoreWallPair(uint32_t a, uint32_t b, Direction dir)
{
    checkNeighbor_(a, b, dir);

    mutableCell(a).walls[wallSlot(dir)] = true;
    mutableCell(b).walls[wallSlot(Opposite(dir))] = true;
}

void Grid::removeBoundaryWall(uint32_t index, Direction dir)
{
    if (index >= cellCount())
        throw std::out_of_range("cell index " + std::to_string(index) + " outside grid");
    if (neighborIndex(index, dir))
        throw std::invalid_argument(std::string(ToString(dir)) + " wall of cell " + std::to_string(index) +
                                    " is not on the grid boundary");

    mutableCell(index).walls[wallSlot(dir)] = false;
    notifyWall_(index, dir);
}

bool Grid::hasPassage(uint32_t a, uint32_t b) const
{
    for (Direction dir : kDirections)
    {
        const auto n = neighborIndex(a, dir);
        if (n && *n == b)
            return !hasWall(a, dir) && !hasWall(b, Opposite(dir));
    }
    return false;
}

uint32_t Grid::openPassageCount() const
{
    // count each pair once, looking only right and up
    uint32_t open = 0;
    for (uint32_t i = 0; i < cellCount(); ++i)
    {
        for (Direction dir : { Direction::Right, Direction::Top })
        {
            const auto n = neighborIndex(i, dir);
            if (n && hasPassage(i, *n)) ++open;
        }
    }
    return open;
}

void Grid::setState(uint32_t index, CellState s)
{
    mutableCell(index).state = s;
    if (listener_.onCellState)
        listener_.onCellState(pointOf(index), s);
}

void Grid::setParent(uint32_t index, uint32_t parentIndex)
{
    if (parentIndex >= cellCount())
        throw std::out_of_range("parent index " + std::to_string(parentIndex) + " outside grid");
    mutableCell(index).parent = parentIndex;
}

void Grid::clearParents()
{
    for (auto& c : cells_)
        c.parent.reset();
}
