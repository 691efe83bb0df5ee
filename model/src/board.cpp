#include "../include/board.hpp"
#include "../include/level_error.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>
#include <string>

Board::Board(std::size_t width, std::size_t height, std::vector<int> cells)
    : width_(width), height_(height), cells_(std::move(cells))
{
    if (cells_.size() != width_ * height_) {
        throw LevelError(ErrorKind::ConversionToArray);
    }
}

bool Board::inBounds(long x, long y) const
{
    return x >= 0 && y >= 0
        && static_cast<std::size_t>(x) < width_
        && static_cast<std::size_t>(y) < height_;
}

int Board::at(std::size_t x, std::size_t y) const
{
    if (x >= width_ || y >= height_) {
        throw std::out_of_range("Board cell out of range: (" + std::to_string(x) + ", " + std::to_string(y) + ")");
    }
    return cells_[y * width_ + x];
}

void Board::set(std::size_t x, std::size_t y, int code)
{
    if (x >= width_ || y >= height_) {
        throw std::out_of_range("Board cell out of range: (" + std::to_string(x) + ", " + std::to_string(y) + ")");
    }
    cells_[y * width_ + x] = code;
}

bool Board::isWalkable(long x, long y) const
{
    if (!inBounds(x, y)) {
        return false;
    }
    return cells_[static_cast<std::size_t>(y) * width_ + static_cast<std::size_t>(x)] != CELL_WALL;
}

std::size_t Board::count(int code) const
{
    return static_cast<std::size_t>(std::count(cells_.begin(), cells_.end(), code));
}

bool operator== (const Board& a, const Board& b)
{
    return a.width() == b.width() && a.height() == b.height() && a.cells() == b.cells();
}

bool operator!= (const Board& a, const Board& b)
{
    return !(a == b);
}
