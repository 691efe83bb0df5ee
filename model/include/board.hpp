#ifndef BOARD_HPP
#define BOARD_HPP

#include <cstddef>
#include <vector>

#define CELL_EMPTY 0
#define CELL_WALL 1
#define CELL_DOT 2
#define CELL_PELLET 3

/// @brief Cell code of the endpoints of warp `id` (always negative)
inline int warpCode(int id) { return -id; }

/// @brief True if the code marks a warp-tunnel endpoint
inline bool isWarpCode(int code) { return code < 0; }

/// @brief Numeric tile layout of a level
/// @details Row-major grid of cell codes: 0 empty, 1 wall, 2 pac-dot,
///          3 power pellet, -id for an endpoint of warp tunnel `id`.
///          The game loop mutates it during play (dots cleared as eaten).
class Board
{
public:
    Board() = default;

    /// @brief Build a board from row-major cells
    /// @param width Number of columns
    /// @param height Number of rows
    /// @param cells Exactly width*height codes, row after row
    /// @throws LevelError(ConversionToArray) if the cell count does not match
    Board(std::size_t width, std::size_t height, std::vector<int> cells);

    std::size_t width() const { return width_; }
    std::size_t height() const { return height_; }

    bool inBounds(long x, long y) const;

    /// @brief Cell code at column x, row y
    /// @throws std::out_of_range outside the board
    int at(std::size_t x, std::size_t y) const;

    /// @brief Overwrite the cell at column x, row y (e.g. a dot was eaten)
    /// @throws std::out_of_range outside the board
    void set(std::size_t x, std::size_t y, int code);

    /// @brief False for walls and anything outside the board
    bool isWalkable(long x, long y) const;

    /// @brief Number of cells holding exactly `code`
    std::size_t count(int code) const;

    const std::vector<int>& cells() const { return cells_; }

private:
    std::size_t width_ = 0;
    std::size_t height_ = 0;
    std::vector<int> cells_;
};
bool operator== (const Board& a, const Board& b);
bool operator!= (const Board& a, const Board& b);

#endif
