#ifndef GAMEPLAY_HPP
#define GAMEPLAY_HPP

#include <array>
#include <cstddef>
#include <string>
#include <glm/glm.hpp>

#define START_LIVES 3
#define MAX_LIVES 3
#define EXTRA_LIFE_POINTS 10000

#define DOT_POINTS 10
#define PELLET_POINTS 50

/// @brief Tile position in a level
/// @details Column/row, zero-based (0 = leftmost / topmost, C-style array indexing).
struct Coordinate
{
    std::size_t x;    ///< Column
    std::size_t y;    ///< Row
};
bool operator== (const Coordinate& a, const Coordinate& b);
bool operator!= (const Coordinate& a, const Coordinate& b);

/// @brief The four ghosts, in release order
enum Ghost
{
    BLINKY,
    PINKY,
    INKY,
    CLYDE
};

/// @brief Initial positions of every entity
/// @details Sub-tile coordinates (x = column, y = row) so the game loop can
///          move entities smoothly between tiles.
struct EntityPositions
{
    glm::dvec2 pacman{0.0, 0.0};                ///< Centered on the two-cell Pac-Man spawn
    std::array<glm::dvec2, 4> ghosts{};         ///< Indexed by Ghost
};
bool operator== (const EntityPositions& a, const EntityPositions& b);

/// @brief Derive initial entity positions from the spawn anchors
/// @param ghost_spawn Top-left cell of the 8x5 ghost block
/// @param pac_spawn Left cell of the Pac-Man pair
/// @return Pac-Man on its pair, Blinky above the block, Pinky at its center,
///         Inky left of Pinky and Clyde right of Pinky
EntityPositions derivePositions(Coordinate ghost_spawn, Coordinate pac_spawn);

/// @brief Bonus fruit of a level
struct Fruit
{
    std::string name;
    int points;
};

/// @brief Dots eaten after which a fruit appears
constexpr std::array<int, 2> FRUIT_DOT_THRESHOLDS = {70, 170};

/// @brief Points for the n-th ghost eaten during one power pellet (n = 0..3)
/// @details 200, 400, 800, 1600. Later ghosts keep scoring 1600.
int ghostPoints(int eaten_before);

/// @brief Bonus fruit for a 1-based level number
/// @throws std::invalid_argument if level < 1
Fruit fruitForLevel(int level);

/// @brief Dots Pac-Man must eat before the ghost leaves the box
int ghostReleaseDots(Ghost ghost);

const char* ghostName(Ghost ghost);

#endif
