#include "../include/gameplay.hpp"

#include <stdexcept>

bool operator== (const Coordinate& a, const Coordinate& b)
{
    return a.x == b.x && a.y == b.y;
}

bool operator!= (const Coordinate& a, const Coordinate& b)
{
    return !(a == b);
}

bool operator== (const EntityPositions& a, const EntityPositions& b)
{
    return a.pacman == b.pacman && a.ghosts == b.ghosts;
}

EntityPositions derivePositions(Coordinate ghost_spawn, Coordinate pac_spawn)
{
    const glm::dvec2 ghost_origin(static_cast<double>(ghost_spawn.x), static_cast<double>(ghost_spawn.y));
    const glm::dvec2 pac_origin(static_cast<double>(pac_spawn.x), static_cast<double>(pac_spawn.y));

    EntityPositions positions;
    positions.pacman = pac_origin + glm::dvec2(0.5, 0.0);
    positions.ghosts[BLINKY] = ghost_origin + glm::dvec2(3.5, -1.0);  // above the box
    positions.ghosts[PINKY] = ghost_origin + glm::dvec2(3.5, 2.0);    // box center
    positions.ghosts[INKY] = ghost_origin + glm::dvec2(1.5, 2.0);     // left of Pinky
    positions.ghosts[CLYDE] = ghost_origin + glm::dvec2(5.5, 2.0);    // right of Pinky
    return positions;
}

int ghostPoints(int eaten_before)
{
    if (eaten_before < 0) {
        eaten_before = 0;
    }
    if (eaten_before > 3) {
        eaten_before = 3;
    }
    return 200 << eaten_before;
}

Fruit fruitForLevel(int level)
{
    if (level < 1) {
        throw std::invalid_argument("Invalid level number: " + std::to_string(level));
    }

    if (level == 1) return {"Cherry", 100};
    if (level == 2) return {"Strawberry", 300};
    if (level <= 4) return {"Orange", 500};
    if (level <= 6) return {"Apple", 700};
    if (level <= 8) return {"Melon", 1000};
    if (level <= 10) return {"Galaxian", 2000};
    if (level <= 12) return {"Bell", 3000};
    return {"Key", 5000};
}

int ghostReleaseDots(Ghost ghost)
{
    // one dot apart so the ghosts leave the box a tile apart
    switch (ghost) {
        case BLINKY: return 0;
        case PINKY: return 1;
        case INKY: return 2;
        case CLYDE: return 3;
    }
    return 0;
}

const char* ghostName(Ghost ghost)
{
    switch (ghost) {
        case BLINKY: return "blinky";
        case PINKY: return "pinky";
        case INKY: return "inky";
        case CLYDE: return "clyde";
    }
    return "ghost";
}
