#ifndef LEVEL_JSON_HPP
#define LEVEL_JSON_HPP

#include "level_loader.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

/// @brief Serialize a parsed level
/// @details Layout:
///          { "width", "height", "board": [[row codes]...],
///            "ghost_spawn": [x, y], "pac_spawn": [x, y],
///            "warps": { "1": [[x, y], [x, y]], ... },
///            "positions": { "pacman": [x, y], "blinky": [x, y], ... },
///            "lives", "points" }
json levelToJson(const Level& level);

#endif
