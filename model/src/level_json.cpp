#include "../include/level_json.hpp"

#include <string>

namespace {

json coordToJson(const Coordinate& c)
{
    return json::array({c.x, c.y});
}

json positionToJson(const glm::dvec2& p)
{
    return json::array({p.x, p.y});
}

}

json levelToJson(const Level& level)
{
    json j;
    j["width"] = level.board.width();
    j["height"] = level.board.height();

    json board = json::array();
    for (std::size_t y = 0; y < level.board.height(); ++y) {
        json row = json::array();
        for (std::size_t x = 0; x < level.board.width(); ++x) {
            row.push_back(level.board.at(x, y));
        }
        board.push_back(row);
    }
    j["board"] = board;

    j["ghost_spawn"] = coordToJson(level.ghost_spawn);
    j["pac_spawn"] = coordToJson(level.pac_spawn);

    json warps = json::object();
    for (const auto& [id, warp] : level.warps) {
        warps[std::to_string(id)] = json::array({coordToJson(warp.a), coordToJson(warp.b)});
    }
    j["warps"] = warps;

    json positions = json::object();
    positions["pacman"] = positionToJson(level.positions.pacman);
    for (int g = BLINKY; g <= CLYDE; ++g) {
        positions[ghostName(static_cast<Ghost>(g))] = positionToJson(level.positions.ghosts[g]);
    }
    j["positions"] = positions;

    j["lives"] = level.lives;
    j["points"] = level.points;
    return j;
}
