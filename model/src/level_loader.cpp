#include "../include/level_loader.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <utility>

ClaimOverlay::ClaimOverlay(const CharGrid& grid)
    : width_(grid.width), claimed_(grid.width * grid.height, false)
{
}

bool ClaimOverlay::anyClaimed(std::size_t x, std::size_t y, std::size_t w, std::size_t h) const
{
    for (std::size_t yy = 0; yy < h; ++yy) {
        for (std::size_t xx = 0; xx < w; ++xx) {
            if (isClaimed(x + xx, y + yy)) {
                return true;
            }
        }
    }
    return false;
}

void ClaimOverlay::claimBlock(std::size_t x, std::size_t y, std::size_t w, std::size_t h)
{
    for (std::size_t yy = 0; yy < h; ++yy) {
        for (std::size_t xx = 0; xx < w; ++xx) {
            claim(x + xx, y + yy);
        }
    }
}

bool operator== (const WarpPair& a, const WarpPair& b)
{
    return a.id == b.id && a.a == b.a && a.b == b.b;
}

std::optional<Coordinate> Level::warpExit(Coordinate from) const
{
    for (const auto& [id, warp] : warps) {
        if (warp.a == from) {
            return warp.b;
        }
        if (warp.b == from) {
            return warp.a;
        }
    }
    return std::nullopt;
}

std::size_t Level::dotsRemaining() const
{
    return board.count(CELL_DOT) + board.count(CELL_PELLET);
}

bool operator== (const Level& a, const Level& b)
{
    return a.board == b.board
        && a.ghost_spawn == b.ghost_spawn
        && a.pac_spawn == b.pac_spawn
        && a.warps == b.warps
        && a.positions == b.positions
        && a.lives == b.lives
        && a.points == b.points;
}

bool operator!= (const Level& a, const Level& b)
{
    return !(a == b);
}

namespace {

// Collapse every UTF-8 sequence above ASCII into one NON_ASCII_CELL so that
// each grid cell is one character of the file.
std::string toCells(const std::string& line)
{
    std::string cells;
    cells.reserve(line.size());

    std::size_t i = 0;
    while (i < line.size()) {
        const unsigned char lead = static_cast<unsigned char>(line[i]);
        if (lead < 0x80) {
            cells.push_back(static_cast<char>(lead));
            ++i;
            continue;
        }

        std::size_t length;
        unsigned long code_point;
        if (lead >= 0xC2 && lead <= 0xDF) {
            length = 2;
            code_point = lead & 0x1F;
        } else if (lead >= 0xE0 && lead <= 0xEF) {
            length = 3;
            code_point = lead & 0x0F;
        } else if (lead >= 0xF0 && lead <= 0xF4) {
            length = 4;
            code_point = lead & 0x07;
        } else {
            throw LevelError(ErrorKind::FileRead);
        }

        if (i + length > line.size()) {
            throw LevelError(ErrorKind::FileRead);
        }
        for (std::size_t k = 1; k < length; ++k) {
            const unsigned char next = static_cast<unsigned char>(line[i + k]);
            if ((next & 0xC0) != 0x80) {
                throw LevelError(ErrorKind::FileRead);
            }
            code_point = (code_point << 6) | (next & 0x3F);
        }

        // overlong forms, surrogates and values past U+10FFFF
        if ((length == 3 && code_point < 0x800)
            || (length == 4 && code_point < 0x10000)
            || (code_point >= 0xD800 && code_point <= 0xDFFF)
            || code_point > 0x10FFFF) {
            throw LevelError(ErrorKind::FileRead);
        }

        cells.push_back(NON_ASCII_CELL);
        i += length;
    }
    return cells;
}

}

CharGrid ingestGrid(const std::string& text)
{
    CharGrid grid;
    std::istringstream stream(text);
    std::string line;
    while (std::getline(stream, line)) {
        // tolerate CRLF files
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        grid.rows.push_back(toCells(line));
    }

    if (grid.rows.empty() || grid.rows[0].empty()) {
        throw LevelError(ErrorKind::LevelEmpty);
    }

    grid.width = grid.rows[0].size();
    for (const auto& row : grid.rows) {
        if (row.size() != grid.width) {
            throw LevelError(ErrorKind::LevelNotRectangular);
        }
    }
    grid.height = grid.rows.size();
    return grid;
}

namespace {

bool isGhostBlockAt(const CharGrid& grid, std::size_t x, std::size_t y)
{
    for (std::size_t yy = 0; yy < GHOST_BLOCK_H; ++yy) {
        for (std::size_t xx = 0; xx < GHOST_BLOCK_W; ++xx) {
            if (grid.at(x + xx, y + yy) != GHOST_MARKER) {
                return false;
            }
        }
    }
    return true;
}

// Any marker left unclaimed after its stage is not part of a valid token.
bool hasStrayMarker(const CharGrid& grid, const ClaimOverlay& claims, char marker)
{
    for (std::size_t y = 0; y < grid.height; ++y) {
        for (std::size_t x = 0; x < grid.width; ++x) {
            if (grid.at(x, y) == marker && !claims.isClaimed(x, y)) {
                return true;
            }
        }
    }
    return false;
}

}

Coordinate findGhostSpawn(const CharGrid& grid, ClaimOverlay& claims)
{
    std::optional<Coordinate> ghost_top_left;

    if (grid.width >= GHOST_BLOCK_W && grid.height >= GHOST_BLOCK_H) {
        for (std::size_t y = 0; y + GHOST_BLOCK_H <= grid.height; ++y) {
            for (std::size_t x = 0; x + GHOST_BLOCK_W <= grid.width; ++x) {
                // windows overlapping the accepted block are the same token
                if (claims.anyClaimed(x, y, GHOST_BLOCK_W, GHOST_BLOCK_H)) {
                    continue;
                }
                if (!isGhostBlockAt(grid, x, y)) {
                    continue;
                }
                if (ghost_top_left.has_value()) {
                    throw LevelError(ErrorKind::MultipleGhostSpawns);
                }
                ghost_top_left = Coordinate{x, y};
                claims.claimBlock(x, y, GHOST_BLOCK_W, GHOST_BLOCK_H);
            }
        }
    }

    if (hasStrayMarker(grid, claims, GHOST_MARKER)) {
        throw LevelError(ErrorKind::InvalidGhostSpawn);
    }
    if (!ghost_top_left.has_value()) {
        throw LevelError(ErrorKind::NoGhostSpawn);
    }

    // ghosts leave through the row above the center, fruit appears below it
    const Coordinate spawn = *ghost_top_left;
    if (spawn.y == 0 || spawn.y + GHOST_BLOCK_H >= grid.height) {
        throw LevelError(ErrorKind::InvalidGhostSpawnPeripheral);
    }
    const std::size_t above = spawn.y - 1;
    const std::size_t below = spawn.y + GHOST_BLOCK_H;
    for (std::size_t x = spawn.x + 3; x <= spawn.x + 4; ++x) {
        if (grid.at(x, above) != ' ' || grid.at(x, below) != ' ') {
            throw LevelError(ErrorKind::InvalidGhostSpawnPeripheral);
        }
    }

    return spawn;
}

Coordinate findPacSpawn(const CharGrid& grid, ClaimOverlay& claims)
{
    std::optional<Coordinate> pac_spawn;

    for (std::size_t y = 0; y < grid.height; ++y) {
        for (std::size_t x = 0; x + PAC_BLOCK_W <= grid.width; ++x) {
            if (claims.isClaimed(x, y) || claims.isClaimed(x + 1, y)) {
                continue;
            }
            if (grid.at(x, y) != PAC_MARKER || grid.at(x + 1, y) != PAC_MARKER) {
                continue;
            }
            if (pac_spawn.has_value()) {
                throw LevelError(ErrorKind::MultiplePacSpawns);
            }
            pac_spawn = Coordinate{x, y};
            claims.claimBlock(x, y, PAC_BLOCK_W, 1);
        }
    }

    if (hasStrayMarker(grid, claims, PAC_MARKER)) {
        throw LevelError(ErrorKind::InvalidPacSpawn);
    }
    if (!pac_spawn.has_value()) {
        throw LevelError(ErrorKind::NoPacSpawn);
    }
    return *pac_spawn;
}

std::map<int, WarpPair> collectWarps(const CharGrid& grid, ClaimOverlay& claims)
{
    // '0' is collected too so that it fails the start-at-1 rule below
    std::map<int, std::vector<Coordinate>> warp_coords;
    for (std::size_t y = 0; y < grid.height; ++y) {
        for (std::size_t x = 0; x < grid.width; ++x) {
            if (claims.isClaimed(x, y)) {
                continue;
            }
            const char c = grid.at(x, y);
            if (c >= '0' && c <= '9') {
                warp_coords[c - '0'].push_back({x, y});
                claims.claim(x, y);
            }
        }
    }

    std::map<int, WarpPair> warps;
    if (warp_coords.empty()) {
        return warps;
    }

    for (const auto& [id, coords] : warp_coords) {
        if (coords.size() != 2) {
            throw LevelError(ErrorKind::InvalidWarp);
        }
    }

    // keys are sorted, so ids must read 1, 2, 3, ...
    int expected = 1;
    for (const auto& [id, coords] : warp_coords) {
        if (id != expected) {
            throw LevelError(ErrorKind::InvalidWarp);
        }
        ++expected;
    }
    if (warp_coords.size() > MAX_WARPS) {
        throw LevelError(ErrorKind::InvalidWarp);
    }

    for (const auto& [id, coords] : warp_coords) {
        warps[id] = WarpPair{id, coords[0], coords[1]};
    }
    return warps;
}

Board encodeBoard(const CharGrid& grid, const ClaimOverlay& claims)
{
    std::vector<int> flat;
    flat.reserve(grid.width * grid.height);

    for (std::size_t y = 0; y < grid.height; ++y) {
        for (std::size_t x = 0; x < grid.width; ++x) {
            const char c = grid.at(x, y);
            const bool claimed = claims.isClaimed(x, y);
            int value;
            if (c == ' ') {
                value = CELL_EMPTY;
            } else if (c == WALL_MARKER) {
                value = CELL_WALL;
            } else if (c == DOT_MARKER) {
                value = CELL_DOT;
            } else if (c == PELLET_MARKER) {
                value = CELL_PELLET;
            } else if (c == PAC_MARKER && claimed) {
                // already stored as pac_spawn, Pac-Man starts on an empty tile
                value = CELL_EMPTY;
            } else if (c == GHOST_MARKER && claimed) {
                // the ghost box stays impassable terrain
                value = CELL_WALL;
            } else if (c >= '1' && c <= '9' && claimed) {
                value = warpCode(c - '0');
            } else {
                throw LevelError(ErrorKind::InvalidCharacters);
            }
            flat.push_back(value);
        }
    }

    return Board(grid.width, grid.height, std::move(flat));
}

Level LevelLoader::loadLevel(const std::string& level_path)
{
    std::error_code ec;
    if (std::filesystem::is_directory(level_path, ec)) {
        throw LevelError(ErrorKind::FileRead);
    }

    std::ifstream file(level_path, std::ios::binary);
    if (!file.is_open()) {
        throw LevelError(ErrorKind::FileRead);
    }

    std::ostringstream contents;
    contents << file.rdbuf();
    if (file.bad()) {
        throw LevelError(ErrorKind::FileRead);
    }
    file.close();

    return parseLevel(contents.str());
}

Level LevelLoader::parseLevel(const std::string& text)
{
    const CharGrid grid = ingestGrid(text);
    ClaimOverlay claims(grid);

    Level loaded_level;
    loaded_level.ghost_spawn = findGhostSpawn(grid, claims);
    loaded_level.pac_spawn = findPacSpawn(grid, claims);
    loaded_level.warps = collectWarps(grid, claims);
    loaded_level.board = encodeBoard(grid, claims);
    loaded_level.positions = derivePositions(loaded_level.ghost_spawn, loaded_level.pac_spawn);
    loaded_level.lives = START_LIVES;
    loaded_level.points = 0;

    return loaded_level;
}
