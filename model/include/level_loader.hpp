#ifndef LEVEL_LOADER_HPP
#define LEVEL_LOADER_HPP

#define GHOST_BLOCK_W 8
#define GHOST_BLOCK_H 5
#define PAC_BLOCK_W 2
#define MAX_WARPS 9

#define GHOST_MARKER '@'
#define PAC_MARKER '$'
#define WALL_MARKER '#'
#define DOT_MARKER '-'
#define PELLET_MARKER '!'

// stands for any character outside ASCII; never valid in a level
#define NON_ASCII_CELL '\x80'

#include "board.hpp"
#include "gameplay.hpp"
#include "level_error.hpp"

#include <map>
#include <optional>
#include <string>
#include <vector>

/// @brief Raw characters of a level file, rows then columns
/// @details Rectangular: every row has exactly `width` characters. One cell
///          per character, so a multi-byte UTF-8 character is stored as a
///          single NON_ASCII_CELL.
struct CharGrid
{
    std::size_t width = 0;
    std::size_t height = 0;
    std::vector<std::string> rows;

    char at(std::size_t x, std::size_t y) const { return rows[y][x]; }
};

/// @brief Cells already interpreted by an earlier parsing stage
/// @details Same dimensions as the grid. Stages that recognise multi-cell
///          tokens mark them here so later stages never read them twice.
class ClaimOverlay
{
public:
    explicit ClaimOverlay(const CharGrid& grid);

    bool isClaimed(std::size_t x, std::size_t y) const { return claimed_[y * width_ + x]; }
    void claim(std::size_t x, std::size_t y) { claimed_[y * width_ + x] = true; }

    /// @brief True if any cell of the w x h window at (x, y) is claimed
    bool anyClaimed(std::size_t x, std::size_t y, std::size_t w, std::size_t h) const;
    void claimBlock(std::size_t x, std::size_t y, std::size_t w, std::size_t h);

private:
    std::size_t width_;
    std::vector<bool> claimed_;
};

/// @brief Both endpoints of one warp tunnel
struct WarpPair
{
    int id;           ///< 1..9
    Coordinate a;     ///< First endpoint in row-major order
    Coordinate b;     ///< Second endpoint in row-major order
};
bool operator== (const WarpPair& a, const WarpPair& b);

/// @brief A validated level, ready for the game loop
/// @details Created once by LevelLoader. The board is the live board: the
///          game loop clears dots and pellets from it as they are eaten.
struct Level
{
    Board board;                      ///< Numeric tile layout
    Coordinate ghost_spawn{0, 0};     ///< Top-left cell of the 8x5 ghost block
    Coordinate pac_spawn{0, 0};       ///< Left cell of the 2x1 Pac-Man pair
    std::map<int, WarpPair> warps;    ///< Warp id -> endpoints, ids 1..n
    EntityPositions positions;        ///< Initial Pac-Man and ghost positions
    int lives = START_LIVES;
    int points = 0;

    /// @brief Endpoint reached by entering the warp at `from`
    /// @return The other endpoint, or std::nullopt if `from` is not a warp cell
    std::optional<Coordinate> warpExit(Coordinate from) const;

    /// @brief Pac-dots and power pellets still on the board
    std::size_t dotsRemaining() const;
};
bool operator== (const Level& a, const Level& b);
bool operator!= (const Level& a, const Level& b);

/// @brief Split level text into a rectangular character grid
/// @details Widths are counted in characters, not bytes.
/// @throws LevelError(FileRead) if the text is not valid UTF-8
/// @throws LevelError(LevelEmpty) for no rows or an empty first row
/// @throws LevelError(LevelNotRectangular) if row lengths differ
CharGrid ingestGrid(const std::string& text);

/// @brief Locate the single 8x5 ghost block and claim it
/// @details Brute-force scan of every top-left candidate, O(width*height*40).
///          The two cells above and below the block center must be blank.
/// @throws LevelError(MultipleGhostSpawns, InvalidGhostSpawn, NoGhostSpawn,
///         InvalidGhostSpawnPeripheral)
Coordinate findGhostSpawn(const CharGrid& grid, ClaimOverlay& claims);

/// @brief Locate the single horizontal Pac-Man pair and claim it
/// @throws LevelError(MultiplePacSpawns, InvalidPacSpawn, NoPacSpawn)
Coordinate findPacSpawn(const CharGrid& grid, ClaimOverlay& claims);

/// @brief Group and validate warp digits, claiming every digit cell
/// @return Empty map if the level has no warps
/// @throws LevelError(InvalidWarp)
std::map<int, WarpPair> collectWarps(const CharGrid& grid, ClaimOverlay& claims);

/// @brief Map every character to its cell code
/// @throws LevelError(InvalidCharacters) on an unknown character
Board encodeBoard(const CharGrid& grid, const ClaimOverlay& claims);

/// @brief Utility class for loading Pac-Man levels from text files
/// @details Runs ingestion, ghost spawn, Pac-Man spawn, warps, encoding and
///          entity placement in that order and stops at the first failure.
///          Holds no state, so independent parses may run on any thread.
class LevelLoader{
public:
    /// @brief Load a level from a text file
    /// @param level_path Path to the level file (e.g., "path/to/0.lvl")
    /// @return Level structure containing the parsed level data
    /// @throws LevelError(FileRead) if the file cannot be read, or any
    ///         structural error found by parseLevel
    static Level loadLevel(const std::string& level_path);

    /// @brief Parse level text already held in memory
    /// @throws LevelError describing the first violation found
    static Level parseLevel(const std::string& text);

    LevelLoader() = delete;
    LevelLoader(const LevelLoader&) = delete;
    LevelLoader& operator=(const LevelLoader&) = delete;
};

#endif
