#ifndef FIXTURES_HPP
#define FIXTURES_HPP

#include "../include/level_error.hpp"
#include "../include/level_loader.hpp"

#include <filesystem>
#include <fstream>
#include <optional>
#include <string>
#include <vector>

/// 12x9 level: ghost block at (1,2), Pac-Man pair at (7,7), no warps.
inline std::vector<std::string> fixtureRows()
{
    return {
        "############",
        "#          #",
        "#@@@@@@@@  #",
        "#@@@@@@@@  #",
        "#@@@@@@@@  #",
        "#@@@@@@@@  #",
        "#@@@@@@@@  #",
        "#      $$  #",
        "############"
    };
}

inline std::vector<std::string> withCell(std::vector<std::string> rows, std::size_t x, std::size_t y, char c)
{
    rows[y][x] = c;
    return rows;
}

inline std::string joinRows(const std::vector<std::string>& rows)
{
    std::string text;
    for (const auto& row : rows) {
        text += row;
        text += '\n';
    }
    return text;
}

/// Kind of the LevelError thrown while parsing, std::nullopt if parsing succeeded.
inline std::optional<ErrorKind> parseError(const std::string& text)
{
    try {
        LevelLoader::parseLevel(text);
    } catch (const LevelError& ex) {
        return ex.kind();
    }
    return std::nullopt;
}

inline std::optional<ErrorKind> parseError(const std::vector<std::string>& rows)
{
    return parseError(joinRows(rows));
}

inline std::filesystem::path writeTempFile(const std::string& name, const std::string& contents)
{
    std::filesystem::path path = std::filesystem::temp_directory_path() / ("paku_test_" + name);
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out << contents;
    return path;
}

#endif
