#include "../include/level_error.hpp"

const char* errorKindName(ErrorKind kind)
{
    switch (kind) {
        case ErrorKind::FileRead: return "FileRead";
        case ErrorKind::LevelEmpty: return "LevelEmpty";
        case ErrorKind::LevelNotRectangular: return "LevelNotRectangular";
        case ErrorKind::NoGhostSpawn: return "NoGhostSpawn";
        case ErrorKind::MultipleGhostSpawns: return "MultipleGhostSpawns";
        case ErrorKind::InvalidGhostSpawn: return "InvalidGhostSpawn";
        case ErrorKind::InvalidGhostSpawnPeripheral: return "InvalidGhostSpawnPeripheral";
        case ErrorKind::NoPacSpawn: return "NoPacSpawn";
        case ErrorKind::MultiplePacSpawns: return "MultiplePacSpawns";
        case ErrorKind::InvalidPacSpawn: return "InvalidPacSpawn";
        case ErrorKind::InvalidWarp: return "InvalidWarp";
        case ErrorKind::InvalidCharacters: return "InvalidCharacters";
        case ErrorKind::ConversionToArray: return "ConversionToArray";
    }
    return "Unknown";
}

const char* errorMessage(ErrorKind kind)
{
    switch (kind) {
        case ErrorKind::FileRead:
            return "Failed to read level file.";
        case ErrorKind::LevelEmpty:
            return "Level file empty or width 0. Ensure no empty lines.";
        case ErrorKind::LevelNotRectangular:
            return "Level not rectangular, rows or column counts are irregular.";
        case ErrorKind::NoGhostSpawn:
            return "Couldn't locate a Ghost spawn.";
        case ErrorKind::MultipleGhostSpawns:
            return "Found multiple Ghost spawns.";
        case ErrorKind::InvalidGhostSpawn:
            return "Stray @ found. @ must form a single 8-wide x 5-tall rectangle declaring the Ghost spawn.";
        case ErrorKind::InvalidGhostSpawnPeripheral:
            return "The two cells above and below the center of the Ghost spawn must be blank for ghost and fruit release.";
        case ErrorKind::NoPacSpawn:
            return "Couldn't locate a Pac-Man spawn.";
        case ErrorKind::MultiplePacSpawns:
            return "Found multiple Pac-Man spawns.";
        case ErrorKind::InvalidPacSpawn:
            return "Stray $ found. $ must be used as a single horizontal pair declaring the Pac-Man spawn.";
        case ErrorKind::InvalidWarp:
            return "Warp numbers must appear in pairs and use contiguous numbers starting at 1.";
        case ErrorKind::InvalidCharacters:
            return "Invalid characters found.";
        case ErrorKind::ConversionToArray:
            return "Internal error: cell count does not match board dimensions.";
    }
    return "Unknown level error.";
}

LevelError::LevelError(ErrorKind kind)
    : std::runtime_error(errorMessage(kind)), kind_(kind)
{
}
