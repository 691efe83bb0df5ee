#ifndef LEVEL_ERROR_HPP
#define LEVEL_ERROR_HPP

#include <stdexcept>
#include <string>

/// @brief Every way a level file can be rejected
/// @details Kinds are listed in detection order. A file with several defects
///          always reports the earliest stage that fails.
enum class ErrorKind
{
    FileRead,
    LevelEmpty,
    LevelNotRectangular,

    NoGhostSpawn,
    MultipleGhostSpawns,
    InvalidGhostSpawn,
    InvalidGhostSpawnPeripheral,

    NoPacSpawn,
    MultiplePacSpawns,
    InvalidPacSpawn,

    InvalidWarp,
    InvalidCharacters,
    ConversionToArray
};

/// @brief Short identifier of an error kind, e.g. "NoPacSpawn"
const char* errorKindName(ErrorKind kind);

/// @brief User-facing explanation of an error kind
const char* errorMessage(ErrorKind kind);

/// @brief Exception thrown by the level parser
/// @details what() returns the message of the kind. No partial level is ever
///          returned alongside it.
class LevelError : public std::runtime_error
{
public:
    explicit LevelError(ErrorKind kind);

    /// @brief Error kind that caused the parse to stop
    ErrorKind kind() const noexcept { return kind_; }

private:
    ErrorKind kind_;
};

#endif
