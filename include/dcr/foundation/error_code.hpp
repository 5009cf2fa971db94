#pragma once

/// @file error_code.hpp
/// @brief Categorized error codes for the dungeon engine.

#include <cstdint>
#include <string_view>

namespace dcr::foundation {

/// Error codes categorized by subsystem using hex ranges.
///
/// Each subsystem occupies a 256-value range (0x100), making it possible
/// to determine the error source from the code value alone.
enum class ErrorCode : uint32_t {
    // General (0x0000 - 0x00FF)
    Success = 0x0000,
    Unknown = 0x0001,
    InvalidArgument = 0x0002,
    NotFound = 0x0003,
    AlreadyExists = 0x0004,

    // Encounter (0x0100 - 0x01FF)
    InvalidAction = 0x0100,        ///< Verb does not match the encounter slot.
    EncounterInProgress = 0x0101,  ///< Slot already occupied.

    // Combat (0x0200 - 0x02FF)
    CharacterDead = 0x0200,        ///< Distinguished: caller must reset.
    InsufficientGold = 0x0201,

    // Skill (0x0300 - 0x03FF)
    UnknownSkill = 0x0300,
    SkillNotLearned = 0x0301,
    InsufficientResources = 0x0302,
    SkillAlreadyLearned = 0x0303,
    SkillPrerequisiteNotMet = 0x0304,

    // Catalog (0x0400 - 0x04FF)
    ClassNotFound = 0x0400,
    CatalogLoadFailed = 0x0401,
    CatalogInvalid = 0x0402,

    // Item (0x0500 - 0x05FF)
    ItemNotFound = 0x0500,
    ItemNotUsable = 0x0501,

    // Config (0x0600 - 0x06FF)
    ConfigLoadFailed = 0x0600,
    ConfigKeyNotFound = 0x0601,
    ConfigTypeMismatch = 0x0602,

    // Logger (0x0800 - 0x08FF)
    LoggerError = 0x0800,
    LoggerNotInitialized = 0x0801,
    LoggerFlushFailed = 0x0802,
};

/// Return the subsystem name for a given error code.
constexpr std::string_view errorSubsystem(ErrorCode code) {
    auto value = static_cast<uint32_t>(code);
    auto category = value & 0xFF00;
    switch (category) {
        case 0x0000: return "General";
        case 0x0100: return "Encounter";
        case 0x0200: return "Combat";
        case 0x0300: return "Skill";
        case 0x0400: return "Catalog";
        case 0x0500: return "Item";
        case 0x0600: return "Config";
        case 0x0800: return "Logger";
        default: return "Unknown";
    }
}

} // namespace dcr::foundation
