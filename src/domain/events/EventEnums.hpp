/**
 * @file EventEnums.hpp
 * @brief Enumerations describing logged events, with string conversions for storage and display.
 */

#pragma once

#include <optional>
#include <string>

namespace glucosetrail::domain {

enum class EventType {
    Food = 1,
    Insulin = 2,
    Exercise = 3,
    Note = 4
};

/// Where an event came from.
enum class SourceType {
    Manual = 1,
    Imported = 2,
    System = 3
};

enum class AbsorptionHint {
    Rapid = 1,
    Normal = 2,
    Slow = 3,
    Other = 4
};

enum class InsulinType {
    Fast = 1,
    Long = 2
};

enum class IntensityType {
    Light = 1,
    Moderate = 2,
    Vigorous = 3
};

inline std::string EventTypeToString(EventType type) {
    switch (type) {
        case EventType::Food: return "Food";
        case EventType::Insulin: return "Insulin";
        case EventType::Exercise: return "Exercise";
        case EventType::Note: return "Note";
        default: return "Unknown";
    }
}

inline std::optional<EventType> EventTypeFromString(const std::string& value) {
    if (value == "Food") return EventType::Food;
    if (value == "Insulin") return EventType::Insulin;
    if (value == "Exercise") return EventType::Exercise;
    if (value == "Note") return EventType::Note;
    return std::nullopt;
}

inline std::string SourceTypeToString(SourceType source) {
    switch (source) {
        case SourceType::Manual: return "Manual";
        case SourceType::Imported: return "Imported";
        case SourceType::System: return "System";
        default: return "Unknown";
    }
}

inline std::optional<SourceType> SourceTypeFromString(const std::string& value) {
    if (value == "Manual") return SourceType::Manual;
    if (value == "Imported") return SourceType::Imported;
    if (value == "System") return SourceType::System;
    return std::nullopt;
}

inline std::string AbsorptionHintToString(AbsorptionHint hint) {
    switch (hint) {
        case AbsorptionHint::Rapid: return "Rapid";
        case AbsorptionHint::Normal: return "Normal";
        case AbsorptionHint::Slow: return "Slow";
        case AbsorptionHint::Other: return "Other";
        default: return "Unknown";
    }
}

inline std::optional<AbsorptionHint> AbsorptionHintFromString(const std::string& value) {
    if (value == "Rapid") return AbsorptionHint::Rapid;
    if (value == "Normal") return AbsorptionHint::Normal;
    if (value == "Slow") return AbsorptionHint::Slow;
    if (value == "Other") return AbsorptionHint::Other;
    return std::nullopt;
}

inline std::string InsulinTypeToString(InsulinType type) {
    switch (type) {
        case InsulinType::Fast: return "Fast";
        case InsulinType::Long: return "Long";
        default: return "Unknown";
    }
}

inline std::optional<InsulinType> InsulinTypeFromString(const std::string& value) {
    if (value == "Fast") return InsulinType::Fast;
    if (value == "Long") return InsulinType::Long;
    return std::nullopt;
}

inline std::string IntensityTypeToString(IntensityType intensity) {
    switch (intensity) {
        case IntensityType::Light: return "Light";
        case IntensityType::Moderate: return "Moderate";
        case IntensityType::Vigorous: return "Vigorous";
        default: return "Unknown";
    }
}

inline std::optional<IntensityType> IntensityTypeFromString(const std::string& value) {
    if (value == "Light") return IntensityType::Light;
    if (value == "Moderate") return IntensityType::Moderate;
    if (value == "Vigorous") return IntensityType::Vigorous;
    return std::nullopt;
}

} // namespace glucosetrail::domain
