/**
 * @file EventJson.cpp
 * @brief Implementation of the event and audit record JSON mapping.
 */

#include "infrastructure/EventJson.hpp"

#include <stdexcept>
#include <type_traits>

#include "domain/common/TimeFormat.hpp"

namespace glucosetrail::infrastructure {

using json = nlohmann::json;
using namespace glucosetrail::domain;

namespace {

template <typename>
inline constexpr bool kAlwaysFalse = false;

json optionalString(const std::optional<std::string>& value) {
    return value ? json(*value) : json(nullptr);
}

std::optional<std::string> readOptionalString(const json& j, const char* key) {
    if (!j.contains(key) || j[key].is_null()) return std::nullopt;
    return j[key].get<std::string>();
}

Timestamp readTime(const json& j, const char* key) {
    return FromEpochMillis(j.at(key).get<std::int64_t>());
}

template <typename E>
E readEnum(const json& j, const char* key, std::optional<E> (*parse)(const std::string&)) {
    std::string raw = j.at(key).get<std::string>();
    auto value = parse(raw);
    if (!value) {
        throw std::runtime_error(std::string("Unknown value for ") + key + ": " + raw);
    }
    return *value;
}

template <typename T>
T unwrap(Result<T> result) {
    if (result.isFailure()) {
        throw std::runtime_error(result.error().code + ": " + result.error().message);
    }
    return std::move(result).value();
}

json detailsToJson(const EventDetails& details) {
    return std::visit([](const auto& d) -> json {
        using T = std::decay_t<decltype(d)>;
        if constexpr (std::is_same_v<T, FoodDetails>) {
            return {
                {"carbohydrateGrams", d.carbohydrates.grams()},
                {"mealTagId", d.mealTag.value()},
                {"absorptionHint", AbsorptionHintToString(d.absorptionHint)}
            };
        } else if constexpr (std::is_same_v<T, InsulinDetails>) {
            return {
                {"insulinType", InsulinTypeToString(d.insulinType)},
                {"insulinUnits", d.dose.formatUnits()},
                {"preparation", optionalString(d.preparation)},
                {"delivery", optionalString(d.delivery)},
                {"timing", optionalString(d.timing)}
            };
        } else if constexpr (std::is_same_v<T, ExerciseDetails>) {
            return {
                {"exerciseTypeId", d.exerciseType.value()},
                {"durationMinutes", d.duration.minutes()},
                {"intensity", IntensityTypeToString(d.intensity)}
            };
        } else if constexpr (std::is_same_v<T, NoteDetails>) {
            return {{"text", d.text.text()}};
        } else {
            static_assert(kAlwaysFalse<T>, "unhandled event variant");
        }
    }, details);
}

EventDetails detailsFromJson(EventType type, const json& d) {
    switch (type) {
        case EventType::Food:
            return FoodDetails{
                unwrap(Carbohydrate::create(d.at("carbohydrateGrams").get<int>())),
                MealTagId::create(d.at("mealTagId").get<int>()),
                readEnum<AbsorptionHint>(d, "absorptionHint", &AbsorptionHintFromString)};
        case EventType::Insulin:
            return InsulinDetails{
                readEnum<InsulinType>(d, "insulinType", &InsulinTypeFromString),
                unwrap(InsulinDose::parse(d.at("insulinUnits").get<std::string>())),
                readOptionalString(d, "preparation"),
                readOptionalString(d, "delivery"),
                readOptionalString(d, "timing")};
        case EventType::Exercise:
            return ExerciseDetails{
                ExerciseTypeId::create(d.at("exerciseTypeId").get<int>()),
                unwrap(ExerciseDuration::create(d.at("durationMinutes").get<int>())),
                readEnum<IntensityType>(d, "intensity", &IntensityTypeFromString)};
        case EventType::Note:
            return NoteDetails{unwrap(NoteText::create(d.at("text").get<std::string>()))};
    }
    throw std::runtime_error("Unknown event type");
}

// Fields every audit record carries.
template <typename R>
json auditEnvelope(const R& r) {
    return {
        {"recordId", r.recordId},
        {"correlationId", r.correlationId},
        {"causationId", r.causationId},
        {"eventId", r.eventId},
        {"userId", r.userId},
        {"eventTime", ToEpochMillis(r.eventTime)}
    };
}

template <typename R>
void readEnvelope(R& r, const json& data, const json& root) {
    r.recordId = data.at("recordId").get<std::string>();
    r.correlationId = data.at("correlationId").get<std::string>();
    r.causationId = data.at("causationId").get<std::string>();
    r.eventId = data.at("eventId").get<std::string>();
    r.userId = data.at("userId").get<std::string>();
    r.eventTime = readTime(data, "eventTime");
    r.occurredAt = readTime(root, "ts");
}

} // namespace

json EventToJson(const Event& event) {
    std::optional<std::string> note;
    if (event.getNote()) note = event.getNote()->text();

    return {
        {"id", event.getId()},
        {"userId", event.getUserId().value()},
        {"eventType", EventTypeToString(event.getType())},
        {"eventTime", ToEpochMillis(event.getEventTime())},
        {"createdAt", ToEpochMillis(event.getCreatedAt())},
        {"source", SourceTypeToString(event.getSource())},
        {"note", optionalString(note)},
        {"details", detailsToJson(event.getDetails())}
    };
}

Event EventFromJson(const json& j) {
    try {
        EventType type = readEnum<EventType>(j, "eventType", &EventTypeFromString);
        std::optional<NoteText> note;
        if (auto raw = readOptionalString(j, "note")) {
            note = unwrap(NoteText::create(*raw));
        }
        return Event::rehydrate(j.at("id").get<std::string>(),
                                UserId::create(j.at("userId").get<std::string>()),
                                readTime(j, "eventTime"),
                                readTime(j, "createdAt"),
                                readEnum<SourceType>(j, "source", &SourceTypeFromString),
                                std::move(note),
                                detailsFromJson(type, j.at("details")));
    } catch (const json::exception& e) {
        throw std::runtime_error(std::string("Malformed event document: ") + e.what());
    } catch (const std::invalid_argument& e) {
        throw std::runtime_error(std::string("Malformed event document: ") + e.what());
    }
}

json AuditRecordToJson(const EventAuditRecord& record) {
    return std::visit([](const auto& r) -> json {
        using T = std::decay_t<decltype(r)>;
        json data = auditEnvelope(r);
        if constexpr (std::is_same_v<T, FoodEventCreated>) {
            data["carbohydrateGrams"] = r.carbohydrateGrams;
            data["mealTagId"] = r.mealTagId;
            data["absorptionHint"] = AbsorptionHintToString(r.absorptionHint);
            data["note"] = optionalString(r.note);
        } else if constexpr (std::is_same_v<T, InsulinEventCreated>) {
            data["insulinType"] = InsulinTypeToString(r.insulinType);
            data["doseUnits"] = r.doseUnits;
            data["preparation"] = optionalString(r.preparation);
            data["delivery"] = optionalString(r.delivery);
            data["timing"] = optionalString(r.timing);
            data["note"] = optionalString(r.note);
        } else if constexpr (std::is_same_v<T, ExerciseEventCreated>) {
            data["exerciseTypeId"] = r.exerciseTypeId;
            data["durationMinutes"] = r.durationMinutes;
            data["intensity"] = IntensityTypeToString(r.intensity);
            data["note"] = optionalString(r.note);
        } else if constexpr (std::is_same_v<T, NoteEventCreated>) {
            data["text"] = r.text;
        } else {
            static_assert(kAlwaysFalse<T>, "unhandled audit record");
        }
        return {{"type", T::Type}, {"data", data}, {"ts", ToEpochMillis(r.occurredAt)}};
    }, record);
}

EventAuditRecord AuditRecordFromJson(const json& j) {
    try {
        std::string type = j.at("type").get<std::string>();
        const json& data = j.at("data");

        if (type == FoodEventCreated::Type) {
            FoodEventCreated r;
            readEnvelope(r, data, j);
            r.carbohydrateGrams = data.at("carbohydrateGrams").get<int>();
            r.mealTagId = data.at("mealTagId").get<int>();
            r.absorptionHint = readEnum<AbsorptionHint>(data, "absorptionHint", &AbsorptionHintFromString);
            r.note = readOptionalString(data, "note");
            return r;
        }
        if (type == InsulinEventCreated::Type) {
            InsulinEventCreated r;
            readEnvelope(r, data, j);
            r.insulinType = readEnum<InsulinType>(data, "insulinType", &InsulinTypeFromString);
            r.doseUnits = data.at("doseUnits").get<double>();
            r.preparation = readOptionalString(data, "preparation");
            r.delivery = readOptionalString(data, "delivery");
            r.timing = readOptionalString(data, "timing");
            r.note = readOptionalString(data, "note");
            return r;
        }
        if (type == ExerciseEventCreated::Type) {
            ExerciseEventCreated r;
            readEnvelope(r, data, j);
            r.exerciseTypeId = data.at("exerciseTypeId").get<int>();
            r.durationMinutes = data.at("durationMinutes").get<int>();
            r.intensity = readEnum<IntensityType>(data, "intensity", &IntensityTypeFromString);
            r.note = readOptionalString(data, "note");
            return r;
        }
        if (type == NoteEventCreated::Type) {
            NoteEventCreated r;
            readEnvelope(r, data, j);
            r.text = data.at("text").get<std::string>();
            return r;
        }
        throw std::runtime_error("Unknown audit record type: " + type);
    } catch (const json::exception& e) {
        throw std::runtime_error(std::string("Malformed audit record: ") + e.what());
    }
}

} // namespace glucosetrail::infrastructure
