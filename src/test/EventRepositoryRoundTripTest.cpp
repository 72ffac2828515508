#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>

#include "application/EventLoggingService.hpp"
#include "domain/common/TimeFormat.hpp"
#include "infrastructure/AuditLogFs.hpp"
#include "infrastructure/EventRepositoryFs.hpp"
#include "infrastructure/PersistenceService.hpp"
#include "test/TestDoubles.hpp"

using namespace glucosetrail::domain;
using namespace glucosetrail::application;
using namespace glucosetrail::infrastructure;
using namespace glucosetrail::test;

namespace fs = std::filesystem;

namespace {

const Timestamp kNow = At("2024-05-01T12:00:00Z");
const UserId kUser = UserId::create("user-1");

struct Ids {
    std::string food;
    std::string insulin;
    std::string exercise;
    std::string note;
};

Ids logOneOfEach(EventLoggingService& service) {
    Ids ids;

    AddFoodCommand food;
    food.userId = kUser.value();
    food.eventTime = kNow - 3h;
    food.carbohydrateGrams = 60;
    food.mealTagId = 3;
    food.absorptionHint = AbsorptionHint::Rapid;
    food.note = "Pizza night";
    ids.food = service.addFood(food).value();

    AddInsulinCommand insulin;
    insulin.userId = kUser.value();
    insulin.eventTime = kNow - 2h;
    insulin.insulinType = InsulinType::Fast;
    insulin.insulinUnits = "6.5";
    insulin.preparation = "Humalog";
    insulin.timing = "before meal";
    ids.insulin = service.addInsulin(insulin).value();

    AddExerciseCommand exercise;
    exercise.userId = kUser.value();
    exercise.eventTime = kNow - 1h;
    exercise.exerciseTypeId = 2;
    exercise.durationMinutes = 45;
    exercise.intensity = IntensityType::Vigorous;
    ids.exercise = service.addExercise(exercise).value();

    AddNoteCommand note;
    note.userId = kUser.value();
    note.eventTime = kNow - 30min;
    note.text = "Sensor replaced";
    ids.note = service.addNote(note).value();

    return ids;
}

void testReloadFromDisk(const fs::path& root) {
    auto persistence = std::make_shared<PersistenceService>();
    auto clock = std::make_shared<ManualClock>(kNow);
    Ids ids;
    {
        auto repo = std::make_shared<EventRepositoryFs>(root.string(), persistence);
        auto audit = std::make_shared<AuditLogFs>(root.string(), persistence);
        EventLoggingService service(repo, audit, clock);
        ids = logOneOfEach(service);
        persistence->flush();
    }

    EventRepositoryFs reloaded(root.string(), persistence);
    assert(reloaded.skippedLines() == 0);
    auto all = reloaded.getByUserId(kUser, std::nullopt, std::nullopt, std::nullopt, {});
    assert(all.size() == 4);
    assert(all[0].getId() == ids.note);
    assert(all[3].getId() == ids.food);

    auto food = reloaded.getById(ids.food, {});
    assert(food && food->getType() == EventType::Food);
    assert(food->getEventTime() == kNow - 3h);
    assert(food->getCreatedAt() == kNow);
    assert(food->getSource() == SourceType::Manual);
    assert(food->getNote() && food->getNote()->text() == "Pizza night");
    const auto* foodDetails = food->detailsAs<FoodDetails>();
    assert(foodDetails->carbohydrates.grams() == 60);
    assert(foodDetails->mealTag.value() == 3);
    assert(foodDetails->absorptionHint == AbsorptionHint::Rapid);

    auto insulin = reloaded.getById(ids.insulin, {});
    const auto* insulinDetails = insulin->detailsAs<InsulinDetails>();
    assert(insulinDetails->dose.formatUnits() == "6.5");
    assert(insulinDetails->preparation == std::optional<std::string>("Humalog"));
    assert(!insulinDetails->delivery);
    assert(insulinDetails->timing == std::optional<std::string>("before meal"));
    assert(!insulin->getNote());

    auto exercise = reloaded.getById(ids.exercise, {});
    const auto* exerciseDetails = exercise->detailsAs<ExerciseDetails>();
    assert(exerciseDetails->exerciseType.value() == 2);
    assert(exerciseDetails->duration.minutes() == 45);
    assert(exerciseDetails->intensity == IntensityType::Vigorous);

    auto note = reloaded.getById(ids.note, {});
    assert(note->detailsAs<NoteDetails>()->text.text() == "Sensor replaced");
    std::cout << "[PASS] All four event kinds reload with their fields." << std::endl;

    AuditLogFs auditLog(root.string(), persistence);
    auto records = auditLog.readAll();
    assert(records.size() == 4);
    assert(AuditRecordEventId(records[0]) == ids.food);
    const auto& insulinRecord = std::get<InsulinEventCreated>(records[1]);
    assert(insulinRecord.doseUnits == 6.5);
    assert(insulinRecord.causationId == insulinRecord.correlationId);
    assert(std::string(AuditRecordType(records[3])) == "NoteEventCreated");
    std::cout << "[PASS] Audit log reads back in append order." << std::endl;
}

void testMalformedLineSkipped(const fs::path& root) {
    auto persistence = std::make_shared<PersistenceService>();
    fs::path file = root / "events" / "user-1.ndjson";
    {
        std::ofstream out(file, std::ios::app);
        out << "{not json" << "\n";
        out << "{\"id\":\"x\",\"eventType\":\"Teleport\"}" << "\n";
    }

    EventRepositoryFs reloaded(root.string(), persistence);
    assert(reloaded.skippedLines() == 2);
    assert(reloaded.countByUserId(kUser, kNow - 24h, kNow, std::nullopt, {}) == 4);
    std::cout << "[PASS] Malformed lines are skipped on load." << std::endl;
}

void testDuplicateIdRejected(const fs::path& root) {
    auto persistence = std::make_shared<PersistenceService>();
    EventRepositoryFs repo(root.string(), persistence);
    auto existing = repo.getByUserId(kUser, EventType::Note, std::nullopt, std::nullopt, {});
    assert(existing.size() == 1);

    bool threw = false;
    try {
        repo.add(existing[0]);
    } catch (const std::runtime_error&) {
        threw = true;
    }
    assert(threw);
    std::cout << "[PASS] Duplicate ids are rejected." << std::endl;
}

void testWallClockTimesReloadExactly(const fs::path& root) {
    auto persistence = std::make_shared<PersistenceService>();
    auto clock = std::make_shared<SystemClock>();
    Timestamp stamped = clock->now();
    assert(FromEpochMillis(ToEpochMillis(stamped)) == stamped);

    auto repo = std::make_shared<EventRepositoryFs>(root.string(), persistence);
    auto audit = std::make_shared<AuditLogFs>(root.string(), persistence);
    EventLoggingService service(repo, audit, clock);

    AddNoteCommand note;
    note.userId = kUser.value();
    note.eventTime = clock->now();
    note.text = "Now";
    std::string id = service.addNote(note).value();
    persistence->flush();

    auto original = repo->getById(id, {});
    EventRepositoryFs reloaded(root.string(), persistence);
    auto restored = reloaded.getById(id, {});
    assert(original && restored);
    assert(restored->getCreatedAt() == original->getCreatedAt());
    assert(restored->getEventTime() == original->getEventTime());
    std::cout << "[PASS] Wall-clock timestamps survive a reload unchanged." << std::endl;
}

} // namespace

int main() {
    std::cout << "[Test] Starting Event Repository Round-Trip Test..." << std::endl;

    fs::path root = fs::temp_directory_path() / "glucosetrail_roundtrip_test";
    fs::remove_all(root);
    fs::create_directories(root);

    testReloadFromDisk(root);
    testMalformedLineSkipped(root);
    testDuplicateIdRejected(root);

    fs::path wallClockRoot = root / "wall_clock";
    fs::create_directories(wallClockRoot);
    testWallClockTimesReloadExactly(wallClockRoot);

    fs::remove_all(root);
    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
