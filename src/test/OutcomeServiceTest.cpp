#include <cassert>
#include <iostream>
#include <memory>

#include "application/OutcomeService.hpp"
#include "domain/analytics/OutcomeMatcher.hpp"
#include "test/TestDoubles.hpp"

using namespace glucosetrail::domain;
using namespace glucosetrail::application;
using namespace glucosetrail::test;
using glucosetrail::infrastructure::InMemoryEventRepository;
using glucosetrail::infrastructure::ManualClock;

namespace {

const Timestamp kNow = At("2024-05-01T18:00:00Z");
const Timestamp kMeal = At("2024-05-01T12:00:00Z");
const Timestamp kTarget = kMeal + 2h;
const UserId kOwner = UserId::create("owner");

struct Fixture {
    std::shared_ptr<InMemoryEventRepository> repo = std::make_shared<InMemoryEventRepository>();
    std::shared_ptr<FakeGlucoseSource> glucose = std::make_shared<FakeGlucoseSource>();
    ManualClock clock{kNow};
    OutcomeService service{repo, glucose};

    std::string addFood() {
        auto created = Event::createFood(kOwner, kMeal, Carbohydrate::create(60).value(), MealTagId::create(1),
                                         AbsorptionHint::Normal, std::nullopt, SourceType::Manual, clock, TestTrace());
        repo->add(created.value().event);
        return created.value().event.getId();
    }

    std::string addNote() {
        auto created = Event::createNote(kOwner, kMeal, NoteText::create("felt dizzy").value(),
                                         SourceType::Manual, clock, TestTrace());
        repo->add(created.value().event);
        return created.value().event.getId();
    }
};

void testNearestReading() {
    Fixture f;
    std::string id = f.addFood();
    f.glucose->readings = {
        Reading(kTarget - 10min, 110),
        Reading(kTarget - 1min, 120),
        Reading(kTarget + 5min, 115),
    };

    auto result = f.service.computeOutcome(id, kOwner);
    assert(result.isSuccess());
    const auto& outcome = result.value();
    assert(outcome.eventId == id);
    assert(outcome.targetTime == kTarget);
    assert(outcome.glucoseValue && *outcome.glucoseValue == 120);
    assert(outcome.readingTime == kTarget - 1min);
    assert(!outcome.isApproximate);
    assert(outcome.message == "Outcome recorded");

    assert(f.glucose->calls == 1);
    assert(f.glucose->lastStart == kTarget - 15min);
    assert(f.glucose->lastEnd == kTarget + 15min);
    std::cout << "[PASS] Nearest reading wins." << std::endl;
}

void testNoReadingIsNotAnError() {
    Fixture f;
    std::string id = f.addFood();

    auto result = f.service.computeOutcome(id, kOwner);
    assert(result.isSuccess());
    assert(result.value().isApproximate);
    assert(!result.value().glucoseValue);
    assert(result.value().readingTime == kTarget);
    assert(result.value().message == "No reading available");
    std::cout << "[PASS] Empty window yields an approximate result." << std::endl;
}

void testErrors() {
    Fixture f;
    std::string food = f.addFood();
    std::string note = f.addNote();

    auto missing = f.service.computeOutcome("does-not-exist", kOwner);
    assert(missing.isFailure());
    assert(missing.error().kind == ErrorKind::NotFound);
    assert(missing.error().code == "Event.NotFound");

    auto forbidden = f.service.computeOutcome(food, UserId::create("intruder"));
    assert(forbidden.error().kind == ErrorKind::Forbidden);
    assert(forbidden.error().code == "Authorization.Forbidden");

    auto wrongType = f.service.computeOutcome(note, kOwner);
    assert(wrongType.error().kind == ErrorKind::InvalidType);
    assert(wrongType.error().code == "Event.InvalidType");

    assert(f.glucose->calls == 0);

    Error upstream{"Dexcom.RateLimited", "Rate limit exceeded. Retry after 60 seconds.", ErrorKind::UpstreamFailure};
    f.glucose->failure = upstream;
    auto failed = f.service.computeOutcome(food, kOwner);
    assert(failed.isFailure());
    assert(failed.error() == upstream);
    std::cout << "[PASS] NotFound, Forbidden, InvalidType and upstream errors." << std::endl;
}

void testCancelledBeforeStart() {
    Fixture f;
    std::string id = f.addFood();
    CancellationSource source;
    source.cancel();

    auto result = f.service.computeOutcome(id, kOwner, source.token());
    assert(result.isFailure());
    assert(result.error().kind == ErrorKind::Cancelled);
    assert(f.glucose->calls == 0);
    std::cout << "[PASS] Cancelled request touches no source." << std::endl;
}

void testMatcherWindowEdges() {
    OutcomeMatcher matcher;
    OutcomeWindow window = matcher.windowFor(kMeal);
    assert(window.target == kTarget);
    assert(window.start == kTarget - 15min);
    assert(window.end == kTarget + 15min);

    // Ties go to the earlier reading.
    auto tie = matcher.selectNearest({Reading(kTarget + 3min, 150), Reading(kTarget - 3min, 140)}, window);
    assert(tie && tie->valueMgDl == 140);

    // Both edges are inside the window; anything beyond is ignored.
    auto edge = matcher.selectNearest({Reading(kTarget + 15min, 99)}, window);
    assert(edge && edge->valueMgDl == 99);
    auto outside = matcher.selectNearest({Reading(kTarget - 16min, 90), Reading(kTarget + 15min + 1s, 91)}, window);
    assert(!outside);

    assert(!matcher.selectNearest({}, window));
    std::cout << "[PASS] Matcher tolerance window and tie-break." << std::endl;
}

void testReadingsOutsideWindowIgnored() {
    Fixture f;
    std::string id = f.addFood();
    f.glucose->ignoreWindow = true;
    f.glucose->readings = {Reading(kTarget - 40min, 200), Reading(kTarget + 14min, 133)};

    auto result = f.service.computeOutcome(id, kOwner);
    assert(result.isSuccess());
    assert(*result.value().glucoseValue == 133);
    std::cout << "[PASS] Out-of-window readings from the source are ignored." << std::endl;
}

} // namespace

int main() {
    std::cout << "[Test] Starting Outcome Service Test..." << std::endl;
    testNearestReading();
    testNoReadingIsNotAnError();
    testErrors();
    testCancelledBeforeStart();
    testMatcherWindowEdges();
    testReadingsOutsideWindowIgnored();
    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
