#include <cassert>
#include <iostream>
#include <memory>

#include "application/ChartService.hpp"
#include "test/TestDoubles.hpp"

using namespace glucosetrail::domain;
using namespace glucosetrail::application;
using namespace glucosetrail::test;
using glucosetrail::infrastructure::ManualClock;

namespace {

const Timestamp kNow = At("2024-05-01T12:00:00Z");
const UserId kUser = UserId::create("user-1");

struct Fixture {
    std::shared_ptr<CountingEventRepository> repo = std::make_shared<CountingEventRepository>();
    std::shared_ptr<FakeGlucoseSource> glucose = std::make_shared<FakeGlucoseSource>();
    std::shared_ptr<ManualClock> clock = std::make_shared<ManualClock>(kNow);
    ChartService service{glucose, repo, clock};

    void addFood(Timestamp at, int grams) {
        repo->add(Event::createFood(kUser, at, Carbohydrate::create(grams).value(), MealTagId::create(1),
                                    AbsorptionHint::Normal, std::nullopt, SourceType::Manual, *clock,
                                    TestTrace()).value().event);
    }

    void addNote(Timestamp at, const std::string& text) {
        repo->add(Event::createNote(kUser, at, NoteText::create(text).value(), SourceType::Manual, *clock,
                                    TestTrace()).value().event);
    }
};

void testInvalidRangeTouchesNothing() {
    Fixture f;
    for (const char* selector : {"7", "0", "abc", "", "48"}) {
        auto chart = f.service.assembleChart(kUser, selector);
        assert(chart.isFailure());
        assert(chart.error().kind == ErrorKind::InvalidRange);
        assert(chart.error().code == "Chart.InvalidRange");

        auto tir = f.service.computeTimeInRange(kUser, selector);
        assert(tir.isFailure());
        assert(tir.error().kind == ErrorKind::InvalidRange);
    }
    assert(f.glucose->calls == 0);
    assert(f.repo->queries == 0);
    std::cout << "[PASS] Unsupported range fails before any fetch." << std::endl;
}

void testAssemblesSortedSeries() {
    Fixture f;
    f.glucose->readings = {
        Reading(kNow - 10min, 140, std::string("flat")),
        Reading(kNow - 2h, 95),
        Reading(kNow - 1h, 180, std::string("singleUp")),
        Reading(kNow - 4h, 60),  // outside a 3h window
    };
    f.addFood(kNow - 30min, 45);
    f.addNote(kNow - 150min, "Remember to change the sensor tomorrow morning");
    f.addFood(kNow - 5h, 20);  // outside a 3h window

    auto result = f.service.assembleChart(kUser, "3");
    assert(result.isSuccess());
    const auto& chart = result.value();

    assert(chart.endTime == kNow);
    assert(chart.startTime == kNow - 3h);
    assert(f.glucose->lastStart == kNow - 3h);
    assert(f.glucose->lastEnd == kNow);

    assert(chart.glucose.size() == 3);
    assert(chart.glucose[0].value == 95);
    assert(chart.glucose[1].value == 180);
    assert(chart.glucose[1].trend && *chart.glucose[1].trend == "singleUp");
    assert(chart.glucose[2].value == 140);

    assert(chart.overlays.size() == 2);
    assert(chart.overlays[0].eventType == EventType::Note);
    assert(chart.overlays[0].tooltip == "Remember to change the sens...");
    assert(chart.overlays[1].eventType == EventType::Food);
    assert(chart.overlays[1].tooltip == "45g carbs");
    assert(chart.overlays[1].timestamp == kNow - 30min);
    std::cout << "[PASS] Chart series sorted ascending with tooltips." << std::endl;
}

void testEmptyWindow() {
    Fixture f;
    auto result = f.service.assembleChart(kUser, "1");
    assert(result.isSuccess());
    assert(result.value().glucose.empty());
    assert(result.value().overlays.empty());
    std::cout << "[PASS] Empty window is an empty chart." << std::endl;
}

void testGlucoseFailureFailsChart() {
    Fixture f;
    f.addFood(kNow - 30min, 45);
    Error upstream{"Dexcom.Unauthorized", "Access token is invalid or expired.", ErrorKind::UpstreamFailure};
    f.glucose->failure = upstream;

    auto result = f.service.assembleChart(kUser, "24");
    assert(result.isFailure());
    assert(result.error() == upstream);
    std::cout << "[PASS] Glucose failure fails the whole chart." << std::endl;
}

void testEventStoreFailureFailsChart() {
    auto repo = std::make_shared<FailingEventRepository>();
    auto glucose = std::make_shared<FakeGlucoseSource>();
    glucose->readings = {Reading(kNow - 1h, 100)};
    ChartService service(glucose, repo, std::make_shared<ManualClock>(kNow));

    auto result = service.assembleChart(kUser, "5");
    assert(result.isFailure());
    assert(result.error().code == "EventStore.Error");
    assert(result.error().kind == ErrorKind::UpstreamFailure);
    std::cout << "[PASS] Event store failure fails the whole chart." << std::endl;
}

void testCancelledChart() {
    Fixture f;
    CancellationSource source;
    source.cancel();
    auto result = f.service.assembleChart(kUser, "3", source.token());
    assert(result.isFailure());
    assert(result.error().kind == ErrorKind::Cancelled);
    assert(f.glucose->calls == 0);
    std::cout << "[PASS] Cancelled chart request." << std::endl;
}

void testTimeInRange() {
    Fixture f;
    f.glucose->readings = {
        Reading(kNow - 1h, 60),
        Reading(kNow - 50min, 100),
        Reading(kNow - 40min, 150),
        Reading(kNow - 30min, 200),
    };

    auto result = f.service.computeTimeInRange(kUser, "24");
    assert(result.isSuccess());
    assert(result.value().totalReadings == 4);
    assert(result.value().inRangeCount == 2);
    assert(result.value().belowCount == 1);
    assert(result.value().aboveCount == 1);
    assert(result.value().percentage == 50.0);
    assert(result.value().targetLower == 70);
    assert(result.value().targetUpper == 180);
    assert(result.value().startTime == kNow - 24h);

    ChartService strict(f.glucose, f.repo, f.clock, TirRange::create(90, 140).value());
    auto custom = strict.computeTimeInRange(kUser, "24");
    assert(custom.value().inRangeCount == 1);
    assert(custom.value().percentage == 25.0);
    assert(custom.value().targetLower == 90);

    f.glucose->readings.clear();
    auto empty = f.service.computeTimeInRange(kUser, "1");
    assert(empty.isSuccess());
    assert(empty.value().totalReadings == 0);
    assert(empty.value().percentage == 0.0);
    std::cout << "[PASS] Time in range over the configured target." << std::endl;
}

} // namespace

int main() {
    std::cout << "[Test] Starting Chart Service Test..." << std::endl;
    testInvalidRangeTouchesNothing();
    testAssemblesSortedSeries();
    testEmptyWindow();
    testGlucoseFailureFailsChart();
    testEventStoreFailureFailsChart();
    testCancelledChart();
    testTimeInRange();
    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
