#include <cassert>
#include <iostream>
#include <memory>

#include "application/EventHistoryService.hpp"
#include "test/TestDoubles.hpp"

using namespace glucosetrail::domain;
using namespace glucosetrail::application;
using namespace glucosetrail::test;
using glucosetrail::infrastructure::InMemoryEventRepository;
using glucosetrail::infrastructure::ManualClock;

namespace {

const Timestamp kNow = At("2024-05-31T12:00:00Z");
const UserId kUser = UserId::create("user-1");
const UserId kOther = UserId::create("user-2");

struct Fixture {
    std::shared_ptr<InMemoryEventRepository> repo = std::make_shared<InMemoryEventRepository>();
    std::shared_ptr<ManualClock> clock = std::make_shared<ManualClock>(kNow);
    EventHistoryService service{repo, clock};

    std::string addFood(const UserId& user, Timestamp at, int grams) {
        auto created = Event::createFood(user, at, Carbohydrate::create(grams).value(), MealTagId::create(1),
                                         AbsorptionHint::Normal, std::nullopt, SourceType::Manual, *clock, TestTrace());
        repo->add(created.value().event);
        return created.value().event.getId();
    }

    std::string addExercise(Timestamp at, int minutes) {
        auto created = Event::createExercise(kUser, at, ExerciseTypeId::create(1), ExerciseDuration::create(minutes).value(),
                                             IntensityType::Moderate, std::nullopt, SourceType::Manual, *clock, TestTrace());
        repo->add(created.value().event);
        return created.value().event.getId();
    }
};

void testDefaultWindowAndOrder() {
    Fixture f;
    f.addFood(kUser, kNow - 31 * 24h, 10);       // before the default window
    f.addFood(kUser, kNow - 29 * 24h, 20);
    f.addExercise(kNow - 2h, 40);
    f.addFood(kUser, kNow - 1h, 30);
    f.addFood(kOther, kNow - 1h, 99);            // someone else's

    auto result = f.service.listEvents(kUser, ListEventsQuery{});
    assert(result.isSuccess());
    const auto& page = result.value();
    assert(page.totalCount == 3);
    assert(page.items.size() == 3);
    assert(page.items[0].summary == "30g carbs");
    assert(page.items[1].summary == "40min");
    assert(page.items[2].summary == "20g carbs");
    assert(page.items[0].eventTime > page.items[1].eventTime);
    assert(page.totalPages() == 1);
    assert(!page.hasNextPage());
    assert(!page.hasPreviousPage());
    std::cout << "[PASS] Default 30-day window, newest first." << std::endl;
}

void testPagingAndTypeFilter() {
    Fixture f;
    for (int i = 0; i < 5; ++i) f.addFood(kUser, kNow - std::chrono::hours(i + 1), 10 + i);
    for (int i = 0; i < 3; ++i) f.addExercise(kNow - std::chrono::minutes(30 + i), 20 + i);

    ListEventsQuery query;
    query.eventType = EventType::Food;
    query.pageSize = 2;
    query.page = 2;

    auto result = f.service.listEvents(kUser, query);
    assert(result.isSuccess());
    const auto& page = result.value();
    assert(page.totalCount == 5);
    assert(page.totalPages() == 3);
    assert(page.items.size() == 2);
    assert(page.items[0].summary == "12g carbs");
    assert(page.items[1].summary == "13g carbs");
    assert(page.hasPreviousPage());
    assert(page.hasNextPage());

    query.page = 3;
    auto last = f.service.listEvents(kUser, query);
    assert(last.value().items.size() == 1);
    assert(!last.value().hasNextPage());

    query.page = 4;
    auto beyond = f.service.listEvents(kUser, query);
    assert(beyond.isSuccess());
    assert(beyond.value().items.empty());
    assert(beyond.value().totalCount == 5);
    std::cout << "[PASS] Paging with a type filter on page and count." << std::endl;
}

void testExplicitBounds() {
    Fixture f;
    f.addFood(kUser, At("2024-05-10T08:00:00Z"), 10);
    f.addFood(kUser, At("2024-05-11T08:00:00Z"), 20);
    f.addFood(kUser, At("2024-05-12T08:00:00Z"), 30);

    ListEventsQuery query;
    query.fromDate = At("2024-05-10T08:00:00Z");
    query.toDate = At("2024-05-11T08:00:00Z");
    auto result = f.service.listEvents(kUser, query);
    assert(result.value().totalCount == 2);

    ListEventsQuery onlyTo;
    onlyTo.toDate = At("2024-05-11T08:00:00Z");
    assert(f.service.listEvents(kUser, onlyTo).value().totalCount == 2);
    std::cout << "[PASS] Inclusive explicit bounds." << std::endl;
}

void testValidation() {
    Fixture f;
    ListEventsQuery query;
    query.page = 0;
    assert(f.service.listEvents(kUser, query).error().code == "Events.InvalidPaging");

    query.page = 1;
    query.pageSize = 0;
    assert(f.service.listEvents(kUser, query).error().code == "Events.InvalidPaging");
    query.pageSize = 101;
    assert(f.service.listEvents(kUser, query).error().code == "Events.InvalidPaging");
    query.pageSize = 100;
    assert(f.service.listEvents(kUser, query).isSuccess());

    query.fromDate = kNow;
    query.toDate = kNow - 1s;
    auto reversed = f.service.listEvents(kUser, query);
    assert(reversed.error().code == "Events.InvalidDateRange");
    assert(reversed.error().kind == ErrorKind::InvalidInput);
    std::cout << "[PASS] Paging and date range validation." << std::endl;
}

void testStoreFailure() {
    auto repo = std::make_shared<FailingEventRepository>();
    EventHistoryService service(repo, std::make_shared<ManualClock>(kNow));
    auto result = service.listEvents(kUser, ListEventsQuery{});
    assert(result.isFailure());
    assert(result.error().code == "EventStore.Error");
    std::cout << "[PASS] Store failure surfaces as EventStore.Error." << std::endl;
}

void testGetEvent() {
    Fixture f;
    std::string id = f.addFood(kUser, kNow - 1h, 55);

    auto found = f.service.getEvent(id, kUser);
    assert(found.isSuccess());
    assert(found.value().getId() == id);
    assert(found.value().detailsAs<FoodDetails>()->carbohydrates.grams() == 55);

    assert(f.service.getEvent(id, kOther).error().kind == ErrorKind::Forbidden);
    assert(f.service.getEvent("missing", kUser).error().kind == ErrorKind::NotFound);
    std::cout << "[PASS] getEvent ownership rules." << std::endl;
}

} // namespace

int main() {
    std::cout << "[Test] Starting Event History Service Test..." << std::endl;
    testDefaultWindowAndOrder();
    testPagingAndTypeFilter();
    testExplicitBounds();
    testValidation();
    testStoreFailure();
    testGetEvent();
    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
