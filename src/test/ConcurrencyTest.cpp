#include <atomic>
#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <string>
#include <thread>
#include <vector>

#include "application/EventLoggingService.hpp"
#include "application/JoinBoth.hpp"
#include "infrastructure/PersistenceService.hpp"
#include "test/TestDoubles.hpp"

using namespace glucosetrail::domain;
using namespace glucosetrail::application;
using namespace glucosetrail::test;
using glucosetrail::infrastructure::InMemoryEventRepository;
using glucosetrail::infrastructure::ManualClock;
using glucosetrail::infrastructure::PersistenceService;

namespace {

const Timestamp kNow = At("2024-05-01T12:00:00Z");
const UserId kUser = UserId::create("user-1");

using Readings = std::vector<GlucoseReading>;

auto fetchFrom(FakeGlucoseSource& source) {
    return [&source](const CancellationToken& token) {
        return source.getReadingsInRange(kUser, kNow - 1h, kNow, token);
    };
}

void testBothSucceed() {
    FakeGlucoseSource first;
    first.readings = {Reading(kNow - 30min, 110)};
    FakeGlucoseSource second;
    second.readings = {Reading(kNow - 20min, 150), Reading(kNow - 10min, 160)};

    auto joined = JoinBoth<Readings, Readings>(CancellationToken{}, fetchFrom(first), fetchFrom(second));
    assert(joined.isSuccess());
    assert(joined.value().first.size() == 1);
    assert(joined.value().second.size() == 2);
    std::cout << "[PASS] Both fetches joined." << std::endl;
}

void testFailureCancelsSibling() {
    FakeGlucoseSource failing;
    failing.failure = Error{"Dexcom.NetworkError", "connection refused", ErrorKind::UpstreamFailure};
    FakeGlucoseSource blocking;
    blocking.waitForCancellation = true;

    auto joined = JoinBoth<Readings, Readings>(CancellationToken{}, fetchFrom(blocking), fetchFrom(failing));
    assert(joined.isFailure());
    assert(joined.error().code == "Dexcom.NetworkError");
    // The sibling observed cancellation and returned before the join did.
    assert(blocking.finished.load());
    assert(failing.finished.load());
    std::cout << "[PASS] First failure wins and the sibling is cancelled." << std::endl;
}

void testCallerCancellation() {
    CancellationSource caller;
    caller.cancel();
    FakeGlucoseSource source;
    auto early = JoinBoth<Readings, Readings>(caller.token(), fetchFrom(source), fetchFrom(source));
    assert(early.error().code == "Request.Cancelled");
    assert(source.calls.load() == 0);

    CancellationSource late;
    FakeGlucoseSource blocking;
    blocking.waitForCancellation = true;
    FakeGlucoseSource quick;
    std::thread canceller([&late] {
        std::this_thread::sleep_for(20ms);
        late.cancel();
    });
    auto joined = JoinBoth<Readings, Readings>(late.token(), fetchFrom(quick), fetchFrom(blocking));
    canceller.join();
    assert(joined.isFailure());
    assert(joined.error().code == "Request.Cancelled");
    assert(blocking.finished.load());
    std::cout << "[PASS] Caller cancellation yields Request.Cancelled." << std::endl;
}

void testConcurrentLogging() {
    auto repo = std::make_shared<InMemoryEventRepository>();
    auto audit = std::make_shared<FakeAuditLog>();
    auto clock = std::make_shared<ManualClock>(kNow);
    EventLoggingService service(repo, audit, clock);

    const int kThreads = 50;
    std::vector<std::thread> threads;
    std::atomic<int> succeeded{0};
    for (int i = 0; i < kThreads; ++i) {
        threads.emplace_back([&service, &succeeded, i]() {
            AddFoodCommand cmd;
            cmd.userId = "user-1";
            cmd.eventTime = kNow - std::chrono::minutes(i);
            cmd.carbohydrateGrams = i;
            cmd.mealTagId = 1;
            if (service.addFood(cmd).isSuccess()) ++succeeded;
        });
    }
    for (auto& t : threads) t.join();

    assert(succeeded.load() == kThreads);
    assert(repo->size() == static_cast<std::size_t>(kThreads));
    assert(audit->readAll().size() == static_cast<std::size_t>(kThreads));
    std::cout << "[PASS] " << kThreads << " concurrent commands all stored." << std::endl;
}

void testSerializedAppends() {
    namespace fs = std::filesystem;
    fs::path root = fs::temp_directory_path() / "glucosetrail_concurrency_test";
    fs::remove_all(root);
    std::string file = (root / "lines.ndjson").string();

    const int kThreads = 8;
    const int kPerThread = 25;
    {
        PersistenceService persistence;
        std::vector<std::thread> threads;
        for (int t = 0; t < kThreads; ++t) {
            threads.emplace_back([&persistence, &file, t]() {
                for (int i = 0; i < kPerThread; ++i) {
                    persistence.appendLineAsync(file, "{\"t\":" + std::to_string(t) + ",\"i\":" + std::to_string(i) + "}");
                }
            });
        }
        for (auto& t : threads) t.join();
        persistence.flush();
        assert(persistence.failedWrites() == 0);
    }

    std::ifstream in(file);
    std::string line;
    int count = 0;
    while (std::getline(in, line)) {
        assert(line.front() == '{' && line.back() == '}');
        ++count;
    }
    assert(count == kThreads * kPerThread);
    fs::remove_all(root);
    std::cout << "[PASS] Concurrent appends land as whole lines." << std::endl;
}

void testReplaceIsAtomic() {
    namespace fs = std::filesystem;
    fs::path root = fs::temp_directory_path() / "glucosetrail_replace_test";
    fs::remove_all(root);
    std::string file = (root / "nested" / "settings.json").string();

    {
        PersistenceService persistence;
        for (int i = 0; i < 20; ++i) {
            persistence.saveTextAsync(file, "{\"revision\":" + std::to_string(i) + "}");
        }
        persistence.flush();
        assert(persistence.failedWrites() == 0);
    }

    std::ifstream in(file);
    std::string content((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    assert(content == "{\"revision\":19}");

    int leftovers = 0;
    for (const auto& entry : fs::directory_iterator(root / "nested")) {
        if (entry.path().extension() == ".tmp") ++leftovers;
    }
    assert(leftovers == 0);
    fs::remove_all(root);
    std::cout << "[PASS] Replace writes land in order with no temp files left." << std::endl;
}

} // namespace

int main() {
    std::cout << "[Test] Starting Concurrency Test..." << std::endl;
    testBothSucceed();
    testFailureCancelsSibling();
    testCallerCancellation();
    testConcurrentLogging();
    testSerializedAppends();
    testReplaceIsAtomic();
    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
