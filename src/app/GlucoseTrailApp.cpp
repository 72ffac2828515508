/**
 * @file GlucoseTrailApp.cpp
 * @brief Implementation of the GlucoseTrailApp class.
 */

#include "app/GlucoseTrailApp.hpp"

#include <filesystem>
#include <iostream>
#include <optional>
#include <stdexcept>

#include <nlohmann/json.hpp>

#include "app/JsonOutput.hpp"
#include "domain/common/TimeFormat.hpp"
#include "infrastructure/AuditLogFs.hpp"
#include "infrastructure/Clocks.hpp"
#include "infrastructure/DexcomGlucoseSource.hpp"
#include "infrastructure/EventJson.hpp"
#include "infrastructure/EventRepositoryFs.hpp"

namespace glucosetrail::app {

namespace fs = std::filesystem;
using json = nlohmann::json;
using namespace glucosetrail::domain;
using namespace glucosetrail::application;

namespace {

/// Thrown for malformed command-line input; reported with exit code 2.
class UsageError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

std::optional<std::string> optionalArg(const std::map<std::string, std::string>& options, const std::string& key) {
    auto it = options.find(key);
    if (it == options.end()) return std::nullopt;
    return it->second;
}

std::string requiredArg(const std::map<std::string, std::string>& options, const std::string& key) {
    auto value = optionalArg(options, key);
    if (!value) throw UsageError("Missing --" + key);
    return *value;
}

int parseInt(const std::string& key, const std::string& value) {
    try {
        std::size_t consumed = 0;
        int parsed = std::stoi(value, &consumed);
        if (consumed != value.size()) throw std::invalid_argument(value);
        return parsed;
    } catch (const std::logic_error&) {
        throw UsageError("--" + key + " expects an integer, got '" + value + "'");
    }
}

Timestamp parseTime(const std::string& key, const std::string& value) {
    auto parsed = ParseIso8601(value);
    if (!parsed) throw UsageError("--" + key + " expects an ISO-8601 time, got '" + value + "'");
    return *parsed;
}

template <typename E>
E parseEnum(const std::string& key, const std::string& value, std::optional<E> (*parse)(const std::string&)) {
    auto parsed = parse(value);
    if (!parsed) throw UsageError("Unknown value for --" + key + ": '" + value + "'");
    return *parsed;
}

int printResult(const json& j) {
    std::cout << j.dump(2) << std::endl;
    return 0;
}

template <typename T>
int printOutcome(const Result<T>& result) {
    if (result.isFailure()) {
        std::cout << ToJson(result.error()).dump(2) << std::endl;
        return 1;
    }
    return printResult(ToJson(result.value()));
}

int printCreated(const Result<std::string>& result) {
    if (result.isFailure()) {
        std::cout << ToJson(result.error()).dump(2) << std::endl;
        return 1;
    }
    return printResult({{"eventId", result.value()}});
}

CommandTrace traceFrom(const std::map<std::string, std::string>& options) {
    return CommandTrace{optionalArg(options, "correlation-id"), optionalArg(options, "causation-id")};
}

} // namespace

int GlucoseTrailApp::Run(int argc, char** argv) {
    std::string projectRoot = ".";
    std::string command;
    Options options;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg.rfind("--", 0) == 0) {
            if (i + 1 >= argc) {
                std::cerr << "[GlucoseTrail] Missing value for " << arg << std::endl;
                return 2;
            }
            std::string key = arg.substr(2);
            std::string value = argv[++i];
            if (key == "root") projectRoot = value;
            else if (key == "user") m_userId = value;
            else options[key] = value;
        } else if (command.empty()) {
            command = arg;
        } else {
            std::cerr << "[GlucoseTrail] Unexpected argument: " << arg << std::endl;
            return 2;
        }
    }

    if (command.empty() || command == "help") {
        PrintUsage();
        return command.empty() ? 2 : 0;
    }
    if (command == "init") {
        return CmdInit(projectRoot);
    }

    if (!Init(projectRoot)) {
        return 1;
    }

    int exitCode = 0;
    try {
        exitCode = Dispatch(command, options);
    } catch (const UsageError& e) {
        std::cerr << "[GlucoseTrail] " << e.what() << std::endl;
        exitCode = 2;
    }
    Shutdown();
    return exitCode;
}

bool GlucoseTrailApp::Init(const std::string& projectRoot) {
    m_config = infrastructure::ConfigLoader::Load(projectRoot);

    fs::path dataDir = fs::path(m_config.dataDir);
    if (dataDir.is_relative()) {
        dataDir = fs::path(projectRoot) / dataDir;
    }

    try {
        m_clock = std::make_shared<infrastructure::SystemClock>();
        m_services.persistenceService = std::make_shared<infrastructure::PersistenceService>();

        auto events = std::make_shared<infrastructure::EventRepositoryFs>(dataDir.string(), m_services.persistenceService);
        auto glucose = std::make_shared<infrastructure::DexcomGlucoseSource>(m_config.dexcom);
        m_auditLog = std::make_shared<infrastructure::AuditLogFs>(dataDir.string(), m_services.persistenceService);

        m_services.loggingService = std::make_unique<EventLoggingService>(events, m_auditLog, m_clock);
        m_services.historyService = std::make_unique<EventHistoryService>(events, m_clock);
        m_services.outcomeService = std::make_unique<OutcomeService>(events, glucose);
        m_services.chartService = std::make_unique<ChartService>(glucose, events, m_clock, m_config.tirRange);
    } catch (const std::exception& e) {
        std::cerr << "[GlucoseTrail] Initialization failed: " << e.what() << std::endl;
        return false;
    }
    return true;
}

void GlucoseTrailApp::Shutdown() {
    if (m_services.persistenceService) {
        m_services.persistenceService->stop();
        if (m_services.persistenceService->failedWrites() > 0) {
            std::cerr << "[GlucoseTrail] " << m_services.persistenceService->failedWrites()
                      << " write(s) failed." << std::endl;
        }
    }
}

int GlucoseTrailApp::Dispatch(const std::string& command, const Options& options) {
    if (command == "audit") return CmdAudit();

    if (m_userId.empty()) {
        throw UsageError("--user is required for '" + command + "'");
    }

    if (command == "add-food") return CmdAddFood(options);
    if (command == "add-insulin") return CmdAddInsulin(options);
    if (command == "add-exercise") return CmdAddExercise(options);
    if (command == "add-note") return CmdAddNote(options);
    if (command == "list") return CmdList(options);
    if (command == "show") return CmdShow(options);
    if (command == "outcome") return CmdOutcome(options);
    if (command == "chart") return CmdChart(options);
    if (command == "tir") return CmdTir(options);

    throw UsageError("Unknown command: " + command);
}

int GlucoseTrailApp::CmdInit(const std::string& projectRoot) {
    std::error_code ec;
    fs::create_directories(projectRoot, ec);
    if (ec) {
        std::cerr << "[GlucoseTrail] Cannot create " << projectRoot << ": " << ec.message() << std::endl;
        return 1;
    }
    auto config = infrastructure::ConfigLoader::Load(projectRoot);
    infrastructure::PersistenceService persistence;
    infrastructure::ConfigLoader::Save(projectRoot, config, persistence);
    persistence.stop();
    if (persistence.failedWrites() > 0) {
        std::cerr << "[GlucoseTrail] Could not write settings.json in " << projectRoot << std::endl;
        return 1;
    }
    return printResult(infrastructure::ConfigLoader::ToJson(config));
}

int GlucoseTrailApp::CmdAddFood(const Options& options) {
    AddFoodCommand cmd;
    cmd.userId = m_userId;
    auto time = optionalArg(options, "time");
    cmd.eventTime = time ? parseTime("time", *time) : m_clock->now();
    cmd.carbohydrateGrams = parseInt("carbs", requiredArg(options, "carbs"));
    cmd.mealTagId = parseInt("meal-tag", requiredArg(options, "meal-tag"));
    if (auto hint = optionalArg(options, "absorption")) {
        cmd.absorptionHint = parseEnum<AbsorptionHint>("absorption", *hint, &AbsorptionHintFromString);
    }
    cmd.note = optionalArg(options, "note");
    cmd.trace = traceFrom(options);
    return printCreated(m_services.loggingService->addFood(cmd));
}

int GlucoseTrailApp::CmdAddInsulin(const Options& options) {
    AddInsulinCommand cmd;
    cmd.userId = m_userId;
    auto time = optionalArg(options, "time");
    cmd.eventTime = time ? parseTime("time", *time) : m_clock->now();
    cmd.insulinType = parseEnum<InsulinType>("type", requiredArg(options, "type"), &InsulinTypeFromString);
    cmd.insulinUnits = requiredArg(options, "units");
    cmd.preparation = optionalArg(options, "preparation");
    cmd.delivery = optionalArg(options, "delivery");
    cmd.timing = optionalArg(options, "timing");
    cmd.note = optionalArg(options, "note");
    cmd.trace = traceFrom(options);
    return printCreated(m_services.loggingService->addInsulin(cmd));
}

int GlucoseTrailApp::CmdAddExercise(const Options& options) {
    AddExerciseCommand cmd;
    cmd.userId = m_userId;
    auto time = optionalArg(options, "time");
    cmd.eventTime = time ? parseTime("time", *time) : m_clock->now();
    cmd.exerciseTypeId = parseInt("exercise-type", requiredArg(options, "exercise-type"));
    cmd.durationMinutes = parseInt("minutes", requiredArg(options, "minutes"));
    if (auto intensity = optionalArg(options, "intensity")) {
        cmd.intensity = parseEnum<IntensityType>("intensity", *intensity, &IntensityTypeFromString);
    }
    cmd.note = optionalArg(options, "note");
    cmd.trace = traceFrom(options);
    return printCreated(m_services.loggingService->addExercise(cmd));
}

int GlucoseTrailApp::CmdAddNote(const Options& options) {
    AddNoteCommand cmd;
    cmd.userId = m_userId;
    auto time = optionalArg(options, "time");
    cmd.eventTime = time ? parseTime("time", *time) : m_clock->now();
    cmd.text = requiredArg(options, "text");
    cmd.trace = traceFrom(options);
    return printCreated(m_services.loggingService->addNote(cmd));
}

int GlucoseTrailApp::CmdList(const Options& options) {
    ListEventsQuery query;
    query.pageSize = m_config.historyPageSize;
    if (auto type = optionalArg(options, "type")) {
        query.eventType = parseEnum<EventType>("type", *type, &EventTypeFromString);
    }
    if (auto from = optionalArg(options, "from")) query.fromDate = parseTime("from", *from);
    if (auto to = optionalArg(options, "to")) query.toDate = parseTime("to", *to);
    if (auto page = optionalArg(options, "page")) query.page = parseInt("page", *page);
    if (auto size = optionalArg(options, "page-size")) query.pageSize = parseInt("page-size", *size);

    return printOutcome(m_services.historyService->listEvents(UserId::create(m_userId), query));
}

int GlucoseTrailApp::CmdShow(const Options& options) {
    return printOutcome(m_services.historyService->getEvent(requiredArg(options, "event"), UserId::create(m_userId)));
}

int GlucoseTrailApp::CmdOutcome(const Options& options) {
    return printOutcome(m_services.outcomeService->computeOutcome(requiredArg(options, "event"), UserId::create(m_userId)));
}

int GlucoseTrailApp::CmdChart(const Options& options) {
    return printOutcome(m_services.chartService->assembleChart(UserId::create(m_userId), requiredArg(options, "range")));
}

int GlucoseTrailApp::CmdTir(const Options& options) {
    auto range = optionalArg(options, "range").value_or("24");
    return printOutcome(m_services.chartService->computeTimeInRange(UserId::create(m_userId), range));
}

int GlucoseTrailApp::CmdAudit() {
    json records = json::array();
    for (const auto& record : m_auditLog->readAll()) {
        records.push_back(infrastructure::AuditRecordToJson(record));
    }
    return printResult(records);
}

void GlucoseTrailApp::PrintUsage() {
    std::cout <<
        "Usage: glucosetrail [--root DIR] [--user ID] <command> [options]\n"
        "\n"
        "Commands:\n"
        "  init                                   write settings.json with defaults\n"
        "  add-food --carbs G --meal-tag N [--absorption Rapid|Normal|Slow|Other] [--time T] [--note TEXT]\n"
        "  add-insulin --type Fast|Long --units U [--preparation P] [--delivery D] [--timing T] [--time T] [--note TEXT]\n"
        "  add-exercise --exercise-type N --minutes M [--intensity Light|Moderate|Vigorous] [--time T] [--note TEXT]\n"
        "  add-note --text TEXT [--time T]\n"
        "  list [--type Food|Insulin|Exercise|Note] [--from T] [--to T] [--page N] [--page-size N]\n"
        "  show --event ID\n"
        "  outcome --event ID                     glucose two hours after a food event\n"
        "  chart --range 1|3|5|8|12|24\n"
        "  tir [--range 1|3|5|8|12|24]\n"
        "  audit                                  print the audit log\n"
        "\n"
        "Times are ISO-8601 (e.g. 2024-05-01T12:30:00Z); a missing zone means UTC.\n";
}

} // namespace glucosetrail::app
