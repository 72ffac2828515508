/**
 * @file GlucoseTrailApp.hpp
 * @brief Command-line application class for GlucoseTrail.
 */

#pragma once

#include <map>
#include <memory>
#include <string>
#include <vector>

#include "application/AppServices.hpp"
#include "domain/common/Clock.hpp"
#include "domain/repositories/IAuditLog.hpp"
#include "infrastructure/ConfigLoader.hpp"

namespace glucosetrail::app {

/**
 * @class GlucoseTrailApp
 * @brief Wires the services from settings.json and runs one command per invocation.
 *
 * Usage: glucosetrail [--root DIR] [--user ID] <command> [--option value ...]
 * Results are printed to stdout as JSON; diagnostics go to stderr.
 */
class GlucoseTrailApp {
public:
    /**
     * @brief Parses the arguments, runs the command and flushes pending writes.
     * @return 0 on success, 1 on a failed command, 2 on a usage error.
     */
    int Run(int argc, char** argv);

private:
    using Options = std::map<std::string, std::string>;

    /**
     * @brief Loads settings and builds the services.
     * @return True if initialization succeeded.
     */
    bool Init(const std::string& projectRoot);

    /**
     * @brief Stops the persistence worker after draining its queue.
     */
    void Shutdown();

    int Dispatch(const std::string& command, const Options& options);

    int CmdInit(const std::string& projectRoot);
    int CmdAddFood(const Options& options);
    int CmdAddInsulin(const Options& options);
    int CmdAddExercise(const Options& options);
    int CmdAddNote(const Options& options);
    int CmdList(const Options& options);
    int CmdShow(const Options& options);
    int CmdOutcome(const Options& options);
    int CmdChart(const Options& options);
    int CmdTir(const Options& options);
    int CmdAudit();

    static void PrintUsage();

    infrastructure::AppConfig m_config;
    application::AppServices m_services;
    std::shared_ptr<domain::IAuditLog> m_auditLog;
    std::shared_ptr<const domain::IClock> m_clock;
    std::string m_userId;
};

} // namespace glucosetrail::app
