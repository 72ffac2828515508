/**
 * @file ChartService.hpp
 * @brief Application Service for the glucose chart and time-in-range summary.
 */

#pragma once

#include <memory>
#include <string>

#include "application/dto/ChartResult.hpp"
#include "domain/common/CancellationToken.hpp"
#include "domain/common/Clock.hpp"
#include "domain/glucose/IGlucoseSource.hpp"
#include "domain/repositories/IEventRepository.hpp"
#include "domain/value_objects/TirRange.hpp"

namespace glucosetrail::application {

/**
 * @class ChartService
 * @brief Windows of the last N hours, N taken from the chart range allow-list.
 *
 * An unsupported selector fails with Chart.InvalidRange before any source is called.
 */
class ChartService {
public:
    ChartService(std::shared_ptr<domain::IGlucoseSource> glucose,
                 std::shared_ptr<domain::IEventRepository> events,
                 std::shared_ptr<const domain::IClock> clock,
                 domain::TirRange targetRange = domain::TirRange::standard());

    /// Glucose series and event overlays for the window, fetched concurrently.
    domain::Result<ChartResult> assembleChart(const domain::UserId& userId,
                                              const std::string& rangeSelector,
                                              const domain::CancellationToken& token = {});

    domain::Result<TirResult> computeTimeInRange(const domain::UserId& userId,
                                                 const std::string& rangeSelector,
                                                 const domain::CancellationToken& token = {});

private:
    std::shared_ptr<domain::IGlucoseSource> m_glucose;
    std::shared_ptr<domain::IEventRepository> m_events;
    std::shared_ptr<const domain::IClock> m_clock;
    domain::TirRange m_targetRange;
};

} // namespace glucosetrail::application
