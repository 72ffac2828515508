/**
 * @file JsonOutput.hpp
 * @brief JSON renderings of query results for the command-line front end.
 */

#pragma once

#include <nlohmann/json.hpp>

#include "application/dto/ChartResult.hpp"
#include "application/dto/EventListing.hpp"
#include "application/dto/OutcomeResult.hpp"
#include "domain/common/Result.hpp"
#include "domain/events/Event.hpp"

namespace glucosetrail::app {

nlohmann::json ToJson(const domain::Error& error);
nlohmann::json ToJson(const application::OutcomeResult& outcome);
nlohmann::json ToJson(const application::ChartResult& chart);
nlohmann::json ToJson(const application::TirResult& tir);
nlohmann::json ToJson(const application::PagedResult<application::EventListItem>& page);
nlohmann::json ToJson(const domain::Event& event);

} // namespace glucosetrail::app
