/**
 * @file snapshot_json.hpp
 * @brief JSON export of snapshots and analytics summaries.
 */

#pragma once

#include "engine/analytics.hpp"
#include "engine/snapshot.hpp"

#include <nlohmann/json.hpp>

#include <string>

namespace io {

nlohmann::json toJson(const core::CustomerOrder& order);
nlohmann::json toJson(const engine::BusinessAnalytics& analytics);
nlohmann::json toJson(const engine::Achievement& achievement);

/**
 * @brief Full snapshot document. Keys and array order are stable, so equal
 *        snapshots dump to identical text.
 */
nlohmann::json toJson(const engine::Snapshot& snapshot);

/**
 * @brief Writes the snapshot document, pretty printed.
 * @throws std::runtime_error if the file cannot be written
 */
void exportSnapshot(const engine::Snapshot& snapshot, const std::string& path);

/**
 * @brief Writes a short end-of-game summary (cash, reputation, analytics).
 * @throws std::runtime_error if the file cannot be written
 */
void exportSummary(const engine::Snapshot& snapshot, const std::string& path);

}
