/**
 * @file activity_log.hpp
 * @brief Bounded, append-only log of player-visible events.
 */

#pragma once

#include "core/game_time.hpp"

#include <deque>
#include <string>
#include <vector>
#include <cstdint>

namespace core {

/**
 * @struct ActivityRecord
 * @brief Immutable log entry stamped with the simulated time it happened.
 */
struct ActivityRecord {
    uint64_t sequence;     ///< 1-based, increases across evictions
    uint32_t day;
    uint32_t minute;       ///< Minute of day
    std::string message;
};

/**
 * @class ActivityLog
 * @brief Ring buffer of ActivityRecords. The oldest record is evicted first.
 */
class ActivityLog {
public:
    explicit ActivityLog(size_t capacity = 50);

    /**
     * @brief Appends a record stamped with `at`, evicting the oldest if full.
     */
    void append(const GameTime& at, const std::string& message);

    /**
     * @brief Returns up to `count` most recent records, oldest first.
     */
    std::vector<ActivityRecord> tail(size_t count) const;

    const std::deque<ActivityRecord>& records() const { return records_; }
    size_t size() const { return records_.size(); }
    size_t capacity() const { return capacity_; }

    /**
     * @brief Number of records ever appended, including evicted ones.
     */
    uint64_t totalAppended() const { return next_sequence_ - 1; }

private:
    size_t capacity_;
    std::deque<ActivityRecord> records_;
    uint64_t next_sequence_ = 1;
};

}
