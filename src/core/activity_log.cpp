/**
 * @file activity_log.cpp
 * @brief Implements the bounded activity log.
 */

#include "core/activity_log.hpp"

#include <algorithm>
#include <stdexcept>

namespace core {

ActivityLog::ActivityLog(size_t capacity)
    : capacity_(capacity) {
    if (capacity_ == 0) {
        throw std::invalid_argument("ActivityLog capacity must be positive");
    }
}

void ActivityLog::append(const GameTime& at, const std::string& message) {
    records_.push_back(ActivityRecord{next_sequence_++, at.day, at.minute_of_day, message});
    while (records_.size() > capacity_) {
        records_.pop_front();
    }
}

std::vector<ActivityRecord> ActivityLog::tail(size_t count) const {
    size_t n = std::min(count, records_.size());
    return std::vector<ActivityRecord>(records_.end() - static_cast<std::ptrdiff_t>(n), records_.end());
}

}
