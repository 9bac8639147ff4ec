/**
 * @file strategy.hpp
 * @brief Defines the Strategy interface for scripted players.
 */

#pragma once

#include "core/command.hpp"
#include "engine/snapshot.hpp"

#include <string>
#include <functional>

namespace strategy {

// callback for issuing a command to the engine
using SubmitCommandCallback = std::function<core::CommandResult(const core::Command&)>;

/**
 * @class Strategy
 * @brief Abstract base class for automated players.
 *
 * A strategy only sees committed snapshots and acts through commands, the
 * same boundary a user interface has.
 */
class Strategy {
public:
    virtual ~Strategy() = default;

    /**
     * @brief Reacts to a newly committed snapshot.
     * @param snapshot Latest committed game state
     */
    virtual void onSnapshot(const engine::Snapshot& snapshot) = 0;

    /**
     * @brief Gets the name of the strategy.
     * @return Name as a string
     */
    virtual std::string name() const = 0;

    /**
     * @brief Prints a summary of the strategy's activity.
     */
    virtual void printSummary() const = 0;

    /**
     * @brief Returns the number of commands the strategy issued.
     */
    virtual size_t commandsIssued() const { return 0; }

    /**
     * @brief Returns the number of issued commands the engine rejected.
     */
    virtual size_t commandsRejected() const { return 0; }
};

}
