/* This file is part of StandingsWatch.
 *
 * StandingsWatch is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * StandingsWatch is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with StandingsWatch.  If not, see <http://www.gnu.org/licenses/>.
 */
#pragma once

#include <stdexcept>
#include <string>

// Missing or unusable required configuration. Fatal: nothing starts.
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& what) : std::runtime_error(what) {}
};

// The virtualized list kept growing past the iteration bound.
class StabilizationTimeout : public std::runtime_error {
public:
    explicit StabilizationTimeout(const std::string& what) : std::runtime_error(what) {}
};

// Collection was abandoned because a stop was requested. Nothing is persisted.
class CollectionCancelled : public std::runtime_error {
public:
    explicit CollectionCancelled(const std::string& what) : std::runtime_error(what) {}
};

// Recoverable failure inside one poll (navigation, timeout, protocol error).
class TransientPollError : public std::runtime_error {
public:
    explicit TransientPollError(const std::string& what) : std::runtime_error(what) {}
};

// The browser session is gone; the scheduler must shut down.
class SessionFatal : public std::runtime_error {
public:
    explicit SessionFatal(const std::string& what) : std::runtime_error(what) {}
};

// Simulation input failed validation. Never escapes ProjectionEngine::project.
class ProjectionError : public std::runtime_error {
public:
    explicit ProjectionError(const std::string& what) : std::runtime_error(what) {}
};
