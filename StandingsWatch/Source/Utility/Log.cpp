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

#include "Log.h"
#include <iostream>
#include <sstream>
#include <ctime>
#include <unordered_map>
#include <unordered_set>
#include <vector>
#include "../Database/Configuration.h"
#include "../Database/GlobalOpts.h"

std::ofstream Logger::writeFileStream_;
std::mutex Logger::writeMutex_;
Configuration* Logger::config_ = NULL;

bool Logger::initialize(const std::string& file, Configuration* config)
{
    config_ = config;
    if (file.empty()) {
        return true;
    }

    // Truncate once per run, then append
    writeFileStream_.open(file.c_str(), std::ios::out | std::ios::trunc);
    if (!writeFileStream_.is_open()) {
        return false;
    }
    writeFileStream_.close();
    writeFileStream_.open(file.c_str(), std::ios::out | std::ios::app);

    return writeFileStream_.is_open();
}

void Logger::deInitialize()
{
    std::scoped_lock lock(writeMutex_);
    if (writeFileStream_.is_open()) {
        writeFileStream_.close();
    }
}


void Logger::write(Zone zone, const std::string& component, const std::string& message)
{
    std::scoped_lock lock(writeMutex_);

    std::string zoneStr(zoneToString(zone));

    std::time_t rawtime = std::time(NULL);
    struct tm const* timeinfo = std::localtime(&rawtime);

    char timeStr[60];
    std::strftime(timeStr, sizeof(timeStr), "%Y-%m-%d %H:%M:%S", timeinfo);

    std::stringstream ss;
    ss << "[" << timeStr << "] [" << zoneStr << "] [" << component << "] " << message << std::endl;
    if (writeFileStream_.is_open()) {
        writeFileStream_ << ss.str();
        writeFileStream_.flush();
    }
    // stderr, so report output on stdout stays clean
    std::cerr << ss.str();
}


bool Logger::isLevelEnabled(const std::string& zone, const std::string& component) {
    static std::once_flag initFlag;
    static std::unordered_map<std::string, bool> globalFilters;
    static std::unordered_map<std::string, std::unordered_set<std::string>> categoryFilters;
    static std::unordered_map<std::string, std::unordered_set<std::string>> excludedFilters;
    static bool allowAll = false;
    static bool allowNone = false;
    static std::string level;

    if (!config_) return false;

    std::call_once(initFlag, []() {
        level = "INFO,NOTICE,WARNING,ERROR";
        Logger::config_->getProperty(OPTION_LOG, level);

        std::stringstream ss(level);
        std::string token;
        while (std::getline(ss, token, ',')) {
            if (token.empty()) continue;
            size_t colonPos = token.find(':');

            if (token == "ALL") {
                allowAll = true;
                return;
            }
            if (token == "NONE") {
                allowNone = true;
                return;
            }

            bool isExclusion = (token[0] == '-');
            std::string logLevel = isExclusion ? token.substr(1) : token;

            if (colonPos != std::string::npos) {
                // LEVEL:Comp:Comp enables (or with '-', disables) components
                std::istringstream categoryStream(logLevel);
                std::vector<std::string> parts;
                std::string part;

                while (std::getline(categoryStream, part, ':')) {
                    parts.push_back(part);
                }

                if (parts.size() > 1) {
                    for (size_t i = 1; i < parts.size(); i++) {
                        if (isExclusion) {
                            excludedFilters[parts[0]].insert(parts[i]);
                        } else {
                            categoryFilters[parts[0]].insert(parts[i]);
                        }
                    }
                }
            } else {
                if (isExclusion) {
                    globalFilters.erase(logLevel);
                } else {
                    globalFilters[logLevel] = true;
                }
            }
        }
        });

    if (allowAll) {
        auto excludedIt = excludedFilters.find(zone);
        if (excludedIt != excludedFilters.end()) {
            if (excludedIt->second.find(component) != excludedIt->second.end()) {
                return false;
            }
        }
        return true;
    }

    if (allowNone) {
        return false;
    }

    auto excludedIt = excludedFilters.find(zone);
    if (excludedIt != excludedFilters.end()) {
        if (excludedIt->second.find(component) != excludedIt->second.end()) {
            return false;
        }
    }

    if (globalFilters.find(zone) != globalFilters.end()) {
        return true;
    }

    auto it = categoryFilters.find(zone);
    if (it != categoryFilters.end()) {
        if (it->second.find(component) != it->second.end()) {
            return true;
        }
    }

    return false;
}

constexpr std::string_view Logger::zoneToString(Zone zone)
{
    switch (zone) {
    case ZONE_INFO: return "INFO";
    case ZONE_DEBUG: return "DEBUG";
    case ZONE_NOTICE: return "NOTICE";
    case ZONE_WARNING: return "WARNING";
    case ZONE_ERROR: return "ERROR";
    default: return "UNKNOWN";
    }
}
