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

#include "Configuration.h"
#include "../Utility/Log.h"
#include "../Utility/Utils.h"
#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>

std::string Configuration::absolutePath;

Configuration::Configuration()
{
}

Configuration::~Configuration()
{
}

void Configuration::initialize()
{
    std::string environment = Utils::getEnvVar("STANDINGSWATCH_ROOT");
    if (!environment.empty()) {
        absolutePath = environment;
        return;
    }

    std::error_code ec;
    std::filesystem::path cwd = std::filesystem::current_path(ec);
    absolutePath = ec ? std::string(".") : cwd.string();
}

std::string Configuration::convertToAbsolutePath(const std::string& prefix, const std::string& path)
{
    if (path.empty() || Utils::isAbsolutePath(path) || prefix.empty()) {
        return path;
    }
    return Utils::combinePath(prefix, path);
}

bool Configuration::import(const std::string& keyPrefix, const std::string& file, bool mustExist)
{
    std::ifstream ifs(file.c_str());
    if (!ifs.is_open()) {
        if (mustExist) {
            LOG_ERROR("Configuration", "could not open " << file);
        }
        else {
            LOG_INFO("Configuration", "could not open " << file << " (optional, skipped)");
        }
        return false;
    }

    LOG_INFO("Configuration", "Importing \"" << file << "\"");

    std::string line;
    int lineCount = 0;
    bool retVal = true;
    while (std::getline(ifs, line)) {
        lineCount++;
        retVal = parseLine(keyPrefix, line, lineCount) && retVal;
    }
    return retVal;
}

bool Configuration::importText(const std::string& keyPrefix, const std::string& text)
{
    std::istringstream ss(text);
    std::string line;
    int lineCount = 0;
    bool retVal = true;
    while (std::getline(ss, line)) {
        lineCount++;
        retVal = parseLine(keyPrefix, line, lineCount) && retVal;
    }
    return retVal;
}

bool Configuration::parseLine(const std::string& keyPrefix, std::string line, int lineCount)
{
    line = Utils::filterComments(line);
    line = Utils::trim(line);
    if (line.empty()) {
        return true;
    }

    size_t position = line.find('=');
    if (position == std::string::npos) {
        LOG_WARNING("Configuration", "Missing an assignment operator (=) on line " << lineCount);
        return false;
    }

    std::string key = line.substr(0, position);
    std::string value = line.substr(position + 1);
    key = Utils::trim(key);
    value = Utils::trim(value);
    if (key.empty()) {
        LOG_WARNING("Configuration", "Empty key on line " << lineCount);
        return false;
    }

    if (!keyPrefix.empty()) {
        key = keyPrefix + "." + key;
    }

    properties_[key] = value;
    LOG_DEBUG("Configuration", "Dump: \"" << key << "\" = \"" << value << "\"");
    return true;
}

bool Configuration::getProperty(const std::string& key, std::string& value) const
{
    auto it = properties_.find(key);
    if (it == properties_.end()) {
        return false;
    }
    value = it->second;
    return true;
}

bool Configuration::getProperty(const std::string& key, int& value) const
{
    std::string strValue;
    if (!getProperty(key, strValue)) {
        return false;
    }
    try {
        value = Utils::convertInt(strValue);
    }
    catch (const std::exception&) {
        LOG_WARNING("Configuration", "Invalid integer for " << key << ": \"" << strValue << "\"");
        return false;
    }
    return true;
}

bool Configuration::getProperty(const std::string& key, bool& value) const
{
    std::string strValue;
    if (!getProperty(key, strValue)) {
        return false;
    }

    strValue = Utils::toLower(strValue);
    if (strValue == "yes" || strValue == "true" || strValue == "on" || strValue == "1") {
        value = true;
    }
    else if (strValue == "no" || strValue == "false" || strValue == "off" || strValue == "0") {
        value = false;
    }
    else {
        LOG_WARNING("Configuration", "Invalid boolean for " << key << ": \"" << strValue << "\"");
        return false;
    }
    return true;
}

bool Configuration::getProperty(const std::string& key, double& value) const
{
    std::string strValue;
    if (!getProperty(key, strValue)) {
        return false;
    }
    try {
        value = Utils::convertDouble(strValue);
    }
    catch (const std::exception&) {
        LOG_WARNING("Configuration", "Invalid number for " << key << ": \"" << strValue << "\"");
        return false;
    }
    return true;
}

bool Configuration::getPropertyAbsolutePath(const std::string& key, std::string& value) const
{
    if (!getProperty(key, value)) {
        return false;
    }
    value = convertToAbsolutePath(absolutePath, value);
    return true;
}

void Configuration::setProperty(const std::string& key, const std::string& value)
{
    properties_[key] = value;
}

bool Configuration::propertyExists(const std::string& key) const
{
    return properties_.find(key) != properties_.end();
}

void Configuration::childKeyCrumbs(const std::string& parent, std::vector<std::string>& children) const
{
    std::string prefix = parent + ".";
    for (const auto& kv : properties_) {
        if (kv.first.compare(0, prefix.size(), prefix) != 0) {
            continue;
        }
        std::string crumb = kv.first.substr(prefix.size());
        crumb = crumb.substr(0, crumb.find('.'));
        if (!crumb.empty() && std::find(children.begin(), children.end(), crumb) == children.end()) {
            children.push_back(crumb);
        }
    }
}
