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

#include <map>
#include <string>
#include <vector>

class Configuration
{
public:
    Configuration();
    virtual ~Configuration();

    // Resolves absolutePath from STANDINGSWATCH_ROOT, else the working directory.
    static void initialize();
    static std::string convertToAbsolutePath(const std::string& prefix, const std::string& path);

    // Reads "key = value" lines. '#' starts a comment; blank lines are ignored.
    bool import(const std::string& keyPrefix, const std::string& file, bool mustExist = true);
    bool importText(const std::string& keyPrefix, const std::string& text);

    bool getProperty(const std::string& key, std::string& value) const;
    bool getProperty(const std::string& key, int& value) const;
    bool getProperty(const std::string& key, bool& value) const;
    bool getProperty(const std::string& key, double& value) const;
    bool getPropertyAbsolutePath(const std::string& key, std::string& value) const;
    void setProperty(const std::string& key, const std::string& value);
    bool propertyExists(const std::string& key) const;
    void childKeyCrumbs(const std::string& parent, std::vector<std::string>& children) const;

    static std::string absolutePath;

private:
    bool parseLine(const std::string& keyPrefix, std::string line, int lineCount);

    typedef std::map<std::string, std::string> PropertiesType;
    PropertiesType properties_;
};
