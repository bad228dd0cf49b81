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

#include <string>
#include <string_view>
#include <vector>
#include <list>

class Utils
{
public:
    static std::string replace(std::string subject, const std::string& search,
                               const std::string& replace);

    static double convertDouble(const std::string& content);
    static int convertInt(const std::string& content);
    static std::string getDirectory(const std::string& filePath);
    static std::string getEnvVar(std::string const& key);
    static std::string getFileName(const std::string& filePath);
    static bool isAbsolutePath(const std::string& path);
    static std::string toLower(const std::string& str);
    static std::string filterComments(const std::string& line);
    static std::string_view trimEnds(std::string_view str);
    static void listToVector(const std::string& str, std::vector<std::string>& vec, char delimiter);
    static std::string trim(std::string& str);
    static bool startsWith(const std::string& str, const std::string& prefix);

    template<typename... Paths>
    static std::string combinePath(Paths... paths) {
        std::list<std::string> pathsList = { paths... };
        return combinePath(pathsList);
    }
    static std::string combinePath(const std::list<std::string>& paths);

    static const char pathSeparator = '/';

private:
    Utils();
    virtual ~Utils();
};
