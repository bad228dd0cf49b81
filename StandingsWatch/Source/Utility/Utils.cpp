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

#include "Utils.h"
#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <locale>

Utils::Utils()
{
}

Utils::~Utils()
{
}

std::string Utils::toLower(const std::string& input)
{
    std::string result = input;
    std::locale loc;

    for(char& c : result)
    {
        c = std::tolower(c, loc);
    }

    return result;
}


std::string Utils::filterComments(const std::string& line)
{
    std::string result = line;

    size_t position = result.find('#');
    if (position != std::string::npos)
    {
        result.erase(position);
    }

    result.erase(std::remove(result.begin(), result.end(), '\r'), result.end());

    return result;
}


std::string Utils::combinePath(const std::list<std::string>& paths)
{
    std::filesystem::path result;
    for (const auto& p : paths)
    {
        result /= p;
    }
    return result.string();
}


bool Utils::isAbsolutePath(const std::string& path)
{
    return std::filesystem::path(path).is_absolute();
}


std::string Utils::replace(
    std::string subject,
    const std::string& search,
    const std::string& replace)
{
    if (search.empty())
        return subject;

    size_t pos = 0;
    while ((pos = subject.find(search, pos)) != std::string::npos)
    {
        subject.replace(pos, search.length(), replace);
        pos += replace.length();
    }
    return subject;
}


double Utils::convertDouble(const std::string& content)
{
    return std::stod(content);
}

int Utils::convertInt(const std::string& content) {
    return std::stoi(content);
}


std::string Utils::getDirectory(const std::string& filePath)
{
    std::filesystem::path path(filePath);
    return path.parent_path().string();
}

std::string Utils::getEnvVar(std::string const& key)
{
    char const* val = std::getenv(key.c_str());

    return val == NULL ? std::string() : std::string(val);
}

std::string Utils::getFileName(const std::string& filePath)
{
    std::filesystem::path path(filePath);
    return path.filename().string();
}


std::string_view Utils::trimEnds(std::string_view view)
{
    size_t trimStart = view.find_first_not_of(" \t\r\n");
    if (trimStart == std::string_view::npos) {
        return "";
    }

    size_t trimEnd = view.find_last_not_of(" \t\r\n");

    return view.substr(trimStart, trimEnd - trimStart + 1);
}


void Utils::listToVector(const std::string& str, std::vector<std::string>& vec, char delimiter)
{
    std::string_view view(str);
    size_t previous = 0;
    size_t current;

    while ((current = view.find(delimiter, previous)) != std::string_view::npos)
    {
        auto trimmed = trimEnds(view.substr(previous, current - previous));
        if (!trimmed.empty()) {
            vec.emplace_back(trimmed);
        }
        previous = current + 1;
    }

    auto trimmed = trimEnds(view.substr(previous));
    if (!trimmed.empty()) {
        vec.emplace_back(trimmed);
    }
}


std::string Utils::trim(std::string& str)
{
    str = std::string(trimEnds(str));
    return str;
}

bool Utils::startsWith(const std::string& str, const std::string& prefix)
{
    return str.compare(0, prefix.size(), prefix) == 0;
}
