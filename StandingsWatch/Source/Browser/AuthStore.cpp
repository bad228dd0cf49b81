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

#include "AuthStore.h"
#include "../Utility/Log.h"
#include <filesystem>
#include <fstream>
#include <iterator>

namespace fs = std::filesystem;

AuthStore::AuthStore(const std::string& path)
    : path_(path)
{
}

bool AuthStore::exists() const
{
    std::error_code ec;
    return !path_.empty() && fs::is_regular_file(path_, ec);
}

bool AuthStore::load(std::string& state) const
{
    std::ifstream in(path_, std::ios::binary);
    if (!in) {
        return false;
    }
    state.assign((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    return !in.bad();
}

bool AuthStore::save(const std::string& state) const
{
    std::error_code ec;
    fs::path p(path_);
    if (p.has_parent_path()) fs::create_directories(p.parent_path(), ec);

    fs::path tmp = p;
    tmp += ".tmp";
    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out) {
            LOG_ERROR("Auth", "Could not write " << tmp.string());
            return false;
        }
        out << state;
        out.flush();
        if (!out) return false;
    }

    fs::rename(tmp, p, ec);
    if (ec) {
        LOG_ERROR("Auth", "Could not replace " << path_ << ": " << ec.message());
        std::error_code ec2;
        fs::remove(tmp, ec2);
        return false;
    }
    return true;
}
