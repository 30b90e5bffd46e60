/** \file    StringUtil.cc
 *  \brief   Implementation of string utility functions.
 *
 *  \copyright 2026 Universitätsbibliothek Tübingen.  All rights reserved.
 *
 *  This program is free software: you can redistribute it and/or modify
 *  it under the terms of the GNU Affero General Public License as
 *  published by the Free Software Foundation, either version 3 of the
 *  License, or (at your option) any later version.
 *
 *  This program is distributed in the hope that it will be useful,
 *  but WITHOUT ANY WARRANTY; without even the implied warranty of
 *  MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 *  GNU Affero General Public License for more details.
 *
 *  You should have received a copy of the GNU Affero General Public License
 *  along with this program.  If not, see <http://www.gnu.org/licenses/>.
 */
#include "StringUtil.h"
#include <cctype>
#include <cerrno>
#include <climits>
#include <cstdlib>


namespace StringUtil {


const std::string WHITE_SPACE(" \t\n\v\r\f");


std::string Trim(const std::string &trim_set, std::string * const s) {
    const auto first_kept(s->find_first_not_of(trim_set));
    if (first_kept == std::string::npos) {
        s->clear();
        return *s;
    }

    const auto last_kept(s->find_last_not_of(trim_set));
    *s = s->substr(first_kept, last_kept - first_kept + 1);
    return *s;
}


std::string &ASCIIToLower(std::string * const s) {
    for (auto &ch : *s) {
        if (ch >= 'A' and ch <= 'Z')
            ch = static_cast<char>(ch - 'A' + 'a');
    }

    return *s;
}


bool ToUnsigned(const std::string &s, unsigned * const n) {
    if (unlikely(s.empty() or not std::isdigit(static_cast<unsigned char>(s[0]))))
        return false;

    char *end_ptr;
    errno = 0;
    const unsigned long ul(std::strtoul(s.c_str(), &end_ptr, 10));
    *n = static_cast<unsigned>(ul);

    const bool success((*end_ptr == '\0') and (errno == 0) and (ul <= UINT_MAX));
    errno = 0;
    return success;
}


bool ToBool(const std::string &value, bool * const b) {
    if (::strcasecmp(value.c_str(), "true") == 0 or ::strcasecmp(value.c_str(), "yes") == 0
        or ::strcasecmp(value.c_str(), "on") == 0)
    {
        *b = true;
        return true;
    }

    if (::strcasecmp(value.c_str(), "false") == 0 or ::strcasecmp(value.c_str(), "off") == 0
        or ::strcasecmp(value.c_str(), "no") == 0)
    {
        *b = false;
        return true;
    }

    return false;
}


} // namespace StringUtil
