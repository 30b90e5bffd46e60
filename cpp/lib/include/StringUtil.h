/** \file    StringUtil.h
 *  \brief   Declarations for string utility functions.
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
#pragma once


#include <stdexcept>
#include <string>
#include <cstring>
#include <strings.h>
#include "util.h"


namespace StringUtil {


/** The default set of white space characters. */
extern const std::string WHITE_SPACE;


/** \brief   Remove all occurences of a set of characters from either end of a string.
 *  \param   trim_set  The set of characters to remove.
 *  \param   s         The string to trim.
 *  \return  The trimmed string.
 */
std::string Trim(const std::string &trim_set, std::string * const s);


inline std::string Trim(const std::string &trim_set, const std::string &s) {
    std::string temp_s(s);
    return Trim(trim_set, &temp_s);
}


inline std::string TrimWhite(std::string * const s) {
    return Trim(WHITE_SPACE, s);
}


inline std::string TrimWhite(const std::string &s) {
    std::string temp_s(s);
    return TrimWhite(&temp_s);
}


// \brief Converts ASCII letters in "s" to lowercase and leaves all other bytes alone.
std::string &ASCIIToLower(std::string * const s);


inline std::string ASCIIToLower(const std::string &s) {
    std::string temp_s(s);
    return ASCIIToLower(&temp_s);
}


/** \brief   Does the given string start with the suggested prefix?
 *  \param   s            The string to test.
 *  \param   prefix       The prefix to test for.
 *  \param   ignore_case  If true, the match will be case-insensitive.
 *  \return  True if the string "s" equals or starts with the prefix "prefix."
 */
inline bool StartsWith(const std::string &s, const std::string &prefix, const bool ignore_case = false) {
    return prefix.empty()
           or (s.length() >= prefix.length()
               and (ignore_case ? (::strncasecmp(s.c_str(), prefix.c_str(), prefix.length()) == 0)
                                : (std::strncmp(s.c_str(), prefix.c_str(), prefix.length()) == 0)));
}


/** \brief   Does the given string end with the suggested suffix?
 *  \param   s            The string to test.
 *  \param   suffix       The suffix to test for.
 *  \param   ignore_case  If true, the match will be case-insensitive.
 *  \return  True if the string "s" equals or ends with the suffix "suffix."
 */
inline bool EndsWith(const std::string &s, const std::string &suffix, const bool ignore_case = false) {
    return suffix.empty()
           or (s.length() >= suffix.length()
               and (ignore_case ? (::strncasecmp(s.c_str() + (s.length() - suffix.length()), suffix.c_str(), suffix.length()) == 0)
                                : (std::strncmp(s.c_str() + (s.length() - suffix.length()), suffix.c_str(), suffix.length()) == 0)));
}


/** \brief  Split a string, then trim the component substrings.
 *  \param  s                     The string to split.
 *  \param  field_separators      Each of these characters separates two fields.
 *  \param  trim_chars            A set of characters to trim from each resulting substring.
 *  \param  container             A string container to hold the parts (e.g. std::vector<std::string>).
 *  \param  suppress_empty_words  If true, we skip empty "words", otherwise we keep them.
 *  \return The number of extracted "words".
 */
template<typename InsertableContainer> unsigned SplitThenTrim(const std::string &s, const std::string &field_separators,
                                                              const std::string &trim_chars, InsertableContainer * const container,
                                                              const bool suppress_empty_words = true)
{
    if (unlikely(field_separators.empty()))
        throw std::runtime_error("in StringUtil::SplitThenTrim: empty field separators string!");

    container->clear();
    if (s.empty())
        return 0;

    unsigned count(0);
    std::string::size_type word_start(0);
    for (;;) {
        const auto separator_pos(s.find_first_of(field_separators, word_start));
        std::string new_word(s.substr(word_start, separator_pos == std::string::npos ? std::string::npos : separator_pos - word_start));
        Trim(trim_chars, &new_word);
        if (not new_word.empty() or not suppress_empty_words) {
            container->insert(container->end(), new_word);
            ++count;
        }

        if (separator_pos == std::string::npos)
            return count;
        word_start = separator_pos + 1;
    }
}


template<typename InsertableContainer> inline unsigned SplitThenTrimWhite(const std::string &s, const char field_separator,
                                                                          InsertableContainer * const container,
                                                                          const bool suppress_empty_words = true)
{
    return SplitThenTrim(s, std::string(1, field_separator), WHITE_SPACE, container, suppress_empty_words);
}


// \brief Splits "s" on white space and commas.  Empty components are always suppressed.
template<typename InsertableContainer> inline unsigned SplitOnWhiteSpaceAndCommas(const std::string &s,
                                                                                  InsertableContainer * const container)
{
    return SplitThenTrim(s, WHITE_SPACE + ",", WHITE_SPACE, container, /* suppress_empty_words = */ true);
}


template<typename StringContainer> std::string Join(const StringContainer &source, const std::string &separator) {
    std::string dest;
    for (auto part(source.cbegin()); part != source.cend(); ++part) {
        if (part != source.cbegin())
            dest += separator;
        dest += *part;
    }

    return dest;
}


/** \brief  Converts "s" to an unsigned number.
 *  \return True if "s" is a valid, non-negative decimal number that fits into an unsigned, o/w false.
 */
bool ToUnsigned(const std::string &s, unsigned * const n);


/** \brief  Converts "value" to a boolean.
 *  \note   "true", "yes" and "on" (case-insensitive) are true, "false", "no" and "off" are false.
 *  \return False if "value" is none of the above.
 */
bool ToBool(const std::string &value, bool * const b);


} // namespace StringUtil
