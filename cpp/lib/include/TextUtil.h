/** \file   TextUtil.h
 *  \brief  Various utility functions related to the processing of UTF-8 encoded text.
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


#include <string>
#include <cstdint>


namespace TextUtil {


/** \brief Converts UTF-8 to a wide character string, one wide character per Unicode code point.
 *  \note  This never fails.  Bytes that are not part of a well-formed UTF-8 sequence are mapped to the
 *         code points U+DC80 through U+DCFF so that WCharToUTF8String() can restore them unchanged.
 */
std::wstring UTF8ToWCharString(const std::string &utf8_string);


// The inverse of UTF8ToWCharString().
std::string WCharToUTF8String(const std::wstring &wchar_string);


/** \brief Encodes a single Unicode code point as UTF-8.
 *  \throws std::runtime_error if "code_point" is larger than U+10FFFF.
 */
std::string UTF32ToUTF8(const uint32_t code_point);


// \return The number of code points in "utf8_string", as counted by UTF8ToWCharString().
size_t CodePointCount(const std::string &utf8_string);


/* The following character classifications and case mappings use a UTF-8 capable locale and
   therefore do not depend on the global locale of the process. */

bool IsAlphabetic(const wchar_t ch);
bool IsDigit(const wchar_t ch);
wchar_t ToLower(const wchar_t ch);
wchar_t ToUpper(const wchar_t ch);


// \return True for letters, digits and underscores.
inline bool IsWordCharacter(const wchar_t ch) {
    return ch == L'_' or IsAlphabetic(ch) or IsDigit(ch);
}


inline bool IsAsciiUppercaseLetterOrDigit(const wchar_t ch) {
    return (ch >= L'A' and ch <= L'Z') or (ch >= L'0' and ch <= L'9');
}


// See https://www.compart.com/en/unicode/category/Zs for where we got this.
bool IsSpaceSeparatorCharacter(const wchar_t ch);


/** Tests against IsSpaceSeparatorCharacter and traditional UNIX whitespace characters. */
bool IsSpace(const wchar_t ch);


std::wstring &ToLower(std::wstring * const s);


// \brief Lowercases all characters of "utf8_string".
std::string UTF8ToLower(const std::string &utf8_string);


/** \brief Replaces backslashes, double quotes and the common control characters with their C escape sequences.
 *  \note  The result never contains a newline.
 */
std::string CStyleEscape(const std::string &unescaped_string);


/** \brief The inverse of CStyleEscape().
 *  \throws std::runtime_error on an unknown or incomplete escape sequence.
 */
std::string CStyleUnescape(const std::string &escaped_string);


} // namespace TextUtil
