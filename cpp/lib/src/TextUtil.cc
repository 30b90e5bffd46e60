/** \file   TextUtil.cc
 *  \brief  Implementation of various utility functions related to the processing of UTF-8 encoded text.
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
#include "TextUtil.h"
#include <locale>
#include <stdexcept>
#include "util.h"


namespace {


// Undecodable bytes 0x80-0xFF are mapped onto this range.
constexpr uint32_t ESCAPED_BYTE_BASE(0xDC00u);


inline bool IsContinuationByte(const unsigned char byte) {
    return (byte & 0b11000000u) == 0b10000000u;
}


/** \brief Attempts to decode one well-formed UTF-8 sequence starting at "utf8_string[offset]".
 *  \return The length of the sequence or 0 if the bytes at "offset" do not form a well-formed, minimally
 *          encoded, non-surrogate sequence.
 */
size_t DecodeSequence(const std::string &utf8_string, const size_t offset, uint32_t * const code_point) {
    const unsigned char lead(static_cast<unsigned char>(utf8_string[offset]));
    size_t sequence_length;
    uint32_t min_code_point;
    if ((lead & 0b10000000u) == 0) {
        *code_point = lead;
        return 1;
    } else if ((lead & 0b11100000u) == 0b11000000u) {
        *code_point = lead & 0b11111u;
        sequence_length = 2, min_code_point = 0x80;
    } else if ((lead & 0b11110000u) == 0b11100000u) {
        *code_point = lead & 0b1111u;
        sequence_length = 3, min_code_point = 0x800;
    } else if ((lead & 0b11111000u) == 0b11110000u) {
        *code_point = lead & 0b111u;
        sequence_length = 4, min_code_point = 0x10000;
    } else
        return 0;

    if (offset + sequence_length > utf8_string.length())
        return 0;
    for (size_t i(1); i < sequence_length; ++i) {
        const unsigned char byte(static_cast<unsigned char>(utf8_string[offset + i]));
        if (not IsContinuationByte(byte))
            return 0;
        *code_point = (*code_point << 6u) | (byte & 0b00111111u);
    }

    if (*code_point < min_code_point or *code_point > 0x10FFFFu or (*code_point >= 0xD800u and *code_point <= 0xDFFFu))
        return 0;

    return sequence_length;
}


const std::locale &GetUTF8Locale() {
    static const std::locale utf8_locale([]() {
        for (const char * const locale_name : { "C.UTF-8", "C.utf8", "en_US.UTF-8", "de_DE.UTF-8" }) {
            try {
                return std::locale(locale_name);
            } catch (const std::runtime_error &) {
                // Try the next candidate.
            }
        }
        LOG_WARNING("no UTF-8 locale available, falling back to the environment's locale!");
        return std::locale("");
    }());

    return utf8_locale;
}


} // unnamed namespace


namespace TextUtil {


std::wstring UTF8ToWCharString(const std::string &utf8_string) {
    std::wstring wchar_string;
    wchar_string.reserve(utf8_string.length());

    size_t offset(0);
    while (offset < utf8_string.length()) {
        uint32_t code_point;
        const size_t sequence_length(DecodeSequence(utf8_string, offset, &code_point));
        if (likely(sequence_length > 0)) {
            wchar_string += static_cast<wchar_t>(code_point);
            offset += sequence_length;
        } else {
            wchar_string += static_cast<wchar_t>(ESCAPED_BYTE_BASE + static_cast<unsigned char>(utf8_string[offset]));
            ++offset;
        }
    }

    return wchar_string;
}


std::string WCharToUTF8String(const std::wstring &wchar_string) {
    std::string utf8_string;
    utf8_string.reserve(wchar_string.length());

    for (const wchar_t wide_ch : wchar_string) {
        const uint32_t code_point(static_cast<uint32_t>(wide_ch));
        if (code_point >= ESCAPED_BYTE_BASE + 0x80u and code_point <= ESCAPED_BYTE_BASE + 0xFFu)
            utf8_string += static_cast<char>(code_point - ESCAPED_BYTE_BASE);
        else
            utf8_string += UTF32ToUTF8(code_point);
    }

    return utf8_string;
}


std::string UTF32ToUTF8(const uint32_t code_point) {
    std::string utf8;

    if (code_point <= 0x7Fu)
        utf8 += static_cast<char>(code_point);
    else if (code_point <= 0x7FFu) {
        utf8 += static_cast<char>(0b11000000u | (code_point >> 6u));
        utf8 += static_cast<char>(0b10000000u | (code_point & 0b00111111u));
    } else if (code_point <= 0xFFFFu) {
        utf8 += static_cast<char>(0b11100000u | (code_point >> 12u));
        utf8 += static_cast<char>(0b10000000u | ((code_point >> 6u) & 0b00111111u));
        utf8 += static_cast<char>(0b10000000u | (code_point & 0b00111111u));
    } else if (code_point <= 0x10FFFFu) {
        utf8 += static_cast<char>(0b11110000u | (code_point >> 18u));
        utf8 += static_cast<char>(0b10000000u | ((code_point >> 12u) & 0b00111111u));
        utf8 += static_cast<char>(0b10000000u | ((code_point >> 6u) & 0b00111111u));
        utf8 += static_cast<char>(0b10000000u | (code_point & 0b00111111u));
    } else
        throw std::runtime_error("in TextUtil::UTF32ToUTF8: invalid Unicode code point " + std::to_string(code_point) + "!");

    return utf8;
}


size_t CodePointCount(const std::string &utf8_string) {
    size_t count(0), offset(0);
    while (offset < utf8_string.length()) {
        uint32_t code_point;
        const size_t sequence_length(DecodeSequence(utf8_string, offset, &code_point));
        offset += (sequence_length > 0) ? sequence_length : 1;
        ++count;
    }

    return count;
}


bool IsAlphabetic(const wchar_t ch) {
    return std::isalpha(ch, GetUTF8Locale());
}


bool IsDigit(const wchar_t ch) {
    return std::isdigit(ch, GetUTF8Locale());
}


wchar_t ToLower(const wchar_t ch) {
    return std::tolower(ch, GetUTF8Locale());
}


wchar_t ToUpper(const wchar_t ch) {
    return std::toupper(ch, GetUTF8Locale());
}


bool IsSpaceSeparatorCharacter(const wchar_t ch) {
    return ch == 0x0020 or ch == 0x00A0 or ch == 0x1680 or ch == 0x2000 or ch == 0x2001 or ch == 0x2002 or ch == 0x2003 or ch == 0x2004
           or ch == 0x2005 or ch == 0x2006 or ch == 0x2007 or ch == 0x2008 or ch == 0x2009 or ch == 0x200A or ch == 0x202F or ch == 0x205F
           or ch == 0x3000;
}


bool IsSpace(const wchar_t ch) {
    return IsSpaceSeparatorCharacter(ch) or ch == '\f' or ch == '\n' or ch == '\r' or ch == '\t' or ch == '\v';
}


std::wstring &ToLower(std::wstring * const s) {
    for (auto &ch : *s)
        ch = ToLower(ch);
    return *s;
}


std::string UTF8ToLower(const std::string &utf8_string) {
    std::wstring wchar_string(UTF8ToWCharString(utf8_string));
    return WCharToUTF8String(ToLower(&wchar_string));
}


std::string CStyleEscape(const std::string &unescaped_string) {
    std::string escaped_string;
    escaped_string.reserve(unescaped_string.length());

    for (const char ch : unescaped_string) {
        switch (ch) {
        case '\\':
            escaped_string += "\\\\";
            break;
        case '"':
            escaped_string += "\\\"";
            break;
        case '\n':
            escaped_string += "\\n";
            break;
        case '\r':
            escaped_string += "\\r";
            break;
        case '\t':
            escaped_string += "\\t";
            break;
        case '\f':
            escaped_string += "\\f";
            break;
        case '\v':
            escaped_string += "\\v";
            break;
        default:
            escaped_string += ch;
        }
    }

    return escaped_string;
}


std::string CStyleUnescape(const std::string &escaped_string) {
    std::string unescaped_string;
    unescaped_string.reserve(escaped_string.length());

    for (auto ch(escaped_string.cbegin()); ch != escaped_string.cend(); ++ch) {
        if (*ch != '\\') {
            unescaped_string += *ch;
            continue;
        }

        ++ch;
        if (unlikely(ch == escaped_string.cend()))
            throw std::runtime_error("in TextUtil::CStyleUnescape: trailing backslash in \"" + escaped_string + "\"!");

        switch (*ch) {
        case '\\':
            unescaped_string += '\\';
            break;
        case '"':
            unescaped_string += '"';
            break;
        case '#':
            unescaped_string += '#';
            break;
        case 'n':
            unescaped_string += '\n';
            break;
        case 'r':
            unescaped_string += '\r';
            break;
        case 't':
            unescaped_string += '\t';
            break;
        case 'f':
            unescaped_string += '\f';
            break;
        case 'v':
            unescaped_string += '\v';
            break;
        default:
            throw std::runtime_error("in TextUtil::CStyleUnescape: unknown escape sequence \\" + std::string(1, *ch) + " in \""
                                     + escaped_string + "\"!");
        }
    }

    return unescaped_string;
}


} // namespace TextUtil
