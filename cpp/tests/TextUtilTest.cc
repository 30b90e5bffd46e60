/** \brief  Tests for the UTF-8 and string utility functions.
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
#include <stdexcept>
#include <string>
#include <vector>
#include "StringUtil.h"
#include "TextUtil.h"
#include "UnitTest.h"


TEST(UTF8ToWCharString) {
    CHECK_TRUE(TextUtil::UTF8ToWCharString("Zoë") == L"Zoë");
    CHECK_TRUE(TextUtil::UTF8ToWCharString("\xF0\x9F\x93\x9A") == std::wstring(1, static_cast<wchar_t>(0x1F4DA)));
    CHECK_EQ(TextUtil::CodePointCount("Größe"), 5u);
    CHECK_EQ(TextUtil::CodePointCount(""), 0u);
}


TEST(InvalidUTF8RoundTrips) {
    for (const std::string &bytes : { std::string("caf\xE9"), std::string("\xC0\xAF"), std::string("\xED\xA0\x80"),
                                      std::string("abc\xE2\x82"), std::string("\xFF\xFE", 2) })
    {
        CHECK_STR_EQ(TextUtil::WCharToUTF8String(TextUtil::UTF8ToWCharString(bytes)), bytes);
    }
    CHECK_EQ(TextUtil::CodePointCount("caf\xE9"), 4u);
}


TEST(UTF32ToUTF8) {
    CHECK_STR_EQ(TextUtil::UTF32ToUTF8('A'), "A");
    CHECK_STR_EQ(TextUtil::UTF32ToUTF8(0xE9), "\xC3\xA9");
    CHECK_STR_EQ(TextUtil::UTF32ToUTF8(0x20AC), "\xE2\x82\xAC");
    CHECK_THROWS(TextUtil::UTF32ToUTF8(0x110000), std::runtime_error);
}


TEST(CaseMappingAndCharacterClasses) {
    CHECK_STR_EQ(TextUtil::UTF8ToLower("ÄÖÜ ÉCOLE"), "äöü école");
    CHECK_TRUE(TextUtil::ToUpper(L'ü') == L'Ü');
    CHECK_TRUE(TextUtil::IsAlphabetic(L'é'));
    CHECK_FALSE(TextUtil::IsAlphabetic(L':'));
    CHECK_TRUE(TextUtil::IsWordCharacter(L'_'));
    CHECK_FALSE(TextUtil::IsWordCharacter(L'-'));
    CHECK_FALSE(TextUtil::IsAsciiUppercaseLetterOrDigit(L'É'));
    CHECK_TRUE(TextUtil::IsSpace(L' '));
}


TEST(CStyleEscapeAndUnescape) {
    const std::string original("a \"quoted\"\tline\nwith a \\ backslash");
    const std::string escaped(TextUtil::CStyleEscape(original));
    CHECK_TRUE(escaped.find('\n') == std::string::npos);
    CHECK_STR_EQ(escaped, "a \\\"quoted\\\"\\tline\\nwith a \\\\ backslash");
    CHECK_STR_EQ(TextUtil::CStyleUnescape(escaped), original);
    CHECK_THROWS(TextUtil::CStyleUnescape("bad \\q"), std::runtime_error);
    CHECK_THROWS(TextUtil::CStyleUnescape("trailing \\"), std::runtime_error);
}


TEST(StringUtilTest) {
    CHECK_STR_EQ(StringUtil::TrimWhite("  \tx y \n"), "x y");
    CHECK_TRUE(StringUtil::EndsWith("references.BIB", ".bib", /* ignore_case = */ true));
    CHECK_FALSE(StringUtil::EndsWith("references.BIB", ".bib"));

    std::vector<std::string> parts;
    CHECK_EQ(StringUtil::SplitOnWhiteSpaceAndCommas(" PERSON, GPE\tORG,,", &parts), 3u);
    CHECK_STR_EQ(StringUtil::Join(parts, "|"), "PERSON|GPE|ORG");

    unsigned n;
    CHECK_TRUE(StringUtil::ToUnsigned("42", &n));
    CHECK_EQ(n, 42u);
    CHECK_FALSE(StringUtil::ToUnsigned("4x", &n));

    bool b;
    CHECK_TRUE(StringUtil::ToBool("Yes", &b));
    CHECK_TRUE(b);
    CHECK_FALSE(StringUtil::ToBool("maybe", &b));
}


TEST_MAIN(TextUtil)
