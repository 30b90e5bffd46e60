/** \brief  Tests for ThreadSafeRegexMatcher.
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
#include <string>
#include "RegexMatcher.h"
#include "UnitTest.h"


TEST(MatchedReportsOffsets) {
    const ThreadSafeRegexMatcher matcher("t[a-z]+e\\s*=", ThreadSafeRegexMatcher::CASE_INSENSITIVE);
    const std::string subject("title = {A}, TITLE= {B}");

    std::string err_msg;
    size_t start_pos, end_pos;
    CHECK_TRUE(matcher.matched(subject, 0, &err_msg, &start_pos, &end_pos));
    CHECK_EQ(start_pos, 0u);
    CHECK_EQ(end_pos, 7u);

    CHECK_TRUE(matcher.matched(subject, end_pos, &err_msg, &start_pos, &end_pos));
    CHECK_EQ(start_pos, 13u);
    CHECK_EQ(end_pos, 19u);
    CHECK_TRUE(err_msg.empty());

    CHECK_FALSE(matcher.matched(subject, end_pos, &err_msg));
    CHECK_TRUE(err_msg.empty());
}


TEST(MatchedReportsInvalidUTF8) {
    const ThreadSafeRegexMatcher utf8_matcher("x", ThreadSafeRegexMatcher::ENABLE_UTF8);
    std::string err_msg;
    CHECK_FALSE(utf8_matcher.matched("a\xFF" "x", 0, &err_msg));
    CHECK_FALSE(err_msg.empty());

    const ThreadSafeRegexMatcher byte_matcher("x", 0);
    CHECK_TRUE(byte_matcher.matched("a\xFF" "x", 0, &err_msg));
    CHECK_TRUE(err_msg.empty());
}


// Nested quantifiers on a subject that can't match exhaust PCRE's default match limit.
TEST(MatchedReportsMatchLimit) {
    const ThreadSafeRegexMatcher matcher("(a+)+$", 0);
    std::string err_msg;
    CHECK_FALSE(matcher.matched(std::string(40, 'a') + "!", 0, &err_msg));
    CHECK_FALSE(err_msg.empty());
}


TEST(Escape) {
    CHECK_STR_EQ(ThreadSafeRegexMatcher::Escape("sub-title"), "sub-title");
    CHECK_STR_EQ(ThreadSafeRegexMatcher::Escape("a.b(c)"), "a\\.b\\(c\\)");

    const ThreadSafeRegexMatcher matcher(ThreadSafeRegexMatcher::Escape("a.b"), 0);
    std::string err_msg;
    CHECK_FALSE(matcher.matched("axb", 0, &err_msg));
    CHECK_TRUE(matcher.matched("a.b", 0, &err_msg));
}


TEST_MAIN(RegexMatcher)
