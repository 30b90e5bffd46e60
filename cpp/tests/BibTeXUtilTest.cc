/** \brief  Tests for the BibTeX field rewriting.
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
#include "BibTeXUtil.h"
#include "TitleNormalizer.h"
#include "UnitTest.h"


TEST(NormalizeTitleFieldsPreservesSurroundingBytes) {
    const std::string document("% A comment with title = {not a FIELD}?\n"
                               "@article{key1,\n"
                               "  author = {Doe, Jane},\n"
                               "  title  =  {The {Structure} of NASA MISSIONS},\n"
                               "  year = 2001\n"
                               "}\n"
                               "\n"
                               "@book{key2, TITLE={An already correct title}, booktitle = {PROCEEDINGS OF Things}}\n");
    TitleNormalizer::Pipeline pipeline(nullptr);
    std::string rewritten_document;
    const auto stats(BibTeXUtil::NormalizeTitleFields(document, &pipeline, { "title" }, &rewritten_document));

    CHECK_EQ(stats.title_count_, 3u);
    CHECK_EQ(stats.changed_count_, 2u);
    CHECK_STR_EQ(rewritten_document, "% A comment with title = {Not a {FIELD}}?\n"
                                     "@article{key1,\n"
                                     "  author = {Doe, Jane},\n"
                                     "  title  =  {The {Structure} of {NASA} {MISSIONS}},\n"
                                     "  year = 2001\n"
                                     "}\n"
                                     "\n"
                                     "@book{key2, TITLE={An already correct title}, booktitle = {PROCEEDINGS OF Things}}\n");
}


TEST(NormalizeTitleFieldsWithSeveralFieldNames) {
    const std::string document("@inproceedings{k, title = {On TOPICS}, booktitle = {the WORKSHOP: day one}, sub-title = {x}}");
    TitleNormalizer::Pipeline pipeline(nullptr);
    std::string rewritten_document;
    const auto stats(BibTeXUtil::NormalizeTitleFields(document, &pipeline, { "title", "booktitle" }, &rewritten_document));

    CHECK_EQ(stats.title_count_, 2u);
    CHECK_EQ(stats.changed_count_, 2u);
    CHECK_STR_EQ(rewritten_document,
                 "@inproceedings{k, title = {On {TOPICS}}, booktitle = {The {WORKSHOP}: Day one}, sub-title = {x}}");
}


TEST(NormalizeTitleFieldsWithUnbalancedBraces) {
    const std::string document("@article{a, title = {Fine title}}\n"
                               "@article{b, title = {Broken {TITLE}\n");
    TitleNormalizer::Pipeline pipeline(nullptr);
    std::string rewritten_document;
    const auto stats(BibTeXUtil::NormalizeTitleFields(document, &pipeline, { "title" }, &rewritten_document));

    CHECK_EQ(stats.title_count_, 1u);
    CHECK_EQ(stats.changed_count_, 0u);
    CHECK_STR_EQ(rewritten_document, document);
}


TEST(NormalizeTitleFieldsWithoutTitles) {
    TitleNormalizer::Pipeline pipeline(nullptr);
    std::string rewritten_document("stale");
    const auto stats(BibTeXUtil::NormalizeTitleFields("", &pipeline, { "title" }, &rewritten_document));
    CHECK_EQ(stats.title_count_, 0u);
    CHECK_STR_EQ(rewritten_document, "");

    CHECK_THROWS(BibTeXUtil::NormalizeTitleFields("", &pipeline, {}, &rewritten_document), std::runtime_error);
}


TEST_MAIN(BibTeXUtil)
