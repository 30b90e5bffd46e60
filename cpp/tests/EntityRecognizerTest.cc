/** \brief  Tests for the named-entity recognisers.
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
#include <sys/stat.h>
#include "EntityRecognizer.h"
#include "FileUtil.h"
#include "IniFile.h"
#include "TitleNormalizer.h"
#include "UnitTest.h"


namespace {


const std::string GAZETTEER("# label<TAB>name\n"
                            "GPE\tNew York\n"
                            "GPE\tNew York City\n"
                            "\n"
                            "ORG\tUN\n"
                            "PERSON\tZoë\n");


// Creates an executable shell script that the external recogniser tests use as a coprocess.
void WriteScript(const std::string &path, const std::string &body) {
    FileUtil::WriteStringOrDie(path, "#!/bin/sh\n" + body);
    if (::chmod(path.c_str(), 0700) != 0)
        throw std::runtime_error("in WriteScript: chmod(2) failed on \"" + path + "\"!");
}


} // unnamed namespace


TEST(NullEntityRecognizerTest) {
    NullEntityRecognizer recognizer;
    std::vector<EntitySpan> spans{ EntitySpan(0, 1, "ORG") };
    recognizer.getEntitySpans("The United Nations", &spans);
    CHECK_TRUE(spans.empty());
    CHECK_TRUE(recognizer.getType() == EntityRecognizer::Type::NONE);
}


TEST(GazetteerEntityRecognizerTest) {
    FileUtil::AutoTempFile gazetteer_file("/tmp/EntityRecognizerTest", ".tsv");
    FileUtil::WriteStringOrDie(gazetteer_file.getFilePath(), GAZETTEER);
    GazetteerEntityRecognizer recognizer(gazetteer_file.getFilePath());
    CHECK_EQ(recognizer.size(), 4u);

    std::vector<EntitySpan> spans;
    recognizer.getEntitySpans("New York City and New York, UN UNESCO Zoë", &spans);
    const std::vector<EntitySpan> expected_spans{ EntitySpan(0, 13, "GPE"), EntitySpan(18, 26, "GPE"), EntitySpan(28, 30, "ORG"),
                                                  EntitySpan(38, 41, "PERSON") };
    CHECK_TRUE(spans == expected_spans);
}


TEST(GazetteerEntityRecognizerMatchesWholeWordsOnly) {
    FileUtil::AutoTempFile gazetteer_file("/tmp/EntityRecognizerTest", ".tsv");
    FileUtil::WriteStringOrDie(gazetteer_file.getFilePath(), GAZETTEER);
    GazetteerEntityRecognizer recognizer(gazetteer_file.getFilePath());

    std::vector<EntitySpan> spans;
    recognizer.getEntitySpans("theUN UNs new york", &spans);
    CHECK_TRUE(spans.empty());

    recognizer.getEntitySpans("(UN)", &spans);
    CHECK_EQ(spans.size(), 1u);
    CHECK_TRUE(spans[0] == EntitySpan(1, 3, "ORG"));
}


TEST(GazetteerEntityRecognizerErrors) {
    CHECK_THROWS(GazetteerEntityRecognizer("/no/such/gazetteer.tsv"), std::runtime_error);

    FileUtil::AutoTempFile gazetteer_file("/tmp/EntityRecognizerTest", ".tsv");
    FileUtil::WriteStringOrDie(gazetteer_file.getFilePath(), "GPE\tParis\nLondon\n");
    CHECK_THROWS(GazetteerEntityRecognizer(gazetteer_file.getFilePath()), std::runtime_error);
}


TEST(ParseEntitySpansTest) {
    std::vector<EntitySpan> spans;
    std::string error_message;
    CHECK_TRUE(ParseEntitySpans("0:3:ORG  5:9:WORK_OF_ART", &spans, &error_message));
    const std::vector<EntitySpan> expected_spans{ EntitySpan(0, 3, "ORG"), EntitySpan(5, 9, "WORK_OF_ART") };
    CHECK_TRUE(spans == expected_spans);

    CHECK_TRUE(ParseEntitySpans("", &spans, &error_message));
    CHECK_TRUE(spans.empty());

    CHECK_FALSE(ParseEntitySpans("0:3", &spans, &error_message));
    CHECK_FALSE(error_message.empty());
    CHECK_FALSE(ParseEntitySpans("a:3:ORG", &spans, &error_message));
    CHECK_FALSE(ParseEntitySpans("1:2:", &spans, &error_message));
    CHECK_FALSE(ParseEntitySpans("-1:2:ORG", &spans, &error_message));
}


TEST(ExternalEntityRecognizerTest) {
    FileUtil::AutoTempFile script("./EntityRecognizerTest", ".sh");
    WriteScript(script.getFilePath(), "while read -r line; do\n"
                                      "    echo \"0:3:ORG 4:6:PERSON\"\n"
                                      "done\n");

    ExternalEntityRecognizer recognizer(script.getFilePath(), {});
    CHECK_TRUE(recognizer.getType() == EntityRecognizer::Type::EXTERNAL);

    std::vector<EntitySpan> spans;
    for (unsigned request(0); request < 3; ++request) {
        recognizer.getEntitySpans("UNO Al\nsecond line", &spans);
        CHECK_EQ(spans.size(), 2u);
    }
    CHECK_TRUE(spans[1] == EntitySpan(4, 6, "PERSON"));
}


TEST(ExternalEntityRecognizerFailures) {
    FileUtil::AutoTempFile exiting_script("./EntityRecognizerTest", ".sh");
    WriteScript(exiting_script.getFilePath(), "exit 0\n");
    ExternalEntityRecognizer exiting_recognizer(exiting_script.getFilePath(), {});
    std::vector<EntitySpan> spans;
    CHECK_THROWS(exiting_recognizer.getEntitySpans("Some text", &spans), std::runtime_error);

    FileUtil::AutoTempFile garbling_script("./EntityRecognizerTest", ".sh");
    WriteScript(garbling_script.getFilePath(), "while read -r line; do\n"
                                               "    echo \"garbage\"\n"
                                               "done\n");
    ExternalEntityRecognizer garbling_recognizer(garbling_script.getFilePath(), {});
    CHECK_THROWS(garbling_recognizer.getEntitySpans("Some text", &spans), std::runtime_error);

    CHECK_THROWS(ExternalEntityRecognizer("/no/such/recognizer", {}), std::runtime_error);
}


// The recogniser answers its first request too late and all later ones immediately.  The late answer must never be
// taken for the answer to a later request.
TEST(ExternalEntityRecognizerTimeout) {
    FileUtil::AutoTempFile script("./EntityRecognizerTest", ".sh");
    WriteScript(script.getFilePath(), "read -r line\n"
                                      "sleep 2\n"
                                      "echo \"0:3:PERSON\"\n"
                                      "while read -r line; do\n"
                                      "    echo \"\"\n"
                                      "done\n");
    FileUtil::AutoTempFile config_file("/tmp/EntityRecognizerTest", ".conf");
    FileUtil::WriteStringOrDie(config_file.getFilePath(), "[EntityRecognizer]\n"
                                                          "type = external\n"
                                                          "command = " + script.getFilePath() + "\n"
                                                          "timeout = 1\n");
    const IniFile ini_file(config_file.getFilePath());
    const auto recognizer(EntityRecognizer::Factory(ini_file.getSectionOrEmpty("EntityRecognizer")));
    CHECK_TRUE(recognizer->getType() == EntityRecognizer::Type::EXTERNAL);

    TitleNormalizer::Pipeline pipeline(recognizer.get(), TitleNormalizer::DEFAULT_ENTITY_LABELS, true,
                                       TitleNormalizer::RecognizerFailurePolicy::SKIP);
    std::string result;
    pipeline.normalize("first title", &result);
    CHECK_STR_EQ(result, "First title");
    CHECK_EQ(pipeline.getRecognizerFailureCount(), 1u);

    pipeline.normalize("abcdef ghi", &result);
    CHECK_STR_EQ(result, "Abcdef ghi");
    CHECK_EQ(pipeline.getRecognizerFailureCount(), 2u);

    std::vector<EntitySpan> spans;
    CHECK_THROWS(recognizer->getEntitySpans("abcdef ghi", &spans), std::runtime_error);
    CHECK_TRUE(spans.empty());
}


TEST(Factory) {
    FileUtil::AutoTempFile gazetteer_file("/tmp/EntityRecognizerTest", ".tsv");
    FileUtil::WriteStringOrDie(gazetteer_file.getFilePath(), GAZETTEER);
    FileUtil::AutoTempFile config_file("/tmp/EntityRecognizerTest", ".conf");
    FileUtil::WriteStringOrDie(config_file.getFilePath(), "[EntityRecognizer]\n"
                                                          "type = gazetteer\n"
                                                          "gazetteer_file = " + gazetteer_file.getFilePath() + "\n");
    const IniFile ini_file(config_file.getFilePath());

    const auto gazetteer_recognizer(EntityRecognizer::Factory(ini_file.getSectionOrEmpty("EntityRecognizer")));
    CHECK_TRUE(gazetteer_recognizer->getType() == EntityRecognizer::Type::GAZETTEER);
    std::vector<EntitySpan> spans;
    gazetteer_recognizer->getEntitySpans("Zoë", &spans);
    CHECK_EQ(spans.size(), 1u);

    const auto null_recognizer(EntityRecognizer::Factory(ini_file.getSectionOrEmpty("NoSuchSection")));
    CHECK_TRUE(null_recognizer->getType() == EntityRecognizer::Type::NONE);
    CHECK_STR_EQ(EntityRecognizerTypeToString(null_recognizer->getType()), "none");
}


TEST_MAIN(EntityRecognizer)
