/** \brief Converts the titles of a BibTeX database to sentence case while protecting named entities and acronyms.
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
#include <memory>
#include <vector>
#include <cstdlib>
#include "BibTeXUtil.h"
#include "EntityRecognizer.h"
#include "FileUtil.h"
#include "IniFile.h"
#include "StringUtil.h"
#include "TitleNormalizer.h"
#include "util.h"


namespace {


[[noreturn]] void Usage() {
    ::Usage("[--min-log-level=log_level] [--config-file=path] input.bib [output.bib]\n"
            "\tIf no output file has been specified, the output will be written to the input file name with the\n"
            "\t\".bib\" extension replaced by \".cleaned.bib\".  Without --config-file we use\n"
            "\t\"" + IniFile::DefaultIniFileName() + "\" if it exists and built-in defaults o/w.\n");
}


std::string DefaultOutputFilename(const std::string &input_filename) {
    const std::string BIB_EXTENSION(".bib");
    if (StringUtil::EndsWith(input_filename, BIB_EXTENSION, /* ignore_case = */ true))
        return input_filename.substr(0, input_filename.length() - BIB_EXTENSION.length()) + ".cleaned.bib";
    return input_filename + ".cleaned.bib";
}


} // unnamed namespace


int Main(int argc, char *argv[]) {
    if (argc < 2)
        Usage();

    std::unique_ptr<IniFile> ini_file;
    const std::string CONFIG_FILE_FLAG_PREFIX("--config-file=");
    if (StringUtil::StartsWith(argv[1], CONFIG_FILE_FLAG_PREFIX)) {
        ini_file.reset(new IniFile(argv[1] + CONFIG_FILE_FLAG_PREFIX.length()));
        --argc, ++argv;
    } else
        ini_file.reset(new IniFile(IniFile::DefaultIniFileName(), /* treat_missing_as_empty = */ true));

    if (argc != 2 and argc != 3)
        Usage();

    const std::string input_filename(argv[1]);
    const std::string output_filename(argc == 3 ? argv[2] : DefaultOutputFilename(input_filename));
    if (output_filename == input_filename)
        LOG_ERROR("input file and output file must not be the same!");

    const std::string document(FileUtil::ReadStringOrDie(input_filename));

    const auto recognizer(EntityRecognizer::Factory(ini_file->getSectionOrEmpty("EntityRecognizer")));
    LOG_DEBUG("using the \"" + EntityRecognizerTypeToString(recognizer->getType()) + "\" entity recognizer.");

    const auto title_normalizer_section(ini_file->getSectionOrEmpty("TitleNormalizer"));
    TitleNormalizer::Pipeline pipeline(recognizer.get(), title_normalizer_section);

    std::vector<std::string> title_fields;
    StringUtil::SplitOnWhiteSpaceAndCommas(title_normalizer_section.getString("title_fields", "title"), &title_fields);
    if (title_fields.empty())
        LOG_ERROR("\"title_fields\" in section \"TitleNormalizer\" must not be empty!");

    std::string rewritten_document;
    const auto stats(BibTeXUtil::NormalizeTitleFields(document, &pipeline, title_fields, &rewritten_document));
    FileUtil::WriteStringOrDie(output_filename, rewritten_document);

    LOG_INFO("Processed titles: " + std::to_string(stats.title_count_));
    LOG_INFO("Titles changed: " + std::to_string(stats.changed_count_));
    if (pipeline.getRecognizerFailureCount() > 0)
        LOG_WARNING("entity recognition failed for " + std::to_string(pipeline.getRecognizerFailureCount()) + " title(s)!");
    LOG_INFO("Cleaned file written to: " + output_filename);

    return EXIT_SUCCESS;
}
