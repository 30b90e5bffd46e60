/** \file    EntityRecognizer.cc
 *  \brief   Implementation of the named-entity recognisers.
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
#include "EntityRecognizer.h"
#include <algorithm>
#include <sstream>
#include <stdexcept>
#include "FileUtil.h"
#include "StringUtil.h"
#include "TextUtil.h"
#include "util.h"


std::unique_ptr<EntityRecognizer> EntityRecognizer::Factory(const IniFile::Section &config_section) {
    const auto type(static_cast<Type>(config_section.getEnum("type", { { "none", static_cast<int>(Type::NONE) },
                                                                       { "gazetteer", static_cast<int>(Type::GAZETTEER) },
                                                                       { "external", static_cast<int>(Type::EXTERNAL) } },
                                                             static_cast<int>(Type::NONE))));
    switch (type) {
    case Type::NONE:
        return std::unique_ptr<EntityRecognizer>(new NullEntityRecognizer());
    case Type::GAZETTEER: {
        const std::string gazetteer_path(config_section.getString("gazetteer_file"));
        std::unique_ptr<GazetteerEntityRecognizer> recognizer(new GazetteerEntityRecognizer(gazetteer_path));
        LOG_INFO("loaded " + std::to_string(recognizer->size()) + " names from \"" + gazetteer_path + "\".");
        return std::unique_ptr<EntityRecognizer>(recognizer.release());
    }
    case Type::EXTERNAL: {
        std::vector<std::string> args;
        StringUtil::SplitThenTrim(config_section.getString("arguments", ""), StringUtil::WHITE_SPACE, StringUtil::WHITE_SPACE, &args);
        return std::unique_ptr<EntityRecognizer>(
            new ExternalEntityRecognizer(config_section.getString("command"), args, config_section.getUnsigned("timeout", 0)));
    }
    }

    LOG_ERROR("unhandled recognizer type " + std::to_string(static_cast<int>(type)) + "!");
}


std::string EntityRecognizerTypeToString(const EntityRecognizer::Type type) {
    switch (type) {
    case EntityRecognizer::Type::NONE:
        return "none";
    case EntityRecognizer::Type::GAZETTEER:
        return "gazetteer";
    case EntityRecognizer::Type::EXTERNAL:
        return "external";
    }

    LOG_ERROR("unknown recognizer type " + std::to_string(static_cast<int>(type)) + "!");
}


GazetteerEntityRecognizer::GazetteerEntityRecognizer(const std::string &gazetteer_path): name_count_(0) {
    std::string gazetteer;
    if (not FileUtil::ReadString(gazetteer_path, &gazetteer))
        throw std::runtime_error("in GazetteerEntityRecognizer::GazetteerEntityRecognizer: can't read \"" + gazetteer_path + "\"!");

    std::istringstream input(gazetteer);
    unsigned line_no(0);
    std::string line;
    while (std::getline(input, line)) {
        ++line_no;
        StringUtil::TrimWhite(&line);
        if (line.empty() or line[0] == '#')
            continue;

        const size_t tab_pos(line.find('\t'));
        if (tab_pos == std::string::npos)
            throw std::runtime_error("in GazetteerEntityRecognizer::GazetteerEntityRecognizer: missing tab on line "
                                     + std::to_string(line_no) + " in \"" + gazetteer_path + "\"!");

        const std::string label(StringUtil::TrimWhite(line.substr(0, tab_pos)));
        const std::string name(StringUtil::TrimWhite(line.substr(tab_pos + 1)));
        if (label.empty() or name.empty())
            throw std::runtime_error("in GazetteerEntityRecognizer::GazetteerEntityRecognizer: empty label or name on line "
                                     + std::to_string(line_no) + " in \"" + gazetteer_path + "\"!");
        addName(label, name);
    }

    for (auto &first_char_and_names : first_char_to_names_map_)
        std::stable_sort(first_char_and_names.second.begin(), first_char_and_names.second.end(),
                         [](const Name &lhs, const Name &rhs) { return lhs.name_.length() > rhs.name_.length(); });
}


void GazetteerEntityRecognizer::addName(const std::string &label, const std::string &name) {
    const std::wstring wide_name(TextUtil::UTF8ToWCharString(name));
    first_char_to_names_map_[wide_name[0]].emplace_back(wide_name, label);
    ++name_count_;
}


void GazetteerEntityRecognizer::getEntitySpans(const std::string &text, std::vector<EntitySpan> * const spans) {
    spans->clear();

    const std::wstring wide_text(TextUtil::UTF8ToWCharString(text));
    size_t pos(0);
    while (pos < wide_text.length()) {
        const auto first_char_and_names(first_char_to_names_map_.find(wide_text[pos]));
        if (first_char_and_names == first_char_to_names_map_.cend()
            or (pos > 0 and TextUtil::IsWordCharacter(wide_text[pos - 1]) and TextUtil::IsWordCharacter(wide_text[pos])))
        {
            ++pos;
            continue;
        }

        bool found_a_match(false);
        for (const auto &name : first_char_and_names->second) {
            const size_t end(pos + name.name_.length());
            if (end > wide_text.length() or wide_text.compare(pos, name.name_.length(), name.name_) != 0)
                continue;
            if (end < wide_text.length() and TextUtil::IsWordCharacter(wide_text[end - 1]) and TextUtil::IsWordCharacter(wide_text[end]))
                continue;

            spans->emplace_back(pos, end, name.label_);
            pos = end;
            found_a_match = true;
            break;
        }

        if (not found_a_match)
            ++pos;
    }
}


ExternalEntityRecognizer::ExternalEntityRecognizer(const std::string &command, const std::vector<std::string> &args,
                                                   const unsigned timeout_in_seconds)
    : coprocess_(command, args, timeout_in_seconds)
{
    LOG_INFO("started entity recognizer \"" + coprocess_.getCommand() + "\" (PID " + std::to_string(coprocess_.getPid()) + ").");
}


void ExternalEntityRecognizer::getEntitySpans(const std::string &text, std::vector<EntitySpan> * const spans) {
    coprocess_.writeLine(TextUtil::CStyleEscape(text));
    const std::string response(coprocess_.readLine());

    std::string error_message;
    if (not ParseEntitySpans(response, spans, &error_message))
        throw std::runtime_error("in ExternalEntityRecognizer::getEntitySpans: bad response from \"" + coprocess_.getCommand() + "\": "
                                 + error_message);
}


bool ParseEntitySpans(const std::string &response, std::vector<EntitySpan> * const spans, std::string * const error_message) {
    spans->clear();
    error_message->clear();

    std::vector<std::string> triples;
    StringUtil::SplitThenTrim(response, StringUtil::WHITE_SPACE, StringUtil::WHITE_SPACE, &triples);
    for (const auto &triple : triples) {
        const size_t first_colon_pos(triple.find(':'));
        const size_t second_colon_pos(first_colon_pos == std::string::npos ? std::string::npos : triple.find(':', first_colon_pos + 1));
        if (second_colon_pos == std::string::npos or second_colon_pos + 1 == triple.length()) {
            *error_message = "malformed triple \"" + triple + "\"!";
            return false;
        }

        unsigned start, end;
        if (not StringUtil::ToUnsigned(triple.substr(0, first_colon_pos), &start)
            or not StringUtil::ToUnsigned(triple.substr(first_colon_pos + 1, second_colon_pos - first_colon_pos - 1), &end))
        {
            *error_message = "bad offset in \"" + triple + "\"!";
            return false;
        }

        spans->emplace_back(start, end, triple.substr(second_colon_pos + 1));
    }

    return true;
}
