/** \file    IniFile.cc
 *  \brief   Implementation of class IniFile.
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
#include "IniFile.h"
#include <fstream>
#include <stdexcept>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <libgen.h>
#include "BibTools.h"
#include "FileUtil.h"
#include "StringUtil.h"
#include "TextUtil.h"
#include "util.h"


void IniFile::Section::insert(const std::string &variable_name, const std::string &value, const std::string &comment) {
    if (unlikely(hasEntry(variable_name)))
        LOG_ERROR("attempting to insert a duplicate variable name: \"" + variable_name + "\" in section \"" + section_name_ + "\"!");

    entries_.emplace_back(variable_name, value, comment);
}


bool IniFile::Section::lookup(const std::string &variable_name, std::string * const s) const {
    const auto existing_entry(find(variable_name));
    if (existing_entry == entries_.end()) {
        s->clear();
        return false;
    }

    *s = existing_entry->value_;
    return true;
}


std::string IniFile::Section::getString(const std::string &variable_name) const {
    const auto existing_entry(find(variable_name));
    if (unlikely(existing_entry == end()))
        LOG_ERROR("can't find \"" + variable_name + "\" in section \"" + section_name_ + "\"!");

    return existing_entry->value_;
}


std::string IniFile::Section::getString(const std::string &variable_name, const std::string &default_value) const {
    const auto existing_entry(find(variable_name));
    if (unlikely(existing_entry == end()))
        return default_value;

    return existing_entry->value_;
}


bool IniFile::Section::getBool(const std::string &variable_name, const bool default_value) const {
    const auto existing_entry(find(variable_name));
    if (unlikely(existing_entry == end()))
        return default_value;

    bool retval;
    if (not StringUtil::ToBool(existing_entry->value_, &retval))
        LOG_ERROR("invalid boolean value in section \"" + section_name_ + "\", entry \"" + variable_name + "\" (bad value is \""
                  + existing_entry->value_ + "\")!");

    return retval;
}


unsigned IniFile::Section::getUnsigned(const std::string &variable_name, const unsigned default_value) const {
    const auto existing_entry(find(variable_name));
    if (unlikely(existing_entry == end()))
        return default_value;

    unsigned number;
    if (not StringUtil::ToUnsigned(existing_entry->value_, &number))
        LOG_ERROR("invalid unsigned value in section \"" + section_name_ + "\", entry \"" + variable_name + "\" (bad value is \""
                  + existing_entry->value_ + "\")!");

    return number;
}


int IniFile::Section::getEnum(const std::string &variable_name, const std::map<std::string, int> &string_to_value_map,
                              const int default_value) const
{
    const auto existing_entry(find(variable_name));
    if (unlikely(existing_entry == end()))
        return default_value;

    const auto name_and_int_value(string_to_value_map.find(existing_entry->value_));
    if (name_and_int_value == string_to_value_map.end())
        LOG_ERROR("in section \"" + section_name_ + "\": invalid enum value \"" + existing_entry->value_ + "\" for entry \""
                  + variable_name + "\"!");

    return name_and_int_value->second;
}


IniFile::IniFile(const std::string &ini_file_name, const bool treat_missing_as_empty)
    : ini_file_name_(ini_file_name), current_lineno_(0)
{
    if (treat_missing_as_empty and not FileUtil::Exists(ini_file_name_)) {
        LOG_DEBUG("\"" + ini_file_name_ + "\" does not exist, using an empty configuration.");
        return;
    }

    processFile();
}


std::string IniFile::DefaultIniFileName() {
    std::string program_name(::program_invocation_name);
    return BibTools::GetConfigPath() + std::string(::basename(&program_name[0])) + ".conf";
}


IniFile::Section IniFile::getSectionOrEmpty(const std::string &section_name) const {
    const auto section(getSection(section_name));
    return (section == sections_.cend()) ? Section(section_name) : *section;
}


std::vector<std::string> IniFile::getSections() const {
    std::vector<std::string> section_names;
    for (const auto &section : sections_)
        section_names.emplace_back(section.section_name_);

    return section_names;
}


std::string IniFile::locationInfo() const {
    return "on line " + std::to_string(current_lineno_) + " in file \"" + ini_file_name_ + "\"";
}


void IniFile::processSectionHeader(const std::string &line) {
    if (line[line.length() - 1] != ']')
        throw std::runtime_error("in IniFile::processSectionHeader: garbled section header " + locationInfo() + "!");

    const std::string section_name(StringUtil::Trim(" \t", line.substr(1, line.length() - 2)));
    if (section_name.empty())
        throw std::runtime_error("in IniFile::processSectionHeader: empty section name " + locationInfo() + "!");

    if (getSection(section_name) != sections_.cend())
        throw std::runtime_error("in IniFile::processSectionHeader: duplicate section \"" + section_name + "\" " + locationInfo() + "!");
    sections_.emplace_back(section_name);
}


namespace {


// IsValidVariableName -- only allow names that start with a letter followed by letters, digits,
// hyphens, underscores and periods.
//
bool IsValidVariableName(const std::string &possible_variable_name) {
    if (unlikely(possible_variable_name.empty()))
        return false;

    auto ch(possible_variable_name.cbegin());
    if (not std::isalpha(static_cast<unsigned char>(*ch)))
        return false;

    for (++ch; ch != possible_variable_name.cend(); ++ch) {
        if (not std::isalnum(static_cast<unsigned char>(*ch)) and *ch != '-' and *ch != '_' and *ch != '.')
            return false;
    }

    return true;
}


void StripComment(std::string * const line, std::string * const comment) {
    comment->clear();

    bool inside_string_literal(false);
    for (auto character(line->begin()); character != line->end(); ++character) {
        if (*character == '"')
            inside_string_literal = not inside_string_literal;
        else if (*character == '#') {
            if (character != line->begin() and *(character - 1) == '\\')
                continue; // skip escaped hash characters
            else if (inside_string_literal)
                continue;

            const auto comment_start_pos(std::distance(line->begin(), character));
            *comment = line->substr(comment_start_pos);
            line->resize(comment_start_pos);
            return;
        }
    }
}


} // unnamed namespace


void IniFile::processSectionEntry(const std::string &line, const std::string &comment) {
    const size_t equal_sign(line.find('='));
    if (equal_sign == std::string::npos) { // A bare name is shorthand for "name = true".
        const std::string variable_name(StringUtil::TrimWhite(line));
        if (unlikely(not IsValidVariableName(variable_name)))
            throw std::runtime_error("in IniFile::processSectionEntry: invalid variable name \"" + variable_name + "\" "
                                     + locationInfo() + "!");

        sections_.back().insert(variable_name, "true", comment);
        return;
    }

    const std::string variable_name(StringUtil::Trim(" \t", line.substr(0, equal_sign)));
    if (not IsValidVariableName(variable_name))
        throw std::runtime_error("in IniFile::processSectionEntry: invalid variable name \"" + variable_name + "\" " + locationInfo()
                                 + "!");

    std::string value(StringUtil::Trim(" \t", line.substr(equal_sign + 1)));
    if (value.empty())
        throw std::runtime_error("in IniFile::processSectionEntry: missing variable value " + locationInfo() + "!");

    if (value[0] == '"') { // double-quoted string
        if (value.length() == 1 or value[value.length() - 1] != '"')
            throw std::runtime_error("in IniFile::processSectionEntry: improperly quoted value " + locationInfo() + "!");

        try {
            value = TextUtil::CStyleUnescape(value.substr(1, value.length() - 2));
        } catch (const std::runtime_error &x) {
            throw std::runtime_error("in IniFile::processSectionEntry: bad escape " + locationInfo() + "! (" + std::string(x.what())
                                     + ")");
        }
    } else {
        std::string::size_type escaped_hash_pos;
        while ((escaped_hash_pos = value.find("\\#")) != std::string::npos)
            value.erase(escaped_hash_pos, 1);
    }

    sections_.back().insert(variable_name, value, comment);
}


void IniFile::processFile() {
    std::ifstream ini_file(ini_file_name_.c_str());
    if (ini_file.fail())
        throw std::runtime_error("in IniFile::processFile: can't open \"" + ini_file_name_ + "\"! (" + std::string(::strerror(errno))
                                 + ")");

    current_lineno_ = 0;
    while (not ini_file.eof()) {
        std::string line;

        // read lines until newline character is not preceeded by a '\'
        bool continued_line(false);
        do {
            std::string buf;
            std::getline(ini_file, buf);
            ++current_lineno_;
            line += StringUtil::TrimWhite(buf);
            if (line.empty())
                break;

            continued_line = line[line.length() - 1] == '\\' and not ini_file.eof();
            if (continued_line)
                line = StringUtil::Trim(" \t", line.substr(0, line.length() - 1)) + " ";
        } while (continued_line);

        std::string comment;
        StripComment(&line, &comment);
        StringUtil::Trim(" \t", &line);
        if (line.empty())
            continue;

        if (line[0] == '[') // should be a section header!
            processSectionHeader(line);
        else { // should be a new setting!
            if (sections_.empty())
                sections_.emplace_back("");
            processSectionEntry(line, comment);
        }
    }
}
