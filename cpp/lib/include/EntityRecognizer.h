/** \file    EntityRecognizer.h
 *  \brief   Named-entity recognisers that report labelled character spans.
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


#include <memory>
#include <string>
#include <unordered_map>
#include <vector>
#include "ExecUtil.h"
#include "IniFile.h"


// A labelled range of code points.  "start_" is inclusive, "end_" is exclusive.
struct EntitySpan {
    size_t start_, end_;
    std::string label_;

public:
    EntitySpan(const size_t start, const size_t end, const std::string &label): start_(start), end_(end), label_(label) { }

    inline bool operator==(const EntitySpan &rhs) const { return start_ == rhs.start_ and end_ == rhs.end_ and label_ == rhs.label_; }
};


class EntityRecognizer {
public:
    enum class Type { NONE, GAZETTEER, EXTERNAL };

protected:
    EntityRecognizer() = default;

public:
    virtual ~EntityRecognizer() = default;

    virtual Type getType() const = 0;

    /** \brief  Finds the named entities in "text".
     *  \param  text   UTF-8 encoded text.
     *  \param  spans  Where to store the entities, offsets are code point offsets into "text".
     *  \throws std::runtime_error if the recogniser is unavailable.
     */
    virtual void getEntitySpans(const std::string &text, std::vector<EntitySpan> * const spans) = 0;

    /** \brief Creates a recogniser according to the "type" entry of "config_section".
     *  \note  Supported types are "none" (the default), "gazetteer" which requires "gazetteer_file" and "external"
     *         which requires "command" and optionally takes "arguments" and "timeout".  Unknown types abort.
     */
    static std::unique_ptr<EntityRecognizer> Factory(const IniFile::Section &config_section);
};


std::string EntityRecognizerTypeToString(const EntityRecognizer::Type type);


class NullEntityRecognizer final : public EntityRecognizer {
public:
    virtual Type getType() const override final { return Type::NONE; }
    virtual void getEntitySpans(const std::string &/* text */, std::vector<EntitySpan> * const spans) override final { spans->clear(); }
};


/** \class GazetteerEntityRecognizer
 *  \brief Finds entities by looking up names from a list.
 *
 *  The list file has one "LABEL<TAB>name" entry per line.  Empty lines and lines starting with a hash mark are
 *  ignored.  Names are matched case-sensitively and only as whole words.  If several names match at the same
 *  position, the longest one wins.  Matches never overlap.
 */
class GazetteerEntityRecognizer final : public EntityRecognizer {
    struct Name {
        std::wstring name_;
        std::string label_;

    public:
        Name(const std::wstring &name, const std::string &label): name_(name), label_(label) { }
    };

    // Keyed by the first character of the names, longest names first.
    std::unordered_map<wchar_t, std::vector<Name>> first_char_to_names_map_;
    size_t name_count_;

public:
    // \throws std::runtime_error if the list can't be read or contains a malformed line.
    explicit GazetteerEntityRecognizer(const std::string &gazetteer_path);

    inline size_t size() const { return name_count_; }

    virtual Type getType() const override final { return Type::GAZETTEER; }
    virtual void getEntitySpans(const std::string &text, std::vector<EntitySpan> * const spans) override final;

private:
    void addName(const std::string &label, const std::string &name);
};


/** \class ExternalEntityRecognizer
 *  \brief Delegates recognition to a long-running external program.
 *
 *  For every request we send one line to the program's stdin: the text with TextUtil::CStyleEscape() applied.  The
 *  program answers with one line of whitespace-separated "start:end:LABEL" triples, where "start" and "end" are
 *  code point offsets.  An empty line means that there are no entities.  Once a request has timed out or failed,
 *  all further requests throw.
 */
class ExternalEntityRecognizer final : public EntityRecognizer {
    ExecUtil::Coprocess coprocess_;

public:
    // \throws std::runtime_error if the program can't be started.
    ExternalEntityRecognizer(const std::string &command, const std::vector<std::string> &args, const unsigned timeout_in_seconds = 0);

    virtual Type getType() const override final { return Type::EXTERNAL; }

    // \throws std::runtime_error if the program can't be reached or sends a malformed response.
    virtual void getEntitySpans(const std::string &text, std::vector<EntitySpan> * const spans) override final;
};


/** \brief Parses a response line of an external recogniser.
 *  \return False if "response" is malformed, o/w true.
 */
bool ParseEntitySpans(const std::string &response, std::vector<EntitySpan> * const spans, std::string * const error_message);
