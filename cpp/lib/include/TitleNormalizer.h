/** \file    TitleNormalizer.h
 *  \brief   Case normalisation of bibliographic titles with brace protection.
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
#include <unordered_set>
#include <vector>
#include "EntityRecognizer.h"
#include "IniFile.h"


/** \namespace TitleNormalizer
 *  \brief     Converts titles to sentence case without destroying proper nouns and acronyms.
 *
 *  A pair of curly braces marks a protected span in the BibTeX sense: its contents are never recased.  The passes in
 *  this namespace first wrap named entities and acronyms in braces, then convert everything outside of braces to
 *  sentence case.  Text that already is in braces is passed through unchanged by all passes.
 */
namespace TitleNormalizer {


// Either one complete protected span, braces included, or text without a complete protected span.
struct Segment {
    std::wstring text_;
    bool is_protected_;

public:
    Segment(const std::wstring &text, const bool is_protected): text_(text), is_protected_(is_protected) { }

    inline bool operator==(const Segment &rhs) const { return text_ == rhs.text_ and is_protected_ == rhs.is_protected_; }
};


/** \brief Splits "text" into protected and unprotected segments.
 *  \note  An opening brace is paired with the first closing brace that follows it, the contents are not inspected
 *         for further braces.  An opening brace without a closing brace is ordinary text.  Concatenating the
 *         segments always yields "text" and no segment is empty.
 */
std::vector<Segment> SplitIntoSegments(const std::wstring &text);


// The named-entity labels that get protected unless configured otherwise.
extern const std::unordered_set<std::string> DEFAULT_ENTITY_LABELS;


/** \brief Wraps the named entities of the unprotected parts of "title" in braces.
 *  \param recognizer      Called once per unprotected segment, may be nullptr in which case "title" is returned as is.
 *  \param entity_labels   Only entities with one of these labels get protected.
 *  \note  Overlapping or touching entities are protected as one span.
 *  \throws std::runtime_error if "recognizer" fails.
 */
std::string ProtectEntities(const std::string &title, EntityRecognizer * const recognizer,
                            const std::unordered_set<std::string> &entity_labels = DEFAULT_ENTITY_LABELS);


/** \brief Wraps each acronym of the unprotected parts of "title" in braces.
 *  \note  A word is considered an acronym if it consists of at least two uppercase ASCII letters or digits.  If
 *         "protect_tokens_with_digits" is true, any word that contains a digit is an acronym, too.
 */
std::string ProtectAcronyms(const std::string &title, const bool protect_tokens_with_digits = true);


/** \brief Lowercases the unprotected parts of "title", then uppercases the first letter of the title as well as each
 *         letter that directly follows a colon and optional whitespace.
 */
std::string ConvertToSentenceCase(const std::string &title);


enum class RecognizerFailurePolicy { ABORT, SKIP };


/** \class Pipeline
 *  \brief Entity protection, acronym protection and sentence casing, in that order.
 */
class Pipeline {
    EntityRecognizer *recognizer_;
    std::unordered_set<std::string> entity_labels_;
    bool protect_tokens_with_digits_;
    RecognizerFailurePolicy recognizer_failure_policy_;
    unsigned recognizer_failure_count_;

public:
    /** \param recognizer  Not owned by the pipeline.  May be nullptr in which case no entities will be protected.
     */
    explicit Pipeline(EntityRecognizer * const recognizer, const std::unordered_set<std::string> &entity_labels = DEFAULT_ENTITY_LABELS,
                      const bool protect_tokens_with_digits = true,
                      const RecognizerFailurePolicy recognizer_failure_policy = RecognizerFailurePolicy::ABORT);

    /** \brief Reads the settings from a "TitleNormalizer" configuration section.
     *  \note  Recognised entries are "entity_labels", "protect_tokens_with_digits" and "on_recognizer_failure".
     */
    Pipeline(EntityRecognizer * const recognizer, const IniFile::Section &config_section);

    /** \brief Normalises "raw_title".
     *  \return True if "*normalized_title" differs from "raw_title", o/w false.
     *  \throws std::runtime_error if the recogniser fails and the failure policy is RecognizerFailurePolicy::ABORT.
     */
    bool normalize(const std::string &raw_title, std::string * const normalized_title);

    inline const std::unordered_set<std::string> &getEntityLabels() const { return entity_labels_; }
    inline bool protectsTokensWithDigits() const { return protect_tokens_with_digits_; }
    inline RecognizerFailurePolicy getRecognizerFailurePolicy() const { return recognizer_failure_policy_; }

    // \return The number of titles for which the recogniser failed and the entity pass was skipped.
    inline unsigned getRecognizerFailureCount() const { return recognizer_failure_count_; }
};


} // namespace TitleNormalizer
