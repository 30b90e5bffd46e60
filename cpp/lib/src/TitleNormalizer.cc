/** \file    TitleNormalizer.cc
 *  \brief   Implementation of the title normalisation passes.
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
#include "TitleNormalizer.h"
#include <algorithm>
#include <stdexcept>
#include "StringUtil.h"
#include "TextUtil.h"
#include "util.h"


namespace TitleNormalizer {


std::vector<Segment> SplitIntoSegments(const std::wstring &text) {
    std::vector<Segment> segments;

    size_t unprotected_start(0);
    for (;;) {
        const size_t opening_brace_pos(text.find(L'{', unprotected_start));
        if (opening_brace_pos == std::wstring::npos)
            break;
        const size_t closing_brace_pos(text.find(L'}', opening_brace_pos + 1));
        if (closing_brace_pos == std::wstring::npos)
            break;

        if (opening_brace_pos > unprotected_start)
            segments.emplace_back(text.substr(unprotected_start, opening_brace_pos - unprotected_start), /* is_protected = */ false);
        segments.emplace_back(text.substr(opening_brace_pos, closing_brace_pos - opening_brace_pos + 1), /* is_protected = */ true);
        unprotected_start = closing_brace_pos + 1;
    }

    if (unprotected_start < text.length())
        segments.emplace_back(text.substr(unprotected_start), /* is_protected = */ false);

    return segments;
}


const std::unordered_set<std::string> DEFAULT_ENTITY_LABELS{ "PERSON", "GPE", "LOC", "ORG", "NORP", "WORK_OF_ART", "EVENT", "PRODUCT" };


namespace {


// \return The spans that are in range and carry one of "entity_labels", sorted and merged.
std::vector<EntitySpan> SelectAndMergeSpans(const std::vector<EntitySpan> &spans, const size_t segment_length,
                                            const std::unordered_set<std::string> &entity_labels)
{
    std::vector<EntitySpan> selected_spans;
    for (const auto &span : spans) {
        if (entity_labels.find(span.label_) == entity_labels.cend())
            continue;
        if (unlikely(span.start_ >= span.end_ or span.end_ > segment_length)) {
            LOG_WARNING("ignoring out-of-range entity span [" + std::to_string(span.start_) + "," + std::to_string(span.end_) + ") ("
                        + span.label_ + ") for a segment of length " + std::to_string(segment_length) + "!");
            continue;
        }
        selected_spans.emplace_back(span);
    }

    std::sort(selected_spans.begin(), selected_spans.end(),
              [](const EntitySpan &lhs, const EntitySpan &rhs) { return lhs.start_ < rhs.start_; });

    std::vector<EntitySpan> merged_spans;
    for (const auto &span : selected_spans) {
        if (merged_spans.empty() or span.start_ > merged_spans.back().end_)
            merged_spans.emplace_back(span);
        else
            merged_spans.back().end_ = std::max(merged_spans.back().end_, span.end_);
    }

    return merged_spans;
}


inline bool IsAcronym(const std::wstring &token, const bool protect_tokens_with_digits) {
    if (token.length() >= 2 and std::all_of(token.cbegin(), token.cend(), TextUtil::IsAsciiUppercaseLetterOrDigit))
        return true;
    return protect_tokens_with_digits and std::any_of(token.cbegin(), token.cend(), TextUtil::IsDigit);
}


std::wstring ProtectAcronymsInSegment(const std::wstring &segment, const bool protect_tokens_with_digits) {
    std::wstring protected_segment;
    protected_segment.reserve(segment.length());

    size_t pos(0);
    while (pos < segment.length()) {
        if (not TextUtil::IsWordCharacter(segment[pos])) {
            protected_segment += segment[pos++];
            continue;
        }

        const size_t token_start(pos);
        while (pos < segment.length() and TextUtil::IsWordCharacter(segment[pos]))
            ++pos;
        const std::wstring token(segment.substr(token_start, pos - token_start));
        if (IsAcronym(token, protect_tokens_with_digits))
            protected_segment += L'{' + token + L'}';
        else
            protected_segment += token;
    }

    return protected_segment;
}


// Uppercases every letter that follows a colon and optional whitespace.
void CapitalizeAfterColons(std::wstring * const segment) {
    for (size_t pos(0); pos < segment->length(); ++pos) {
        if ((*segment)[pos] != L':')
            continue;

        size_t letter_pos(pos + 1);
        while (letter_pos < segment->length() and TextUtil::IsSpace((*segment)[letter_pos]))
            ++letter_pos;
        if (letter_pos < segment->length() and TextUtil::IsAlphabetic((*segment)[letter_pos]))
            (*segment)[letter_pos] = TextUtil::ToUpper((*segment)[letter_pos]);
        pos = letter_pos - 1;
    }
}


} // unnamed namespace


std::string ProtectEntities(const std::string &title, EntityRecognizer * const recognizer,
                            const std::unordered_set<std::string> &entity_labels)
{
    if (recognizer == nullptr)
        return title;

    std::wstring protected_title;
    for (const auto &segment : SplitIntoSegments(TextUtil::UTF8ToWCharString(title))) {
        if (segment.is_protected_) {
            protected_title += segment.text_;
            continue;
        }

        std::vector<EntitySpan> spans;
        recognizer->getEntitySpans(TextUtil::WCharToUTF8String(segment.text_), &spans);
        const auto merged_spans(SelectAndMergeSpans(spans, segment.text_.length(), entity_labels));

        size_t last_end(0);
        for (const auto &span : merged_spans) {
            protected_title += segment.text_.substr(last_end, span.start_ - last_end);
            protected_title += L'{' + segment.text_.substr(span.start_, span.end_ - span.start_) + L'}';
            last_end = span.end_;
        }
        protected_title += segment.text_.substr(last_end);
    }

    return TextUtil::WCharToUTF8String(protected_title);
}


std::string ProtectAcronyms(const std::string &title, const bool protect_tokens_with_digits) {
    std::wstring protected_title;
    for (const auto &segment : SplitIntoSegments(TextUtil::UTF8ToWCharString(title)))
        protected_title += segment.is_protected_ ? segment.text_ : ProtectAcronymsInSegment(segment.text_, protect_tokens_with_digits);

    return TextUtil::WCharToUTF8String(protected_title);
}


std::string ConvertToSentenceCase(const std::string &title) {
    std::wstring sentence_cased_title;
    bool capitalized_first_letter(false);
    for (auto &segment : SplitIntoSegments(TextUtil::UTF8ToWCharString(title))) {
        if (segment.is_protected_) {
            sentence_cased_title += segment.text_;
            continue;
        }

        TextUtil::ToLower(&segment.text_);
        if (not capitalized_first_letter) {
            const auto first_letter(std::find_if(segment.text_.begin(), segment.text_.end(), TextUtil::IsAlphabetic));
            if (first_letter != segment.text_.end()) {
                *first_letter = TextUtil::ToUpper(*first_letter);
                capitalized_first_letter = true;
            }
        }
        CapitalizeAfterColons(&segment.text_);

        sentence_cased_title += segment.text_;
    }

    return TextUtil::WCharToUTF8String(sentence_cased_title);
}


Pipeline::Pipeline(EntityRecognizer * const recognizer, const std::unordered_set<std::string> &entity_labels,
                   const bool protect_tokens_with_digits, const RecognizerFailurePolicy recognizer_failure_policy)
    : recognizer_(recognizer), entity_labels_(entity_labels), protect_tokens_with_digits_(protect_tokens_with_digits),
      recognizer_failure_policy_(recognizer_failure_policy), recognizer_failure_count_(0)
{
}


Pipeline::Pipeline(EntityRecognizer * const recognizer, const IniFile::Section &config_section)
    : recognizer_(recognizer), protect_tokens_with_digits_(config_section.getBool("protect_tokens_with_digits", true)),
      recognizer_failure_policy_(static_cast<RecognizerFailurePolicy>(
          config_section.getEnum("on_recognizer_failure",
                                 { { "abort", static_cast<int>(RecognizerFailurePolicy::ABORT) },
                                   { "skip", static_cast<int>(RecognizerFailurePolicy::SKIP) } },
                                 static_cast<int>(RecognizerFailurePolicy::ABORT)))),
      recognizer_failure_count_(0)
{
    std::string entity_labels;
    if (not config_section.lookup("entity_labels", &entity_labels))
        entity_labels_ = DEFAULT_ENTITY_LABELS;
    else {
        StringUtil::SplitOnWhiteSpaceAndCommas(entity_labels, &entity_labels_);
        if (entity_labels_.empty())
            LOG_WARNING("\"entity_labels\" is empty, no named entities will be protected!");
    }
}


bool Pipeline::normalize(const std::string &raw_title, std::string * const normalized_title) {
    std::string entities_protected;
    try {
        entities_protected = ProtectEntities(raw_title, recognizer_, entity_labels_);
    } catch (const std::runtime_error &x) {
        if (recognizer_failure_policy_ == RecognizerFailurePolicy::ABORT)
            throw;

        ++recognizer_failure_count_;
        LOG_WARNING("entity recognition failed for \"" + raw_title + "\", protecting acronyms only! (" + std::string(x.what()) + ")");
        entities_protected = raw_title;
    }

    *normalized_title = ConvertToSentenceCase(ProtectAcronyms(entities_protected, protect_tokens_with_digits_));
    return *normalized_title != raw_title;
}


} // namespace TitleNormalizer
