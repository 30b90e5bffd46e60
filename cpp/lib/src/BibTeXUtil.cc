/** \file    BibTeXUtil.cc
 *  \brief   Implementation of the BibTeX rewriting functions.
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
#include "BibTeXUtil.h"
#include <algorithm>
#include <stdexcept>
#include "RegexMatcher.h"
#include "StringUtil.h"
#include "util.h"


namespace BibTeXUtil {


namespace {


// \return The position of the closing brace that balances an opening brace just before "start" or std::string::npos.
size_t FindBalancingBrace(const std::string &document, const size_t start) {
    unsigned depth(1);
    for (size_t pos(start); pos < document.length(); ++pos) {
        if (document[pos] == '{')
            ++depth;
        else if (document[pos] == '}' and --depth == 0)
            return pos;
    }

    return std::string::npos;
}


unsigned LineNumber(const std::string &document, const size_t pos) {
    return 1 + static_cast<unsigned>(std::count(document.cbegin(), document.cbegin() + pos, '\n'));
}


} // unnamed namespace


RewriteStats NormalizeTitleFields(const std::string &document, TitleNormalizer::Pipeline * const pipeline,
                                  const std::vector<std::string> &field_names, std::string * const rewritten_document)
{
    if (unlikely(field_names.empty()))
        throw std::runtime_error("in BibTeXUtil::NormalizeTitleFields: no field names!");

    std::vector<std::string> escaped_field_names;
    for (const auto &field_name : field_names)
        escaped_field_names.emplace_back(ThreadSafeRegexMatcher::Escape(field_name));
    const ThreadSafeRegexMatcher field_matcher("(?<![\\w-])(?:" + StringUtil::Join(escaped_field_names, "|") + ")\\s*=\\s*\\{",
                                               ThreadSafeRegexMatcher::CASE_INSENSITIVE);

    RewriteStats stats;
    rewritten_document->clear();
    rewritten_document->reserve(document.length());

    size_t copied_up_to(0), search_start(0), match_start, value_start;
    std::string err_msg;
    while (field_matcher.matched(document, search_start, &err_msg, &match_start, &value_start)) {
        const size_t closing_brace_pos(FindBalancingBrace(document, value_start));
        if (closing_brace_pos == std::string::npos) {
            LOG_WARNING("unbalanced braces in the field value starting on line " + std::to_string(LineNumber(document, match_start))
                        + ", leaving it alone!");
            search_start = value_start;
            continue;
        }

        const std::string raw_title(document.substr(value_start, closing_brace_pos - value_start));
        std::string normalized_title;
        ++stats.title_count_;
        if (pipeline->normalize(raw_title, &normalized_title)) {
            ++stats.changed_count_;
            LOG_DEBUG("\"" + raw_title + "\" => \"" + normalized_title + "\"");
        }

        rewritten_document->append(document, copied_up_to, value_start - copied_up_to);
        *rewritten_document += normalized_title;
        copied_up_to = search_start = closing_brace_pos;
    }
    if (unlikely(not err_msg.empty()))
        throw std::runtime_error("in BibTeXUtil::NormalizeTitleFields: field search failed near line "
                                 + std::to_string(LineNumber(document, search_start)) + ": " + err_msg);
    rewritten_document->append(document, copied_up_to, std::string::npos);

    return stats;
}


} // namespace BibTeXUtil
