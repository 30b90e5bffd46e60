/** \file   RegexMatcher.cc
 *  \brief  Implementation of the ThreadSafeRegexMatcher class.
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
#include "RegexMatcher.h"
#include <cstring>
#include "util.h"


namespace {


bool CompileRegex(const std::string &pattern, const unsigned options, ::pcre **pcre_arg, ::pcre_extra **pcre_extra_arg,
                  std::string * const err_msg)
{
    err_msg->clear();

    const char *errptr;
    int erroffset;

    int pcre_options(0);
    if (options & ThreadSafeRegexMatcher::ENABLE_UTF8)
        pcre_options |= PCRE_UTF8;
    if (options & ThreadSafeRegexMatcher::CASE_INSENSITIVE)
        pcre_options |= PCRE_CASELESS;

    *pcre_arg = ::pcre_compile(pattern.c_str(), pcre_options, &errptr, &erroffset, nullptr);
    if (*pcre_arg == nullptr) {
        *pcre_extra_arg = nullptr;
        *err_msg = "failed to compile invalid regular expression: \"" + pattern + "\"! (" + std::string(errptr) + ")";
        return false;
    }

    // Can't use PCRE_STUDY_JIT_COMPILE because it's not thread safe.
    *pcre_extra_arg = ::pcre_study(*pcre_arg, 0, &errptr);
    if (*pcre_extra_arg == nullptr and errptr != nullptr) {
        ::pcre_free(*pcre_arg);
        *pcre_arg = nullptr;
        *err_msg = "failed to \"study\" the compiled pattern \"" + pattern + "\"! (" + std::string(errptr) + ")";
        return false;
    }

    return true;
}


} // unnamed namespace


ThreadSafeRegexMatcher::ThreadSafeRegexMatcher(const std::string &pattern, const unsigned options)
    : pattern_(pattern), options_(options), pcre_data_(new PcreData)
{
    std::string err_msg;
    if (not CompileRegex(pattern_, options_, &pcre_data_->pcre_, &pcre_data_->pcre_extra_, &err_msg))
        LOG_ERROR("failed to compile pattern: \"" + pattern + "\": " + err_msg);
}


bool ThreadSafeRegexMatcher::matched(const std::string &subject, const size_t subject_start_offset, std::string * const err_msg,
                                     size_t * const start_pos, size_t * const end_pos) const
{
    err_msg->clear();

    int substr_indices[(1 + MAX_SUBSTRING_MATCHES) * 3];
    const int retcode(::pcre_exec(pcre_data_->pcre_, pcre_data_->pcre_extra_, subject.data(), subject.length(), subject_start_offset, 0,
                                  substr_indices, sizeof(substr_indices) / sizeof(substr_indices[0])));

    if (retcode == 0) {
        LOG_ERROR("Too many captured substrings! (We only support " + std::to_string(MAX_SUBSTRING_MATCHES)
                  + " substrings.)");
    }

    if (retcode > 0) {
        if (start_pos != nullptr)
            *start_pos = substr_indices[0];
        if (end_pos != nullptr)
            *end_pos = substr_indices[1];
        return true;
    }

    if (retcode != PCRE_ERROR_NOMATCH) {
        if (retcode == PCRE_ERROR_BADUTF8)
            *err_msg = "invalid UTF-8 in subject";
        else if (retcode == PCRE_ERROR_MATCHLIMIT or retcode == PCRE_ERROR_RECURSIONLIMIT)
            *err_msg = "match limit exceeded for pattern '" + pattern_ + "'";
        else
            *err_msg = "unknown PCRE error for pattern '" + pattern_ + "': " + std::to_string(retcode);
    }

    return false;
}


std::string ThreadSafeRegexMatcher::Escape(const std::string &subpattern) {
    static const char * const METACHARACTERS("\\^$.[]|()?*+{}");

    std::string escaped_subpattern;
    for (const char ch : subpattern) {
        if (std::strchr(METACHARACTERS, ch) != nullptr and ch != '\0')
            escaped_subpattern += '\\';
        escaped_subpattern += ch;
    }

    return escaped_subpattern;
}
