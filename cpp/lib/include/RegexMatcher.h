/** \file   RegexMatcher.h
 *  \brief  Interface for the ThreadSafeRegexMatcher class.
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
#include <pcre.h>


/** \class ThreadSafeRegexMatcher
 *  \brief Wrapper class for simple use cases of the PCRE library.  Instances can be shared between threads
 *         because no per-match state is stored in them.
 */
class ThreadSafeRegexMatcher {
public:
    // We need this wrapper class to use the incomplete
    // PCRE types with the STL smart pointers
    struct PcreData {
        ::pcre *pcre_;
        ::pcre_extra *pcre_extra_;
    public:
        PcreData() : pcre_(nullptr), pcre_extra_(nullptr) {}
        ~PcreData() {
            if (pcre_extra_ != nullptr)
                ::pcre_free_study(pcre_extra_);

            if (pcre_ != nullptr)
                ::pcre_free(pcre_);
        }
    };

    enum Option { ENABLE_UTF8 = 1, CASE_INSENSITIVE = 2 }; // These need to be powers of 2.
private:
    static constexpr size_t MAX_SUBSTRING_MATCHES = 20;

    const std::string pattern_;
    const unsigned options_;
    std::shared_ptr<PcreData> pcre_data_;
public:
    // \note Aborts with a log message if "pattern" does not compile.
    explicit ThreadSafeRegexMatcher(const std::string &pattern, const unsigned options = ENABLE_UTF8);
    ThreadSafeRegexMatcher(const ThreadSafeRegexMatcher &rhs)
        : pattern_(rhs.pattern_), options_(rhs.options_), pcre_data_(rhs.pcre_data_) {}

    inline const std::string &getPattern() const { return pattern_; }

    /** \brief Matches "subject" starting at "subject_start_offset".  Neither "subject" nor any substrings are copied.
     *  \param err_msg    Will be set to the empty string on a match or if there simply was no match, o/w to a
     *                    description of what went wrong, e.g. invalid UTF-8 in "subject" or an exceeded match limit.
     *  \param start_pos  If not nullptr and the match succeeded, the offset of the first byte of the match.
     *  \param end_pos    If not nullptr and the match succeeded, the offset of the last byte + 1 of the match.
     *  \return True if we had a match, o/w false.
     */
    bool matched(const std::string &subject, const size_t subject_start_offset, std::string * const err_msg,
                 size_t * const start_pos = nullptr, size_t * const end_pos = nullptr) const;

    /** \brief Escape all PCRE metacharacters in the given string with a backslash (see `man pcrepattern`) */
    static std::string Escape(const std::string &subpattern);
};
