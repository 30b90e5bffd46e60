/** \file   FileUtil.h
 *  \brief  File-related utility functions.
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
#include <unistd.h>


namespace FileUtil {


/** \class AutoTempFile
 *  \brief Creates a temp file and removes it when going out of scope.
 */
class AutoTempFile {
    std::string path_;
    bool automatically_remove_;

public:
    explicit AutoTempFile(const std::string &path_prefix = "/tmp/ATF", const std::string &path_suffix = "",
                          bool automatically_remove = true);
    ~AutoTempFile() {
        if (not path_.empty() and automatically_remove_)
            ::unlink(path_.c_str());
    }

    const std::string &getFilePath() const { return path_; }
};


/** \brief  Does the named file (or directory) exist?.
 *  \param  path           The path of the file.
 *  \param  error_message  Where to store an error message if an error occurred.
 */
bool Exists(const std::string &path, std::string * const error_message = nullptr);


bool WriteString(const std::string &path, const std::string &data);
void WriteStringOrDie(const std::string &path, const std::string &data);
bool ReadString(const std::string &path, std::string * const data);
std::string ReadStringOrDie(const std::string &path);


} // namespace FileUtil
