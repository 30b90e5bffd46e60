/** \file    ExecUtil.h
 *  \brief   Utility functions for starting and talking to subprocesses.
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
#include <vector>
#include <signal.h>
#include <sys/types.h>


namespace ExecUtil {


/** \class SignalBlocker
 *  \brief Blocks a signal for the livetime of an instance of this class.
 */
class SignalBlocker {
    sigset_t saved_set_;
public:
    explicit SignalBlocker(const int signal_to_block);
    ~SignalBlocker();
};


/** \class Coprocess
 *  \brief A child process that we exchange newline-terminated lines with over its stdin and stdout.
 *
 *  The child inherits our stderr.  The destructor closes the child's stdin, gives it a moment to exit and kills it
 *  with SIGKILL if it doesn't.  After the first failed read or write, e.g. a timeout, requests and responses may no
 *  longer be paired up, so the instance is marked as broken and all further reads and writes throw.
 */
class Coprocess {
    std::string command_;
    pid_t pid_;
    int to_child_fd_, from_child_fd_;
    unsigned timeout_in_seconds_;
    std::string read_buffer_;
    bool broken_;
public:
    /** \param  command             The path to the command that should be executed.  If it contains no slash we
     *                              locate it with Which().
     *  \param  args                The arguments for the command, not including the command itself.
     *  \param  timeout_in_seconds  If not zero, the maximum time that readLine() waits for a response.
     *  \throws std::runtime_error if the command can't be found or started.
     */
    explicit Coprocess(const std::string &command, const std::vector<std::string> &args = std::vector<std::string>{},
                       const unsigned timeout_in_seconds = 0);
    Coprocess(const Coprocess &) = delete;
    Coprocess &operator=(const Coprocess &) = delete;
    ~Coprocess();

    inline pid_t getPid() const { return pid_; }
    inline const std::string &getCommand() const { return command_; }
    inline bool isBroken() const { return broken_; }

    /** \brief Sends "line" followed by a newline to the child.
     *  \note  "line" must not contain a newline.
     *  \throws std::runtime_error if the write fails, e.g. because the child has exited, or if the instance is broken.
     */
    void writeLine(const std::string &line);

    /** \brief Reads the next line, without the terminating newline, from the child's stdout.
     *  \throws std::runtime_error on a read error, on a timeout, if the child closed its stdout or if the instance is
     *          broken.
     */
    std::string readLine();
private:
    void throwIfBroken(const std::string &function_name) const;
    void doWriteLine(const std::string &line);
    std::string doReadLine();
};


/** \brief Tries to find a path, with the help of the environment variable PATH, to "executable_candidate".
 *  \return The path where the executable can be found or the empty string if no such path was found or if
 *          "executable_candidate" is not executable.
 */
std::string Which(const std::string &executable_candidate);


} // namespace ExecUtil
