/** \file    ExecUtil.cc
 *  \brief   Implementation of the ExecUtil functions and classes.
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
#include "ExecUtil.h"
#include <stdexcept>
#include <unordered_map>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <ctime>
#include <fcntl.h>
#include <poll.h>
#include <sys/stat.h>
#include <sys/wait.h>
#include <unistd.h>
#include "StringUtil.h"
#include "util.h"


namespace {


const int EXECVE_FAILURE(248);


bool IsExecutableFile(const std::string &path) {
    struct stat statbuf;
    return ::stat(path.c_str(), &statbuf) == 0 and S_ISREG(statbuf.st_mode) and (statbuf.st_mode & S_IXUSR);
}


std::string SafeGetEnv(const char * const name) {
    const char * const value(::getenv(name));
    return (value == nullptr) ? "" : value;
}


void CloseOrWarn(const int fd) {
    if (fd != -1 and ::close(fd) != 0)
        LOG_WARNING("close(2) failed: " + std::string(::strerror(errno)));
}


} // unnamed namespace


namespace ExecUtil {


SignalBlocker::SignalBlocker(const int signal_to_block) {
    sigset_t new_set;
    ::sigemptyset(&new_set);
    ::sigaddset(&new_set, signal_to_block);
    if (::pthread_sigmask(SIG_BLOCK, &new_set, &saved_set_) != 0)
        LOG_ERROR("call to pthread_sigmask(3) failed!");
}


SignalBlocker::~SignalBlocker() {
    if (::pthread_sigmask(SIG_SETMASK, &saved_set_, nullptr) != 0)
        LOG_ERROR("call to pthread_sigmask(3) failed!");
}


Coprocess::Coprocess(const std::string &command, const std::vector<std::string> &args, const unsigned timeout_in_seconds)
    : pid_(-1), to_child_fd_(-1), from_child_fd_(-1), timeout_in_seconds_(timeout_in_seconds), broken_(false)
{
    command_ = Which(command);
    if (command_.empty())
        throw std::runtime_error("in ExecUtil::Coprocess::Coprocess: can't find an executable \"" + command + "\"!");

    int to_child[2], from_child[2];
    if (::pipe2(to_child, O_CLOEXEC) != 0)
        throw std::runtime_error("in ExecUtil::Coprocess::Coprocess: pipe2(2) failed: " + std::string(::strerror(errno)));
    if (::pipe2(from_child, O_CLOEXEC) != 0) {
        const int saved_errno(errno);
        ::close(to_child[0]), ::close(to_child[1]);
        throw std::runtime_error("in ExecUtil::Coprocess::Coprocess: pipe2(2) failed: " + std::string(::strerror(saved_errno)));
    }

    // Build the argument list for execv(2) before forking:
    std::vector<char *> argv;
    argv.emplace_back(const_cast<char *>(command_.c_str()));
    for (const auto &arg : args)
        argv.emplace_back(const_cast<char *>(arg.c_str()));
    argv.emplace_back(nullptr);

    pid_ = ::fork();
    if (pid_ == -1) {
        const int saved_errno(errno);
        ::close(to_child[0]), ::close(to_child[1]), ::close(from_child[0]), ::close(from_child[1]);
        throw std::runtime_error("in ExecUtil::Coprocess::Coprocess: fork(2) failed: " + std::string(::strerror(saved_errno)));
    }

    // The child process:
    if (pid_ == 0) {
        if (::dup2(to_child[0], STDIN_FILENO) == -1 or ::dup2(from_child[1], STDOUT_FILENO) == -1)
            ::_exit(EXECVE_FAILURE);
        ::execv(command_.c_str(), argv.data());
        ::_exit(EXECVE_FAILURE); // We typically never get here.
    }

    // The parent of the fork:
    ::close(to_child[0]);
    ::close(from_child[1]);
    to_child_fd_ = to_child[1];
    from_child_fd_ = from_child[0];
    LOG_DEBUG("started \"" + command_ + "\" with PID " + std::to_string(pid_) + ".");
}


Coprocess::~Coprocess() {
    CloseOrWarn(to_child_fd_);
    CloseOrWarn(from_child_fd_);
    if (pid_ <= 0)
        return;

    // Closing the child's stdin should make it exit on its own, we give it a second to do so.
    int child_exit_status;
    for (unsigned attempt(0); attempt < 20; ++attempt) {
        const pid_t wait_retval(::waitpid(pid_, &child_exit_status, WNOHANG));
        if (wait_retval == pid_ or (wait_retval == -1 and errno != EINTR)) {
            if (wait_retval == pid_ and WIFEXITED(child_exit_status) and WEXITSTATUS(child_exit_status) == EXECVE_FAILURE)
                LOG_WARNING("failed to execv(2) \"" + command_ + "\"!");
            return;
        }
        const struct timespec fifty_milliseconds{ 0, 50 * 1000 * 1000 };
        ::nanosleep(&fifty_milliseconds, nullptr);
    }

    LOG_WARNING("\"" + command_ + "\" (PID " + std::to_string(pid_) + ") did not exit, killing it.");
    ::kill(pid_, SIGKILL);
    while (::waitpid(pid_, &child_exit_status, 0) == -1 and errno == EINTR)
        /* Intentionally empty! */;
}


void Coprocess::throwIfBroken(const std::string &function_name) const {
    if (unlikely(broken_))
        throw std::runtime_error("in ExecUtil::Coprocess::" + function_name + ": \"" + command_
                                 + "\" is out of sync after an earlier failure!");
}


void Coprocess::writeLine(const std::string &line) {
    throwIfBroken("writeLine");
    if (unlikely(line.find('\n') != std::string::npos))
        throw std::runtime_error("in ExecUtil::Coprocess::writeLine: line contains a newline!");

    try {
        doWriteLine(line);
    } catch (const std::runtime_error &) {
        broken_ = true;
        throw;
    }
}


std::string Coprocess::readLine() {
    throwIfBroken("readLine");
    try {
        return doReadLine();
    } catch (const std::runtime_error &) {
        broken_ = true;
        throw;
    }
}


void Coprocess::doWriteLine(const std::string &line) {
    const std::string data(line + "\n");

    // A child that has exited would get us killed by SIGPIPE, so we block it and consume any pending instance.
    SignalBlocker sigpipe_blocker(SIGPIPE);
    size_t total_written(0);
    while (total_written < data.length()) {
        const ssize_t written(::write(to_child_fd_, data.data() + total_written, data.length() - total_written));
        if (written == -1) {
            if (errno == EINTR)
                continue;

            const int saved_errno(errno);
            if (saved_errno == EPIPE) {
                sigset_t sigpipe_set;
                ::sigemptyset(&sigpipe_set);
                ::sigaddset(&sigpipe_set, SIGPIPE);
                const struct timespec no_wait{ 0, 0 };
                ::sigtimedwait(&sigpipe_set, nullptr, &no_wait);
            }
            throw std::runtime_error("in ExecUtil::Coprocess::writeLine: write to \"" + command_ + "\" failed: "
                                     + std::string(::strerror(saved_errno)));
        }
        total_written += static_cast<size_t>(written);
    }
}


std::string Coprocess::doReadLine() {
    for (;;) {
        const size_t newline_pos(read_buffer_.find('\n'));
        if (newline_pos != std::string::npos) {
            const std::string line(read_buffer_.substr(0, newline_pos));
            read_buffer_.erase(0, newline_pos + 1);
            return line;
        }

        struct pollfd poll_fd{ from_child_fd_, POLLIN, 0 };
        const int poll_retval(::poll(&poll_fd, 1, timeout_in_seconds_ == 0 ? -1 : static_cast<int>(timeout_in_seconds_ * 1000)));
        if (poll_retval == -1) {
            if (errno == EINTR)
                continue;
            throw std::runtime_error("in ExecUtil::Coprocess::readLine: poll(2) failed: " + std::string(::strerror(errno)));
        }
        if (poll_retval == 0)
            throw std::runtime_error("in ExecUtil::Coprocess::readLine: \"" + command_ + "\" did not respond within "
                                     + std::to_string(timeout_in_seconds_) + " seconds!");

        char buf[4096];
        const ssize_t count(::read(from_child_fd_, buf, sizeof buf));
        if (count == -1) {
            if (errno == EINTR)
                continue;
            throw std::runtime_error("in ExecUtil::Coprocess::readLine: read from \"" + command_ + "\" failed: "
                                     + std::string(::strerror(errno)));
        }
        if (count == 0)
            throw std::runtime_error("in ExecUtil::Coprocess::readLine: \"" + command_ + "\" closed its output!");
        read_buffer_.append(buf, static_cast<size_t>(count));
    }
}


std::unordered_map<std::string, std::string> which_cache;


std::string Which(const std::string &executable_candidate) {
    auto which_cache_entry = which_cache.find(executable_candidate);
    if (which_cache_entry != which_cache.cend())
        return which_cache_entry->second;

    std::string executable;

    if (executable_candidate.find('/') != std::string::npos) {
        if (not IsExecutableFile(executable_candidate))
            return "";
        executable = executable_candidate;
    } else {
        const auto PATH(SafeGetEnv("PATH"));
        if (PATH.empty())
            return "";

        std::vector<std::string> path_components;
        StringUtil::SplitThenTrimWhite(PATH, ':', &path_components);
        for (const auto &path_component : path_components) {
            const std::string full_path(path_component + "/" + executable_candidate);
            if (IsExecutableFile(full_path)) {
                executable = full_path;
                break;
            }
        }
    }

    if (executable.empty())
        return "";

    which_cache[executable_candidate] = executable;
    return executable;
}


} // namespace ExecUtil
