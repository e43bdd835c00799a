/*
 * Copyright (C) 2020 Emeric Poupon
 *
 * This file is part of PFS.
 *
 * PFS is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * PFS is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with PFS.  If not, see <http://www.gnu.org/licenses/>.
 */

#include "ChildProcess.hpp"

#include <fcntl.h>
#include <signal.h>
#include <sys/wait.h>

#include <algorithm>
#include <cassert>
#include <cerrno>
#include <iterator>
#include <mutex>
#include <system_error>

#include <boost/asio/buffer.hpp>
#include <boost/asio/read.hpp>

#include "core/ILogger.hpp"

namespace pfs::core
{
    namespace
    {
        class ChildProcessSystemException : public ChildProcessException
        {
        public:
            ChildProcessSystemException(std::error_code err, const std::string& errMsg)
                : ChildProcessException{ errMsg + ": " + err.message() }
            {
            }

            ChildProcessSystemException(boost::system::error_code ec, const std::string& errMsg)
                : ChildProcessException{ errMsg + ": " + ec.message() }
            {
            }
        };
    } // namespace

    ChildProcess::ChildProcess(boost::asio::io_context& ioContext, const std::filesystem::path& path, const Args& args)
        : _childStdout{ ioContext }
    {
        // make sure only one thread is executing this part of code
        static std::mutex mutex;
        const std::scoped_lock lock{ mutex };

        int pipefd[2];

        if (pipe(pipefd) == -1)
            throw ChildProcessSystemException{ std::error_code{ errno, std::generic_category() }, "pipe failed!" };

        // Only set O_NONBLOCK on read end - usually programs don't expect stdout to be non-blocking
        if (fcntl(pipefd[0], F_SETFL, O_NONBLOCK) == -1)
        {
            const std::error_code ec{ errno, std::generic_category() };
            close(pipefd[0]);
            close(pipefd[1]);
            throw ChildProcessSystemException{ ec, "fcntl failed to set O_NONBLOCK!" };
        }

        const int res{ fork() };
        if (res == -1)
        {
            const std::error_code ec{ errno, std::generic_category() };
            close(pipefd[0]);
            close(pipefd[1]);
            throw ChildProcessSystemException{ ec, "fork failed!" };
        }

        if (res == 0) // CHILD
        {
            // Never close stdin/out/err, most programs expect these to exist;
            // rather connect them to /dev/null if unwanted
            const int nullFd{ open("/dev/null", O_RDWR) };
            if (nullFd != -1)
            {
                dup2(nullFd, STDIN_FILENO);
                dup2(nullFd, STDERR_FILENO);
                close(nullFd);
            }

            if (dup2(pipefd[1], STDOUT_FILENO) == -1)
                _exit(-1);
            close(pipefd[0]);
            close(pipefd[1]);

            std::vector<const char*> execArgs;
            std::transform(std::cbegin(args), std::cend(args), std::back_inserter(execArgs), [](const std::string& arg) { return arg.c_str(); });
            execArgs.push_back(nullptr);

            execv(path.string().c_str(), const_cast<char* const*>(execArgs.data()));
            _exit(-1);
        }

        // PARENT
        close(pipefd[1]);
        _childPID = res;

        boost::system::error_code assignError;
        _childStdout.assign(pipefd[0], assignError);
        if (assignError)
        {
            close(pipefd[0]);
            kill();
            wait();
            throw ChildProcessSystemException{ assignError, "assigning read end of pipe to asio stream failed!" };
        }

        PFS_LOG(CHILDPROCESS, DEBUG, "Started child process, pid = " << _childPID);
    }

    ChildProcess::~ChildProcess()
    {
        PFS_LOG(CHILDPROCESS, DEBUG, "Closing child process " << _childPID << "...");
        {
            boost::system::error_code closeError;
            _childStdout.close(closeError);
            if (closeError)
                PFS_LOG(CHILDPROCESS, ERROR, "Close failed: " << closeError.message());
        }

        if (!_finished)
            kill();

        try
        {
            wait();
        }
        catch (const ChildProcessException& e)
        {
            PFS_LOG(CHILDPROCESS, ERROR, "Cannot wait for child process " << _childPID << ": " << e.what());
        }
    }

    void ChildProcess::kill()
    {
        // process may already have finished
        PFS_LOG(CHILDPROCESS, DEBUG, "Killing child process " << _childPID << "...");
        if (::kill(_childPID, SIGKILL) == -1)
        {
            const int err{ errno };
            PFS_LOG(CHILDPROCESS, DEBUG, "Kill failed: " << (std::error_code{ err, std::generic_category() }.message()));
        }
    }

    void ChildProcess::wait()
    {
        int wstatus{};
        const pid_t pid{ waitpid(_childPID, &wstatus, 0) };
        if (pid == -1)
            throw ChildProcessSystemException{ std::error_code{ errno, std::generic_category() }, "waitpid failed!" };

        if (WIFEXITED(wstatus))
        {
            PFS_LOG(CHILDPROCESS, DEBUG, "Exit code = " << WEXITSTATUS(wstatus));
        }
        else if (WIFSIGNALED(wstatus))
        {
            PFS_LOG(CHILDPROCESS, DEBUG, "Terminated by signal " << WTERMSIG(wstatus));
        }
    }

    void ChildProcess::asyncRead(std::byte* data, std::size_t bufferSize, ReadCallback callback)
    {
        assert(!_finished);

        // read_some: the progress output comes in small bursts
        _childStdout.async_read_some(boost::asio::buffer(data, bufferSize),
            [this, callback{ std::move(callback) }](const boost::system::error_code& error, std::size_t bytesTransferred) {
                if (error == boost::asio::error::operation_aborted)
                {
                    // forbidden to read any captured param here as the ChildProcess instance may already have been destroyed
                    return;
                }

                ReadResult readResult{ ReadResult::Success };
                if (error == boost::asio::error::eof)
                {
                    readResult = ReadResult::EndOfFile;
                    _finished = true;
                }
                else if (error)
                {
                    PFS_LOG(CHILDPROCESS, ERROR, "Read failed: " << error.message());
                    readResult = ReadResult::Error;
                }

                callback(readResult, bytesTransferred);
            });
    }
} // namespace pfs::core
