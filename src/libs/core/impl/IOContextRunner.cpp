/*
 * Copyright (C) 2021 Emeric Poupon
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

#include "core/IOContextRunner.hpp"

#include <pthread.h>

#include <cstdlib>
#include <string>

#include "core/ILogger.hpp"

namespace pfs::core
{
    IOContextRunner::IOContextRunner(boost::asio::io_context& ioContext, std::size_t threadCount, std::string_view name)
        : _ioContext{ ioContext }
        , _work{ boost::asio::make_work_guard(ioContext) }
    {
        PFS_LOG(UTILS, INFO, "Starting IO context '" << name << "' with " << threadCount << " threads...");

        for (std::size_t i{}; i < threadCount; ++i)
        {
            // pthread names are limited to 15 chars
            const std::string threadName{ std::string{ name.substr(0, 11) } + "_" + std::to_string(i) };

            _threads.emplace_back([this, threadName] {
                ::pthread_setname_np(::pthread_self(), threadName.substr(0, 15).c_str());

                try
                {
                    _ioContext.run();
                }
                catch (const std::exception& e)
                {
                    PFS_LOG(UTILS, FATAL, "Exception caught in IO context: " << e.what());
                    std::abort();
                }
            });
        }
    }

    IOContextRunner::~IOContextRunner()
    {
        PFS_LOG(UTILS, DEBUG, "Stopping IO context...");
        _work.reset();
        _ioContext.stop();

        for (std::thread& t : _threads)
            t.join();
    }
} // namespace pfs::core
