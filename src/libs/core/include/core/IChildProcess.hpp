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

#pragma once

#include <cstddef>
#include <functional>
#include <string>
#include <vector>

#include "core/Exception.hpp"

namespace pfs::core
{
    class ChildProcessException : public PfsException
    {
    public:
        using PfsException::PfsException;
    };

    // Child process whose stdout is readable by the parent
    // Destroying an unfinished child process kills it
    class IChildProcess
    {
    public:
        using Args = std::vector<std::string>;

        virtual ~IChildProcess() = default;

        enum class ReadResult
        {
            Success,
            Error,
            EndOfFile,
        };

        // Callback is not called if the child process is destroyed while the read is pending
        using ReadCallback = std::function<void(ReadResult, std::size_t)>;
        virtual void asyncRead(std::byte* data, std::size_t bufferSize, ReadCallback callback) = 0;
    };
} // namespace pfs::core
