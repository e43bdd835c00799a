/*
 * Copyright (C) 2025 Emeric Poupon
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

#include <string>
#include <string_view>
#include <system_error>

#include "core/Exception.hpp"

namespace pfs::stream
{
    class Exception : public core::PfsException
    {
    public:
        using PfsException::PfsException;
    };

    // Writes, seeks relative to something else than the beginning, seeks past the available bytes
    class UnsupportedOperationException : public Exception
    {
    public:
        using Exception::Exception;
    };

    // A pending read was interrupted by cancel() or close()
    class CancelledException : public Exception
    {
    public:
        CancelledException()
            : Exception{ "Read operation cancelled" } {}
    };

    class StreamClosedException : public Exception
    {
    public:
        StreamClosedException()
            : Exception{ "Stream is closed" } {}
    };

    class IOException : public Exception
    {
    public:
        IOException(std::string_view message, std::error_code err)
            : Exception{ std::string{ message } + ": " + err.message() }
            , _err{ err }
        {
        }

        std::error_code getErrorCode() const { return _err; }

    private:
        std::error_code _err;
    };
} // namespace pfs::stream
