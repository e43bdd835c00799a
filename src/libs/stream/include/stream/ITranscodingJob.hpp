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

#include <cstdint>

namespace pfs::stream
{
    // View of the job producing the bytes a stream is following
    // Counters are monotonic and can be accessed from any thread
    class ITranscodingJob
    {
    public:
        virtual ~ITranscodingJob() = default;

        // Once true, stays true
        virtual bool hasExited() const = 0;

        virtual std::uint64_t getBytesTranscoded() const = 0;

        virtual std::uint64_t getBytesDownloaded() const = 0;
        virtual void addBytesDownloaded(std::uint64_t byteCount) = 0;

        // Called once by each consumer that no longer needs the job
        // Must not throw, even if the job has already ended
        virtual void onTranscodeEndRequest() = 0;
    };
} // namespace pfs::stream
