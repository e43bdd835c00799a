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

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace pfs::av
{
    // One block of the ffmpeg "-progress" output
    struct Progress
    {
        std::optional<std::uint64_t> totalSize; // bytes written to the output so far
        std::optional<std::chrono::microseconds> outTime;
        bool end{}; // last block
    };

    // Incremental parser: data may be cut anywhere, including in the middle of a line
    class ProgressParser
    {
    public:
        using ProgressCallback = std::function<void(const Progress&)>;

        void feed(std::string_view data, const ProgressCallback& callback);

    private:
        void processLine(std::string_view line, const ProgressCallback& callback);

        std::string _pendingLine;
        Progress _currentProgress;
    };
} // namespace pfs::av
