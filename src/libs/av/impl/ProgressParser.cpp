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

#include "ProgressParser.hpp"

#include "core/ILogger.hpp"
#include "core/String.hpp"

namespace pfs::av
{
    void ProgressParser::feed(std::string_view data, const ProgressCallback& callback)
    {
        while (!data.empty())
        {
            const std::size_t lineEnd{ data.find('\n') };
            if (lineEnd == std::string_view::npos)
            {
                _pendingLine.append(data);
                return;
            }

            _pendingLine.append(data.substr(0, lineEnd));
            data.remove_prefix(lineEnd + 1);

            processLine(_pendingLine, callback);
            _pendingLine.clear();
        }
    }

    void ProgressParser::processLine(std::string_view line, const ProgressCallback& callback)
    {
        line = core::stringUtils::stringTrim(line);
        if (line.empty())
            return;

        const std::size_t separator{ line.find('=') };
        if (separator == std::string_view::npos)
        {
            PFS_LOG(TRANSCODING, DEBUG, "Skipping unexpected progress line '" << line << "'");
            return;
        }

        const std::string_view key{ core::stringUtils::stringTrim(line.substr(0, separator)) };
        const std::string_view value{ core::stringUtils::stringTrim(line.substr(separator + 1)) };

        if (key == "total_size")
        {
            // "N/A" until something is written
            if (const auto totalSize{ core::stringUtils::readAs<std::uint64_t>(value) })
                _currentProgress.totalSize = *totalSize;
        }
        else if (key == "out_time_us")
        {
            if (const auto outTime{ core::stringUtils::readAs<std::int64_t>(value) }; outTime && *outTime >= 0)
                _currentProgress.outTime = std::chrono::microseconds{ *outTime };
        }
        else if (key == "progress")
        {
            _currentProgress.end = (value == "end");
            callback(_currentProgress);
            _currentProgress = Progress{};
        }
    }
} // namespace pfs::av
