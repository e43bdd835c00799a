/*
 * Copyright (C) 2019 Emeric Poupon
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

#include "core/StreamLogger.hpp"

#include <thread>

namespace pfs::core::logging
{
    StreamLogger::StreamLogger(std::ostream& os, Severity minSeverity)
        : _os{ os }
        , _minSeverity{ minSeverity }
    {
    }

    void StreamLogger::processLog(const Log& log)
    {
        processLog(log.getModule(), log.getSeverity(), log.getMessage());
    }

    void StreamLogger::processLog(Module module, Severity severity, std::string_view message)
    {
        if (!isSeverityActive(severity))
            return;

        const std::scoped_lock lock{ _mutex };
        _os << std::this_thread::get_id() << " [" << getSeverityName(severity) << "] [" << getModuleName(module) << "] " << message << std::endl;
    }
} // namespace pfs::core::logging
