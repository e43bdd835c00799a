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

#pragma once

#include <mutex>
#include <ostream>

#include "core/ILogger.hpp"

namespace pfs::core::logging
{
    // Logs every message at least as important as minSeverity, without timestamp
    class StreamLogger final : public ILogger
    {
    public:
        StreamLogger(std::ostream& os, Severity minSeverity = defaultMinSeverity);

        bool isSeverityActive(Severity severity) const override { return severity <= _minSeverity; }
        void processLog(const Log& log) override;
        void processLog(Module module, Severity severity, std::string_view message) override;

    private:
        std::mutex _mutex;
        std::ostream& _os;
        const Severity _minSeverity;
    };
} // namespace pfs::core::logging
