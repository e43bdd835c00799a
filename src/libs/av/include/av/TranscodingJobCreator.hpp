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

#include <filesystem>
#include <memory>

#include "av/TranscodingParameters.hpp"
#include "stream/ITranscodingJob.hpp"

namespace pfs::av
{
    // Starts an ffmpeg process transcoding the input into outputFile
    // The output file is created before the process is started, and removed once the job is destroyed
    // The process is killed on the first end request
    // Uses the IChildProcessManager and IConfig services
    // Throws av::Exception if the job cannot be started
    std::shared_ptr<stream::ITranscodingJob> createTranscodingJob(const InputParameters& inputParameters, const OutputParameters& outputParameters, const std::filesystem::path& outputFile);
} // namespace pfs::av
