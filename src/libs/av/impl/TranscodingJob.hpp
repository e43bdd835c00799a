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

#include <array>
#include <atomic>
#include <cstddef>
#include <mutex>

#include "av/TranscodingParameters.hpp"
#include "core/IChildProcess.hpp"
#include "stream/ITranscodingJob.hpp"

#include "ProgressParser.hpp"

namespace pfs::av
{
    class TranscodingJob final : public stream::ITranscodingJob, public std::enable_shared_from_this<TranscodingJob>
    {
    public:
        TranscodingJob(const InputParameters& inputParameters, const OutputParameters& outputParameters, const std::filesystem::path& outputFile);
        ~TranscodingJob() override;
        TranscodingJob(const TranscodingJob&) = delete;
        TranscodingJob& operator=(const TranscodingJob&) = delete;

        void start();

    private:
        bool hasExited() const override { return _exited; }
        std::uint64_t getBytesTranscoded() const override { return _bytesTranscoded; }
        std::uint64_t getBytesDownloaded() const override { return _bytesDownloaded; }
        void addBytesDownloaded(std::uint64_t byteCount) override { _bytesDownloaded += byteCount; }
        void onTranscodeEndRequest() override;

        void createOutputFile();
        void asyncReadProgress();
        void onProgressRead(core::IChildProcess::ReadResult result, std::size_t nbBytesRead);
        void onProgress(const Progress& progress);

        const std::size_t _debugId{};
        const InputParameters _inputParams;
        const OutputParameters _outputParams;
        const std::filesystem::path _outputFile;

        std::atomic<bool> _exited{};
        std::atomic<std::uint64_t> _bytesTranscoded{};
        std::atomic<std::uint64_t> _bytesDownloaded{};

        std::mutex _mutex;
        std::unique_ptr<core::IChildProcess> _childProcess;
        ProgressParser _progressParser;
        std::array<std::byte, 1024> _progressBuffer;
    };
} // namespace pfs::av
