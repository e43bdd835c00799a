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

#include "TranscodingJob.hpp"

#include <fstream>
#include <iomanip>
#include <sstream>
#include <string>
#include <string_view>
#include <system_error>

#include "av/Exception.hpp"
#include "av/TranscodingJobCreator.hpp"
#include "core/IChildProcessManager.hpp"
#include "core/IConfig.hpp"
#include "core/ILogger.hpp"
#include "core/Service.hpp"

namespace pfs::av
{
#define LOG(severity, message) PFS_LOG(TRANSCODING, severity, "[" << _debugId << "] - " << message)

    namespace
    {
        std::atomic<std::size_t> globalId{};

        std::filesystem::path getFFmpegPath()
        {
            const std::filesystem::path ffmpegPath{ core::Service<core::IConfig>::get()->getPath("ffmpeg-file", "/usr/bin/ffmpeg") };
            if (!std::filesystem::exists(ffmpegPath))
                throw Exception{ "File '" + ffmpegPath.string() + "' does not exist!" };

            return ffmpegPath;
        }
    } // namespace

    std::shared_ptr<stream::ITranscodingJob> createTranscodingJob(const InputParameters& inputParameters, const OutputParameters& outputParameters, const std::filesystem::path& outputFile)
    {
        auto job{ std::make_shared<TranscodingJob>(inputParameters, outputParameters, outputFile) };
        job->start();

        return job;
    }

    TranscodingJob::TranscodingJob(const InputParameters& inputParams, const OutputParameters& outputParams, const std::filesystem::path& outputFile)
        : _debugId{ globalId++ }
        , _inputParams{ inputParams }
        , _outputParams{ outputParams }
        , _outputFile{ outputFile }
    {
    }

    TranscodingJob::~TranscodingJob()
    {
        _childProcess.reset();

        std::error_code ec;
        std::filesystem::remove(_outputFile, ec);
        if (ec)
            LOG(WARNING, "Cannot remove output file " << _outputFile << ": " << ec.message());
        else
            LOG(DEBUG, "Removed output file " << _outputFile);
    }

    void TranscodingJob::start()
    {
        try
        {
            if (!std::filesystem::exists(_inputParams.file))
                throw Exception{ "File " + _inputParams.file.string() + " does not exist!" };
            if (!std::filesystem::is_regular_file(_inputParams.file))
                throw Exception{ "File " + _inputParams.file.string() + " is not regular!" };
        }
        catch (const std::filesystem::filesystem_error& e)
        {
            throw Exception{ "File error '" + _inputParams.file.string() + "': " + e.what() };
        }

        const std::filesystem::path ffmpegPath{ getFFmpegPath() };

        // readers may open the output file before ffmpeg writes anything
        createOutputFile();

        LOG(INFO, "Transcoding file " << _inputParams.file << " into " << _outputFile);

        std::vector<std::string> args;

        args.emplace_back(ffmpegPath.string());

        // Make sure:
        // - we do not produce anything in the stderr output
        // - we do not rely on input
        // in order not to block the whole forked process
        args.emplace_back("-loglevel");
        args.emplace_back("quiet");
        args.emplace_back("-nostdin");

        // stdout only carries the progress report
        args.emplace_back("-nostats");
        args.emplace_back("-progress");
        args.emplace_back("pipe:1");

        // input Offset
        {
            args.emplace_back("-ss");

            std::ostringstream oss;
            oss << std::fixed << std::showpoint << std::setprecision(3) << (_inputParams.offset.count() / float{ 1'000 });
            args.emplace_back(oss.str());
        }

        // Input file
        args.emplace_back("-i");
        args.emplace_back(_inputParams.file.string());

        if (_outputParams.stripMetadata)
        {
            args.emplace_back("-map_metadata");
            args.emplace_back("-1");
        }

        // Skip video flows (including covers)
        args.emplace_back("-vn");

        args.emplace_back("-b:a");
        args.emplace_back(std::to_string(_outputParams.bitrate));

        // Codecs and formats
        switch (_outputParams.format)
        {
        case OutputFormat::MP3:
            args.emplace_back("-f");
            args.emplace_back("mp3");
            break;

        case OutputFormat::OGG_OPUS:
            args.emplace_back("-acodec");
            args.emplace_back("libopus");
            args.emplace_back("-f");
            args.emplace_back("ogg");
            break;

        case OutputFormat::MATROSKA_OPUS:
            args.emplace_back("-acodec");
            args.emplace_back("libopus");
            args.emplace_back("-f");
            args.emplace_back("matroska");
            break;

        case OutputFormat::OGG_VORBIS:
            args.emplace_back("-acodec");
            args.emplace_back("libvorbis");
            args.emplace_back("-f");
            args.emplace_back("ogg");
            break;

        case OutputFormat::WEBM_VORBIS:
            args.emplace_back("-acodec");
            args.emplace_back("libvorbis");
            args.emplace_back("-f");
            args.emplace_back("webm");
            break;

        default:
            throw Exception{ "Unhandled format (" + std::to_string(static_cast<int>(_outputParams.format)) + ")" };
        }

        // the output file already exists
        args.emplace_back("-y");
        args.emplace_back(_outputFile.string());

        LOG(DEBUG, "Dumping args (" << args.size() << ")");
        for (const std::string& arg : args)
            LOG(DEBUG, "Arg = '" << arg << "'");

        const std::scoped_lock lock{ _mutex };
        try
        {
            _childProcess = core::Service<core::IChildProcessManager>::get()->spawnChildProcess(ffmpegPath, args);
        }
        catch (const core::ChildProcessException& exception)
        {
            throw Exception{ "Cannot execute '" + ffmpegPath.string() + "': " + exception.what() };
        }

        asyncReadProgress();
    }

    void TranscodingJob::createOutputFile()
    {
        std::ofstream ofs{ _outputFile, std::ios::out | std::ios::binary | std::ios::trunc };
        if (!ofs)
            throw Exception{ "Cannot create output file '" + _outputFile.string() + "'" };
    }

    void TranscodingJob::onTranscodeEndRequest()
    {
        const std::scoped_lock lock{ _mutex };

        if (_exited)
        {
            LOG(DEBUG, "End of request on a job that has already ended");
            return;
        }

        LOG(DEBUG, "End of request, stopping transcoding");
        // kills the process if still running
        _childProcess.reset();
        _exited = true;
    }

    // must be called with _mutex held
    void TranscodingJob::asyncReadProgress()
    {
        _childProcess->asyncRead(_progressBuffer.data(), _progressBuffer.size(), [weakSelf = weak_from_this()](core::IChildProcess::ReadResult result, std::size_t nbBytesRead) {
            if (const std::shared_ptr<TranscodingJob> self{ weakSelf.lock() })
                self->onProgressRead(result, nbBytesRead);
        });
    }

    void TranscodingJob::onProgressRead(core::IChildProcess::ReadResult result, std::size_t nbBytesRead)
    {
        const std::scoped_lock lock{ _mutex };

        // killed meanwhile
        if (!_childProcess)
            return;

        switch (result)
        {
        case core::IChildProcess::ReadResult::Success:
            _progressParser.feed(std::string_view{ reinterpret_cast<const char*>(_progressBuffer.data()), nbBytesRead }, [this](const Progress& progress) { onProgress(progress); });
            asyncReadProgress();
            return;

        case core::IChildProcess::ReadResult::EndOfFile:
            LOG(DEBUG, "Transcoding ended");
            break;

        case core::IChildProcess::ReadResult::Error:
            LOG(ERROR, "Cannot read transcoding progress, considering job as ended");
            break;
        }

        {
            std::error_code ec;
            const std::uintmax_t fileSize{ std::filesystem::file_size(_outputFile, ec) };
            if (!ec)
                _bytesTranscoded = fileSize;
        }
        _exited = true;

        LOG(DEBUG, "Bytes transcoded = " << _bytesTranscoded << ", bytes downloaded = " << _bytesDownloaded);
    }

    void TranscodingJob::onProgress(const Progress& progress)
    {
        if (progress.totalSize)
            _bytesTranscoded = *progress.totalSize;

        LOG(DEBUG, "Progress: total size = " << _bytesTranscoded << ", out time = " << (progress.outTime ? progress.outTime->count() / 1000 : 0) << " ms" << (progress.end ? ", end" : ""));
    }
} // namespace pfs::av
