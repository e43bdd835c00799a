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

#include "ProgressiveStreamResource.hpp"

#include <unistd.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <optional>
#include <string>
#include <string_view>

#include <Wt/Http/Request.h>
#include <Wt/Http/Response.h>
#include <Wt/Http/ResponseContinuation.h>

#include "av/ProgressiveResourceHandlerCreator.hpp"
#include "av/TranscodingJobCreator.hpp"
#include "av/TranscodingParameters.hpp"
#include "core/Exception.hpp"
#include "core/ILogger.hpp"
#include "core/IResourceHandler.hpp"

#include "StreamParameters.hpp"

#define STREAM_LOG(severity, message) PFS_LOG(HTTP, severity, "Progressive stream resource: " << message)

namespace pfs
{
    namespace
    {
        // mediaDirectory must be canonical
        std::optional<std::filesystem::path> resolveMediaFile(const std::filesystem::path& mediaDirectory, std::string_view relativePath)
        {
            const std::filesystem::path path{ relativePath };
            if (path.empty() || path.is_absolute())
                return std::nullopt;

            std::error_code ec;
            const std::filesystem::path resolvedPath{ std::filesystem::weakly_canonical(mediaDirectory / path, ec) };
            if (ec)
                return std::nullopt;

            const auto [mediaDirectoryEnd, resolvedPathIt]{ std::mismatch(mediaDirectory.begin(), mediaDirectory.end(), resolvedPath.begin(), resolvedPath.end()) };
            if (mediaDirectoryEnd != mediaDirectory.end() || resolvedPathIt == resolvedPath.end())
                return std::nullopt;

            return resolvedPath;
        }
    } // namespace

    ProgressiveStreamResource::ProgressiveStreamResource(boost::asio::io_context& ioContext, const std::filesystem::path& mediaDirectory, const std::filesystem::path& transcodeDirectory, const stream::TailFollowParameters& streamParameters)
        : _ioContext{ ioContext }
        , _mediaDirectory{ mediaDirectory }
        , _transcodeDirectory{ transcodeDirectory }
        , _streamParameters{ streamParameters }
    {
    }

    ProgressiveStreamResource::~ProgressiveStreamResource()
    {
        beingDeleted();
    }

    void ProgressiveStreamResource::handleRequest(const Wt::Http::Request& request, Wt::Http::Response& response)
    {
        std::shared_ptr<core::IResourceHandler> resourceHandler;

        Wt::Http::ResponseContinuation* continuation{ request.continuation() };
        if (!continuation)
        {
            const std::optional<StreamParameters> parameters{ parseStreamParameters([&](const std::string& parameterName) { return request.getParameter(parameterName); }) };
            if (!parameters)
            {
                response.setStatus(400);
                return;
            }

            const std::optional<std::filesystem::path> mediaFile{ resolveMediaFile(_mediaDirectory, parameters->file) };
            if (!mediaFile)
            {
                STREAM_LOG(ERROR, "Invalid file '" << parameters->file << "'");
                response.setStatus(400);
                return;
            }

            std::error_code ec;
            if (!std::filesystem::is_regular_file(*mediaFile, ec))
            {
                STREAM_LOG(DEBUG, "File " << *mediaFile << " not found");
                response.setStatus(404);
                return;
            }

            av::InputParameters inputParameters;
            inputParameters.file = *mediaFile;
            inputParameters.offset = parameters->offset;

            const av::OutputParameters& outputParameters{ parameters->outputParameters };
            const std::filesystem::path outputFile{ createOutputFilePath(av::formatToFileExtension(outputParameters.format)) };

            try
            {
                auto job{ av::createTranscodingJob(inputParameters, outputParameters, outputFile) };
                auto stream{ stream::createTailFollowFileStream(_ioContext, outputFile, job, _streamParameters) };

                if (parameters->duration)
                    stream->setLength(av::estimateContentLength(outputParameters.bitrate, *parameters->duration - parameters->offset));

                resourceHandler = av::createProgressiveResourceHandler(std::move(stream), av::formatToMimeType(outputParameters.format));
            }
            catch (const core::PfsException& e)
            {
                STREAM_LOG(ERROR, "Cannot stream file " << *mediaFile << ": " << e.what());
                response.setStatus(500);
                return;
            }
        }
        else
        {
            resourceHandler = Wt::cpp17::any_cast<std::shared_ptr<core::IResourceHandler>>(continuation->data());
        }

        continuation = resourceHandler->processRequest(request, response);
        if (continuation)
            continuation->setData(resourceHandler);
    }

    std::filesystem::path ProgressiveStreamResource::createOutputFilePath(std::string_view extension) const
    {
        static std::atomic<std::size_t> counter{};

        return _transcodeDirectory / (std::to_string(::getpid()) + "-" + std::to_string(counter++) + std::string{ extension });
    }
} // namespace pfs
