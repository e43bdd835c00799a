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

#include <Wt/WResource.h>
#include <boost/asio/io_context.hpp>

#include "stream/ITailFollowStream.hpp"

namespace pfs
{
    // Transcodes a media file into a temporary file while serving it
    // Parameters: file, format, bitrate, [offset], [duration]
    class ProgressiveStreamResource : public Wt::WResource
    {
    public:
        ProgressiveStreamResource(boost::asio::io_context& ioContext, const std::filesystem::path& mediaDirectory, const std::filesystem::path& transcodeDirectory, const stream::TailFollowParameters& streamParameters);
        ~ProgressiveStreamResource() override;

        void handleRequest(const Wt::Http::Request& request, Wt::Http::Response& response) override;

    private:
        std::filesystem::path createOutputFilePath(std::string_view extension) const;

        boost::asio::io_context& _ioContext;
        const std::filesystem::path _mediaDirectory;
        const std::filesystem::path _transcodeDirectory;
        const stream::TailFollowParameters _streamParameters;
    };
} // namespace pfs
