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

#include "av/TranscodingParameters.hpp"

#include <string>

#include "av/Exception.hpp"
#include "core/String.hpp"

namespace pfs::av
{
    std::string_view formatToMimeType(OutputFormat format)
    {
        switch (format)
        {
        case OutputFormat::MP3:
            return "audio/mpeg";
        case OutputFormat::OGG_OPUS:
            return "audio/opus";
        case OutputFormat::MATROSKA_OPUS:
            return "audio/x-matroska";
        case OutputFormat::OGG_VORBIS:
            return "audio/ogg";
        case OutputFormat::WEBM_VORBIS:
            return "audio/webm";
        }

        throw Exception{ "Invalid encoding" };
    }

    std::string_view formatToFileExtension(OutputFormat format)
    {
        switch (format)
        {
        case OutputFormat::MP3:
            return ".mp3";
        case OutputFormat::OGG_OPUS:
            return ".opus";
        case OutputFormat::MATROSKA_OPUS:
            return ".mka";
        case OutputFormat::OGG_VORBIS:
            return ".ogg";
        case OutputFormat::WEBM_VORBIS:
            return ".webm";
        }

        throw Exception{ "Invalid encoding" };
    }

    std::optional<OutputFormat> parseOutputFormat(std::string_view str)
    {
        const std::string format{ core::stringUtils::stringToLower(str) };

        if (format == "mp3")
            return OutputFormat::MP3;
        if (format == "ogg_opus")
            return OutputFormat::OGG_OPUS;
        if (format == "matroska_opus")
            return OutputFormat::MATROSKA_OPUS;
        if (format == "ogg_vorbis")
            return OutputFormat::OGG_VORBIS;
        if (format == "webm_vorbis")
            return OutputFormat::WEBM_VORBIS;

        return std::nullopt;
    }

    std::uint64_t estimateContentLength(std::size_t bitrate, std::chrono::milliseconds duration)
    {
        if (duration.count() <= 0)
            return 0;

        return static_cast<std::uint64_t>(bitrate / 8) * static_cast<std::uint64_t>(duration.count()) / 1000;
    }
} // namespace pfs::av
