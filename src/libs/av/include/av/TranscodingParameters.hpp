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
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string_view>

namespace pfs::av
{
    struct InputParameters
    {
        std::filesystem::path file;             // Path to the input file
        std::chrono::milliseconds offset{}; // Offset in the input file to start transcoding from
    };

    enum class OutputFormat
    {
        MP3,
        OGG_OPUS,
        MATROSKA_OPUS,
        OGG_VORBIS,
        WEBM_VORBIS,
    };

    struct OutputParameters
    {
        OutputFormat format{ OutputFormat::MP3 };
        std::size_t bitrate{ 128'000 };
        bool stripMetadata{ true };
    };

    std::string_view formatToMimeType(OutputFormat format);
    std::string_view formatToFileExtension(OutputFormat format);

    // "mp3", "ogg_opus", "matroska_opus", "ogg_vorbis", "webm_vorbis"
    std::optional<OutputFormat> parseOutputFormat(std::string_view str);

    std::uint64_t estimateContentLength(std::size_t bitrate, std::chrono::milliseconds duration);
} // namespace pfs::av
