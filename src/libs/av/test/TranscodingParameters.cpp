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

#include <gtest/gtest.h>

#include "av/TranscodingParameters.hpp"

namespace pfs::av::tests
{
    TEST(TranscodingParameters, parseOutputFormat)
    {
        EXPECT_EQ(parseOutputFormat("mp3"), OutputFormat::MP3);
        EXPECT_EQ(parseOutputFormat("ogg_opus"), OutputFormat::OGG_OPUS);
        EXPECT_EQ(parseOutputFormat("matroska_opus"), OutputFormat::MATROSKA_OPUS);
        EXPECT_EQ(parseOutputFormat("OGG_VORBIS"), OutputFormat::OGG_VORBIS);
        EXPECT_EQ(parseOutputFormat("webm_vorbis"), OutputFormat::WEBM_VORBIS);
        EXPECT_EQ(parseOutputFormat("flac"), std::nullopt);
        EXPECT_EQ(parseOutputFormat(""), std::nullopt);
    }

    TEST(TranscodingParameters, mimeTypes)
    {
        EXPECT_EQ(formatToMimeType(OutputFormat::MP3), "audio/mpeg");
        EXPECT_EQ(formatToMimeType(OutputFormat::OGG_OPUS), "audio/opus");
        EXPECT_EQ(formatToMimeType(OutputFormat::WEBM_VORBIS), "audio/webm");
        EXPECT_EQ(formatToFileExtension(OutputFormat::MATROSKA_OPUS), ".mka");
        EXPECT_EQ(formatToFileExtension(OutputFormat::OGG_VORBIS), ".ogg");
    }

    TEST(TranscodingParameters, estimateContentLength)
    {
        using namespace std::chrono_literals;

        EXPECT_EQ(estimateContentLength(128'000, 10s), 160'000);
        EXPECT_EQ(estimateContentLength(320'000, 1500ms), 60'000);
        EXPECT_EQ(estimateContentLength(128'000, 0s), 0);
        EXPECT_EQ(estimateContentLength(128'000, -5s), 0);
    }
} // namespace pfs::av::tests
