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
#include <map>
#include <string>

#include <gtest/gtest.h>

#include "StreamParameters.hpp"

namespace pfs::tests
{
    namespace
    {
        using ParameterMap = std::map<std::string, std::string>;

        std::optional<StreamParameters> parse(const ParameterMap& parameters)
        {
            return parseStreamParameters([&](const std::string& parameterName) -> const std::string* {
                const auto it{ parameters.find(parameterName) };
                return it == std::cend(parameters) ? nullptr : &it->second;
            });
        }
    } // namespace

    TEST(StreamParameters, mandatoryOnly)
    {
        const auto parameters{ parse({ { "file", "album/track.flac" }, { "format", "OGG_OPUS" }, { "bitrate", "96000" } }) };
        ASSERT_TRUE(parameters);

        EXPECT_EQ(parameters->file, "album/track.flac");
        EXPECT_EQ(parameters->outputParameters.format, av::OutputFormat::OGG_OPUS);
        EXPECT_EQ(parameters->outputParameters.bitrate, 96'000);
        EXPECT_TRUE(parameters->outputParameters.stripMetadata);
        EXPECT_EQ(parameters->offset, std::chrono::seconds{ 0 });
        EXPECT_FALSE(parameters->duration);
    }

    TEST(StreamParameters, offsetAndDuration)
    {
        const auto parameters{ parse({ { "file", "track.flac" }, { "format", "mp3" }, { "bitrate", "128000" }, { "offset", "30" }, { "duration", "240" } }) };
        ASSERT_TRUE(parameters);

        EXPECT_EQ(parameters->offset, std::chrono::seconds{ 30 });
        ASSERT_TRUE(parameters->duration);
        EXPECT_EQ(*parameters->duration, std::chrono::seconds{ 240 });
    }

    TEST(StreamParameters, missingMandatory)
    {
        EXPECT_FALSE(parse({ { "format", "mp3" }, { "bitrate", "128000" } }));
        EXPECT_FALSE(parse({ { "file", "track.flac" }, { "bitrate", "128000" } }));
        EXPECT_FALSE(parse({ { "file", "track.flac" }, { "format", "mp3" } }));
    }

    TEST(StreamParameters, invalidFormatOrBitrate)
    {
        EXPECT_FALSE(parse({ { "file", "track.flac" }, { "format", "wav" }, { "bitrate", "128000" } }));
        EXPECT_FALSE(parse({ { "file", "track.flac" }, { "format", "mp3" }, { "bitrate", "8000" } }));
        EXPECT_FALSE(parse({ { "file", "track.flac" }, { "format", "mp3" }, { "bitrate", "640000" } }));
        EXPECT_FALSE(parse({ { "file", "track.flac" }, { "format", "mp3" }, { "bitrate", "-128000" } }));
        EXPECT_FALSE(parse({ { "file", "track.flac" }, { "format", "mp3" }, { "bitrate", "fast" } }));
    }

    TEST(StreamParameters, negativeOffsetOrDuration)
    {
        EXPECT_FALSE(parse({ { "file", "track.flac" }, { "format", "mp3" }, { "bitrate", "128000" }, { "offset", "-5" } }));
        EXPECT_FALSE(parse({ { "file", "track.flac" }, { "format", "mp3" }, { "bitrate", "128000" }, { "offset", "-5" }, { "duration", "240" } }));
        EXPECT_FALSE(parse({ { "file", "track.flac" }, { "format", "mp3" }, { "bitrate", "128000" }, { "duration", "-240" } }));
    }

    TEST(StreamParameters, unparsableOffsetOrDuration)
    {
        EXPECT_FALSE(parse({ { "file", "track.flac" }, { "format", "mp3" }, { "bitrate", "128000" }, { "offset", "start" } }));
        EXPECT_FALSE(parse({ { "file", "track.flac" }, { "format", "mp3" }, { "bitrate", "128000" }, { "duration", "" } }));
    }

    TEST(StreamParameters, offsetBeyondDuration)
    {
        EXPECT_FALSE(parse({ { "file", "track.flac" }, { "format", "mp3" }, { "bitrate", "128000" }, { "offset", "240" }, { "duration", "240" } }));
        EXPECT_FALSE(parse({ { "file", "track.flac" }, { "format", "mp3" }, { "bitrate", "128000" }, { "offset", "300" }, { "duration", "240" } }));
        EXPECT_TRUE(parse({ { "file", "track.flac" }, { "format", "mp3" }, { "bitrate", "128000" }, { "offset", "239" }, { "duration", "240" } }));
    }
} // namespace pfs::tests
