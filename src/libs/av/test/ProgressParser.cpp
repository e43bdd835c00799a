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

#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "ProgressParser.hpp"

namespace pfs::av::tests
{
    namespace
    {
        std::vector<Progress> parse(ProgressParser& parser, const std::vector<std::string_view>& chunks)
        {
            std::vector<Progress> res;
            for (std::string_view chunk : chunks)
                parser.feed(chunk, [&](const Progress& progress) { res.push_back(progress); });

            return res;
        }
    } // namespace

    TEST(ProgressParser, blocks)
    {
        ProgressParser parser;
        const std::vector<Progress> res{ parse(parser, { "bitrate=128.0kbits/s\ntotal_size=4096\nout_time_us=256000\nout_time=00:00:00.256000\nprogress=continue\n"
                                                         "total_size=8192\nout_time_us=512000\nprogress=end\n" }) };

        ASSERT_EQ(res.size(), 2);
        EXPECT_EQ(res[0].totalSize, 4096);
        EXPECT_EQ(res[0].outTime, std::chrono::microseconds{ 256'000 });
        EXPECT_FALSE(res[0].end);
        EXPECT_EQ(res[1].totalSize, 8192);
        EXPECT_EQ(res[1].outTime, std::chrono::microseconds{ 512'000 });
        EXPECT_TRUE(res[1].end);
    }

    TEST(ProgressParser, splitLines)
    {
        ProgressParser parser;
        std::vector<Progress> res{ parse(parser, { "total_si", "ze=12", "34\npro", "gress=cont" }) };
        EXPECT_TRUE(res.empty());

        res = parse(parser, { "inue\n" });
        ASSERT_EQ(res.size(), 1);
        EXPECT_EQ(res[0].totalSize, 1234);
        EXPECT_FALSE(res[0].end);
    }

    TEST(ProgressParser, notAvailable)
    {
        ProgressParser parser;
        const std::vector<Progress> res{ parse(parser, { "total_size=N/A\nout_time_us=N/A\nprogress=continue\n" }) };

        ASSERT_EQ(res.size(), 1);
        EXPECT_FALSE(res[0].totalSize);
        EXPECT_FALSE(res[0].outTime);
    }

    TEST(ProgressParser, blocksAreIndependent)
    {
        ProgressParser parser;
        const std::vector<Progress> res{ parse(parser, { "total_size=10\nprogress=continue\nprogress=continue\n" }) };

        ASSERT_EQ(res.size(), 2);
        EXPECT_EQ(res[0].totalSize, 10);
        EXPECT_FALSE(res[1].totalSize);
    }

    TEST(ProgressParser, malformed)
    {
        ProgressParser parser;
        const std::vector<Progress> res{ parse(parser, { "garbage\n\r\n  \ntotal_size = 42 \r\nprogress=end\r\n" }) };

        ASSERT_EQ(res.size(), 1);
        EXPECT_EQ(res[0].totalSize, 42);
        EXPECT_TRUE(res[0].end);
    }
} // namespace pfs::av::tests
