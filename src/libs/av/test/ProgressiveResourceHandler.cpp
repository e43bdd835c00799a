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
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <string>

#include <gtest/gtest.h>

#include <boost/asio/io_context.hpp>

#include "stream/ITailFollowStream.hpp"

#include "ProgressiveResourceHandler.hpp"

namespace pfs::av::tests
{
    namespace
    {
        std::filesystem::path createFile(const std::filesystem::path& path, std::size_t size)
        {
            std::ofstream ofs{ path, std::ios::out | std::ios::binary };
            ofs << std::string(size, 'a');
            return path;
        }

        // 1000 bytes produced so far
        class PrepareResponseTest : public ::testing::Test
        {
        protected:
            ~PrepareResponseTest() override
            {
                std::filesystem::remove(_filePath);
            }

            const std::filesystem::path _filePath{ createFile(std::tmpnam(nullptr), 1000) };
            boost::asio::io_context _ioContext;
            const std::shared_ptr<stream::ITailFollowStream> _stream{ stream::createTailFollowFileStream(_ioContext, _filePath, nullptr, stream::TailFollowParameters{}) };
        };
    } // namespace

    TEST_F(PrepareResponseTest, wholeStream)
    {
        const ResponseSetup setup{ prepareResponse(*_stream, 5000, std::nullopt) };

        EXPECT_EQ(setup.status, 200);
        ASSERT_TRUE(setup.contentLength);
        EXPECT_EQ(*setup.contentLength, 5000);
        EXPECT_TRUE(setup.contentRange.empty());
        EXPECT_EQ(_stream->getPosition(), 0);
    }

    TEST_F(PrepareResponseTest, range)
    {
        const ResponseSetup setup{ prepareResponse(*_stream, 5000, ByteRange{ 100, 4999 }) };

        EXPECT_EQ(setup.status, 206);
        ASSERT_TRUE(setup.contentLength);
        EXPECT_EQ(*setup.contentLength, 4900);
        EXPECT_EQ(setup.contentRange, "bytes 100-4999/5000");
        EXPECT_EQ(_stream->getPosition(), 100);
    }

    TEST_F(PrepareResponseTest, rangeNotProducedYet)
    {
        const ResponseSetup setup{ prepareResponse(*_stream, 5000, ByteRange{ 2000, 4999 }) };

        EXPECT_EQ(setup.status, 416);
        EXPECT_FALSE(setup.contentLength);
        EXPECT_EQ(setup.contentRange, "bytes */*");
    }

    TEST_F(PrepareResponseTest, sourceRemoved)
    {
        std::filesystem::remove(_filePath);

        const ResponseSetup setup{ prepareResponse(*_stream, 5000, ByteRange{ 100, 4999 }) };

        EXPECT_EQ(setup.status, 500);
        EXPECT_FALSE(setup.contentLength);
        EXPECT_TRUE(setup.contentRange.empty());
    }

    TEST_F(PrepareResponseTest, closedStream)
    {
        _stream->close();

        const ResponseSetup setup{ prepareResponse(*_stream, 5000, ByteRange{ 100, 4999 }) };

        EXPECT_EQ(setup.status, 500);
        EXPECT_FALSE(setup.contentLength);
    }
} // namespace pfs::av::tests
