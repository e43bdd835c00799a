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
#include <functional>
#include <memory>
#include <system_error>

#include <boost/asio/io_context.hpp>

#include "stream/IByteSource.hpp"
#include "stream/ITranscodingJob.hpp"

namespace pfs::stream
{
    enum class SeekOrigin
    {
        Begin,
        Current,
        End,
    };

    struct TailFollowParameters
    {
        std::chrono::milliseconds timeout{ 30'000 };   // max wait for new bytes in a single read
        std::chrono::milliseconds pollInterval{ 50 };  // wait between two attempts
    };

    // Read-only stream over a source that is still being written by a job
    // Reads wait for new bytes as long as the job is running, up to the timeout
    // Single reader: reads must not be issued concurrently
    class ITailFollowStream
    {
    public:
        virtual ~ITailFollowStream() = default;

        virtual bool canRead() const = 0;
        virtual bool canSeek() const = 0;
        virtual bool canWrite() const = 0;

        // Blocking calls
        // Returns as soon as at least one byte is available, 0 means end of stream
        // Throws CancelledException if cancel() or close() is called meanwhile
        virtual std::size_t readSome(std::byte* buffer, std::size_t bufferSize) = 0;

        // Non blocking calls
        // Callback is called from the io context, never from within asyncReadSome
        // ec is std::errc::operation_canceled if cancel() or close() is called meanwhile
        using ReadCallback = std::function<void(std::error_code ec, std::size_t nbBytesRead)>;
        virtual void asyncReadSome(std::byte* buffer, std::size_t bufferSize, ReadCallback callback) = 0;

        // Interrupts the pending read, if any
        virtual void cancel() = 0;

        // Only SeekOrigin::Begin is supported, and only within the materialized bytes
        virtual std::uint64_t seek(std::int64_t offset, SeekOrigin origin) = 0;
        virtual std::uint64_t getPosition() const = 0;

        // Estimated total length, as set by setLength (0 if unknown)
        virtual std::uint64_t getLength() const = 0;
        virtual void setLength(std::uint64_t estimatedLength) = 0;

        // Always throws UnsupportedOperationException
        virtual void write(const std::byte* buffer, std::size_t bufferSize) = 0;
        virtual void flush() = 0;

        // Releases the source and notifies the job, if any. Can be called several times
        virtual void close() = 0;
    };

    // job may be null (live source): reads then wait up to the timeout
    std::shared_ptr<ITailFollowStream> createTailFollowStream(boost::asio::io_context& ioContext, std::unique_ptr<IByteSource> source, std::shared_ptr<ITranscodingJob> job, const TailFollowParameters& parameters = {});
    std::shared_ptr<ITailFollowStream> createTailFollowFileStream(boost::asio::io_context& ioContext, const std::filesystem::path& path, std::shared_ptr<ITranscodingJob> job, const TailFollowParameters& parameters = {});
} // namespace pfs::stream
