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
#include <condition_variable>
#include <mutex>
#include <optional>

#include <boost/asio/steady_timer.hpp>

#include "stream/ITailFollowStream.hpp"

namespace pfs::stream
{
    class TailFollowStream final : public ITailFollowStream, public std::enable_shared_from_this<TailFollowStream>
    {
    public:
        TailFollowStream(boost::asio::io_context& ioContext, std::unique_ptr<IByteSource> source, std::shared_ptr<ITranscodingJob> job, const TailFollowParameters& parameters);
        ~TailFollowStream() override;
        TailFollowStream(const TailFollowStream&) = delete;
        TailFollowStream& operator=(const TailFollowStream&) = delete;

    private:
        bool canRead() const override;
        bool canSeek() const override { return true; }
        bool canWrite() const override { return false; }

        std::size_t readSome(std::byte* buffer, std::size_t bufferSize) override;
        void asyncReadSome(std::byte* buffer, std::size_t bufferSize, ReadCallback callback) override;
        void cancel() override;

        std::uint64_t seek(std::int64_t offset, SeekOrigin origin) override;
        std::uint64_t getPosition() const override;

        std::uint64_t getLength() const override;
        void setLength(std::uint64_t estimatedLength) override;

        void write(const std::byte* buffer, std::size_t bufferSize) override;
        void flush() override;

        void close() override;

        using clock = std::chrono::steady_clock;

        void startRead();
        // Makes one read attempt and decides whether the read is over
        // Returns std::nullopt if the caller has to wait and try again
        std::optional<std::size_t> pollOnce(std::byte* buffer, std::size_t bufferSize, clock::time_point readStartTime);
        void asyncPoll(std::byte* buffer, std::size_t bufferSize, clock::time_point readStartTime, ReadCallback callback);
        void checkNotClosed() const;

        const std::size_t _debugId{};
        const TailFollowParameters _parameters;
        const std::shared_ptr<ITranscodingJob> _job;

        mutable std::mutex _mutex;
        std::condition_variable _waitCondition;
        std::unique_ptr<IByteSource> _source;
        boost::asio::steady_timer _pollTimer;
        std::uint64_t _estimatedLength{};
        bool _closed{};
        bool _readCancelled{};
    };
} // namespace pfs::stream
