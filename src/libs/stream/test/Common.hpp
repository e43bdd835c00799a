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

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

#include "stream/IByteSource.hpp"
#include "stream/ITranscodingJob.hpp"

namespace pfs::stream::tests
{
    class ScopedFileDeleter final
    {
    public:
        ScopedFileDeleter(const std::filesystem::path& path)
            : _path{ path } {}
        ~ScopedFileDeleter() { std::filesystem::remove(_path); }

    private:
        ScopedFileDeleter(const ScopedFileDeleter&) = delete;
        ScopedFileDeleter(ScopedFileDeleter&&) = delete;
        ScopedFileDeleter operator=(const ScopedFileDeleter&) = delete;
        ScopedFileDeleter operator=(ScopedFileDeleter&&) = delete;

        const std::filesystem::path _path;
    };

    // Shared between the test and the source given to the stream
    struct GrowingSourceState
    {
        mutable std::mutex mutex;
        std::vector<std::byte> data;
        std::uint64_t position{};
        std::size_t readCount{};
        std::size_t emptyReadCount{};            // next reads returning nothing, even if data is there
        std::optional<std::error_code> readError; // next reads fail
        bool closeError{};
        bool closed{};

        void append(std::string_view str)
        {
            const std::scoped_lock lock{ mutex };
            for (const char c : str)
                data.push_back(static_cast<std::byte>(c));
        }

        std::size_t getReadCount() const
        {
            const std::scoped_lock lock{ mutex };
            return readCount;
        }

        bool isClosed() const
        {
            const std::scoped_lock lock{ mutex };
            return closed;
        }
    };

    class GrowingByteSource final : public IByteSource
    {
    public:
        GrowingByteSource(std::shared_ptr<GrowingSourceState> state)
            : _state{ std::move(state) } {}

    private:
        std::size_t readSome(std::byte* buffer, std::size_t bufferSize) override;
        void seek(std::uint64_t offset) override;
        std::uint64_t getPosition() const override;
        std::uint64_t getMaterializedLength() const override;
        void close() override;

        const std::shared_ptr<GrowingSourceState> _state;
    };

    class FakeTranscodingJob final : public ITranscodingJob
    {
    public:
        void setExited() { _exited = true; }
        void setBytesTranscoded(std::uint64_t byteCount) { _bytesTranscoded = byteCount; }
        std::size_t getEndRequestCount() const { return _endRequestCount; }

        bool hasExited() const override { return _exited; }
        std::uint64_t getBytesTranscoded() const override { return _bytesTranscoded; }
        std::uint64_t getBytesDownloaded() const override { return _bytesDownloaded; }
        void addBytesDownloaded(std::uint64_t byteCount) override { _bytesDownloaded += byteCount; }
        void onTranscodeEndRequest() override { ++_endRequestCount; }

    private:
        std::atomic<bool> _exited{};
        std::atomic<std::uint64_t> _bytesTranscoded{};
        std::atomic<std::uint64_t> _bytesDownloaded{};
        std::atomic<std::size_t> _endRequestCount{};
    };

    std::string toString(const std::byte* buffer, std::size_t size);
} // namespace pfs::stream::tests
