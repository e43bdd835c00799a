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

#include "TailFollowStream.hpp"

#include <atomic>
#include <string>
#include <string_view>

#include <boost/asio/post.hpp>

#include "core/ILogger.hpp"
#include "stream/Exception.hpp"

namespace pfs::stream
{
#define LOG(severity, message) PFS_LOG(STREAM, severity, "[" << _debugId << "] - " << message)

    namespace
    {
        std::atomic<std::size_t> globalId{};

        std::string_view seekOriginToString(SeekOrigin origin)
        {
            switch (origin)
            {
            case SeekOrigin::Begin:
                return "begin";
            case SeekOrigin::Current:
                return "current";
            case SeekOrigin::End:
                return "end";
            }
            return "";
        }
    } // namespace

    std::shared_ptr<ITailFollowStream> createTailFollowStream(boost::asio::io_context& ioContext, std::unique_ptr<IByteSource> source, std::shared_ptr<ITranscodingJob> job, const TailFollowParameters& parameters)
    {
        return std::make_shared<TailFollowStream>(ioContext, std::move(source), std::move(job), parameters);
    }

    std::shared_ptr<ITailFollowStream> createTailFollowFileStream(boost::asio::io_context& ioContext, const std::filesystem::path& path, std::shared_ptr<ITranscodingJob> job, const TailFollowParameters& parameters)
    {
        return createTailFollowStream(ioContext, createFileByteSource(path), std::move(job), parameters);
    }

    TailFollowStream::TailFollowStream(boost::asio::io_context& ioContext, std::unique_ptr<IByteSource> source, std::shared_ptr<ITranscodingJob> job, const TailFollowParameters& parameters)
        : _debugId{ globalId++ }
        , _parameters{ parameters }
        , _job{ std::move(job) }
        , _source{ std::move(source) }
        , _pollTimer{ ioContext }
    {
        LOG(DEBUG, "Following source, job = " << (_job ? "yes" : "no") << ", timeout = " << _parameters.timeout.count() << " ms, poll interval = " << _parameters.pollInterval.count() << " ms");
    }

    TailFollowStream::~TailFollowStream()
    {
        close();
    }

    bool TailFollowStream::canRead() const
    {
        const std::scoped_lock lock{ _mutex };
        return !_closed;
    }

    std::size_t TailFollowStream::readSome(std::byte* buffer, std::size_t bufferSize)
    {
        startRead();
        if (bufferSize == 0)
            return 0;

        const clock::time_point readStartTime{ clock::now() };
        while (true)
        {
            if (const std::optional<std::size_t> nbBytesRead{ pollOnce(buffer, bufferSize, readStartTime) })
                return *nbBytesRead;

            std::unique_lock lock{ _mutex };
            if (_waitCondition.wait_for(lock, _parameters.pollInterval, [this] { return _closed || _readCancelled; }))
            {
                LOG(DEBUG, "Read interrupted while waiting for data");
                throw CancelledException{};
            }
        }
    }

    void TailFollowStream::asyncReadSome(std::byte* buffer, std::size_t bufferSize, ReadCallback callback)
    {
        startRead();

        boost::asio::post(_pollTimer.get_executor(), [self = shared_from_this(), buffer, bufferSize, readStartTime = clock::now(), callback = std::move(callback)]() mutable {
            self->asyncPoll(buffer, bufferSize, readStartTime, std::move(callback));
        });
    }

    void TailFollowStream::asyncPoll(std::byte* buffer, std::size_t bufferSize, clock::time_point readStartTime, ReadCallback callback)
    {
        std::optional<std::size_t> nbBytesRead;
        try
        {
            nbBytesRead = bufferSize == 0 ? 0 : pollOnce(buffer, bufferSize, readStartTime);
        }
        catch (const CancelledException&)
        {
            callback(std::make_error_code(std::errc::operation_canceled), 0);
            return;
        }
        catch (const IOException& e)
        {
            LOG(ERROR, "Read failed: " << e.what());
            callback(e.getErrorCode(), 0);
            return;
        }

        if (nbBytesRead)
        {
            callback({}, *nbBytesRead);
            return;
        }

        // cancel() and close() cancel the timer under the same lock
        const std::scoped_lock lock{ _mutex };
        _pollTimer.expires_after(_parameters.pollInterval);
        _pollTimer.async_wait([self = shared_from_this(), buffer, bufferSize, readStartTime, callback = std::move(callback)](const boost::system::error_code& ec) mutable {
            if (ec)
            {
                PFS_LOG(STREAM, DEBUG, "[" << self->_debugId << "] - Read interrupted while waiting for data: " << ec.message());
                callback(std::make_error_code(std::errc::operation_canceled), 0);
                return;
            }

            self->asyncPoll(buffer, bufferSize, readStartTime, std::move(callback));
        });
    }

    void TailFollowStream::cancel()
    {
        {
            const std::scoped_lock lock{ _mutex };
            _readCancelled = true;
            _pollTimer.cancel();
        }
        _waitCondition.notify_all();
    }

    void TailFollowStream::startRead()
    {
        const std::scoped_lock lock{ _mutex };
        checkNotClosed();
        _readCancelled = false;
    }

    std::optional<std::size_t> TailFollowStream::pollOnce(std::byte* buffer, std::size_t bufferSize, clock::time_point readStartTime)
    {
        // Sampled before reading: bytes written just before the job exited must still be served
        const bool jobExited{ _job && _job->hasExited() };

        std::size_t nbBytesRead{};
        {
            const std::scoped_lock lock{ _mutex };
            if (_closed || _readCancelled)
                throw CancelledException{};

            nbBytesRead = _source->readSome(buffer, bufferSize);
        }

        if (nbBytesRead > 0)
        {
            if (_job)
                _job->addBytesDownloaded(nbBytesRead);

            return nbBytesRead;
        }

        if (jobExited)
        {
            LOG(DEBUG, "Job exited, end of stream");
            return 0;
        }

        // No job means a live source: do not wait forever for it
        const clock::duration elapsed{ clock::now() - readStartTime };
        if (elapsed >= _parameters.timeout)
        {
            LOG(DEBUG, "No data after " << std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count() << " ms, end of stream");
            return 0;
        }

        return std::nullopt;
    }

    std::uint64_t TailFollowStream::seek(std::int64_t offset, SeekOrigin origin)
    {
        const std::scoped_lock lock{ _mutex };
        checkNotClosed();

        LOG(DEBUG, "Seek requested: offset = " << offset << ", origin = " << seekOriginToString(origin));
        if (_job)
            LOG(DEBUG, "Bytes downloaded = " << _job->getBytesDownloaded() << ", bytes transcoded = " << _job->getBytesTranscoded());

        if (origin != SeekOrigin::Begin)
            throw UnsupportedOperationException{ "Seek is only supported from the beginning of the stream" };
        if (offset < 0)
            throw UnsupportedOperationException{ "Cannot seek to negative offset " + std::to_string(offset) };

        const std::uint64_t materializedLength{ _source->getMaterializedLength() };
        LOG(DEBUG, "Materialized length = " << materializedLength);
        if (static_cast<std::uint64_t>(offset) > materializedLength)
            throw UnsupportedOperationException{ "Cannot seek to offset " + std::to_string(offset) + ", only " + std::to_string(materializedLength) + " bytes available" };

        _source->seek(static_cast<std::uint64_t>(offset));
        return _source->getPosition();
    }

    std::uint64_t TailFollowStream::getPosition() const
    {
        const std::scoped_lock lock{ _mutex };
        checkNotClosed();

        return _source->getPosition();
    }

    std::uint64_t TailFollowStream::getLength() const
    {
        const std::scoped_lock lock{ _mutex };
        checkNotClosed();

        return _estimatedLength;
    }

    void TailFollowStream::setLength(std::uint64_t estimatedLength)
    {
        const std::scoped_lock lock{ _mutex };
        checkNotClosed();

        LOG(DEBUG, "Estimated length set to " << estimatedLength);
        _estimatedLength = estimatedLength;
    }

    void TailFollowStream::write(const std::byte* /*buffer*/, std::size_t /*bufferSize*/)
    {
        throw UnsupportedOperationException{ "Stream is read only" };
    }

    void TailFollowStream::flush()
    {
        const std::scoped_lock lock{ _mutex };
        checkNotClosed();
    }

    void TailFollowStream::close()
    {
        {
            const std::scoped_lock lock{ _mutex };
            if (_closed)
                return;

            _closed = true;
            _pollTimer.cancel();

            // the job must be notified anyway
            try
            {
                _source->close();
            }
            catch (const std::exception& e)
            {
                LOG(WARNING, "Cannot close source: " << e.what());
            }
            _source.reset();
        }
        _waitCondition.notify_all();

        LOG(DEBUG, "Stream closed");

        if (_job)
            _job->onTranscodeEndRequest();
    }

    void TailFollowStream::checkNotClosed() const
    {
        if (_closed)
            throw StreamClosedException{};
    }
} // namespace pfs::stream
