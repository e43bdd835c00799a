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

#include "ProgressiveResourceHandler.hpp"

#include <algorithm>
#include <atomic>
#include <sstream>

#include <Wt/Http/Request.h>
#include <Wt/Http/Response.h>
#include <Wt/Http/ResponseContinuation.h>

#include "av/ProgressiveResourceHandlerCreator.hpp"
#include "core/ILogger.hpp"
#include "stream/Exception.hpp"

namespace pfs::av
{
#define LOG(severity, message) PFS_LOG(HTTP, severity, "[" << _debugId << "] - " << message)

    namespace
    {
        std::atomic<std::size_t> globalId{};
    }

    std::shared_ptr<core::IResourceHandler> createProgressiveResourceHandler(std::shared_ptr<stream::ITailFollowStream> stream, std::string_view mimeType)
    {
        return std::make_shared<ProgressiveResourceHandler>(std::move(stream), mimeType);
    }

    ProgressiveResourceHandler::ProgressiveResourceHandler(std::shared_ptr<stream::ITailFollowStream> stream, std::string_view mimeType)
        : _debugId{ globalId++ }
        , _stream{ std::move(stream) }
        , _mimeType{ mimeType }
    {
    }

    ProgressiveResourceHandler::~ProgressiveResourceHandler()
    {
        LOG(DEBUG, "Closing stream, total served byte count = " << _totalServedByteCount);
        _stream->close();
    }

    Wt::Http::ResponseContinuation* ProgressiveResourceHandler::processRequest(const Wt::Http::Request& request, Wt::Http::Response& response)
    {
        if (!request.continuation())
        {
            if (!setupResponse(request, response))
                return {};
        }

        writeReadyBytes(response);

        if (_readError)
        {
            // the client gets less bytes than announced
            LOG(ERROR, "Read failed after " << _totalServedByteCount << " bytes, interrupting response: " << _readError.message());
            return {};
        }

        if (!_endOfStream && (!_remainingBytes || *_remainingBytes > 0))
        {
            const std::size_t readSize{ _remainingBytes ? static_cast<std::size_t>(std::min<std::uint64_t>(*_remainingBytes, _buffer.size())) : _buffer.size() };

            Wt::Http::ResponseContinuation* continuation{ response.createContinuation() };
            continuation->waitForMoreData();
            try
            {
                _stream->asyncReadSome(_buffer.data(), readSize, [weakSelf = weak_from_this(), continuation](std::error_code ec, std::size_t nbBytesRead) {
                    // handler destroyed meanwhile: the response no longer exists
                    const std::shared_ptr<ProgressiveResourceHandler> self{ weakSelf.lock() };
                    if (!self)
                        return;

                    if (ec)
                        self->_readError = ec;
                    else if (nbBytesRead == 0)
                        self->_endOfStream = true;
                    else
                        self->_bytesReadyCount = nbBytesRead;

                    continuation->haveMoreData();
                });
            }
            catch (const stream::Exception& e)
            {
                LOG(ERROR, "Cannot read stream: " << e.what());
                return {};
            }

            return continuation;
        }

        writePadding(response);
        LOG(DEBUG, "Response complete, total served byte count = " << _totalServedByteCount);

        return {};
    }

    ResponseSetup prepareResponse(stream::ITailFollowStream& stream, std::uint64_t estimatedLength, const std::optional<ByteRange>& range)
    {
        ResponseSetup setup;

        if (!range)
        {
            setup.status = 200;
            setup.contentLength = estimatedLength;
            return setup;
        }

        try
        {
            stream.seek(static_cast<std::int64_t>(range->firstByte), stream::SeekOrigin::Begin);
        }
        catch (const stream::UnsupportedOperationException& e)
        {
            PFS_LOG(HTTP, DEBUG, "Cannot serve range " << range->firstByte << "-" << range->lastByte << ": " << e.what());

            setup.status = 416; // Requested range not satisfiable
            setup.contentRange = "bytes */*";
            return setup;
        }
        catch (const stream::Exception& e)
        {
            PFS_LOG(HTTP, ERROR, "Cannot seek stream to " << range->firstByte << ": " << e.what());

            setup.status = 500;
            return setup;
        }

        std::ostringstream contentRange;
        contentRange << "bytes " << range->firstByte << "-" << range->lastByte << "/" << estimatedLength;

        setup.status = 206;
        setup.contentLength = range->lastByte - range->firstByte + 1;
        setup.contentRange = contentRange.str();

        return setup;
    }

    bool ProgressiveResourceHandler::setupResponse(const Wt::Http::Request& request, Wt::Http::Response& response)
    {
        response.addHeader("Accept-Ranges", "bytes");
        response.setMimeType(_mimeType);
        LOG(DEBUG, "Mime type set to '" << _mimeType << "'");

        std::uint64_t estimatedLength{};
        try
        {
            estimatedLength = _stream->getLength();
        }
        catch (const stream::Exception& e)
        {
            LOG(ERROR, "Cannot get stream length: " << e.what());
            response.setStatus(500);
            return false;
        }

        if (estimatedLength == 0)
        {
            LOG(DEBUG, "No estimated length, serving whole stream");
            response.setStatus(200);
            return true;
        }

        const Wt::Http::Request::ByteRangeSpecifier ranges{ request.getRanges(static_cast<::int64_t>(estimatedLength)) };
        if (!ranges.isSatisfiable())
        {
            response.setStatus(416); // Requested range not satisfiable
            response.addHeader("Content-Range", "bytes */*");

            LOG(DEBUG, "Range not satisfiable");
            return false;
        }

        std::optional<ByteRange> range;
        if (ranges.size() == 1)
        {
            range = ByteRange{ static_cast<std::uint64_t>(ranges[0].firstByte()), static_cast<std::uint64_t>(ranges[0].lastByte()) };
            LOG(DEBUG, "Range requested = " << range->firstByte << "-" << range->lastByte);
        }
        else
        {
            LOG(DEBUG, "No/multiple range requested");
        }

        const ResponseSetup setup{ prepareResponse(*_stream, estimatedLength, range) };
        response.setStatus(setup.status);
        if (!setup.contentRange.empty())
            response.addHeader("Content-Range", setup.contentRange);
        if (!setup.contentLength)
            return false;

        _remainingBytes = *setup.contentLength;
        response.setContentLength(*setup.contentLength);

        return true;
    }

    void ProgressiveResourceHandler::writeReadyBytes(Wt::Http::Response& response)
    {
        if (_bytesReadyCount == 0)
            return;

        std::size_t byteCount{ _bytesReadyCount };
        if (_remainingBytes)
        {
            byteCount = static_cast<std::size_t>(std::min<std::uint64_t>(byteCount, *_remainingBytes));
            *_remainingBytes -= byteCount;
        }

        response.out().write(reinterpret_cast<const char*>(_buffer.data()), static_cast<std::streamsize>(byteCount));
        _totalServedByteCount += byteCount;
        _bytesReadyCount = 0;
    }

    void ProgressiveResourceHandler::writePadding(Wt::Http::Response& response)
    {
        // the estimated length may be larger than what was actually produced
        if (!_remainingBytes || *_remainingBytes == 0)
            return;

        LOG(DEBUG, "Adding " << *_remainingBytes << " padding bytes");
        _buffer.fill(std::byte{ 0 });

        while (*_remainingBytes > 0)
        {
            const std::size_t byteCount{ static_cast<std::size_t>(std::min<std::uint64_t>(*_remainingBytes, _buffer.size())) };
            response.out().write(reinterpret_cast<const char*>(_buffer.data()), static_cast<std::streamsize>(byteCount));
            *_remainingBytes -= byteCount;
        }
    }
} // namespace pfs::av
