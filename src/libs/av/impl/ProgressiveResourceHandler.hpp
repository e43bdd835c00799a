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

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <system_error>

#include "core/IResourceHandler.hpp"
#include "stream/ITailFollowStream.hpp"

namespace pfs::av
{
    struct ByteRange
    {
        std::uint64_t firstByte{};
        std::uint64_t lastByte{};
    };

    struct ResponseSetup
    {
        int status{};
        std::optional<std::uint64_t> contentLength; // not set if the response has no body
        std::string contentRange;
    };

    // Positions the stream for the requested range (whole stream if not set) and describes the response to send
    ResponseSetup prepareResponse(stream::ITailFollowStream& stream, std::uint64_t estimatedLength, const std::optional<ByteRange>& range);

    class ProgressiveResourceHandler final : public core::IResourceHandler, public std::enable_shared_from_this<ProgressiveResourceHandler>
    {
    public:
        ProgressiveResourceHandler(std::shared_ptr<stream::ITailFollowStream> stream, std::string_view mimeType);
        ~ProgressiveResourceHandler() override;
        ProgressiveResourceHandler(const ProgressiveResourceHandler&) = delete;
        ProgressiveResourceHandler& operator=(const ProgressiveResourceHandler&) = delete;

    private:
        Wt::Http::ResponseContinuation* processRequest(const Wt::Http::Request& request, Wt::Http::Response& response) override;

        // returns false if the response is already complete
        bool setupResponse(const Wt::Http::Request& request, Wt::Http::Response& response);
        void writeReadyBytes(Wt::Http::Response& response);
        void writePadding(Wt::Http::Response& response);

        static constexpr std::size_t _chunkSize{ 65'536 };

        const std::size_t _debugId{};
        const std::shared_ptr<stream::ITailFollowStream> _stream;
        const std::string _mimeType;

        std::array<std::byte, _chunkSize> _buffer;
        std::size_t _bytesReadyCount{};
        std::uint64_t _totalServedByteCount{};
        std::optional<std::uint64_t> _remainingBytes; // only set if a length is announced
        bool _endOfStream{};
        std::error_code _readError;
    };
} // namespace pfs::av
