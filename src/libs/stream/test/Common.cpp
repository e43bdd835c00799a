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

#include "Common.hpp"

#include <algorithm>

#include "stream/Exception.hpp"

namespace pfs::stream::tests
{
    std::size_t GrowingByteSource::readSome(std::byte* buffer, std::size_t bufferSize)
    {
        const std::scoped_lock lock{ _state->mutex };

        _state->readCount++;
        if (_state->readError)
            throw IOException{ "Read failed", *_state->readError };

        if (_state->emptyReadCount > 0)
        {
            _state->emptyReadCount--;
            return 0;
        }

        if (_state->position >= _state->data.size())
            return 0;

        const std::size_t nbBytesRead{ std::min<std::size_t>(bufferSize, _state->data.size() - _state->position) };
        std::copy_n(std::cbegin(_state->data) + _state->position, nbBytesRead, buffer);
        _state->position += nbBytesRead;

        return nbBytesRead;
    }

    void GrowingByteSource::seek(std::uint64_t offset)
    {
        const std::scoped_lock lock{ _state->mutex };
        _state->position = offset;
    }

    std::uint64_t GrowingByteSource::getPosition() const
    {
        const std::scoped_lock lock{ _state->mutex };
        return _state->position;
    }

    std::uint64_t GrowingByteSource::getMaterializedLength() const
    {
        const std::scoped_lock lock{ _state->mutex };
        return _state->data.size();
    }

    void GrowingByteSource::close()
    {
        const std::scoped_lock lock{ _state->mutex };
        _state->closed = true;
        if (_state->closeError)
            throw IOException{ "Close failed", std::make_error_code(std::errc::io_error) };
    }

    std::string toString(const std::byte* buffer, std::size_t size)
    {
        return std::string{ reinterpret_cast<const char*>(buffer), size };
    }
} // namespace pfs::stream::tests
