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

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>

namespace pfs::stream
{
    // Raw byte source that may still be growing
    // All methods may throw IOException
    class IByteSource
    {
    public:
        virtual ~IByteSource() = default;

        // Non blocking: returns what is available right now, possibly 0 byte
        virtual std::size_t readSome(std::byte* buffer, std::size_t bufferSize) = 0;

        // offset must be within the materialized bytes
        virtual void seek(std::uint64_t offset) = 0;
        virtual std::uint64_t getPosition() const = 0;

        // Amount of bytes physically available so far
        virtual std::uint64_t getMaterializedLength() const = 0;

        virtual void close() = 0;
    };

    // Opens the file for reading, even if another process is still writing it
    std::unique_ptr<IByteSource> createFileByteSource(const std::filesystem::path& path);
} // namespace pfs::stream
