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

#include <filesystem>
#include <fstream>

#include "stream/IByteSource.hpp"

namespace pfs::stream
{
    class FileByteSource final : public IByteSource
    {
    public:
        FileByteSource(const std::filesystem::path& path);
        ~FileByteSource() override = default;
        FileByteSource(const FileByteSource&) = delete;
        FileByteSource& operator=(const FileByteSource&) = delete;

    private:
        std::size_t readSome(std::byte* buffer, std::size_t bufferSize) override;
        void seek(std::uint64_t offset) override;
        std::uint64_t getPosition() const override;
        std::uint64_t getMaterializedLength() const override;
        void close() override;

        const std::filesystem::path _path;
        std::ifstream _ifs;
        std::uint64_t _position{};
    };
} // namespace pfs::stream
