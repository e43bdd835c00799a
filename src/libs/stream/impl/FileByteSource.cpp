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

#include "FileByteSource.hpp"

#include <cerrno>

#include "core/ILogger.hpp"
#include "stream/Exception.hpp"

namespace pfs::stream
{
    std::unique_ptr<IByteSource> createFileByteSource(const std::filesystem::path& path)
    {
        return std::make_unique<FileByteSource>(path);
    }

    FileByteSource::FileByteSource(const std::filesystem::path& path)
        : _path{ path }
        , _ifs{ path, std::ios::in | std::ios::binary }
    {
        if (!_ifs)
            throw IOException{ "Cannot open file '" + _path.string() + "'", std::error_code{ errno, std::generic_category() } };

        PFS_LOG(STREAM, DEBUG, "Opened file " << _path);
    }

    std::size_t FileByteSource::readSome(std::byte* buffer, std::size_t bufferSize)
    {
        if (!_ifs.is_open())
            throw IOException{ "Cannot read file '" + _path.string() + "'", std::make_error_code(std::errc::bad_file_descriptor) };

        // a previous read may have hit the end of the file: the writer may have appended data since then
        _ifs.clear();
        _ifs.seekg(static_cast<std::streamoff>(_position));
        _ifs.read(reinterpret_cast<char*>(buffer), static_cast<std::streamsize>(bufferSize));

        if (_ifs.bad())
            throw IOException{ "Read failed on file '" + _path.string() + "'", std::error_code{ errno, std::generic_category() } };

        const std::size_t nbBytesRead{ static_cast<std::size_t>(_ifs.gcount()) };
        _position += nbBytesRead;

        return nbBytesRead;
    }

    void FileByteSource::seek(std::uint64_t offset)
    {
        _position = offset;
    }

    std::uint64_t FileByteSource::getPosition() const
    {
        return _position;
    }

    std::uint64_t FileByteSource::getMaterializedLength() const
    {
        std::error_code ec;
        const std::uintmax_t fileSize{ std::filesystem::file_size(_path, ec) };
        if (ec)
            throw IOException{ "Cannot get size of file '" + _path.string() + "'", ec };

        return fileSize;
    }

    void FileByteSource::close()
    {
        _ifs.clear();
        _ifs.close();
        if (_ifs.fail())
            throw IOException{ "Cannot close file '" + _path.string() + "'", std::error_code{ errno, std::generic_category() } };

        PFS_LOG(STREAM, DEBUG, "Closed file " << _path);
    }
} // namespace pfs::stream
