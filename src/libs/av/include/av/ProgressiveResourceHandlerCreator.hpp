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

#include <memory>
#include <string_view>

#include "core/IResourceHandler.hpp"
#include "stream/ITailFollowStream.hpp"

namespace pfs::av
{
    // Serves a stream that is still being produced, announcing its estimated length if set
    // Destroying the handler closes the stream
    std::shared_ptr<core::IResourceHandler> createProgressiveResourceHandler(std::shared_ptr<stream::ITailFollowStream> stream, std::string_view mimeType);
} // namespace pfs::av
