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
#include <functional>
#include <optional>
#include <string>

#include "av/TranscodingParameters.hpp"

namespace pfs
{
    struct StreamParameters
    {
        std::string file; // relative to the media directory
        av::OutputParameters outputParameters;
        std::chrono::seconds offset{};
        std::optional<std::chrono::seconds> duration; // of the whole media, offset excluded
    };

    // Returns nullptr if the parameter is not set
    using ParameterGetter = std::function<const std::string*(const std::string& parameterName)>;

    // Parameters: file, format, bitrate, [offset], [duration]
    // Returns std::nullopt if a parameter is missing or invalid
    std::optional<StreamParameters> parseStreamParameters(const ParameterGetter& getParameter);
} // namespace pfs
