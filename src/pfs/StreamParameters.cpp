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
#include "StreamParameters.hpp"

#include "core/ILogger.hpp"
#include "core/String.hpp"

namespace pfs
{
    namespace
    {
        constexpr std::size_t minBitrate{ 32'000 };
        constexpr std::size_t maxBitrate{ 320'000 };

        template<typename T>
        std::optional<T> readParameterAs(const ParameterGetter& getParameter, const std::string& parameterName)
        {
            const std::string* paramStr{ getParameter(parameterName) };
            if (!paramStr)
            {
                PFS_LOG(HTTP, DEBUG, "Missing parameter '" << parameterName << "'");
                return std::nullopt;
            }

            auto res{ core::stringUtils::readAs<T>(*paramStr) };
            if (!res)
                PFS_LOG(HTTP, ERROR, "Cannot parse parameter '" << parameterName << "' from value '" << *paramStr << "'");

            return res;
        }

        // unsigned reads silently wrap negative values
        std::optional<std::chrono::seconds> readSecondsParameter(const ParameterGetter& getParameter, const std::string& parameterName)
        {
            const auto value{ readParameterAs<std::chrono::seconds::rep>(getParameter, parameterName) };
            if (!value)
                return std::nullopt;

            if (*value < 0)
            {
                PFS_LOG(HTTP, ERROR, "Parameter '" << parameterName << "' must not be negative");
                return std::nullopt;
            }

            return std::chrono::seconds{ *value };
        }
    } // namespace

    std::optional<StreamParameters> parseStreamParameters(const ParameterGetter& getParameter)
    {
        StreamParameters parameters;

        // mandatory parameters
        const auto file{ readParameterAs<std::string>(getParameter, "file") };
        const auto formatStr{ readParameterAs<std::string>(getParameter, "format") };
        const auto bitrate{ readParameterAs<std::size_t>(getParameter, "bitrate") };

        if (!file || !formatStr || !bitrate)
            return std::nullopt;

        const std::optional<av::OutputFormat> format{ av::parseOutputFormat(*formatStr) };
        if (!format)
        {
            PFS_LOG(HTTP, ERROR, "Unknown format '" << *formatStr << "'");
            return std::nullopt;
        }

        if (*bitrate < minBitrate || *bitrate > maxBitrate)
        {
            PFS_LOG(HTTP, ERROR, "Bitrate '" << *bitrate << "' is not allowed");
            return std::nullopt;
        }

        // optional parameters
        if (getParameter("offset"))
        {
            const auto offset{ readSecondsParameter(getParameter, "offset") };
            if (!offset)
                return std::nullopt;

            parameters.offset = *offset;
        }

        if (getParameter("duration"))
        {
            parameters.duration = readSecondsParameter(getParameter, "duration");
            if (!parameters.duration)
                return std::nullopt;

            if (parameters.offset >= *parameters.duration)
            {
                PFS_LOG(HTTP, ERROR, "Offset " << parameters.offset.count() << "s is beyond duration " << parameters.duration->count() << "s");
                return std::nullopt;
            }
        }

        parameters.file = *file;
        parameters.outputParameters.format = *format;
        parameters.outputParameters.bitrate = *bitrate;
        parameters.outputParameters.stripMetadata = true;

        return parameters;
    }
} // namespace pfs
