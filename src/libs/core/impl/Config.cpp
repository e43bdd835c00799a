/*
 * Copyright (C) 2016 Emeric Poupon
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

#include "Config.hpp"

#include <optional>
#include <string>

#include "core/Exception.hpp"

namespace pfs::core
{
    std::unique_ptr<IConfig> createConfig(const std::filesystem::path& p)
    {
        return std::make_unique<Config>(p);
    }

    Config::Config(const std::filesystem::path& p)
    {
        try
        {
            _config.readFile(p.c_str());
        }
        catch (const libconfig::FileIOException&)
        {
            throw PfsException{ "Cannot open config file '" + p.string() + "'" };
        }
        catch (const libconfig::ParseException& e)
        {
            throw PfsException{ "Cannot parse config file '" + p.string() + "', line = " + std::to_string(e.getLine()) + ", error = '" + e.getError() + "'" };
        }
        catch (const libconfig::ConfigException& e)
        {
            throw PfsException{ "Cannot open config file '" + p.string() + "': " + e.what() };
        }
    }

    std::string_view Config::getString(std::string_view setting, std::string_view def)
    {
        if (const auto res{ lookup<const char*>(setting) })
            return *res;

        return def;
    }

    void Config::visitStrings(std::string_view setting, std::function<void(std::string_view)> _func, std::initializer_list<std::string_view> defs)
    {
        try
        {
            const libconfig::Setting& values{ _config.lookup(std::string{ setting }) };
            if (!values.isList() && !values.isArray())
                throw PfsException{ "Setting '" + std::string{ setting } + "' must be a list of strings" };

            for (int i{}; i < values.getLength(); ++i)
                _func(static_cast<const char*>(values[i]));
        }
        catch (const libconfig::SettingNotFoundException&)
        {
            for (std::string_view def : defs)
                _func(def);
        }
        catch (const libconfig::SettingTypeException&)
        {
            throw PfsException{ "Setting '" + std::string{ setting } + "' must be a list of strings" };
        }
    }

    std::filesystem::path Config::getPath(std::string_view setting, const std::filesystem::path& def)
    {
        if (const auto res{ lookup<const char*>(setting) })
            return std::filesystem::path{ std::string{ *res } };

        return def;
    }

    unsigned long Config::getULong(std::string_view setting, unsigned long def)
    {
        if (const auto res{ lookup<unsigned int>(setting) })
            return *res;

        return def;
    }

    bool Config::getBool(std::string_view setting, bool def)
    {
        if (const auto res{ lookup<bool>(setting) })
            return *res;

        return def;
    }

    // std::nullopt if missing, wrongly typed settings are errors
    template<typename T>
    std::optional<T> Config::lookup(std::string_view setting) const
    {
        try
        {
            return static_cast<T>(_config.lookup(std::string{ setting }));
        }
        catch (const libconfig::SettingNotFoundException&)
        {
            return std::nullopt;
        }
        catch (const libconfig::SettingTypeException&)
        {
            throw PfsException{ "Setting '" + std::string{ setting } + "' has an unexpected type" };
        }
    }
} // namespace pfs::core
