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

#include <cstdio>
#include <fstream>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "core/Exception.hpp"
#include "core/IConfig.hpp"

namespace pfs::core::tests
{
    class ConfigTest : public ::testing::Test
    {
    protected:
        ~ConfigTest() override { std::filesystem::remove(_tmpFile); }

        void writeConfig(std::string_view content)
        {
            std::ofstream ofs{ _tmpFile, std::ios::out | std::ios::trunc };
            ofs << content;
        }

        const std::filesystem::path _tmpFile{ std::tmpnam(nullptr) };
    };

    TEST_F(ConfigTest, values)
    {
        writeConfig(R"(working-dir = "/tmp/pfs";
listen-port = 5091;
progressive-stream-timeout-ms = 1500;
behind-reverse-proxy = true;
trusted-proxies = ( "127.0.0.1", "::1" );
)");
        auto config{ createConfig(_tmpFile) };

        EXPECT_EQ(config->getPath("working-dir", "/var/pfs"), "/tmp/pfs");
        EXPECT_EQ(config->getULong("listen-port", 5090), 5091);
        EXPECT_EQ(config->getULong("progressive-stream-timeout-ms", 30'000), 1500);
        EXPECT_TRUE(config->getBool("behind-reverse-proxy", false));

        std::vector<std::string> proxies;
        config->visitStrings("trusted-proxies", [&](std::string_view proxy) { proxies.emplace_back(proxy); }, {});
        EXPECT_EQ(proxies, (std::vector<std::string>{ "127.0.0.1", "::1" }));
    }

    TEST_F(ConfigTest, defaults)
    {
        writeConfig("listen-addr = \"127.0.0.1\";\n");
        auto config{ createConfig(_tmpFile) };

        EXPECT_EQ(config->getString("listen-addr", "0.0.0.0"), "127.0.0.1");
        EXPECT_EQ(config->getString("log-min-severity", "info"), "info");
        EXPECT_EQ(config->getULong("progressive-stream-poll-interval-ms", 50), 50);
        EXPECT_FALSE(config->getBool("behind-reverse-proxy", false));

        std::vector<std::string> proxies;
        config->visitStrings("trusted-proxies", [&](std::string_view proxy) { proxies.emplace_back(proxy); }, { "127.0.0.1" });
        EXPECT_EQ(proxies, (std::vector<std::string>{ "127.0.0.1" }));
    }

    TEST_F(ConfigTest, wrongType)
    {
        writeConfig(R"(listen-port = "not a number";
listen-addr = 127;
behind-reverse-proxy = 1;
working-dir = true;
trusted-proxies = ( 1, 2 );
)");
        auto config{ createConfig(_tmpFile) };

        EXPECT_THROW(config->getULong("listen-port", 5090), PfsException);
        EXPECT_THROW(config->getString("listen-addr", "0.0.0.0"), PfsException);
        EXPECT_THROW(config->getBool("behind-reverse-proxy", false), PfsException);
        EXPECT_THROW(config->getPath("working-dir", "/var/pfs"), PfsException);
        EXPECT_THROW(config->visitStrings("trusted-proxies", [](std::string_view) {}, {}), PfsException);

        // still usable afterwards
        EXPECT_EQ(config->getULong("http-server-thread-count", 0), 0);
    }

    TEST_F(ConfigTest, parseError)
    {
        writeConfig("listen-port = ;\n");
        EXPECT_THROW(createConfig(_tmpFile), PfsException);
    }

    TEST_F(ConfigTest, scalarInsteadOfList)
    {
        writeConfig("trusted-proxies = \"127.0.0.1\";\n");
        auto config{ createConfig(_tmpFile) };

        EXPECT_THROW(config->visitStrings("trusted-proxies", [](std::string_view) {}, {}), PfsException);
    }

    TEST(Config, missingFile)
    {
        EXPECT_THROW(createConfig("/this/file/does/not/exist.conf"), PfsException);
    }
} // namespace pfs::core::tests
