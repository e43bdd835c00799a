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

#include <gtest/gtest.h>

#include "core/Service.hpp"

namespace pfs::core::tests
{
    class IMyService
    {
    public:
        virtual ~IMyService() = default;
        virtual int getValue() const = 0;
    };

    class MyService : public IMyService
    {
        int getValue() const override { return 42; }
    };

    TEST(Service, ctr)
    {
        EXPECT_FALSE(Service<IMyService>().exists());
        EXPECT_EQ(Service<IMyService>().get(), nullptr);

        {
            Service<IMyService> myService{ std::make_unique<MyService>() };

            EXPECT_TRUE(Service<IMyService>().exists());
            EXPECT_EQ(Service<IMyService>().get(), myService.get());
            EXPECT_EQ(Service<IMyService>()->getValue(), 42);
        }

        EXPECT_FALSE(Service<IMyService>().exists());
    }
} // namespace pfs::core::tests
