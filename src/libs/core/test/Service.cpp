/*
 * Copyright (C) 2026 Emeric Poupon
 *
 * This file is part of MRS.
 *
 * MRS is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * MRS is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with MRS.  If not, see <http://www.gnu.org/licenses/>.
 */

#include <gtest/gtest.h>

#include "core/Service.hpp"

namespace mrs::core::tests
{
    class IMyService
    {
    public:
        virtual ~IMyService() = default;
        virtual int getValue() const = 0;
    };

    class MyService : public IMyService
    {
    public:
        int getValue() const override { return 42; }
    };

    TEST(Service, lifetime)
    {
        EXPECT_FALSE(Service<IMyService>::exists());
        EXPECT_EQ(Service<IMyService>::get(), nullptr);

        {
            Service<IMyService> myService{ std::make_unique<MyService>() };

            EXPECT_TRUE(Service<IMyService>::exists());
            EXPECT_EQ(Service<IMyService>::get(), myService.operator->());
            EXPECT_EQ(myService->getValue(), 42);
        }

        EXPECT_FALSE(Service<IMyService>::exists());
    }

    TEST(Service, lateAssign)
    {
        Service<IMyService> myService;
        EXPECT_FALSE(Service<IMyService>::exists());

        IMyService& assigned{ myService.assign(std::make_unique<MyService>()) };
        EXPECT_TRUE(Service<IMyService>::exists());
        EXPECT_EQ(&assigned, Service<IMyService>::get());
    }
} // namespace mrs::core::tests
