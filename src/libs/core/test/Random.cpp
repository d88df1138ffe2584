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

#include <vector>

#include <gtest/gtest.h>

#include "core/Random.hpp"

namespace mrs::core::random::tests
{
    TEST(Random, seededGeneratorsAreReproducible)
    {
        RandGenerator gen1{ createSeededGenerator(42) };
        RandGenerator gen2{ createSeededGenerator(42) };

        for (std::size_t i{}; i < 100; ++i)
            EXPECT_EQ(getRandom(0, 1000, gen1), getRandom(0, 1000, gen2));
    }

    TEST(Random, getRandomBounds)
    {
        for (std::size_t i{}; i < 1000; ++i)
        {
            const int value{ getRandom(10, 30) };
            EXPECT_GE(value, 10);
            EXPECT_LE(value, 30);
        }
    }

    TEST(Random, pickRandom)
    {
        const std::vector<int> empty;
        EXPECT_EQ(pickRandom(empty), std::cend(empty));

        const std::vector<int> values{ 1, 2, 3 };
        for (std::size_t i{}; i < 100; ++i)
        {
            auto it{ pickRandom(values) };
            ASSERT_NE(it, std::cend(values));
        }
    }
} // namespace mrs::core::random::tests
