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

#include <cmath>

#include <gtest/gtest.h>

#include "popularity/PopularityEngine.hpp"

#include "Common.hpp"

namespace mrs::recommendation::tests
{
    TEST(PopularityEngine, noItem)
    {
        const PopularityEngine engine{ 2.5 };
        EXPECT_TRUE(engine.recommend(10, std::vector<Rating>{ { "u1", "m1", 5 } }, std::vector<Item>{}).empty());
    }

    TEST(PopularityEngine, noRating)
    {
        const PopularityEngine engine{ 2.5 };
        const std::vector<Item> items{ createItem("m1"), createItem("m2"), createItem("m3") };

        const RecommendationResult result{ engine.recommend(10, {}, items) };
        EXPECT_EQ(result, (RecommendationResult{ { "m1", 2.5 }, { "m2", 2.5 }, { "m3", 2.5 } }));
    }

    TEST(PopularityEngine, volumeAndQuality)
    {
        const PopularityEngine engine{ 2.5 };
        const std::vector<Item> items{ createItem("m1"), createItem("m2"), createItem("m3"), createItem("m4") };
        const std::vector<Rating> ratings{
            { "u1", "m2", 4 },
            { "u1", "m1", 5 },
            { "u2", "m1", 5 },
        };

        const RecommendationResult result{ engine.recommend(10, ratings, items) };
        checkResult(result, 10);

        // fewer items than the limit: everything is returned
        ASSERT_EQ(result.size(), 4);
        EXPECT_EQ(result[0].itemId, "m1");
        EXPECT_NEAR(result[0].score, 5 * std::log(3.), 1e-9);
        EXPECT_EQ(result[1].itemId, "m2");
        EXPECT_NEAR(result[1].score, 4 * std::log(2.), 1e-9);
        EXPECT_EQ(result[2], (ScoredItem{ "m3", 2.5 }));
        EXPECT_EQ(result[3], (ScoredItem{ "m4", 2.5 }));
    }

    TEST(PopularityEngine, limit)
    {
        const PopularityEngine engine{ 2.5 };
        const std::vector<Item> items{ createItem("m1"), createItem("m2"), createItem("m3") };
        const std::vector<Rating> ratings{ { "u1", "m2", 4 }, { "u1", "m3", 5 } };

        const RecommendationResult result{ engine.recommend(1, ratings, items) };
        ASSERT_EQ(result.size(), 1);
        EXPECT_EQ(result[0].itemId, "m3");

        EXPECT_TRUE(engine.recommend(0, ratings, items).empty());
    }

    TEST(PopularityEngine, defaultScoreAbovePoorRatings)
    {
        const PopularityEngine engine{ 2.5 };
        const std::vector<Item> items{ createItem("m1"), createItem("m2") };
        const std::vector<Rating> ratings{ { "u1", "m1", 1 } };

        const RecommendationResult result{ engine.recommend(10, ratings, items) };
        checkResult(result, 10);
        ASSERT_EQ(result.size(), 2);
        EXPECT_EQ(result[0], (ScoredItem{ "m2", 2.5 }));
        EXPECT_EQ(result[1].itemId, "m1");
        EXPECT_NEAR(result[1].score, std::log(2.), 1e-9);
    }

    TEST(PopularityEngine, tiesInFirstRatedOrder)
    {
        const PopularityEngine engine{ 2.5 };
        const std::vector<Item> items{ createItem("m1"), createItem("m2"), createItem("m3") };
        const std::vector<Rating> ratings{ { "u1", "m3", 4 }, { "u1", "m1", 4 }, { "u1", "m2", 4 } };

        const RecommendationResult result{ engine.recommend(3, ratings, items) };
        ASSERT_EQ(result.size(), 3);
        EXPECT_EQ(result[0].itemId, "m3");
        EXPECT_EQ(result[1].itemId, "m1");
        EXPECT_EQ(result[2].itemId, "m2");
    }
} // namespace mrs::recommendation::tests
