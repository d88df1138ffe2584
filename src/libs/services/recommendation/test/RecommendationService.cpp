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

#include "services/recommendation/Exception.hpp"
#include "services/recommendation/IRecommendationService.hpp"
#include "services/recommendation/Snapshot.hpp"

#include "Common.hpp"

namespace mrs::recommendation::tests
{
    namespace
    {
        void publishSampleData(SnapshotStore& store)
        {
            std::vector<Item> items;
            for (int i{ 1 }; i <= 6; ++i)
                items.push_back(createItem("m" + std::to_string(i), i <= 3 ? "Detectives chasing a killer in the city" : "Friends laughing at a wedding", i <= 3 ? "Thriller" : "Comedy"));

            store.publish({
                              { "u1", "m1", 5 },
                              { "u1", "m2", 4 },
                              { "u2", "m1", 5 },
                              { "u2", "m3", 4 },
                              { "u2", "m4", 2 },
                          },
                std::move(items));
        }
    } // namespace

    TEST(RecommendationService, invalidLimit)
    {
        SnapshotStore store;
        publishSampleData(store);
        const auto service{ createRecommendationService(store) };

        EXPECT_THROW(service->computeRecommendations("u1", 0, Algorithm::Hybrid), InvalidArgumentException);
        EXPECT_THROW(service->computePopularity(0), InvalidArgumentException);
    }

    TEST(RecommendationService, invalidSettings)
    {
        SnapshotStore store;
        EXPECT_THROW(createRecommendationService(store, RecommendationSettings{ .neighborCount = 0 }), Exception);
    }

    TEST(RecommendationService, emptyStore)
    {
        SnapshotStore store;
        const auto service{ createRecommendationService(store) };

        for (Algorithm algorithm : { Algorithm::Collaborative, Algorithm::Content, Algorithm::Hybrid })
            EXPECT_TRUE(service->computeRecommendations("u1", 10, algorithm).empty());
        EXPECT_TRUE(service->computePopularity(10).empty());
    }

    TEST(RecommendationService, algorithms)
    {
        SnapshotStore store;
        publishSampleData(store);
        const auto service{ createRecommendationService(store) };

        {
            const RecommendationResult result{ service->computeRecommendations("u1", 10, Algorithm::Collaborative) };
            checkResult(result, 10);
            ASSERT_EQ(result.size(), 2);
            EXPECT_EQ(result[0].itemId, "m3");
            EXPECT_EQ(result[1].itemId, "m4");
        }

        {
            const RecommendationResult result{ service->computeRecommendations("u1", 2, Algorithm::Content) };
            checkResult(result, 2);
            ASSERT_EQ(result.size(), 2);
            // same description and category as the liked items, only the title differs
            EXPECT_EQ(result[0].itemId, "m3");
            EXPECT_GT(result[0].score, 0.5);
            EXPECT_LT(result[0].score, 1.0);
        }

        EXPECT_TRUE(service->computeRecommendations("unknown", 10, Algorithm::Collaborative).empty());
        EXPECT_TRUE(service->computeRecommendations("unknown", 10, Algorithm::Content).empty());
        EXPECT_EQ(service->computeRecommendations("unknown", 10, Algorithm::Hybrid), service->computePopularity(10));
    }

    TEST(RecommendationService, deterministic)
    {
        SnapshotStore store;
        publishSampleData(store);
        const auto service{ createRecommendationService(store) };

        for (Algorithm algorithm : { Algorithm::Collaborative, Algorithm::Content, Algorithm::Hybrid })
            EXPECT_EQ(service->computeRecommendations("u2", 3, algorithm), service->computeRecommendations("u2", 3, algorithm));

        SnapshotStore otherStore;
        publishSampleData(otherStore);
        const auto otherService{ createRecommendationService(otherStore) };
        EXPECT_EQ(service->computeRecommendations("u2", 3, Algorithm::Hybrid), otherService->computeRecommendations("u2", 3, Algorithm::Hybrid));
    }

    TEST(RecommendationService, snapshotChange)
    {
        SnapshotStore store;
        publishSampleData(store);
        const auto service{ createRecommendationService(store) };

        EXPECT_EQ(service->computePopularity(10).size(), 6);

        store.publish({ { "u1", "m1", 5 } }, { createItem("m1"), createItem("m9") });

        const RecommendationResult result{ service->computePopularity(10) };
        ASSERT_EQ(result.size(), 2);
        EXPECT_EQ(result[0].itemId, "m1");
        EXPECT_EQ(result[1].itemId, "m9");

        EXPECT_TRUE(service->computeRecommendations("u2", 10, Algorithm::Collaborative).empty());
    }
} // namespace mrs::recommendation::tests
