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

#include <array>
#include <thread>
#include <vector>

#include <gtest/gtest.h>

#include "MatrixCache.hpp"

#include "Common.hpp"

namespace mrs::recommendation::tests
{
    namespace
    {
        constexpr std::size_t maxFeatures{ 100 };

        std::shared_ptr<const Snapshot> createTestSnapshot(std::uint64_t version)
        {
            return createSnapshot({ { "u1", "m1", 5 }, { "u2", "m2", 3 } },
                { createItem("m1", "space adventure", "SciFi"), createItem("m2", "space opera", "SciFi") },
                version);
        }
    } // namespace

    TEST(MatrixCache, sameVersionIsShared)
    {
        MatrixCache cache{ maxFeatures };
        const auto snapshot{ createTestSnapshot(1) };

        const auto first{ cache.getMatrices(snapshot) };
        const auto second{ cache.getMatrices(snapshot) };
        ASSERT_TRUE(first);
        EXPECT_EQ(first, second);
        EXPECT_EQ(first->getSnapshot().version, 1);

        // built once, then reused
        const UserItemMatrix* userItemMatrix{ first->getUserItemMatrix() };
        ASSERT_NE(userItemMatrix, nullptr);
        EXPECT_EQ(second->getUserItemMatrix(), userItemMatrix);
        EXPECT_EQ(userItemMatrix->getUsers().size(), 2);

        const ContentSimilarityMatrix* similarityMatrix{ first->getContentSimilarityMatrix() };
        ASSERT_NE(similarityMatrix, nullptr);
        EXPECT_EQ(second->getContentSimilarityMatrix(), similarityMatrix);
    }

    TEST(MatrixCache, sameVersionFromDistinctSnapshotObjects)
    {
        MatrixCache cache{ maxFeatures };

        const auto first{ cache.getMatrices(createTestSnapshot(1)) };
        const auto second{ cache.getMatrices(createTestSnapshot(1)) };
        EXPECT_EQ(first, second);
    }

    TEST(MatrixCache, newVersionReplacesMatrices)
    {
        MatrixCache cache{ maxFeatures };

        const auto first{ cache.getMatrices(createTestSnapshot(1)) };
        const auto second{ cache.getMatrices(createTestSnapshot(2)) };
        ASSERT_TRUE(second);
        EXPECT_NE(first, second);
        EXPECT_EQ(second->getSnapshot().version, 2);
        EXPECT_EQ(cache.getMatrices(createTestSnapshot(2)), second);

        // previous holders keep a usable instance
        EXPECT_EQ(first->getSnapshot().version, 1);
        EXPECT_NE(first->getUserItemMatrix(), nullptr);
    }

    TEST(MatrixCache, olderVersionDoesNotEvict)
    {
        MatrixCache cache{ maxFeatures };

        const auto current{ cache.getMatrices(createTestSnapshot(2)) };
        const auto outdated{ cache.getMatrices(createTestSnapshot(1)) };
        ASSERT_TRUE(outdated);
        EXPECT_NE(outdated, current);
        EXPECT_EQ(outdated->getSnapshot().version, 1);

        EXPECT_EQ(cache.getMatrices(createTestSnapshot(2)), current);
    }

    TEST(MatrixCache, emptySnapshot)
    {
        MatrixCache cache{ maxFeatures };

        const auto matrices{ cache.getMatrices(createSnapshot({}, {}, 1)) };
        ASSERT_TRUE(matrices);
        EXPECT_EQ(matrices->getUserItemMatrix(), nullptr);
        EXPECT_EQ(matrices->getContentSimilarityMatrix(), nullptr);
    }

    TEST(MatrixCache, concurrentAccess)
    {
        MatrixCache cache{ maxFeatures };
        const auto snapshot{ createTestSnapshot(1) };

        constexpr std::size_t threadCount{ 8 };
        std::array<const UserItemMatrix*, threadCount> userItemMatrices{};
        std::array<const ContentSimilarityMatrix*, threadCount> similarityMatrices{};
        {
            std::vector<std::thread> threads;
            for (std::size_t i{}; i < threadCount; ++i)
            {
                threads.emplace_back([&, i] {
                    const auto matrices{ cache.getMatrices(snapshot) };
                    userItemMatrices[i] = matrices->getUserItemMatrix();
                    similarityMatrices[i] = matrices->getContentSimilarityMatrix();
                });
            }

            for (std::thread& thread : threads)
                thread.join();
        }

        ASSERT_NE(userItemMatrices[0], nullptr);
        ASSERT_NE(similarityMatrices[0], nullptr);
        for (std::size_t i{ 1 }; i < threadCount; ++i)
        {
            EXPECT_EQ(userItemMatrices[i], userItemMatrices[0]);
            EXPECT_EQ(similarityMatrices[i], similarityMatrices[0]);
        }
    }
} // namespace mrs::recommendation::tests
