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

#pragma once

#include <cmath>
#include <memory>
#include <unordered_set>
#include <vector>

#include <gtest/gtest.h>

#include "services/recommendation/Snapshot.hpp"
#include "services/recommendation/Types.hpp"

namespace mrs::recommendation::tests
{
    inline Item createItem(std::string_view id, std::string_view description = "", std::string_view category = "")
    {
        return Item{ .id = std::string{ id }, .title = std::string{ id }, .description = std::string{ description }, .category = std::string{ category }, .releaseDate = "" };
    }

    inline std::shared_ptr<const Snapshot> createSnapshot(std::vector<Rating> ratings, std::vector<Item> items, std::uint64_t version = 1)
    {
        auto snapshot{ std::make_shared<Snapshot>() };
        snapshot->version = version;
        snapshot->ratings = std::move(ratings);
        snapshot->items = std::move(items);
        return snapshot;
    }

    // Invariants that hold for any result
    inline void checkResult(const RecommendationResult& result, std::size_t limit)
    {
        EXPECT_LE(result.size(), limit);

        std::unordered_set<ItemId> itemIds;
        for (std::size_t i{}; i < result.size(); ++i)
        {
            EXPECT_TRUE(itemIds.insert(result[i].itemId).second) << "duplicate item " << result[i].itemId;
            EXPECT_TRUE(std::isfinite(result[i].score));
            if (i > 0)
                EXPECT_GE(result[i - 1].score, result[i].score);
        }
    }
} // namespace mrs::recommendation::tests
