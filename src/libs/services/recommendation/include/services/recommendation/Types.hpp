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

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mrs::recommendation
{
    using UserId = std::string;
    using ItemId = std::string;

    struct Rating
    {
        UserId userId;
        ItemId itemId;
        double score{}; // in [1, 5]

        bool operator==(const Rating& other) const = default;
    };

    struct Item
    {
        ItemId id;
        std::string title;
        std::string description;
        std::string category; // always normalized to a plain string by the ingestion layer
        std::string releaseDate;

        bool operator==(const Item& other) const = default;
    };

    struct ScoredItem
    {
        ItemId itemId;
        double score{};

        bool operator==(const ScoredItem& other) const = default;
    };

    // Unique item ids, sorted by descending score
    using RecommendationResult = std::vector<ScoredItem>;

    enum class Algorithm
    {
        Collaborative,
        Content,
        Hybrid,
    };

    std::string_view getAlgorithmName(Algorithm algorithm);
    std::optional<Algorithm> parseAlgorithm(std::string_view str);
} // namespace mrs::recommendation
