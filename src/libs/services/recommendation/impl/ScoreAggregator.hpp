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

#include <cstddef>
#include <functional>
#include <unordered_map>
#include <vector>

#include "services/recommendation/Types.hpp"

namespace mrs::recommendation
{
    // Collects score contributions for items, keeping track of the order in which items are first seen
    class ScoreAggregator
    {
    public:
        void addContribution(const ItemId& itemId, double score);

        std::size_t getItemCount() const { return _entries.size(); }

        // Results are sorted by descending score, ties in first seen order, and truncated to maxCount
        RecommendationResult getMeanScores(std::size_t maxCount) const;
        RecommendationResult getSumScores(std::size_t maxCount) const;

        using ScoreReducer = std::function<double(double sum, std::size_t count)>;
        RecommendationResult getScores(std::size_t maxCount, const ScoreReducer& reducer) const;

    private:
        struct Entry
        {
            ItemId itemId;
            double sum{};
            std::size_t count{};
        };
        std::vector<Entry> _entries;
        std::unordered_map<ItemId, std::size_t> _entryIndexes;
    };

    // Stable sort by descending score, then truncate
    void sortAndTruncate(RecommendationResult& result, std::size_t maxCount);
} // namespace mrs::recommendation
