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

#include "ScoreAggregator.hpp"

#include <algorithm>

namespace mrs::recommendation
{
    void ScoreAggregator::addContribution(const ItemId& itemId, double score)
    {
        auto [it, inserted]{ _entryIndexes.try_emplace(itemId, _entries.size()) };
        if (inserted)
            _entries.push_back(Entry{ .itemId = itemId });

        Entry& entry{ _entries[it->second] };
        entry.sum += score;
        entry.count += 1;
    }

    RecommendationResult ScoreAggregator::getMeanScores(std::size_t maxCount) const
    {
        return getScores(maxCount, [](double sum, std::size_t count) { return sum / static_cast<double>(count); });
    }

    RecommendationResult ScoreAggregator::getSumScores(std::size_t maxCount) const
    {
        return getScores(maxCount, [](double sum, std::size_t) { return sum; });
    }

    RecommendationResult ScoreAggregator::getScores(std::size_t maxCount, const ScoreReducer& reducer) const
    {
        RecommendationResult res;
        res.reserve(_entries.size());
        for (const Entry& entry : _entries)
            res.push_back(ScoredItem{ entry.itemId, reducer(entry.sum, entry.count) });

        sortAndTruncate(res, maxCount);
        return res;
    }

    void sortAndTruncate(RecommendationResult& result, std::size_t maxCount)
    {
        std::stable_sort(std::begin(result), std::end(result), [](const ScoredItem& a, const ScoredItem& b) { return a.score > b.score; });
        if (result.size() > maxCount)
            result.resize(maxCount);
    }
} // namespace mrs::recommendation
