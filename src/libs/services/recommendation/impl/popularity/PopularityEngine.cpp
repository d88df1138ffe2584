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

#include "PopularityEngine.hpp"

#include <cmath>
#include <unordered_set>

#include "core/ILogger.hpp"

#include "MatrixCache.hpp"
#include "ScoreAggregator.hpp"

namespace mrs::recommendation
{
    std::unique_ptr<IEngine> createPopularityEngine(const RecommendationSettings& settings)
    {
        return std::make_unique<PopularityEngine>(settings.defaultPopularityScore);
    }

    RecommendationResult PopularityEngine::recommend(const SnapshotMatrices& matrices, const UserId& /*userId*/, std::size_t maxCount) const
    {
        const Snapshot& snapshot{ matrices.getSnapshot() };
        return recommend(maxCount, snapshot.ratings, snapshot.items);
    }

    RecommendationResult PopularityEngine::recommend(std::size_t maxCount, std::span<const Rating> ratings, std::span<const Item> items) const
    {
        if (maxCount == 0 || items.empty())
            return {};

        ScoreAggregator aggregator;
        for (const Rating& rating : ratings)
            aggregator.addContribution(rating.itemId, rating.score);

        RecommendationResult res{ aggregator.getScores(maxCount, [](double sum, std::size_t count) {
            const double mean{ sum / static_cast<double>(count) };
            return mean * std::log(static_cast<double>(count) + 1);
        }) };

        if (res.size() < maxCount)
        {
            std::unordered_set<ItemId> ratedItems;
            for (const Rating& rating : ratings)
                ratedItems.insert(rating.itemId);

            for (const Item& item : items)
            {
                if (res.size() >= maxCount)
                    break;

                if (ratedItems.insert(item.id).second)
                    res.push_back(ScoredItem{ item.id, _defaultScore });
            }

            // the default score may be above the score of poorly rated items
            sortAndTruncate(res, maxCount);
        }

        MRS_LOG(RECOMMENDATION, DEBUG, "Popularity: " << aggregator.getItemCount() << " rated items, returning " << res.size() << " items");

        return res;
    }
} // namespace mrs::recommendation
