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

#include "ContentEngine.hpp"

#include <unordered_set>
#include <vector>

#include "core/ILogger.hpp"

#include "MatrixBuilder.hpp"
#include "MatrixCache.hpp"
#include "ScoreAggregator.hpp"

namespace mrs::recommendation
{
    std::unique_ptr<IEngine> createContentEngine(const RecommendationSettings& settings)
    {
        return std::make_unique<ContentEngine>(settings.likedThreshold);
    }

    RecommendationResult ContentEngine::recommend(const SnapshotMatrices& matrices, const UserId& userId, std::size_t maxCount) const
    {
        const ContentSimilarityMatrix* similarityMatrix{ matrices.getContentSimilarityMatrix() };
        if (!similarityMatrix)
            return {};

        return recommend(userId, maxCount, *similarityMatrix, matrices.getSnapshot().ratings);
    }

    RecommendationResult ContentEngine::recommend(const UserId& userId, std::size_t maxCount, const ContentSimilarityMatrix& similarityMatrix, std::span<const Rating> ratings) const
    {
        if (maxCount == 0)
            return {};

        std::unordered_set<ItemId> ratedItems;
        std::vector<ItemId> likedItems;
        for (const Rating& rating : ratings)
        {
            if (rating.userId != userId)
                continue;

            ratedItems.insert(rating.itemId);
            if (rating.score >= _likedThreshold)
                likedItems.push_back(rating.itemId);
        }

        if (likedItems.empty())
        {
            MRS_LOG(RECOMMENDATION, DEBUG, "Content: no liked item for user '" << userId << "' (" << ratedItems.size() << " rated items)");
            return {};
        }

        const std::vector<ItemId>& items{ similarityMatrix.getItems() };

        ScoreAggregator aggregator;
        for (const ItemId& likedItem : likedItems)
        {
            // may have been rated but not be part of the catalog anymore
            const std::optional<std::size_t> likedItemIndex{ similarityMatrix.findItemIndex(likedItem) };
            if (!likedItemIndex)
                continue;

            const std::span<const double> similarities{ similarityMatrix.getSimilarities(*likedItemIndex) };
            for (std::size_t itemIndex{}; itemIndex < items.size(); ++itemIndex)
            {
                if (items[itemIndex] == likedItem || ratedItems.contains(items[itemIndex]))
                    continue;

                aggregator.addContribution(items[itemIndex], similarities[itemIndex]);
            }
        }

        MRS_LOG(RECOMMENDATION, DEBUG, "Content: user '" << userId << "', " << likedItems.size() << " liked items, " << aggregator.getItemCount() << " candidates");

        return aggregator.getMeanScores(maxCount);
    }
} // namespace mrs::recommendation
