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

#include "MatrixBuilder.hpp"

#include <algorithm>
#include <cassert>
#include <cmath>
#include <map>
#include <set>
#include <string>

#include "core/ILogger.hpp"

#include "TfIdfVectorizer.hpp"

namespace mrs::recommendation
{
    namespace
    {
        template<typename Id>
        std::unordered_map<Id, std::size_t> computeIndexes(const std::vector<Id>& ids)
        {
            std::unordered_map<Id, std::size_t> res;
            for (std::size_t i{}; i < ids.size(); ++i)
                res.emplace(ids[i], i); // keeps the first occurrence

            return res;
        }

        template<typename Id>
        std::optional<std::size_t> findIndex(const std::unordered_map<Id, std::size_t>& indexes, const Id& id)
        {
            auto it{ indexes.find(id) };
            if (it == std::cend(indexes))
                return std::nullopt;

            return it->second;
        }

        std::string getItemDocument(const Item& item)
        {
            return item.title + " " + item.description + " " + item.category;
        }
    } // namespace

    UserItemMatrix::UserItemMatrix(std::vector<UserId> users, std::vector<ItemId> items)
        : _users{ std::move(users) }
        , _items{ std::move(items) }
        , _userIndexes{ computeIndexes(_users) }
        , _itemIndexes{ computeIndexes(_items) }
        , _scores{ _users.size(), _items.size() }
    {
    }

    std::optional<std::size_t> UserItemMatrix::findUserIndex(const UserId& userId) const
    {
        return findIndex(_userIndexes, userId);
    }

    std::optional<std::size_t> UserItemMatrix::findItemIndex(const ItemId& itemId) const
    {
        return findIndex(_itemIndexes, itemId);
    }

    ContentSimilarityMatrix::ContentSimilarityMatrix(std::vector<ItemId> items, Matrix<double> similarities)
        : _items{ std::move(items) }
        , _itemIndexes{ computeIndexes(_items) }
        , _similarities{ std::move(similarities) }
    {
        assert(_similarities.getRowCount() == _items.size());
        assert(_similarities.getColumnCount() == _items.size());
    }

    std::optional<std::size_t> ContentSimilarityMatrix::findItemIndex(const ItemId& itemId) const
    {
        return findIndex(_itemIndexes, itemId);
    }

    std::optional<UserItemMatrix> buildUserItemMatrix(std::span<const Rating> ratings)
    {
        if (ratings.empty())
            return std::nullopt;

        // Several ratings for the same pair are averaged
        struct ScoreSum
        {
            double sum{};
            std::size_t count{};
        };
        std::map<UserId, std::map<ItemId, ScoreSum>> scoreSums;
        std::set<ItemId> itemIds;
        for (const Rating& rating : ratings)
        {
            ScoreSum& scoreSum{ scoreSums[rating.userId][rating.itemId] };
            scoreSum.sum += rating.score;
            scoreSum.count += 1;
            itemIds.insert(rating.itemId);
        }

        std::vector<UserId> users;
        users.reserve(scoreSums.size());
        for (const auto& [userId, itemScores] : scoreSums)
            users.push_back(userId);

        std::vector<ItemId> items(std::cbegin(itemIds), std::cend(itemIds));

        UserItemMatrix matrix{ std::move(users), std::move(items) };
        for (const auto& [userId, itemScores] : scoreSums)
        {
            const std::size_t userIndex{ *matrix.findUserIndex(userId) };
            for (const auto& [itemId, scoreSum] : itemScores)
                matrix.setScore(userIndex, *matrix.findItemIndex(itemId), scoreSum.sum / static_cast<double>(scoreSum.count));
        }

        MRS_LOG(RECOMMENDATION, DEBUG, "Built user item matrix: " << matrix.getUsers().size() << " users x " << matrix.getItems().size() << " items");

        return matrix;
    }

    std::optional<ContentSimilarityMatrix> buildContentFeatures(std::span<const Item> items, std::size_t maxFeatures)
    {
        if (items.empty())
            return std::nullopt;

        std::vector<ItemId> itemIds;
        std::vector<std::string> documents;
        itemIds.reserve(items.size());
        documents.reserve(items.size());
        for (const Item& item : items)
        {
            itemIds.push_back(item.id);
            documents.push_back(getItemDocument(item));
        }

        TfIdfVectorizer vectorizer{ maxFeatures };
        const std::vector<DocumentVector> vectors{ vectorizer.fitTransform(documents) };

        Matrix<double> similarities{ items.size(), items.size() };
        for (std::size_t i{}; i < vectors.size(); ++i)
        {
            for (std::size_t j{ i }; j < vectors.size(); ++j)
            {
                const double similarity{ computeCosineSimilarity(vectors[i], vectors[j]) };
                similarities.get(i, j) = similarity;
                similarities.get(j, i) = similarity;
            }
        }

        MRS_LOG(RECOMMENDATION, DEBUG, "Built content similarity matrix: " << items.size() << " items, vocabulary size = " << vectorizer.getVocabulary().size());

        return ContentSimilarityMatrix{ std::move(itemIds), std::move(similarities) };
    }

    double computeCosineSimilarity(std::span<const double> a, std::span<const double> b)
    {
        assert(a.size() == b.size());

        double dotProduct{};
        double normA{};
        double normB{};
        for (std::size_t i{}; i < a.size(); ++i)
        {
            dotProduct += a[i] * b[i];
            normA += a[i] * a[i];
            normB += b[i] * b[i];
        }

        if (normA == 0 || normB == 0)
            return 0;

        return dotProduct / (std::sqrt(normA) * std::sqrt(normB));
    }
} // namespace mrs::recommendation
