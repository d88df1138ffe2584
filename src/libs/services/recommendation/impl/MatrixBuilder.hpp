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
#include <optional>
#include <span>
#include <unordered_map>
#include <vector>

#include "services/recommendation/Types.hpp"

#include "Matrix.hpp"

namespace mrs::recommendation
{
    // User x item scores, users and items in lexicographic order. Unrated cells are 0
    class UserItemMatrix
    {
    public:
        UserItemMatrix(std::vector<UserId> users, std::vector<ItemId> items);

        const std::vector<UserId>& getUsers() const { return _users; }
        const std::vector<ItemId>& getItems() const { return _items; }

        std::optional<std::size_t> findUserIndex(const UserId& userId) const;
        std::optional<std::size_t> findItemIndex(const ItemId& itemId) const;

        std::span<const double> getUserScores(std::size_t userIndex) const { return _scores.getRow(userIndex); }
        double getScore(std::size_t userIndex, std::size_t itemIndex) const { return _scores.get(userIndex, itemIndex); }
        void setScore(std::size_t userIndex, std::size_t itemIndex, double score) { _scores.get(userIndex, itemIndex) = score; }

    private:
        std::vector<UserId> _users;
        std::vector<ItemId> _items;
        std::unordered_map<UserId, std::size_t> _userIndexes;
        std::unordered_map<ItemId, std::size_t> _itemIndexes;
        Matrix<double> _scores;
    };

    // Symmetric item x item cosine similarities, items in snapshot order
    class ContentSimilarityMatrix
    {
    public:
        ContentSimilarityMatrix(std::vector<ItemId> items, Matrix<double> similarities);

        const std::vector<ItemId>& getItems() const { return _items; }

        // First occurrence in the snapshot in case of duplicate ids
        std::optional<std::size_t> findItemIndex(const ItemId& itemId) const;

        std::span<const double> getSimilarities(std::size_t itemIndex) const { return _similarities.getRow(itemIndex); }
        double getSimilarity(std::size_t itemIndexA, std::size_t itemIndexB) const { return _similarities.get(itemIndexA, itemIndexB); }

    private:
        std::vector<ItemId> _items;
        std::unordered_map<ItemId, std::size_t> _itemIndexes;
        Matrix<double> _similarities;
    };

    // Both return std::nullopt on empty input
    std::optional<UserItemMatrix> buildUserItemMatrix(std::span<const Rating> ratings);
    std::optional<ContentSimilarityMatrix> buildContentFeatures(std::span<const Item> items, std::size_t maxFeatures);

    // 0 if any of the vectors has a zero norm
    double computeCosineSimilarity(std::span<const double> a, std::span<const double> b);
} // namespace mrs::recommendation
