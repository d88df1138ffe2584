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
#include <memory>
#include <mutex>
#include <optional>

#include "services/recommendation/Snapshot.hpp"

#include "MatrixBuilder.hpp"

namespace mrs::recommendation
{
    // Matrices derived from one snapshot, each one built on first use
    // Safe to share between concurrent computations
    class SnapshotMatrices
    {
    public:
        SnapshotMatrices(std::shared_ptr<const Snapshot> snapshot, std::size_t maxFeatures);
        SnapshotMatrices(const SnapshotMatrices&) = delete;
        SnapshotMatrices& operator=(const SnapshotMatrices&) = delete;

        const Snapshot& getSnapshot() const { return *_snapshot; }

        // nullptr if there is no rating
        const UserItemMatrix* getUserItemMatrix() const;
        // nullptr if there is no item
        const ContentSimilarityMatrix* getContentSimilarityMatrix() const;

    private:
        const std::shared_ptr<const Snapshot> _snapshot;
        const std::size_t _maxFeatures;

        mutable std::once_flag _userItemMatrixFlag;
        mutable std::optional<UserItemMatrix> _userItemMatrix;
        mutable std::once_flag _contentSimilarityMatrixFlag;
        mutable std::optional<ContentSimilarityMatrix> _contentSimilarityMatrix;
    };

    // Keeps the matrices of the most recently requested snapshot version
    class MatrixCache
    {
    public:
        MatrixCache(std::size_t maxFeatures);
        MatrixCache(const MatrixCache&) = delete;
        MatrixCache& operator=(const MatrixCache&) = delete;

        std::shared_ptr<const SnapshotMatrices> getMatrices(std::shared_ptr<const Snapshot> snapshot);

    private:
        const std::size_t _maxFeatures;

        std::mutex _mutex;
        std::shared_ptr<const SnapshotMatrices> _matrices;
    };
} // namespace mrs::recommendation
