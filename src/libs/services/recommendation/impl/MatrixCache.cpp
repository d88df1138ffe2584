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

#include "MatrixCache.hpp"

#include "core/ILogger.hpp"

namespace mrs::recommendation
{
    SnapshotMatrices::SnapshotMatrices(std::shared_ptr<const Snapshot> snapshot, std::size_t maxFeatures)
        : _snapshot{ std::move(snapshot) }
        , _maxFeatures{ maxFeatures }
    {
    }

    const UserItemMatrix* SnapshotMatrices::getUserItemMatrix() const
    {
        std::call_once(_userItemMatrixFlag, [this] {
            MRS_LOG(RECOMMENDATION, DEBUG, "Building user item matrix for snapshot version " << _snapshot->version);
            _userItemMatrix = buildUserItemMatrix(_snapshot->ratings);
        });

        return _userItemMatrix ? &_userItemMatrix.value() : nullptr;
    }

    const ContentSimilarityMatrix* SnapshotMatrices::getContentSimilarityMatrix() const
    {
        std::call_once(_contentSimilarityMatrixFlag, [this] {
            MRS_LOG(RECOMMENDATION, DEBUG, "Building content similarity matrix for snapshot version " << _snapshot->version);
            _contentSimilarityMatrix = buildContentFeatures(_snapshot->items, _maxFeatures);
        });

        return _contentSimilarityMatrix ? &_contentSimilarityMatrix.value() : nullptr;
    }

    MatrixCache::MatrixCache(std::size_t maxFeatures)
        : _maxFeatures{ maxFeatures }
    {
    }

    std::shared_ptr<const SnapshotMatrices> MatrixCache::getMatrices(std::shared_ptr<const Snapshot> snapshot)
    {
        std::scoped_lock lock{ _mutex };

        if (_matrices && snapshot->version < _matrices->getSnapshot().version)
        {
            // late reader of an outdated snapshot: do not evict the newer matrices
            return std::make_shared<const SnapshotMatrices>(std::move(snapshot), _maxFeatures);
        }

        if (!_matrices || _matrices->getSnapshot().version != snapshot->version)
        {
            MRS_LOG(RECOMMENDATION, DEBUG, "Matrices now bound to snapshot version " << snapshot->version);
            _matrices = std::make_shared<const SnapshotMatrices>(std::move(snapshot), _maxFeatures);
        }

        return _matrices;
    }
} // namespace mrs::recommendation
