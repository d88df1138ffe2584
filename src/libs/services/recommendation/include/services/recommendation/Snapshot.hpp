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

#include <cstdint>
#include <map>
#include <memory>
#include <shared_mutex>
#include <vector>

#include <Wt/WDateTime.h>

#include "services/recommendation/Types.hpp"

namespace mrs::recommendation
{
    // Immutable once published
    struct Snapshot
    {
        std::uint64_t version{};
        std::vector<Rating> ratings;
        std::vector<Item> items;
        Wt::WDateTime createdAt; // invalid for the initial empty snapshot
    };

    // Holds the current snapshot. Publishing swaps in a new snapshot: readers
    // keep a consistent view for as long as they hold their pointer.
    class SnapshotStore
    {
    public:
        SnapshotStore();
        ~SnapshotStore() = default;
        SnapshotStore(const SnapshotStore&) = delete;
        SnapshotStore& operator=(const SnapshotStore&) = delete;

        std::shared_ptr<const Snapshot> getCurrent() const;
        std::shared_ptr<const Snapshot> publish(std::vector<Rating> ratings, std::vector<Item> items);

    private:
        mutable std::shared_mutex _mutex;
        std::shared_ptr<const Snapshot> _current;
    };

    struct SnapshotStats
    {
        std::size_t ratingCount{};
        std::size_t itemCount{};
        std::size_t userCount{};
        std::map<double, std::size_t> ratingDistribution; // score -> rating count
        double averageRating{};
    };

    SnapshotStats computeSnapshotStats(const Snapshot& snapshot);
} // namespace mrs::recommendation
