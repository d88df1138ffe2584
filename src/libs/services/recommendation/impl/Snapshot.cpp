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

#include "services/recommendation/Snapshot.hpp"

#include <mutex>
#include <unordered_set>

#include "core/ILogger.hpp"

namespace mrs::recommendation
{
    SnapshotStore::SnapshotStore()
        : _current{ std::make_shared<const Snapshot>() }
    {
    }

    std::shared_ptr<const Snapshot> SnapshotStore::getCurrent() const
    {
        std::shared_lock lock{ _mutex };
        return _current;
    }

    std::shared_ptr<const Snapshot> SnapshotStore::publish(std::vector<Rating> ratings, std::vector<Item> items)
    {
        auto snapshot{ std::make_shared<Snapshot>() };
        snapshot->ratings = std::move(ratings);
        snapshot->items = std::move(items);
        snapshot->createdAt = Wt::WDateTime::currentDateTime();

        {
            std::unique_lock lock{ _mutex };
            snapshot->version = _current->version + 1;
            _current = snapshot;
        }

        MRS_LOG(RECOMMENDATION, INFO, "Published snapshot version " << snapshot->version << ": " << snapshot->ratings.size() << " ratings, " << snapshot->items.size() << " items");

        return snapshot;
    }

    SnapshotStats computeSnapshotStats(const Snapshot& snapshot)
    {
        SnapshotStats stats;

        stats.ratingCount = snapshot.ratings.size();
        stats.itemCount = snapshot.items.size();

        std::unordered_set<std::string_view> users;
        double scoreSum{};
        for (const Rating& rating : snapshot.ratings)
        {
            users.insert(rating.userId);
            stats.ratingDistribution[rating.score]++;
            scoreSum += rating.score;
        }
        stats.userCount = users.size();

        if (!snapshot.ratings.empty())
            stats.averageRating = scoreSum / static_cast<double>(snapshot.ratings.size());

        return stats;
    }
} // namespace mrs::recommendation
