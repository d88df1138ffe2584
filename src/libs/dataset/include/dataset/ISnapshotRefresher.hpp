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

#include <chrono>
#include <cstddef>
#include <memory>
#include <string>

#include <Wt/WDateTime.h>

namespace mrs::recommendation
{
    class SnapshotStore;
}

namespace mrs::dataset
{
    class IDataSource;

    // Periodically loads a data source and publishes the result as a new snapshot
    class ISnapshotRefresher
    {
    public:
        virtual ~ISnapshotRefresher() = default;

        // Reload as soon as possible, asynchronously
        virtual void requestRefresh() = 0;

        // Reload now, in the caller's thread
        virtual void refresh() = 0;

        struct Status
        {
            Wt::WDateTime lastRefreshDateTime; // last successful refresh
            std::string lastError;             // empty if the last refresh succeeded
            std::size_t refreshCount{};        // successful refreshes
            std::size_t failureCount{};
        };
        virtual Status getStatus() const = 0;
    };

    // A first load is done during construction
    // If this first load fails, the fallback source is published instead, or an empty dataset if there is no fallback
    // A period of 0 disables periodic refreshes
    std::unique_ptr<ISnapshotRefresher> createSnapshotRefresher(recommendation::SnapshotStore& store, IDataSource& source, std::chrono::seconds period, IDataSource* fallbackSource = nullptr);
} // namespace mrs::dataset
