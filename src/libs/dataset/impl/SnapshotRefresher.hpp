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

#include <mutex>

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>

#include "core/IOContextRunner.hpp"
#include "dataset/ISnapshotRefresher.hpp"

namespace mrs::dataset
{
    class SnapshotRefresher : public ISnapshotRefresher
    {
    public:
        SnapshotRefresher(recommendation::SnapshotStore& store, IDataSource& source, std::chrono::seconds period, IDataSource* fallbackSource);
        ~SnapshotRefresher() override;
        SnapshotRefresher(const SnapshotRefresher&) = delete;
        SnapshotRefresher& operator=(const SnapshotRefresher&) = delete;

    private:
        void requestRefresh() override;
        void refresh() override;
        Status getStatus() const override;

        void loadInitialSnapshot();
        bool loadAndPublish(IDataSource& source);
        void scheduleRefresh();
        void onRefreshFailed(const std::string& error);

        recommendation::SnapshotStore& _store;
        IDataSource& _source;
        IDataSource* const _fallbackSource;
        const std::chrono::seconds _period;

        std::mutex _refreshMutex;

        mutable std::mutex _statusMutex;
        Status _status;

        boost::asio::io_context _ioContext;
        boost::asio::steady_timer _refreshTimer;
        core::IOContextRunner _ioContextRunner; // must be last
    };
} // namespace mrs::dataset
