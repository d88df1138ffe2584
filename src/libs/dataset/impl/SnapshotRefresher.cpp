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

#include "SnapshotRefresher.hpp"

#include <boost/asio/post.hpp>

#include "core/ILogger.hpp"
#include "dataset/Exception.hpp"
#include "dataset/IDataSource.hpp"
#include "services/recommendation/Snapshot.hpp"

namespace mrs::dataset
{
    std::unique_ptr<ISnapshotRefresher> createSnapshotRefresher(recommendation::SnapshotStore& store, IDataSource& source, std::chrono::seconds period, IDataSource* fallbackSource)
    {
        return std::make_unique<SnapshotRefresher>(store, source, period, fallbackSource);
    }

    SnapshotRefresher::SnapshotRefresher(recommendation::SnapshotStore& store, IDataSource& source, std::chrono::seconds period, IDataSource* fallbackSource)
        : _store{ store }
        , _source{ source }
        , _fallbackSource{ fallbackSource }
        , _period{ period }
        , _refreshTimer{ _ioContext }
        , _ioContextRunner{ _ioContext, 1, "Refresher" }
    {
        if (_period.count() < 0)
            throw Exception{ "Refresh period must be positive" };

        loadInitialSnapshot();

        if (_period.count() > 0)
            scheduleRefresh();
        else
            MRS_LOG(DATASET, INFO, "Periodic refresh disabled");
    }

    SnapshotRefresher::~SnapshotRefresher()
    {
        MRS_LOG(DATASET, DEBUG, "Stopping refresher...");
    }

    void SnapshotRefresher::requestRefresh()
    {
        MRS_LOG(DATASET, DEBUG, "Refresh requested");
        boost::asio::post(_ioContext, [this] { refresh(); });
    }

    void SnapshotRefresher::refresh()
    {
        const std::scoped_lock lock{ _refreshMutex };

        if (!loadAndPublish(_source))
            MRS_LOG(DATASET, WARNING, "Keeping snapshot version " << _store.getCurrent()->version);
    }

    ISnapshotRefresher::Status SnapshotRefresher::getStatus() const
    {
        const std::scoped_lock lock{ _statusMutex };
        return _status;
    }

    void SnapshotRefresher::loadInitialSnapshot()
    {
        const std::scoped_lock lock{ _refreshMutex };

        if (loadAndPublish(_source))
            return;

        if (_fallbackSource)
        {
            MRS_LOG(DATASET, WARNING, "Using fallback source '" << _fallbackSource->getName() << "'");
            if (loadAndPublish(*_fallbackSource))
                return;
        }

        MRS_LOG(DATASET, WARNING, "Publishing an empty dataset");
        _store.publish({}, {});
    }

    bool SnapshotRefresher::loadAndPublish(IDataSource& source)
    {
        MRS_LOG(DATASET, DEBUG, "Loading data from source '" << source.getName() << "'");

        try
        {
            Dataset dataset{ source.load() };

            const auto snapshot{ _store.publish(std::move(dataset.ratings), std::move(dataset.items)) };
            MRS_LOG(DATASET, DEBUG, "Source '" << source.getName() << "' loaded as snapshot version " << snapshot->version);

            const std::scoped_lock lock{ _statusMutex };
            _status.lastRefreshDateTime = snapshot->createdAt;
            _status.lastError.clear();
            _status.refreshCount++;

            return true;
        }
        catch (const Exception& e)
        {
            MRS_LOG(DATASET, ERROR, "Cannot load data from source '" << source.getName() << "': " << e.what());
            onRefreshFailed(e.what());
        }

        return false;
    }

    void SnapshotRefresher::onRefreshFailed(const std::string& error)
    {
        const std::scoped_lock lock{ _statusMutex };
        _status.lastError = error;
        _status.failureCount++;
    }

    void SnapshotRefresher::scheduleRefresh()
    {
        MRS_LOG(DATASET, DEBUG, "Scheduled refresh in " << _period.count() << " seconds...");

        _refreshTimer.expires_after(_period);
        _refreshTimer.async_wait([this](const boost::system::error_code& ec) {
            if (ec == boost::asio::error::operation_aborted)
                return;

            if (ec)
            {
                MRS_LOG(DATASET, ERROR, "Steady timer failure: " << ec.message());
                return;
            }

            refresh();
            scheduleRefresh();
        });
    }
} // namespace mrs::dataset
