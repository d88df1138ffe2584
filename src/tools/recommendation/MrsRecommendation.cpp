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

#include <filesystem>
#include <iomanip>
#include <iostream>
#include <stdlib.h>
#include <unordered_map>

#include <boost/program_options.hpp>

#include "core/IConfig.hpp"
#include "core/ILogger.hpp"
#include "core/Service.hpp"
#include "dataset/IDataSource.hpp"
#include "services/recommendation/Exception.hpp"
#include "services/recommendation/IRecommendationService.hpp"
#include "services/recommendation/RecommendationSettings.hpp"
#include "services/recommendation/Snapshot.hpp"

namespace mrs
{
    void dumpResult(const recommendation::Snapshot& snapshot, const recommendation::RecommendationResult& result)
    {
        std::unordered_map<std::string_view, const recommendation::Item*> itemsById;
        for (const recommendation::Item& item : snapshot.items)
            itemsById.emplace(item.id, &item);

        std::size_t rank{ 1 };
        for (const recommendation::ScoredItem& scoredItem : result)
        {
            std::cout << "\t" << rank++ << ". " << scoredItem.itemId;

            auto itItem{ itemsById.find(scoredItem.itemId) };
            if (itItem != std::cend(itemsById))
                std::cout << " '" << itItem->second->title << "' {" << itItem->second->category << "}";

            std::cout << " score = " << std::fixed << std::setprecision(4) << scoredItem.score << std::endl;
        }

        if (result.empty())
            std::cout << "\tNo result" << std::endl;
    }

    void dumpStats(const recommendation::Snapshot& snapshot)
    {
        const recommendation::SnapshotStats stats{ recommendation::computeSnapshotStats(snapshot) };

        std::cout << "*** Stats ***" << std::endl;
        std::cout << "Ratings: " << stats.ratingCount << std::endl;
        std::cout << "Movies: " << stats.itemCount << std::endl;
        std::cout << "Users: " << stats.userCount << std::endl;
        std::cout << "Average rating: " << std::fixed << std::setprecision(2) << stats.averageRating << std::endl;
        std::cout << "Rating distribution:" << std::endl;
        for (const auto& [score, count] : stats.ratingDistribution)
            std::cout << "\t" << score << ": " << count << std::endl;
    }
} // namespace mrs

int main(int argc, char* argv[])
{
    try
    {
        using namespace mrs;
        namespace po = boost::program_options;

        po::options_description desc{ "Allowed options" };
        desc.add_options()("help,h", "print usage message")("conf,c", po::value<std::string>(), "MRS config file, to read recommendation settings")("ratings", po::value<std::string>(), "Ratings JSON file")("items", po::value<std::string>(), "Movies JSON file")("mock", po::value<unsigned>()->implicit_value(dataset::defaultMockSeed), "Use generated mock data, with the given seed")("user,u", po::value<std::string>(), "Display recommendations for this user")("type,t", po::value<std::string>()->default_value("hybrid"), "Recommendation type: collaborative, content or hybrid")("limit,l", po::value<unsigned>()->default_value(10), "Max result count")("popular,p", "Display popular movies")("stats,s", "Display dataset statistics")("verbose,v", "Enable debug logs");

        po::variables_map vm;
        po::store(po::parse_command_line(argc, argv, desc), vm);

        if (vm.count("help"))
        {
            std::cout << desc << std::endl;
            return EXIT_SUCCESS;
        }

        // log to stdout
        core::Service<core::logging::ILogger> logger{ core::logging::createLogger(vm.count("verbose") ? core::logging::Severity::DEBUG : core::logging::Severity::WARNING) };

        std::unique_ptr<dataset::IDataSource> dataSource;
        if (vm.count("mock"))
            dataSource = dataset::createMockDataSource(vm["mock"].as<unsigned>());
        else if (vm.count("ratings") && vm.count("items"))
            dataSource = dataset::createJsonFileDataSource(vm["ratings"].as<std::string>(), vm["items"].as<std::string>());
        else
        {
            std::cerr << "Either --mock or both --ratings and --items must be set" << std::endl;
            std::cerr << desc << std::endl;
            return EXIT_FAILURE;
        }

        recommendation::RecommendationSettings settings;
        core::Service<core::IConfig> config;
        if (vm.count("conf"))
        {
            config.assign(core::createConfig(vm["conf"].as<std::string>()));
            settings = recommendation::readRecommendationSettings(*config);
        }

        const std::optional<recommendation::Algorithm> algorithm{ recommendation::parseAlgorithm(vm["type"].as<std::string>()) };
        if (!algorithm)
        {
            std::cerr << "Invalid recommendation type '" << vm["type"].as<std::string>() << "'" << std::endl;
            return EXIT_FAILURE;
        }
        const std::size_t limit{ vm["limit"].as<unsigned>() };

        std::cout << "Loading data from source '" << dataSource->getName() << "'..." << std::endl;
        dataset::Dataset dataset{ dataSource->load() };

        recommendation::SnapshotStore snapshotStore;
        const auto snapshot{ snapshotStore.publish(std::move(dataset.ratings), std::move(dataset.items)) };
        std::cout << "Data loaded: " << snapshot->ratings.size() << " ratings, " << snapshot->items.size() << " movies" << std::endl;

        const auto recommendationService{ recommendation::createRecommendationService(snapshotStore, settings) };

        if (vm.count("stats"))
            dumpStats(*snapshot);

        if (vm.count("popular"))
        {
            std::cout << "*** Popular movies ***" << std::endl;
            dumpResult(*snapshot, recommendationService->computePopularity(limit));
        }

        if (vm.count("user"))
        {
            const std::string userId{ vm["user"].as<std::string>() };

            std::cout << "*** " << recommendation::getAlgorithmName(*algorithm) << " recommendations for user '" << userId << "' ***" << std::endl;
            dumpResult(*snapshot, recommendationService->computeRecommendations(userId, limit, *algorithm));
        }
    }
    catch (std::exception& e)
    {
        std::cerr << "Caught exception: " << e.what() << std::endl;
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
