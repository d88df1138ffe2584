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

#include "MockDataSource.hpp"

#include <array>
#include <iomanip>
#include <sstream>
#include <string>

#include "core/ILogger.hpp"
#include "core/Random.hpp"
#include "core/String.hpp"

namespace mrs::dataset
{
    namespace
    {
        using namespace recommendation;

        constexpr std::array<std::string_view, 6> categories{ "Action", "Comedy", "Drama", "Horror", "Sci-Fi", "Romance" };

        std::vector<Item> generateItems(core::random::RandGenerator& generator)
        {
            std::vector<Item> items;
            items.reserve(MockDataSource::itemCount);

            for (std::size_t i{ 1 }; i <= MockDataSource::itemCount; ++i)
            {
                const std::string category{ *core::random::pickRandom(categories, generator) };

                std::ostringstream releaseDate;
                releaseDate << "202" << core::random::getRandom(0, 3, generator) << "-" << std::setw(2) << std::setfill('0') << core::random::getRandom(1, 12, generator) << "-01";

                items.push_back(Item{
                    .id = "movie_" + std::to_string(i),
                    .title = "Movie " + std::to_string(i),
                    .description = "This is a " + core::stringUtils::stringToLower(category) + " movie with exciting plot and great characters.",
                    .category = category,
                    .releaseDate = releaseDate.str(),
                });
            }

            return items;
        }

        std::vector<Rating> generateRatings(const std::vector<Item>& items, core::random::RandGenerator& generator)
        {
            // scores 1 to 5
            std::discrete_distribution<int> scoreDistribution{ 0.1, 0.1, 0.2, 0.3, 0.3 };

            std::vector<Rating> ratings;
            for (std::size_t i{ 1 }; i <= MockDataSource::userCount; ++i)
            {
                const std::string userId{ "user_" + std::to_string(i) };
                const std::size_t ratingCount{ core::random::getRandom(MockDataSource::minRatingCountPerUser, MockDataSource::maxRatingCountPerUser, generator) };

                std::vector<std::size_t> itemIndexes(items.size());
                for (std::size_t j{}; j < itemIndexes.size(); ++j)
                    itemIndexes[j] = j;
                core::random::shuffleContainer(itemIndexes, generator);
                itemIndexes.resize(std::min(ratingCount, itemIndexes.size()));

                for (std::size_t itemIndex : itemIndexes)
                    ratings.push_back(Rating{ .userId = userId, .itemId = items[itemIndex].id, .score = static_cast<double>(scoreDistribution(generator) + 1) });
            }

            return ratings;
        }
    } // namespace

    std::unique_ptr<IDataSource> createMockDataSource(std::uint32_t seed)
    {
        return std::make_unique<MockDataSource>(seed);
    }

    MockDataSource::MockDataSource(std::uint32_t seed)
        : _seed{ seed }
    {
    }

    Dataset MockDataSource::load()
    {
        core::random::RandGenerator generator{ core::random::createSeededGenerator(_seed) };

        Dataset dataset;
        dataset.items = generateItems(generator);
        dataset.ratings = generateRatings(dataset.items, generator);

        MRS_LOG(DATASET, INFO, "Generated mock data: " << dataset.ratings.size() << " ratings, " << dataset.items.size() << " movies");

        return dataset;
    }
} // namespace mrs::dataset
