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

#include "JsonFileDataSource.hpp"

#include <fstream>
#include <sstream>

#include "core/ILogger.hpp"
#include "dataset/Exception.hpp"

namespace mrs::dataset
{
    namespace
    {
        std::string readFile(const std::filesystem::path& path)
        {
            std::ifstream ifs{ path, std::ios::in | std::ios::binary };
            if (!ifs)
                throw Exception{ "Cannot open file '" + path.string() + "'" };

            std::ostringstream oss;
            oss << ifs.rdbuf();
            if (ifs.bad())
                throw Exception{ "Cannot read file '" + path.string() + "'" };

            return oss.str();
        }
    } // namespace

    std::unique_ptr<IDataSource> createJsonFileDataSource(const std::filesystem::path& ratingsFile, const std::filesystem::path& itemsFile)
    {
        return std::make_unique<JsonFileDataSource>(ratingsFile, itemsFile);
    }

    JsonFileDataSource::JsonFileDataSource(const std::filesystem::path& ratingsFile, const std::filesystem::path& itemsFile)
        : _ratingsFile{ ratingsFile }
        , _itemsFile{ itemsFile }
    {
    }

    Dataset JsonFileDataSource::load()
    {
        MRS_LOG(DATASET, DEBUG, "Loading ratings from " << _ratingsFile << " and movies from " << _itemsFile);

        Dataset dataset;
        dataset.ratings = parseRatings(readFile(_ratingsFile));
        dataset.items = parseItems(readFile(_itemsFile));

        MRS_LOG(DATASET, INFO, "Loaded " << dataset.ratings.size() << " ratings and " << dataset.items.size() << " movies");

        return dataset;
    }
} // namespace mrs::dataset
