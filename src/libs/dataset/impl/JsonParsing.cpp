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

#include "dataset/Dataset.hpp"

#include <cmath>
#include <optional>

#include <Wt/Json/Array.h>
#include <Wt/Json/Object.h>
#include <Wt/Json/Parser.h>
#include <Wt/Json/Value.h>
#include <Wt/WException.h>

#include "core/ILogger.hpp"
#include "dataset/Exception.hpp"

namespace mrs::dataset
{
    namespace
    {
        using namespace recommendation;

        constexpr double minRatingScore{ 1 };
        constexpr double maxRatingScore{ 5 };

        Wt::Json::Array parseArray(std::string_view json, std::string_view what)
        {
            Wt::Json::Value root;
            try
            {
                Wt::Json::parse(std::string{ json }, root);
            }
            catch (const Wt::WException& e)
            {
                throw Exception{ "Cannot parse " + std::string{ what } + ": " + e.what() };
            }

            if (root.type() != Wt::Json::Type::Array)
                throw Exception{ "Cannot parse " + std::string{ what } + ": expected an array" };

            return static_cast<const Wt::Json::Array&>(root);
        }

        std::optional<std::string> getString(const Wt::Json::Object& obj, const std::string& key)
        {
            if (obj.type(key) != Wt::Json::Type::String)
                return std::nullopt;

            std::string res{ static_cast<std::string>(obj.get(key)) };
            if (res.empty())
                return std::nullopt;

            return res;
        }

        std::optional<Rating> parseRating(const Wt::Json::Object& obj)
        {
            std::optional<std::string> userId{ getString(obj, "userId") };
            std::optional<std::string> itemId{ getString(obj, "movieId") };
            if (!userId || !itemId)
                return std::nullopt;

            if (obj.type("score") != Wt::Json::Type::Number)
                return std::nullopt;

            const double score{ static_cast<double>(obj.get("score")) };
            if (!std::isfinite(score) || score < minRatingScore || score > maxRatingScore)
                return std::nullopt;

            return Rating{ .userId = std::move(*userId), .itemId = std::move(*itemId), .score = score };
        }

        // category is either a plain string or a category object
        std::string parseCategory(const Wt::Json::Object& obj)
        {
            static const std::string unknownCategory{ "Unknown" };

            switch (obj.type("category"))
            {
            case Wt::Json::Type::String:
                return static_cast<std::string>(obj.get("category"));

            case Wt::Json::Type::Object:
                {
                    const Wt::Json::Object& categoryObj{ static_cast<const Wt::Json::Object&>(obj.get("category")) };
                    if (categoryObj.type("name") == Wt::Json::Type::String)
                        return static_cast<std::string>(categoryObj.get("name"));
                    break;
                }

            default:
                break;
            }

            return unknownCategory;
        }

        std::optional<Item> parseItem(const Wt::Json::Object& obj)
        {
            std::optional<std::string> id{ getString(obj, "_id") };
            if (!id)
                id = getString(obj, "id");
            if (!id)
                return std::nullopt;

            return Item{
                .id = std::move(*id),
                .title = getString(obj, "title").value_or(""),
                .description = getString(obj, "description").value_or(""),
                .category = parseCategory(obj),
                .releaseDate = getString(obj, "releaseDate").value_or(""),
            };
        }

        template<typename T, typename ParseFunc>
        std::vector<T> parseRecords(std::string_view json, std::string_view what, ParseFunc parseFunc)
        {
            const Wt::Json::Array records{ parseArray(json, what) };

            std::vector<T> res;
            res.reserve(records.size());

            std::size_t skippedCount{};
            for (const Wt::Json::Value& record : records)
            {
                std::optional<T> value;
                if (record.type() == Wt::Json::Type::Object)
                    value = parseFunc(static_cast<const Wt::Json::Object&>(record));

                if (value)
                    res.push_back(std::move(*value));
                else
                    skippedCount++;
            }

            MRS_LOG_IF(DATASET, WARNING, skippedCount > 0, "Skipped " << skippedCount << " invalid " << what << " records");
            MRS_LOG(DATASET, DEBUG, "Parsed " << res.size() << " " << what);

            return res;
        }
    } // namespace

    std::vector<Rating> parseRatings(std::string_view json)
    {
        return parseRecords<Rating>(json, "ratings", parseRating);
    }

    std::vector<Item> parseItems(std::string_view json)
    {
        return parseRecords<Item>(json, "movies", parseItem);
    }
} // namespace mrs::dataset
