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

#include <limits>
#include <map>
#include <string>

#include <gtest/gtest.h>

#include "core/IConfig.hpp"
#include "services/recommendation/Exception.hpp"
#include "services/recommendation/RecommendationSettings.hpp"

namespace mrs::recommendation::tests
{
    namespace
    {
        // Only numeric settings are supported
        class TestConfig final : public core::IConfig
        {
        public:
            TestConfig(std::map<std::string, double> values)
                : _values{ std::move(values) } {}

        private:
            std::string_view getString(std::string_view, std::string_view def) override { return def; }
            void visitStrings(std::string_view, std::function<void(std::string_view)> func, std::initializer_list<std::string_view> defs) override
            {
                for (std::string_view def : defs)
                    func(def);
            }
            std::filesystem::path getPath(std::string_view, const std::filesystem::path& def) override { return def; }
            unsigned long getULong(std::string_view setting, unsigned long def) override { return static_cast<unsigned long>(get(setting, static_cast<double>(def))); }
            long getLong(std::string_view setting, long def) override { return static_cast<long>(get(setting, static_cast<double>(def))); }
            double getDouble(std::string_view setting, double def) override { return get(setting, def); }
            bool getBool(std::string_view, bool def) override { return def; }

            double get(std::string_view setting, double def) const
            {
                auto it{ _values.find(std::string{ setting }) };
                return it == std::cend(_values) ? def : it->second;
            }

            const std::map<std::string, double> _values;
        };
    } // namespace

    TEST(RecommendationSettings, defaults)
    {
        TestConfig config{ {} };
        const RecommendationSettings settings{ readRecommendationSettings(config) };

        EXPECT_EQ(settings.neighborCount, 10);
        EXPECT_EQ(settings.likedThreshold, 4);
        EXPECT_EQ(settings.maxFeatures, 1000);
        EXPECT_EQ(settings.minRatingsForCollaborative, 5);
        EXPECT_DOUBLE_EQ(settings.collaborativeWeight, 0.7);
        EXPECT_DOUBLE_EQ(settings.contentWeight, 0.3);
        EXPECT_DOUBLE_EQ(settings.defaultPopularityScore, 2.5);
    }

    TEST(RecommendationSettings, overrides)
    {
        TestConfig config{ {
            { "recommendation-neighbor-count", 3 },
            { "recommendation-collaborative-weight", 0.5 },
            { "recommendation-content-weight", 0.5 },
            { "recommendation-default-popularity-score", 1 },
        } };
        const RecommendationSettings settings{ readRecommendationSettings(config) };

        EXPECT_EQ(settings.neighborCount, 3);
        EXPECT_DOUBLE_EQ(settings.collaborativeWeight, 0.5);
        EXPECT_DOUBLE_EQ(settings.contentWeight, 0.5);
        EXPECT_DOUBLE_EQ(settings.defaultPopularityScore, 1);
        EXPECT_EQ(settings.maxFeatures, 1000);
    }

    TEST(RecommendationSettings, invalid)
    {
        {
            TestConfig config{ { { "recommendation-neighbor-count", 0 } } };
            EXPECT_THROW(readRecommendationSettings(config), Exception);
        }
        {
            TestConfig config{ { { "recommendation-max-features", 0 } } };
            EXPECT_THROW(readRecommendationSettings(config), Exception);
        }
        {
            TestConfig config{ { { "recommendation-content-weight", std::numeric_limits<double>::infinity() } } };
            EXPECT_THROW(readRecommendationSettings(config), Exception);
        }
    }
} // namespace mrs::recommendation::tests
