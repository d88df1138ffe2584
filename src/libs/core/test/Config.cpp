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

#include <fstream>
#include <vector>

#include <gtest/gtest.h>

#include "core/Exception.hpp"
#include "core/IConfig.hpp"

namespace mrs::core::tests
{
    namespace
    {
        class ScopedConfigFile
        {
        public:
            ScopedConfigFile(std::string_view content)
                : _path{ std::filesystem::temp_directory_path() / ("mrs-test-" + std::to_string(::testing::UnitTest::GetInstance()->random_seed()) + ".conf") }
            {
                std::ofstream ofs{ _path, std::ios::out | std::ios::trunc };
                ofs << content;
            }

            ~ScopedConfigFile()
            {
                std::error_code ec;
                std::filesystem::remove(_path, ec);
            }

            ScopedConfigFile(const ScopedConfigFile&) = delete;
            ScopedConfigFile& operator=(const ScopedConfigFile&) = delete;

            const std::filesystem::path& getPath() const { return _path; }

        private:
            const std::filesystem::path _path;
        };
    } // namespace

    TEST(Config, values)
    {
        ScopedConfigFile file{ R"(
dataset-source = "mock";
dataset-items-file = "/tmp/movies.json";
listen-port = 5001;
recommendation-collaborative-weight = 0.6;
recommendation-content-weight = 1;
dataset-mock-fallback = false;
trusted-proxies = ( "10.0.0.1", "10.0.0.2" );
)" };

        auto config{ createConfig(file.getPath()) };

        EXPECT_EQ(config->getString("dataset-source", "json"), "mock");
        EXPECT_EQ(config->getString("missing", "default"), "default");
        EXPECT_EQ(config->getPath("dataset-items-file", "/var/mrs/movies.json"), std::filesystem::path{ "/tmp/movies.json" });
        EXPECT_EQ(config->getULong("listen-port", 5000), 5001);
        EXPECT_EQ(config->getLong("missing", -2), -2);
        EXPECT_DOUBLE_EQ(config->getDouble("recommendation-collaborative-weight", 0.7), 0.6);
        EXPECT_DOUBLE_EQ(config->getDouble("recommendation-content-weight", 0.3), 1.0);
        EXPECT_DOUBLE_EQ(config->getDouble("missing", 2.5), 2.5);
        EXPECT_FALSE(config->getBool("dataset-mock-fallback", true));
        EXPECT_TRUE(config->getBool("missing", true));

        std::vector<std::string> proxies;
        config->visitStrings("trusted-proxies", [&](std::string_view proxy) { proxies.emplace_back(proxy); }, { "127.0.0.1" });
        EXPECT_EQ(proxies, (std::vector<std::string>{ "10.0.0.1", "10.0.0.2" }));

        std::vector<std::string> defaults;
        config->visitStrings("missing", [&](std::string_view value) { defaults.emplace_back(value); }, { "a", "b" });
        EXPECT_EQ(defaults, (std::vector<std::string>{ "a", "b" }));
    }

    TEST(Config, wrongType)
    {
        ScopedConfigFile file{ R"(listen-port = "not a number";)" };

        auto config{ createConfig(file.getPath()) };
        EXPECT_EQ(config->getULong("listen-port", 5000), 5000);
    }

    TEST(Config, missingFile)
    {
        EXPECT_THROW(createConfig("/nonexistent/path/mrs.conf"), MrsException);
    }

    TEST(Config, parseError)
    {
        ScopedConfigFile file{ "listen-port = ;" };
        EXPECT_THROW(createConfig(file.getPath()), MrsException);
    }
} // namespace mrs::core::tests
