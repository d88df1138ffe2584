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

#include <gtest/gtest.h>

#include "core/Random.hpp"
#include "dataset/Exception.hpp"
#include "dataset/IDataSource.hpp"

namespace mrs::dataset::tests
{
    namespace
    {
        class ScopedFile
        {
        public:
            ScopedFile(std::string_view content)
                : _path{ std::filesystem::temp_directory_path() / ("mrs-test-" + std::to_string(core::random::getRandom<unsigned>(0, 1'000'000'000)) + ".json") }
            {
                std::ofstream ofs{ _path };
                ofs << content;
            }
            ~ScopedFile()
            {
                std::error_code ec;
                std::filesystem::remove(_path, ec);
            }
            ScopedFile(const ScopedFile&) = delete;
            ScopedFile& operator=(const ScopedFile&) = delete;

            const std::filesystem::path& getPath() const { return _path; }

        private:
            const std::filesystem::path _path;
        };
    } // namespace

    TEST(JsonFileDataSource, load)
    {
        const ScopedFile ratingsFile{ R"([{"userId": "u1", "movieId": "m1", "score": 4}])" };
        const ScopedFile itemsFile{ R"([{"_id": "m1", "title": "Title", "category": {"name": "Drama"}}, {"_id": "m2"}])" };

        auto source{ createJsonFileDataSource(ratingsFile.getPath(), itemsFile.getPath()) };
        EXPECT_EQ(source->getName(), "json");

        const Dataset dataset{ source->load() };
        ASSERT_EQ(dataset.ratings.size(), 1);
        EXPECT_EQ(dataset.ratings[0].userId, "u1");
        ASSERT_EQ(dataset.items.size(), 2);
        EXPECT_EQ(dataset.items[0].category, "Drama");
        EXPECT_EQ(dataset.items[1].category, "Unknown");
    }

    TEST(JsonFileDataSource, missingFile)
    {
        const ScopedFile itemsFile{ "[]" };

        auto source{ createJsonFileDataSource("/this/file/does/not/exist.json", itemsFile.getPath()) };
        EXPECT_THROW(source->load(), Exception);
    }

    TEST(JsonFileDataSource, malformedFile)
    {
        const ScopedFile ratingsFile{ "[]" };
        const ScopedFile itemsFile{ "{ not json" };

        auto source{ createJsonFileDataSource(ratingsFile.getPath(), itemsFile.getPath()) };
        EXPECT_THROW(source->load(), Exception);
    }
} // namespace mrs::dataset::tests
