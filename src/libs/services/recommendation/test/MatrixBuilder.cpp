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

#include <cmath>

#include <gtest/gtest.h>

#include "MatrixBuilder.hpp"
#include "TfIdfVectorizer.hpp"

#include "Common.hpp"

namespace mrs::recommendation::tests
{
    TEST(UserItemMatrix, empty)
    {
        EXPECT_FALSE(buildUserItemMatrix({}).has_value());
    }

    TEST(UserItemMatrix, basic)
    {
        const std::vector<Rating> ratings{
            { "u2", "m3", 4 },
            { "u1", "m1", 5 },
            { "u2", "m1", 3 },
            { "u1", "m2", 1 },
        };

        const std::optional<UserItemMatrix> matrix{ buildUserItemMatrix(ratings) };
        ASSERT_TRUE(matrix.has_value());

        EXPECT_EQ(matrix->getUsers(), (std::vector<UserId>{ "u1", "u2" }));
        EXPECT_EQ(matrix->getItems(), (std::vector<ItemId>{ "m1", "m2", "m3" }));

        const std::size_t u1{ *matrix->findUserIndex("u1") };
        const std::size_t u2{ *matrix->findUserIndex("u2") };
        EXPECT_EQ(matrix->getScore(u1, *matrix->findItemIndex("m1")), 5);
        EXPECT_EQ(matrix->getScore(u1, *matrix->findItemIndex("m2")), 1);
        EXPECT_EQ(matrix->getScore(u1, *matrix->findItemIndex("m3")), 0);
        EXPECT_EQ(matrix->getScore(u2, *matrix->findItemIndex("m1")), 3);
        EXPECT_EQ(matrix->getScore(u2, *matrix->findItemIndex("m2")), 0);
        EXPECT_EQ(matrix->getScore(u2, *matrix->findItemIndex("m3")), 4);

        EXPECT_FALSE(matrix->findUserIndex("u3").has_value());
        EXPECT_FALSE(matrix->findItemIndex("m4").has_value());
    }

    TEST(UserItemMatrix, duplicateRatingsAreAveraged)
    {
        const std::vector<Rating> ratings{
            { "u1", "m1", 5 },
            { "u1", "m1", 2 },
        };

        const std::optional<UserItemMatrix> matrix{ buildUserItemMatrix(ratings) };
        ASSERT_TRUE(matrix.has_value());
        ASSERT_EQ(matrix->getItems().size(), 1);
        EXPECT_DOUBLE_EQ(matrix->getScore(0, 0), 3.5);
    }

    TEST(CosineSimilarity, dense)
    {
        const std::vector<double> a{ 5, 5, 0 };
        const std::vector<double> b{ 5, 0, 4 };
        const std::vector<double> zero{ 0, 0, 0 };

        EXPECT_NEAR(computeCosineSimilarity(a, a), 1.0, 1e-12);
        EXPECT_NEAR(computeCosineSimilarity(a, b), 25 / (std::sqrt(50.) * std::sqrt(41.)), 1e-12);
        EXPECT_EQ(computeCosineSimilarity(a, zero), 0);
        EXPECT_EQ(computeCosineSimilarity(zero, zero), 0);
    }

    TEST(TfIdfVectorizer, tokenize)
    {
        EXPECT_EQ(TfIdfVectorizer::tokenize("Sci-Fi: A space_opera, 2001!"), (std::vector<std::string>{ "sci", "fi", "space_opera", "2001" }));
        EXPECT_EQ(TfIdfVectorizer::tokenize(""), std::vector<std::string>{});
        EXPECT_EQ(TfIdfVectorizer::tokenize("a b c"), std::vector<std::string>{});
    }

    TEST(TfIdfVectorizer, tokenizeNonAscii)
    {
        // ASCII letters are folded, UTF-8 sequences are kept as is
        EXPECT_EQ(TfIdfVectorizer::tokenize("DRAMA Drama"), (std::vector<std::string>{ "drama", "drama" }));
        EXPECT_EQ(TfIdfVectorizer::tokenize("\xC3\x89PIQUE \xC3\xA9pique"), (std::vector<std::string>{ "\xC3\x89pique", "\xC3\xA9pique" }));
        EXPECT_EQ(TfIdfVectorizer::tokenize("caf\xC3\xA9-th\xC3\xA9\xC3\xA2tre"), (std::vector<std::string>{ "caf\xC3\xA9", "th\xC3\xA9\xC3\xA2tre" }));
    }

    TEST(TfIdfVectorizer, extractTerms)
    {
        // "this", "is", "with" are stop words, removed before bigrams are built. "a" is too short
        EXPECT_EQ(TfIdfVectorizer::extractTerms("This is a drama movie with great characters"),
            (std::vector<std::string>{ "drama", "movie", "great", "characters", "drama movie", "movie great", "great characters" }));
    }

    TEST(TfIdfVectorizer, maxFeatures)
    {
        TfIdfVectorizer vectorizer{ 2 };
        const std::vector<DocumentVector> vectors{ vectorizer.fitTransform({ "alpha alpha beta", "alpha gamma" }) };

        // alpha: 3, everything else: 1 -> "alpha alpha" wins the lexicographic tie break
        EXPECT_EQ(vectorizer.getVocabulary(), (std::vector<std::string>{ "alpha", "alpha alpha" }));
        ASSERT_EQ(vectors.size(), 2);
    }

    TEST(TfIdfVectorizer, normalizedVectors)
    {
        TfIdfVectorizer vectorizer{ 1000 };
        const std::vector<DocumentVector> vectors{ vectorizer.fitTransform({ "space adventure", "romantic comedy", "the of and" }) };
        ASSERT_EQ(vectors.size(), 3);

        for (std::size_t i{}; i < 2; ++i)
        {
            double norm{};
            for (const TermWeight& termWeight : vectors[i])
                norm += termWeight.weight * termWeight.weight;
            EXPECT_NEAR(norm, 1.0, 1e-12);
        }

        // only stop words
        EXPECT_TRUE(vectors[2].empty());
        EXPECT_EQ(computeCosineSimilarity(vectors[0], vectors[2]), 0);
        EXPECT_NEAR(computeCosineSimilarity(vectors[0], vectors[1]), 0, 1e-12);
    }

    TEST(ContentSimilarityMatrix, empty)
    {
        EXPECT_FALSE(buildContentFeatures({}, 1000).has_value());
    }

    TEST(ContentSimilarityMatrix, identicalTexts)
    {
        const std::vector<Item> items{
            Item{ .id = "m1", .title = "Star", .description = "A journey through space", .category = "Sci-Fi" },
            Item{ .id = "m2", .title = "Star", .description = "A journey through space", .category = "Sci-Fi" },
            Item{ .id = "m3", .title = "Love", .description = "A romantic story in Paris", .category = "Romance" },
        };

        const std::optional<ContentSimilarityMatrix> matrix{ buildContentFeatures(items, 1000) };
        ASSERT_TRUE(matrix.has_value());
        EXPECT_EQ(matrix->getItems(), (std::vector<ItemId>{ "m1", "m2", "m3" }));

        EXPECT_NEAR(matrix->getSimilarity(0, 1), 1.0, 1e-9);
        EXPECT_NEAR(matrix->getSimilarity(1, 0), 1.0, 1e-9);
        EXPECT_NEAR(matrix->getSimilarity(0, 0), 1.0, 1e-9);
        EXPECT_NEAR(matrix->getSimilarity(0, 2), 0.0, 1e-9);
        EXPECT_EQ(matrix->getSimilarity(0, 2), matrix->getSimilarity(2, 0));
    }

    TEST(ContentSimilarityMatrix, emptyTexts)
    {
        const std::vector<Item> items{ createItem("m1"), Item{ .id = "m2" } };

        const std::optional<ContentSimilarityMatrix> matrix{ buildContentFeatures(items, 1000) };
        ASSERT_TRUE(matrix.has_value());

        // "m2" has no text at all: zero vector
        EXPECT_EQ(matrix->getSimilarity(1, 1), 0);
        EXPECT_EQ(matrix->getSimilarity(0, 1), 0);
    }

    TEST(ContentSimilarityMatrix, duplicateIds)
    {
        const std::vector<Item> items{ createItem("m1", "first"), createItem("m1", "second") };

        const std::optional<ContentSimilarityMatrix> matrix{ buildContentFeatures(items, 1000) };
        ASSERT_TRUE(matrix.has_value());
        EXPECT_EQ(matrix->findItemIndex("m1"), std::optional<std::size_t>{ 0 });
    }
} // namespace mrs::recommendation::tests
