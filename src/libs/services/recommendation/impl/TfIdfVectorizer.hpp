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

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace mrs::recommendation
{
    // Sparse, L2 normalized document vector: (term index, weight), sorted by term index
    struct TermWeight
    {
        std::size_t termIndex;
        double weight;
    };
    using DocumentVector = std::vector<TermWeight>;

    // Turns a corpus of documents into TF-IDF vectors
    // - ASCII lowercase only, other UTF-8 bytes are kept as is ("É" and "é" are distinct)
    // - tokens are runs of at least 2 word characters
    // - English stop words removed, then unigrams and bigrams generated
    // - vocabulary limited to the maxFeatures most frequent terms in the corpus
    // - idf = ln((1 + n) / (1 + df)) + 1
    class TfIdfVectorizer
    {
    public:
        TfIdfVectorizer(std::size_t maxFeatures);

        std::vector<DocumentVector> fitTransform(const std::vector<std::string>& documents);

        // Only valid after fitTransform, sorted
        const std::vector<std::string>& getVocabulary() const { return _vocabulary; }

        static std::vector<std::string> tokenize(std::string_view document);
        static std::vector<std::string> extractTerms(std::string_view document);

    private:
        const std::size_t _maxFeatures;
        std::vector<std::string> _vocabulary;
    };

    // Dot product of two normalized sparse vectors
    double computeCosineSimilarity(const DocumentVector& a, const DocumentVector& b);
} // namespace mrs::recommendation
