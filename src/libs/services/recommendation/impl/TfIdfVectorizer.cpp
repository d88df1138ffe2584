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

#include "TfIdfVectorizer.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <map>
#include <unordered_map>

#include "core/ILogger.hpp"
#include "core/String.hpp"

#include "StopWords.hpp"

namespace mrs::recommendation
{
    namespace
    {
        bool isWordCharacter(unsigned char c)
        {
            // non ASCII bytes are considered as parts of words
            return std::isalnum(c) || c == '_' || c >= 0x80;
        }

        using TermCounts = std::map<std::string, std::size_t>;

        TermCounts countTerms(std::string_view document)
        {
            TermCounts res;
            for (std::string& term : TfIdfVectorizer::extractTerms(document))
                res[std::move(term)]++;

            return res;
        }

        void normalize(DocumentVector& vector)
        {
            double norm{};
            for (const TermWeight& termWeight : vector)
                norm += termWeight.weight * termWeight.weight;

            norm = std::sqrt(norm);
            if (norm == 0)
                return;

            for (TermWeight& termWeight : vector)
                termWeight.weight /= norm;
        }
    } // namespace

    TfIdfVectorizer::TfIdfVectorizer(std::size_t maxFeatures)
        : _maxFeatures{ maxFeatures }
    {
    }

    std::vector<std::string> TfIdfVectorizer::tokenize(std::string_view document)
    {
        std::vector<std::string> tokens;

        const std::string lowerDocument{ core::stringUtils::stringToLower(document) };

        std::string::size_type pos{};
        while (pos < lowerDocument.size())
        {
            while (pos < lowerDocument.size() && !isWordCharacter(lowerDocument[pos]))
                ++pos;

            const std::string::size_type start{ pos };
            while (pos < lowerDocument.size() && isWordCharacter(lowerDocument[pos]))
                ++pos;

            if (pos - start >= 2)
                tokens.emplace_back(lowerDocument.substr(start, pos - start));
        }

        return tokens;
    }

    std::vector<std::string> TfIdfVectorizer::extractTerms(std::string_view document)
    {
        std::vector<std::string> words{ tokenize(document) };
        words.erase(std::remove_if(std::begin(words), std::end(words), [](const std::string& word) { return isEnglishStopWord(word); }), std::end(words));

        std::vector<std::string> terms;
        terms.reserve(words.size() * 2);

        for (const std::string& word : words)
            terms.push_back(word);

        for (std::size_t i{ 1 }; i < words.size(); ++i)
            terms.push_back(words[i - 1] + " " + words[i]);

        return terms;
    }

    std::vector<DocumentVector> TfIdfVectorizer::fitTransform(const std::vector<std::string>& documents)
    {
        std::vector<TermCounts> documentTermCounts;
        documentTermCounts.reserve(documents.size());
        for (const std::string& document : documents)
            documentTermCounts.push_back(countTerms(document));

        // corpus frequency and document frequency of each term
        struct TermStats
        {
            std::size_t corpusCount{};
            std::size_t documentCount{};
        };
        std::map<std::string_view, TermStats> termStats;
        for (const TermCounts& termCounts : documentTermCounts)
        {
            for (const auto& [term, count] : termCounts)
            {
                TermStats& stats{ termStats[term] };
                stats.corpusCount += count;
                stats.documentCount += 1;
            }
        }

        // keep the most frequent terms, ties in lexicographic order
        std::vector<std::string_view> selectedTerms;
        selectedTerms.reserve(termStats.size());
        for (const auto& [term, stats] : termStats)
            selectedTerms.push_back(term);

        if (selectedTerms.size() > _maxFeatures)
        {
            std::stable_sort(std::begin(selectedTerms), std::end(selectedTerms), [&](std::string_view a, std::string_view b) {
                return termStats.at(a).corpusCount > termStats.at(b).corpusCount;
            });
            selectedTerms.resize(_maxFeatures);
            std::sort(std::begin(selectedTerms), std::end(selectedTerms));
        }

        _vocabulary.assign(std::cbegin(selectedTerms), std::cend(selectedTerms));

        const double documentCount{ static_cast<double>(documents.size()) };
        std::unordered_map<std::string_view, std::size_t> termIndexes;
        std::vector<double> idfs(_vocabulary.size());
        for (std::size_t i{}; i < _vocabulary.size(); ++i)
        {
            termIndexes.emplace(_vocabulary[i], i);
            const double df{ static_cast<double>(termStats.at(_vocabulary[i]).documentCount) };
            idfs[i] = std::log((1 + documentCount) / (1 + df)) + 1;
        }

        MRS_LOG(RECOMMENDATION, DEBUG, "TF-IDF: " << documents.size() << " documents, " << termStats.size() << " distinct terms, " << _vocabulary.size() << " kept");

        std::vector<DocumentVector> res;
        res.reserve(documents.size());
        for (const TermCounts& termCounts : documentTermCounts)
        {
            DocumentVector vector;
            for (const auto& [term, count] : termCounts)
            {
                auto itTermIndex{ termIndexes.find(term) };
                if (itTermIndex == std::cend(termIndexes))
                    continue;

                vector.push_back(TermWeight{ itTermIndex->second, static_cast<double>(count) * idfs[itTermIndex->second] });
            }

            // term counts and vocabulary share the same ordering: term indexes are sorted
            normalize(vector);
            res.push_back(std::move(vector));
        }

        return res;
    }

    double computeCosineSimilarity(const DocumentVector& a, const DocumentVector& b)
    {
        double res{};

        auto itA{ std::cbegin(a) };
        auto itB{ std::cbegin(b) };
        while (itA != std::cend(a) && itB != std::cend(b))
        {
            if (itA->termIndex < itB->termIndex)
                ++itA;
            else if (itB->termIndex < itA->termIndex)
                ++itB;
            else
            {
                res += itA->weight * itB->weight;
                ++itA;
                ++itB;
            }
        }

        return res;
    }
} // namespace mrs::recommendation
