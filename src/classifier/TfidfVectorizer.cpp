#include "classifier/TfidfVectorizer.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <map>
#include <unordered_set>

namespace CodeRisk
{
    namespace Classifier
    {
        namespace
        {
            bool isWordChar(char c) noexcept
            {
                const auto uc = static_cast<unsigned char>(c);
                return std::isalnum(uc) != 0 || c == '_' || uc >= 0x80;
            }

            std::vector<std::string> wordTokens(std::string_view text)
            {
                std::vector<std::string> tokens;
                std::size_t i = 0;
                while (i < text.size())
                {
                    if (!isWordChar(text[i]))
                    {
                        ++i;
                        continue;
                    }
                    const std::size_t start = i;
                    while (i < text.size() && isWordChar(text[i]))
                        ++i;
                    if (i - start >= 2)
                    {
                        std::string token(text.substr(start, i - start));
                        for (char &c : token)
                            c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
                        tokens.push_back(std::move(token));
                    }
                }
                return tokens;
            }

            std::unordered_map<std::string, std::size_t> countTerms(const std::vector<std::string> &terms)
            {
                std::unordered_map<std::string, std::size_t> counts;
                for (const auto &t : terms)
                    ++counts[t];
                return counts;
            }
        } // namespace

        TfidfVectorizer::TfidfVectorizer(TfidfOptions options)
            : m_options(options)
        {
            if (m_options.minN == 0)
                m_options.minN = 1;
            if (m_options.maxN < m_options.minN)
                m_options.maxN = m_options.minN;
        }

        std::vector<std::string> TfidfVectorizer::analyze(std::string_view document) const
        {
            const std::vector<std::string> tokens = wordTokens(document);

            std::vector<std::string> grams;
            for (std::size_t n = m_options.minN; n <= m_options.maxN; ++n)
            {
                if (tokens.size() < n)
                    break;
                for (std::size_t i = 0; i + n <= tokens.size(); ++i)
                {
                    std::string gram = tokens[i];
                    for (std::size_t k = 1; k < n; ++k)
                    {
                        gram += ' ';
                        gram += tokens[i + k];
                    }
                    grams.push_back(std::move(gram));
                }
            }
            return grams;
        }

        Matrix TfidfVectorizer::fitTransform(const std::vector<std::string> &documents)
        {
            m_vocabulary.clear();
            m_features.clear();
            m_idf.clear();

            std::vector<std::unordered_map<std::string, std::size_t>> perDocument;
            perDocument.reserve(documents.size());

            // Ordered so that equal totals fall back to alphabetical order.
            std::map<std::string, std::size_t> totals;
            std::map<std::string, std::size_t> documentFrequency;

            for (const auto &doc : documents)
            {
                perDocument.push_back(countTerms(analyze(doc)));
                for (const auto &[term, count] : perDocument.back())
                {
                    totals[term] += count;
                    ++documentFrequency[term];
                }
            }

            std::vector<std::pair<std::string, std::size_t>> ranked(totals.begin(), totals.end());
            std::stable_sort(ranked.begin(), ranked.end(),
                             [](const auto &a, const auto &b) { return a.second > b.second; });
            if (ranked.size() > m_options.maxFeatures)
                ranked.resize(m_options.maxFeatures);

            for (const auto &entry : ranked)
                m_features.push_back(entry.first);
            std::sort(m_features.begin(), m_features.end());

            const double n = static_cast<double>(documents.size());
            m_idf.reserve(m_features.size());
            for (std::size_t i = 0; i < m_features.size(); ++i)
            {
                m_vocabulary.emplace(m_features[i], i);
                const double df = static_cast<double>(documentFrequency[m_features[i]]);
                m_idf.push_back(std::log((1.0 + n) / (1.0 + df)) + 1.0);
            }

            Matrix rows;
            rows.reserve(perDocument.size());
            for (const auto &counts : perDocument)
                rows.push_back(weigh(counts));
            return rows;
        }

        FeatureRow TfidfVectorizer::transform(std::string_view document) const
        {
            return weigh(countTerms(analyze(document)));
        }

        FeatureRow TfidfVectorizer::weigh(const std::unordered_map<std::string, std::size_t> &counts) const
        {
            FeatureRow row(m_features.size(), 0.0);
            for (const auto &[term, count] : counts)
            {
                auto it = m_vocabulary.find(term);
                if (it != m_vocabulary.end())
                    row[it->second] = static_cast<double>(count) * m_idf[it->second];
            }

            double norm = 0.0;
            for (double v : row)
                norm += v * v;
            if (norm > 0.0)
            {
                norm = std::sqrt(norm);
                for (double &v : row)
                    v /= norm;
            }
            return row;
        }

    } // namespace Classifier
} // namespace CodeRisk
