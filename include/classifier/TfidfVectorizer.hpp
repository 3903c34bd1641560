#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace CodeRisk
{
    namespace Classifier
    {
        using FeatureRow = std::vector<double>;
        using Matrix     = std::vector<FeatureRow>;

        struct TfidfOptions
        {
            std::size_t minN        = 1;     // shortest word n-gram
            std::size_t maxN        = 3;     // longest word n-gram
            std::size_t maxFeatures = 500;   // vocabulary cap
        };

        /**
         * TfidfVectorizer
         *
         * Bag-of-n-grams TF-IDF features:
         *  - lowercase; tokens are runs of 2+ word characters;
         *  - word n-grams minN..maxN joined by a single space;
         *  - vocabulary capped at maxFeatures by total corpus count
         *    (ties broken alphabetically), then indexed alphabetically;
         *  - smooth idf: ln((1 + n) / (1 + df)) + 1;
         *  - each row L2-normalised.
         */
        class TfidfVectorizer
        {
        public:
            explicit TfidfVectorizer(TfidfOptions options = TfidfOptions{});

            /// Learn vocabulary and idf from documents; returns their rows.
            Matrix fitTransform(const std::vector<std::string> &documents);

            /// Row for one document; unseen n-grams are ignored.
            FeatureRow transform(std::string_view document) const;

            std::size_t vocabularySize() const noexcept { return m_features.size(); }

            /// Feature names in column order.
            const std::vector<std::string> &features() const noexcept { return m_features; }

            /// Lowercased n-grams of a document, in document order.
            std::vector<std::string> analyze(std::string_view document) const;

        private:
            FeatureRow weigh(const std::unordered_map<std::string, std::size_t> &counts) const;

        private:
            TfidfOptions                                 m_options;
            std::unordered_map<std::string, std::size_t> m_vocabulary;
            std::vector<std::string>                     m_features;
            std::vector<double>                          m_idf;
        };

    } // namespace Classifier
} // namespace CodeRisk
