#pragma once

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <string_view>
#include <vector>

#include "classifier/RandomForest.hpp"
#include "classifier/SyntheticCorpus.hpp"
#include "classifier/TfidfVectorizer.hpp"

namespace CodeRisk
{
    namespace Classifier
    {
        struct ClassifierSettings
        {
            std::uint32_t seed              = 42;
            std::size_t   syntheticSamples  = 20;    // generated per class
            std::size_t   maxFeatures       = 500;
            std::size_t   nEstimators       = 100;
            double        trainedConfidence = 0.8;
        };

        /**
         * DefectClassifier
         *
         * Responsibilities:
         *  - Train a TF-IDF + random forest model on a labelled corpus
         *    (the synthetic corpus unless one is supplied).
         *  - Map a snippet to the probability that it is defective.
         *
         * Design notes:
         *  - Training runs once, from the constructor, through initialize().
         *  - Read-only afterwards; classify() is safe to call concurrently.
         *  - A corpus with no usable vocabulary or a single class leaves the
         *    model untrained: classify() then answers 0.5 and confidence()
         *    answers 0.5.
         */
        class DefectClassifier
        {
        public:
            explicit DefectClassifier(ClassifierSettings settings = ClassifierSettings{});

            /// Train on a caller-supplied corpus instead of the synthetic one.
            DefectClassifier(ClassifierSettings settings, std::vector<LabelledSample> corpus);

            DefectClassifier(const DefectClassifier &)            = delete;
            DefectClassifier &operator=(const DefectClassifier &) = delete;

            /// Idempotent; later calls are no-ops.
            void initialize();

            bool isTrained() const noexcept { return m_trained; }

            /// Probability of the defective class in [0, 1].
            double classify(std::string_view code) const;

            double confidence() const noexcept;

            const ClassifierSettings &settings() const noexcept { return m_settings; }
            std::size_t vocabularySize() const noexcept { return m_vectorizer.vocabularySize(); }

        private:
            void train();

        private:
            ClassifierSettings          m_settings;
            std::vector<LabelledSample> m_corpus;
            TfidfVectorizer             m_vectorizer;
            RandomForest                m_forest;
            std::once_flag              m_initOnce;
            bool                        m_trained = false;
        };

    } // namespace Classifier
} // namespace CodeRisk
