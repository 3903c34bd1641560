#include "classifier/DefectClassifier.hpp"

#include <algorithm>
#include <string>

#include "utils/Logger.hpp"
#include "utils/TimeUtils.hpp"

namespace CodeRisk
{
    namespace Classifier
    {
        namespace
        {
            constexpr double kNeutral = 0.5;
        }

        DefectClassifier::DefectClassifier(ClassifierSettings settings)
            : DefectClassifier(settings,
                               SyntheticCorpus(settings.seed, settings.syntheticSamples).build())
        {
        }

        DefectClassifier::DefectClassifier(ClassifierSettings settings, std::vector<LabelledSample> corpus)
            : m_settings(settings),
              m_corpus(std::move(corpus)),
              m_vectorizer(TfidfOptions{ 1, 3, settings.maxFeatures }),
              m_forest(ForestOptions{ settings.nEstimators, settings.seed })
        {
            initialize();
        }

        void DefectClassifier::initialize()
        {
            std::call_once(m_initOnce, [this] { train(); });
        }

        void DefectClassifier::train()
        {
            auto &log = Utils::getLogger();
            const auto start = Utils::SteadyClock::now();

            std::vector<std::string> documents;
            std::vector<int> labels;
            documents.reserve(m_corpus.size());
            labels.reserve(m_corpus.size());
            for (const auto &sample : m_corpus)
            {
                documents.push_back(sample.code);
                labels.push_back(sample.label == 0 ? 0 : 1);
            }

            const bool hasClean     = std::find(labels.begin(), labels.end(), 0) != labels.end();
            const bool hasDefective = std::find(labels.begin(), labels.end(), 1) != labels.end();
            if (!hasClean || !hasDefective)
            {
                log.warn("DefectClassifier: training corpus has a single class; classifier left untrained");
                m_corpus.clear();
                return;
            }

            const Matrix rows = m_vectorizer.fitTransform(documents);
            if (m_vectorizer.vocabularySize() == 0)
            {
                log.warn("DefectClassifier: empty vocabulary; classifier left untrained");
                m_corpus.clear();
                return;
            }

            m_forest.fit(rows, labels);
            m_trained = true;
            m_corpus.clear();

            log.info("DefectClassifier trained on " + std::to_string(documents.size()) + " samples ("
                     + std::to_string(m_vectorizer.vocabularySize()) + " features, "
                     + std::to_string(m_forest.treeCount()) + " trees) in "
                     + std::to_string(static_cast<long long>(Utils::elapsedMillis(start))) + " ms");
        }

        double DefectClassifier::classify(std::string_view code) const
        {
            if (!m_trained)
                return kNeutral;

            const double p = m_forest.predictProbability(m_vectorizer.transform(code));
            return std::clamp(p, 0.0, 1.0);
        }

        double DefectClassifier::confidence() const noexcept
        {
            return m_trained ? m_settings.trainedConfidence : kNeutral;
        }

    } // namespace Classifier
} // namespace CodeRisk
