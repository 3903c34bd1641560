#pragma once

#include <cstddef>
#include <cstdint>
#include <random>
#include <string>
#include <vector>

namespace CodeRisk
{
    namespace Classifier
    {
        /// Training snippet; label 0 is clean, 1 is defective.
        struct LabelledSample
        {
            std::string code;
            int         label = 0;
        };

        /**
         * SyntheticCorpus
         *
         * Builds the classifier's training set: hand-written clean and
         * defective exemplars followed by template-generated variations,
         * one clean and one defective per round.
         *
         * The same seed always yields the same corpus on a given standard
         * library (distribution output is implementation-defined).
         */
        class SyntheticCorpus
        {
        public:
            SyntheticCorpus(std::uint32_t seed, std::size_t generatedPerClass);

            std::vector<LabelledSample> build();

        private:
            std::string generateClean();
            std::string generateDefective();

            template <typename Container>
            const std::string &pick(const Container &choices)
            {
                std::uniform_int_distribution<std::size_t> dist(0, choices.size() - 1);
                return choices[dist(m_rng)];
            }

        private:
            std::mt19937 m_rng;
            std::size_t  m_generatedPerClass;
        };

    } // namespace Classifier
} // namespace CodeRisk
