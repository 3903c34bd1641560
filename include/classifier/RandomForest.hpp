#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

#include "classifier/DecisionTree.hpp"

namespace CodeRisk
{
    namespace Classifier
    {
        struct ForestOptions
        {
            std::size_t   nEstimators = 100;
            std::uint32_t seed        = 42;
        };

        /**
         * RandomForest
         *
         * Bagged ensemble of DecisionTree classifiers.
         *
         * Design notes:
         *  - Each tree gets its own std::mt19937 seeded from a master
         *    generator, so a fixed seed reproduces the whole forest.
         *  - Bootstrap samples have the size of the training set.
         *  - Features per split: floor(sqrt(feature count)), at least 1.
         *  - predictProbability is the mean of the trees' leaf probabilities.
         */
        class RandomForest
        {
        public:
            explicit RandomForest(ForestOptions options = ForestOptions{});

            /// Throws std::invalid_argument on empty input or mismatched sizes.
            void fit(const Matrix &rows, const std::vector<int> &labels);

            double predictProbability(const FeatureRow &row) const;

            bool fitted() const noexcept { return !m_trees.empty(); }
            std::size_t treeCount() const noexcept { return m_trees.size(); }

        private:
            ForestOptions             m_options;
            std::vector<DecisionTree> m_trees;
        };

    } // namespace Classifier
} // namespace CodeRisk
