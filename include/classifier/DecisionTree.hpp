#pragma once

#include <cstddef>
#include <random>
#include <vector>

#include "classifier/TfidfVectorizer.hpp"

namespace CodeRisk
{
    namespace Classifier
    {
        /**
         * DecisionTree
         *
         * Binary CART classifier (labels 0 / 1) grown to purity.
         *
         * Design notes:
         *  - Gini impurity; thresholds are midpoints between adjacent
         *    distinct feature values, rows with value <= threshold go left.
         *  - At each node up to maxFeatures features are drawn at random
         *    without replacement; drawing continues past maxFeatures while
         *    no valid split has been found.
         *  - Nodes live in a flat vector; leaves store P(label == 1).
         */
        class DecisionTree
        {
        public:
            /**
             * Grow the tree on the rows named by sampleIndices (repeats
             * allowed, as produced by bootstrap sampling).
             */
            void fit(const Matrix &rows,
                     const std::vector<int> &labels,
                     const std::vector<std::size_t> &sampleIndices,
                     std::size_t maxFeatures,
                     std::mt19937 &rng);

            /// Leaf probability of label 1; 0.5 for an unfitted tree.
            double predictProbability(const FeatureRow &row) const;

            std::size_t nodeCount() const noexcept { return m_nodes.size(); }

        private:
            struct Node
            {
                int         feature     = -1;   // -1 marks a leaf
                double      threshold   = 0.0;
                std::size_t left        = 0;
                std::size_t right       = 0;
                double      probability = 0.5;
            };

            struct Split
            {
                int    feature   = -1;
                double threshold = 0.0;
                double impurity  = 0.0;
            };

            std::size_t grow(const Matrix &rows,
                             const std::vector<int> &labels,
                             const std::vector<std::size_t> &indices,
                             std::size_t maxFeatures,
                             std::mt19937 &rng);

            Split bestSplit(const Matrix &rows,
                            const std::vector<int> &labels,
                            const std::vector<std::size_t> &indices,
                            std::size_t maxFeatures,
                            std::mt19937 &rng) const;

        private:
            std::vector<Node> m_nodes;
        };

    } // namespace Classifier
} // namespace CodeRisk
