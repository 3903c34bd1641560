#include "classifier/RandomForest.hpp"

#include <algorithm>
#include <cmath>
#include <random>
#include <stdexcept>

namespace CodeRisk
{
    namespace Classifier
    {
        RandomForest::RandomForest(ForestOptions options)
            : m_options(options)
        {
            if (m_options.nEstimators == 0)
                m_options.nEstimators = 1;
        }

        void RandomForest::fit(const Matrix &rows, const std::vector<int> &labels)
        {
            if (rows.empty())
                throw std::invalid_argument("RandomForest: empty training set");
            if (rows.size() != labels.size())
                throw std::invalid_argument("RandomForest: rows and labels differ in length");

            const std::size_t featureCount = rows.front().size();
            const std::size_t maxFeatures = std::max<std::size_t>(
                1, static_cast<std::size_t>(std::sqrt(static_cast<double>(featureCount))));

            m_trees.clear();
            m_trees.reserve(m_options.nEstimators);

            std::mt19937 master(m_options.seed);
            std::vector<std::size_t> sample(rows.size());

            for (std::size_t t = 0; t < m_options.nEstimators; ++t)
            {
                std::mt19937 rng(master());
                std::uniform_int_distribution<std::size_t> pick(0, rows.size() - 1);
                for (auto &idx : sample)
                    idx = pick(rng);

                DecisionTree tree;
                tree.fit(rows, labels, sample, maxFeatures, rng);
                m_trees.push_back(std::move(tree));
            }
        }

        double RandomForest::predictProbability(const FeatureRow &row) const
        {
            if (m_trees.empty())
                return 0.5;

            double sum = 0.0;
            for (const auto &tree : m_trees)
                sum += tree.predictProbability(row);
            return sum / static_cast<double>(m_trees.size());
        }

    } // namespace Classifier
} // namespace CodeRisk
