#include "classifier/DecisionTree.hpp"

#include <algorithm>
#include <numeric>
#include <stdexcept>
#include <utility>

namespace CodeRisk
{
    namespace Classifier
    {
        namespace
        {
            // Adjacent values closer than this are treated as equal.
            constexpr double kFeatureEpsilon = 1e-7;

            double gini(std::size_t positives, std::size_t total) noexcept
            {
                if (total == 0)
                    return 0.0;
                const double p = static_cast<double>(positives) / static_cast<double>(total);
                return 1.0 - (p * p + (1.0 - p) * (1.0 - p));
            }
        } // namespace

        void DecisionTree::fit(const Matrix &rows,
                               const std::vector<int> &labels,
                               const std::vector<std::size_t> &sampleIndices,
                               std::size_t maxFeatures,
                               std::mt19937 &rng)
        {
            if (rows.size() != labels.size())
                throw std::invalid_argument("DecisionTree: rows and labels differ in length");
            if (sampleIndices.empty())
                throw std::invalid_argument("DecisionTree: no samples to fit");

            m_nodes.clear();
            grow(rows, labels, sampleIndices, std::max<std::size_t>(1, maxFeatures), rng);
        }

        double DecisionTree::predictProbability(const FeatureRow &row) const
        {
            if (m_nodes.empty())
                return 0.5;

            std::size_t at = 0;
            while (m_nodes[at].feature >= 0)
            {
                const Node &node = m_nodes[at];
                const auto f = static_cast<std::size_t>(node.feature);
                const double value = f < row.size() ? row[f] : 0.0;
                at = value <= node.threshold ? node.left : node.right;
            }
            return m_nodes[at].probability;
        }

        std::size_t DecisionTree::grow(const Matrix &rows,
                                       const std::vector<int> &labels,
                                       const std::vector<std::size_t> &indices,
                                       std::size_t maxFeatures,
                                       std::mt19937 &rng)
        {
            std::size_t positives = 0;
            for (std::size_t idx : indices)
                positives += labels[idx] == 1 ? 1 : 0;

            const std::size_t self = m_nodes.size();
            m_nodes.emplace_back();
            m_nodes[self].probability = static_cast<double>(positives) / static_cast<double>(indices.size());

            if (positives == 0 || positives == indices.size())
                return self;

            const Split split = bestSplit(rows, labels, indices, maxFeatures, rng);
            if (split.feature < 0)
                return self;

            std::vector<std::size_t> leftIdx;
            std::vector<std::size_t> rightIdx;
            const auto f = static_cast<std::size_t>(split.feature);
            for (std::size_t idx : indices)
            {
                if (rows[idx][f] <= split.threshold)
                    leftIdx.push_back(idx);
                else
                    rightIdx.push_back(idx);
            }

            // m_nodes may reallocate during recursion; index, never hold references.
            const std::size_t left  = grow(rows, labels, leftIdx, maxFeatures, rng);
            const std::size_t right = grow(rows, labels, rightIdx, maxFeatures, rng);

            m_nodes[self].feature   = split.feature;
            m_nodes[self].threshold = split.threshold;
            m_nodes[self].left      = left;
            m_nodes[self].right     = right;
            return self;
        }

        DecisionTree::Split DecisionTree::bestSplit(const Matrix &rows,
                                                    const std::vector<int> &labels,
                                                    const std::vector<std::size_t> &indices,
                                                    std::size_t maxFeatures,
                                                    std::mt19937 &rng) const
        {
            const std::size_t featureCount = rows[indices.front()].size();

            std::vector<std::size_t> order(featureCount);
            std::iota(order.begin(), order.end(), std::size_t{0});

            std::size_t totalPositives = 0;
            for (std::size_t idx : indices)
                totalPositives += labels[idx] == 1 ? 1 : 0;
            const std::size_t total = indices.size();

            Split best;
            std::vector<std::pair<double, int>> column(total);

            for (std::size_t visited = 0; visited < featureCount; ++visited)
            {
                if (visited >= maxFeatures && best.feature >= 0)
                    break;

                // Partial Fisher-Yates: draw the next feature without replacement.
                std::uniform_int_distribution<std::size_t> draw(visited, featureCount - 1);
                std::swap(order[visited], order[draw(rng)]);
                const std::size_t f = order[visited];

                for (std::size_t k = 0; k < total; ++k)
                    column[k] = { rows[indices[k]][f], labels[indices[k]] };
                std::sort(column.begin(), column.end(),
                          [](const auto &a, const auto &b) { return a.first < b.first; });

                if (column.back().first <= column.front().first + kFeatureEpsilon)
                    continue;   // constant at this node

                std::size_t leftPositives = 0;
                for (std::size_t k = 0; k + 1 < total; ++k)
                {
                    leftPositives += column[k].second == 1 ? 1 : 0;
                    if (column[k + 1].first <= column[k].first + kFeatureEpsilon)
                        continue;

                    const std::size_t leftCount  = k + 1;
                    const std::size_t rightCount = total - leftCount;
                    const double impurity =
                        (static_cast<double>(leftCount) * gini(leftPositives, leftCount)
                         + static_cast<double>(rightCount) * gini(totalPositives - leftPositives, rightCount))
                        / static_cast<double>(total);

                    if (best.feature < 0 || impurity < best.impurity)
                    {
                        best.feature   = static_cast<int>(f);
                        best.threshold = (column[k].first + column[k + 1].first) / 2.0;
                        best.impurity  = impurity;
                    }
                }
            }
            return best;
        }

    } // namespace Classifier
} // namespace CodeRisk
