#include "similarity_engine.hpp"

#include <algorithm>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

#include "recommendation_exception.hpp"

namespace affinity::recommendation {

namespace {

// A row has no defined Pearson correlation when all of its cells are equal,
// and no defined cosine similarity when all of its cells are zero.
template <typename Row>
auto isDegenerate(const Row& row, SimilarityMetric metric) -> bool {
    if (row.size() == 0) {
        return true;
    }
    if (metric == SimilarityMetric::PEARSON) {
        return row.maxCoeff() == row.minCoeff();
    }
    return (row.array() == 0.0).all();
}

auto boundedRatio(double dot, double normProduct) -> double {
    return std::clamp(dot / normProduct, -1.0, 1.0);
}

auto degenerateRows(const Eigen::MatrixXd& values, SimilarityMetric metric)
    -> std::vector<bool> {
    std::vector<bool> degenerate(static_cast<size_t>(values.rows()));
    for (Eigen::Index i = 0; i < values.rows(); ++i) {
        degenerate[static_cast<size_t>(i)] =
            isDegenerate(values.row(i), metric);
    }
    return degenerate;
}

// Similarity of every pair of rows, upper triangle mirrored. Pairs with a
// degenerate row and the diagonal stay 0.
auto pairwiseSimilarity(const Eigen::MatrixXd& values, SimilarityMetric metric,
                        const std::vector<bool>& degenerate)
    -> Eigen::MatrixXd {
    const Eigen::Index n = values.rows();
    Eigen::MatrixXd vectors = values;
    if (metric == SimilarityMetric::PEARSON) {
        Eigen::VectorXd means = values.rowwise().mean();
        vectors.colwise() -= means;
    }
    Eigen::VectorXd norms = vectors.rowwise().norm();

    Eigen::MatrixXd result = Eigen::MatrixXd::Zero(n, n);
    for (Eigen::Index i = 0; i < n; ++i) {
        if (degenerate[static_cast<size_t>(i)]) {
            continue;
        }
        for (Eigen::Index j = i + 1; j < n; ++j) {
            if (degenerate[static_cast<size_t>(j)]) {
                continue;
            }
            double sim = boundedRatio(vectors.row(i).dot(vectors.row(j)),
                                      norms(i) * norms(j));
            result(i, j) = sim;
            result(j, i) = sim;
        }
    }
    return result;
}

void checkSameSize(const Eigen::VectorXd& first,
                   const Eigen::VectorXd& second) {
    if (first.size() != second.size()) {
        throw InvalidInputError("Rating vectors differ in length: " +
                                std::to_string(first.size()) + " vs " +
                                std::to_string(second.size()));
    }
}

// The vector helpers run the same kernel as computeSimilarity on a two-row
// matrix.
auto vectorSimilarity(const Eigen::VectorXd& first,
                      const Eigen::VectorXd& second, SimilarityMetric metric)
    -> std::optional<double> {
    checkSameSize(first, second);
    Eigen::MatrixXd rows(2, first.size());
    rows.row(0) = first.transpose();
    rows.row(1) = second.transpose();

    const auto degenerate = degenerateRows(rows, metric);
    if (degenerate[0] || degenerate[1]) {
        return std::nullopt;
    }
    return pairwiseSimilarity(rows, metric, degenerate)(0, 1);
}

}  // namespace

auto degeneratePolicyToString(DegeneratePolicy policy) -> std::string {
    switch (policy) {
        case DegeneratePolicy::SubstituteZero:
            return "zero";
        case DegeneratePolicy::Throw:
            return "throw";
    }
    return "zero";
}

auto degeneratePolicyFromString(const std::string& name)
    -> std::optional<DegeneratePolicy> {
    if (name == "zero") {
        return DegeneratePolicy::SubstituteZero;
    }
    if (name == "throw") {
        return DegeneratePolicy::Throw;
    }
    return std::nullopt;
}

SimilarityEngine::SimilarityEngine(DegeneratePolicy policy) : policy_(policy) {}

auto SimilarityEngine::computeSimilarity(const InteractionMatrix& matrix,
                                         SimilarityMetric metric) const
    -> SimilarityMatrix {
    const auto& values = matrix.values();
    if (values.rows() == 0 || values.cols() == 0) {
        throw InvalidInputError(
            "Cannot compute similarity over an empty interaction matrix");
    }
    if (!values.allFinite()) {
        throw InvalidInputError("Interaction matrix holds non-finite ratings");
    }

    const Eigen::Index n = values.rows();
    const auto& users = matrix.userIds();
    const auto degenerate = degenerateRows(values, metric);
    const auto healthy = static_cast<size_t>(
        std::count(degenerate.begin(), degenerate.end(), false));

    if (policy_ == DegeneratePolicy::Throw && n > 1 &&
        healthy < degenerate.size()) {
        auto first = std::find(degenerate.begin(), degenerate.end(), true);
        auto user = users[static_cast<size_t>(first - degenerate.begin())];
        throw DegenerateInputError(
            metricToString(metric) + " similarity is undefined for user " +
            std::to_string(user) +
            (metric == SimilarityMetric::PEARSON
                 ? ": rating vector has zero variance"
                 : ": rating vector has zero norm"));
    }

    Eigen::MatrixXd result = pairwiseSimilarity(values, metric, degenerate);

    const auto total = static_cast<size_t>(n);
    const size_t healthyPairs = healthy > 1 ? healthy * (healthy - 1) / 2 : 0;
    const size_t substituted = total * (total - 1) / 2 - healthyPairs;

    if (substituted > 0) {
        spdlog::warn("{} user pairs had undefined {} similarity, using 0",
                     substituted, metricToString(metric));
    }
    spdlog::info("Computed {} similarity for {} users over {} items",
                 metricToString(metric), n, values.cols());

    return SimilarityMatrix(users, std::move(result));
}

auto SimilarityEngine::pearsonCorrelation(const Eigen::VectorXd& first,
                                          const Eigen::VectorXd& second)
    -> std::optional<double> {
    return vectorSimilarity(first, second, SimilarityMetric::PEARSON);
}

auto SimilarityEngine::cosineSimilarity(const Eigen::VectorXd& first,
                                        const Eigen::VectorXd& second)
    -> std::optional<double> {
    return vectorSimilarity(first, second, SimilarityMetric::COSINE);
}

}  // namespace affinity::recommendation
