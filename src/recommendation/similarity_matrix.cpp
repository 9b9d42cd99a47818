#include "similarity_matrix.hpp"

#include <algorithm>
#include <cctype>
#include <functional>
#include <iterator>
#include <utility>

#include "recommendation_exception.hpp"

namespace affinity::recommendation {

auto metricToString(SimilarityMetric metric) -> std::string {
    switch (metric) {
        case SimilarityMetric::PEARSON:
            return "pearson";
        case SimilarityMetric::COSINE:
            return "cosine";
    }
    return "pearson";
}

auto metricFromString(const std::string& name)
    -> std::optional<SimilarityMetric> {
    std::string lowered;
    lowered.reserve(name.size());
    std::transform(name.begin(), name.end(), std::back_inserter(lowered),
                   [](unsigned char c) { return std::tolower(c); });

    if (lowered == "pearson") {
        return SimilarityMetric::PEARSON;
    }
    if (lowered == "cosine") {
        return SimilarityMetric::COSINE;
    }
    return std::nullopt;
}

SimilarityMatrix::SimilarityMatrix(std::vector<UserId> userIds,
                                   Eigen::MatrixXd values)
    : userIds_(std::move(userIds)), values_(std::move(values)) {
    auto n = static_cast<Eigen::Index>(userIds_.size());
    if (values_.rows() != n || values_.cols() != n) {
        throw InvalidInputError("Similarity matrix must be square over " +
                                std::to_string(n) + " users");
    }
    if (std::adjacent_find(userIds_.begin(), userIds_.end(),
                           std::greater_equal<>()) != userIds_.end()) {
        throw InvalidInputError(
            "Similarity matrix user index must be strictly increasing");
    }
}

auto SimilarityMatrix::indexOf(UserId user) const
    -> std::optional<Eigen::Index> {
    auto it = std::lower_bound(userIds_.begin(), userIds_.end(), user);
    if (it == userIds_.end() || *it != user) {
        return std::nullopt;
    }
    return static_cast<Eigen::Index>(std::distance(userIds_.begin(), it));
}

auto SimilarityMatrix::at(UserId first, UserId second) const -> double {
    auto row = indexOf(first);
    auto col = indexOf(second);
    if (!row || !col) {
        throw UnknownUserError("User " + std::to_string(row ? second : first) +
                               " is not part of the similarity matrix");
    }
    return values_(*row, *col);
}

auto SimilarityMatrix::isSymmetric() const -> bool {
    for (Eigen::Index i = 0; i < values_.rows(); ++i) {
        for (Eigen::Index j = i + 1; j < values_.cols(); ++j) {
            if (values_(i, j) != values_(j, i)) {
                return false;
            }
        }
    }
    return true;
}

auto SimilarityMatrix::hasZeroDiagonal() const -> bool {
    for (Eigen::Index i = 0; i < values_.rows(); ++i) {
        if (values_(i, i) != 0.0) {
            return false;
        }
    }
    return true;
}

}  // namespace affinity::recommendation
