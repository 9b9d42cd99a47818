#ifndef AFFINITY_RECOMMENDATION_SIMILARITY_MATRIX_HPP
#define AFFINITY_RECOMMENDATION_SIMILARITY_MATRIX_HPP

#include <optional>
#include <string>
#include <vector>

#include <eigen3/Eigen/Dense>

#include "../data/observation.hpp"

namespace affinity::recommendation {

using data::UserId;

/**
 * @brief Similarity metric type
 */
enum class SimilarityMetric {
    PEARSON,  ///< Pearson correlation over zero-filled rating rows
    COSINE,   ///< Cosine of the angle between raw rating rows
};

/**
 * @brief Convert SimilarityMetric to its lowercase name
 */
[[nodiscard]] auto metricToString(SimilarityMetric metric) -> std::string;

/**
 * @brief Parse a metric name ("pearson" or "cosine", case-insensitive)
 * @return Parsed metric, or nullopt for an unknown name
 */
[[nodiscard]] auto metricFromString(const std::string& name)
    -> std::optional<SimilarityMetric>;

/**
 * @brief Square user by user similarity matrix
 *
 * Indexed by the sorted user ids of the interaction matrix it was computed
 * from. Symmetric, with an all-zero diagonal, values within [-1, 1].
 */
class SimilarityMatrix {
public:
    /**
     * @param userIds Sorted user ids labelling rows and columns
     * @param values Square matrix of size userIds.size()
     * @throws InvalidInputError if the shape does not match the index or the
     * index is not sorted
     */
    SimilarityMatrix(std::vector<UserId> userIds, Eigen::MatrixXd values);

    [[nodiscard]] auto userIds() const -> const std::vector<UserId>& {
        return userIds_;
    }
    [[nodiscard]] auto values() const -> const Eigen::MatrixXd& {
        return values_;
    }
    [[nodiscard]] auto size() const -> size_t { return userIds_.size(); }

    [[nodiscard]] auto contains(UserId user) const -> bool {
        return indexOf(user).has_value();
    }

    /**
     * @brief Position of a user in the index, or nullopt if absent
     */
    [[nodiscard]] auto indexOf(UserId user) const
        -> std::optional<Eigen::Index>;

    /**
     * @brief Similarity between two users
     * @throws UnknownUserError if either user is absent
     */
    [[nodiscard]] auto at(UserId first, UserId second) const -> double;

    /**
     * @brief Check M(i, j) == M(j, i) for every pair
     */
    [[nodiscard]] auto isSymmetric() const -> bool;

    /**
     * @brief Check every self-similarity is exactly 0
     */
    [[nodiscard]] auto hasZeroDiagonal() const -> bool;

private:
    std::vector<UserId> userIds_;
    Eigen::MatrixXd values_;
};

}  // namespace affinity::recommendation

#endif  // AFFINITY_RECOMMENDATION_SIMILARITY_MATRIX_HPP
