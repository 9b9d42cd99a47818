#ifndef AFFINITY_RECOMMENDATION_SIMILARITY_ENGINE_HPP
#define AFFINITY_RECOMMENDATION_SIMILARITY_ENGINE_HPP

#include <optional>
#include <string>

#include <eigen3/Eigen/Dense>

#include "interaction_matrix.hpp"
#include "similarity_matrix.hpp"

namespace affinity::recommendation {

/**
 * @brief What to do with a pair whose similarity is undefined
 */
enum class DegeneratePolicy {
    SubstituteZero,  ///< Use 0 similarity for the pair
    Throw,           ///< Raise DegenerateInputError
};

[[nodiscard]] auto degeneratePolicyToString(DegeneratePolicy policy)
    -> std::string;

/**
 * @brief Parse "zero" or "throw"
 * @return Parsed policy, or nullopt for an unknown name
 */
[[nodiscard]] auto degeneratePolicyFromString(const std::string& name)
    -> std::optional<DegeneratePolicy>;

/**
 * @brief Computes user by user similarity from an interaction matrix
 *
 * Pearson correlation is taken over the full zero-filled rating rows, so an
 * unrated item counts as a rating of 0. This approximates taste correlation
 * and differs from the co-rated-only formulation. Cosine similarity uses the
 * raw rows without centering.
 *
 * Pairs are computed once for the upper triangle and mirrored, so the result
 * is exactly symmetric. The diagonal is forced to 0 so that a user never
 * selects itself as a neighbor.
 */
class SimilarityEngine {
public:
    explicit SimilarityEngine(
        DegeneratePolicy policy = DegeneratePolicy::SubstituteZero);

    /**
     * @brief Compute the pairwise similarity matrix
     * @param matrix Zero-filled interaction matrix
     * @param metric Similarity metric
     * @return Symmetric similarity matrix with zero diagonal
     * @throws InvalidInputError if the matrix is empty or holds non-finite
     * values
     * @throws DegenerateInputError under DegeneratePolicy::Throw when a
     * zero-variance (Pearson) or zero-norm (cosine) row takes part in a pair
     */
    [[nodiscard]] auto computeSimilarity(const InteractionMatrix& matrix,
                                         SimilarityMetric metric) const
        -> SimilarityMatrix;

    [[nodiscard]] auto policy() const -> DegeneratePolicy { return policy_; }

    /**
     * @brief Pearson correlation between two equally sized vectors
     * @return Correlation in [-1, 1], or nullopt if either vector is constant
     * @throws InvalidInputError on a size mismatch
     */
    [[nodiscard]] static auto pearsonCorrelation(const Eigen::VectorXd& first,
                                                 const Eigen::VectorXd& second)
        -> std::optional<double>;

    /**
     * @brief Cosine similarity between two equally sized vectors
     * @return Similarity in [-1, 1], or nullopt if either vector is all zeros
     * @throws InvalidInputError on a size mismatch
     */
    [[nodiscard]] static auto cosineSimilarity(const Eigen::VectorXd& first,
                                               const Eigen::VectorXd& second)
        -> std::optional<double>;

private:
    DegeneratePolicy policy_;
};

}  // namespace affinity::recommendation

#endif  // AFFINITY_RECOMMENDATION_SIMILARITY_ENGINE_HPP
