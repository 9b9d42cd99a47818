#ifndef AFFINITY_RECOMMENDATION_NEIGHBORHOOD_SELECTOR_HPP
#define AFFINITY_RECOMMENDATION_NEIGHBORHOOD_SELECTOR_HPP

#include <vector>

#include "similarity_matrix.hpp"

namespace affinity::recommendation {

/**
 * @brief A similar user and its similarity to the target
 */
struct Neighbor {
    UserId userId = 0;
    double score = 0.0;

    bool operator==(const Neighbor&) const = default;
};

/// Neighbors ordered by descending score, then ascending userId
using Neighborhood = std::vector<Neighbor>;

/**
 * @brief Selects the K users most similar to a target user
 */
class NeighborhoodSelector {
public:
    /**
     * @brief Rank the target's similarity row and keep the top k users
     *
     * Ties on score are broken by ascending userId. The target user is never
     * part of the result.
     *
     * @param similarity Similarity matrix
     * @param targetUser Target user
     * @param k Maximum neighborhood size; k <= 0 yields an empty neighborhood
     * @return Neighborhood of at most k users
     * @throws UnknownUserError if targetUser is absent from the matrix
     */
    [[nodiscard]] static auto selectTop(const SimilarityMatrix& similarity,
                                        UserId targetUser, int k)
        -> Neighborhood;
};

}  // namespace affinity::recommendation

#endif  // AFFINITY_RECOMMENDATION_NEIGHBORHOOD_SELECTOR_HPP
