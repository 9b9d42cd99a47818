#include "neighborhood_selector.hpp"

#include <algorithm>
#include <string>

#include <spdlog/spdlog.h>

#include "recommendation_exception.hpp"

namespace affinity::recommendation {

auto NeighborhoodSelector::selectTop(const SimilarityMatrix& similarity,
                                     UserId targetUser, int k)
    -> Neighborhood {
    auto row = similarity.indexOf(targetUser);
    if (!row) {
        throw UnknownUserError("User " + std::to_string(targetUser) +
                               " is not part of the similarity matrix");
    }
    if (k <= 0) {
        return {};
    }

    const auto& users = similarity.userIds();
    const auto& values = similarity.values();

    Neighborhood neighbors;
    neighbors.reserve(users.size());
    for (size_t i = 0; i < users.size(); ++i) {
        if (users[i] == targetUser) {
            continue;
        }
        neighbors.push_back(
            {users[i], values(*row, static_cast<Eigen::Index>(i))});
    }

    std::sort(neighbors.begin(), neighbors.end(),
              [](const Neighbor& a, const Neighbor& b) {
                  if (a.score != b.score) {
                      return a.score > b.score;
                  }
                  return a.userId < b.userId;
              });

    if (neighbors.size() > static_cast<size_t>(k)) {
        neighbors.resize(static_cast<size_t>(k));
    }

    spdlog::debug("Selected {} neighbors for user {}", neighbors.size(),
                  targetUser);
    return neighbors;
}

}  // namespace affinity::recommendation
