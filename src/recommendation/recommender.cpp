#include "recommender.hpp"

#include <algorithm>

namespace affinity::recommendation {

auto Recommender::topN(const PredictionSet& predictions, int n)
    -> Recommendation {
    if (n <= 0 || predictions.empty()) {
        return {};
    }

    Recommendation ranked;
    ranked.reserve(predictions.size());
    for (const auto& prediction : predictions) {
        ranked.push_back({prediction.itemId, prediction.itemTitle,
                          prediction.predictedRating});
    }

    std::sort(ranked.begin(), ranked.end(),
              [](const RecommendedItem& a, const RecommendedItem& b) {
                  if (a.predictedRating != b.predictedRating) {
                      return a.predictedRating > b.predictedRating;
                  }
                  if (a.itemTitle != b.itemTitle) {
                      return a.itemTitle < b.itemTitle;
                  }
                  return a.itemId < b.itemId;
              });

    if (ranked.size() > static_cast<size_t>(n)) {
        ranked.resize(static_cast<size_t>(n));
    }
    return ranked;
}

}  // namespace affinity::recommendation
