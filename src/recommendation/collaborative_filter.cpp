#include "collaborative_filter.hpp"

#include <mutex>
#include <sstream>
#include <stdexcept>
#include <utility>

#include <spdlog/spdlog.h>

#include "interaction_matrix.hpp"
#include "recommendation.hpp"

namespace affinity::recommendation {

CollaborativeFilter::CollaborativeFilter(
    std::shared_ptr<const RatingStore> ratings, const Config& config,
    std::shared_ptr<cache::ISimilarityCache> cache)
    : ratings_(std::move(ratings)),
      config_(config),
      cache_(std::move(cache)),
      engine_(config.degeneratePolicy) {
    if (!ratings_) {
        throw std::invalid_argument("Rating store cannot be null");
    }
    spdlog::info(
        "CollaborativeFilter initialized with {} metric, {} neighbors, top {}",
        metricToString(config_.metric), config_.neighborhoodSize,
        config_.topN);
}

auto CollaborativeFilter::loadFromCache() const
    -> std::shared_ptr<const SimilarityMatrix> {
    if (!cache_ || !cache_->exists(config_.metric)) {
        return nullptr;
    }

    auto loaded = cache_->load(config_.metric);
    if (!loaded) {
        spdlog::warn("Ignoring cached {} similarity matrix: {}",
                     metricToString(config_.metric), loaded.error());
        return nullptr;
    }
    if (loaded->userIds() != ratings_->userIds()) {
        spdlog::warn(
            "Ignoring cached {} similarity matrix: it covers {} users, the "
            "rating store has {}",
            metricToString(config_.metric), loaded->size(),
            ratings_->userCount());
        return nullptr;
    }

    return std::make_shared<const SimilarityMatrix>(std::move(*loaded));
}

void CollaborativeFilter::saveToCache(const SimilarityMatrix& matrix) const {
    if (!cache_) {
        return;
    }
    if (auto saved = cache_->save(config_.metric, matrix); !saved) {
        spdlog::warn("Failed to cache {} similarity matrix: {}",
                     metricToString(config_.metric), saved.error());
    }
}

auto CollaborativeFilter::similarity()
    -> std::shared_ptr<const SimilarityMatrix> {
    {
        std::shared_lock lock(mtx_);
        if (similarity_) {
            return similarity_;
        }
    }

    std::unique_lock lock(mtx_);
    if (similarity_) {
        return similarity_;
    }

    auto matrix = loadFromCache();
    if (!matrix) {
        auto interactions = InteractionMatrixBuilder::build(*ratings_);
        auto computed = std::make_shared<const SimilarityMatrix>(
            engine_.computeSimilarity(interactions, config_.metric));
        saveToCache(*computed);
        matrix = std::move(computed);
    }

    similarity_ = matrix;
    return similarity_;
}

auto CollaborativeFilter::similarUsers(UserId user, int k) -> Neighborhood {
    auto matrix = similarity();
    return NeighborhoodSelector::selectTop(*matrix, user, k);
}

auto CollaborativeFilter::predict(UserId user) -> PredictionSet {
    auto neighborhood = similarUsers(user, config_.neighborhoodSize);
    return RatingPredictor::predict(*ratings_, neighborhood, user);
}

auto CollaborativeFilter::recommend(UserId user) -> RecommendationResult {
    return recommend(user, config_.topN);
}

auto CollaborativeFilter::recommend(UserId user, int topN)
    -> RecommendationResult {
    RecommendationResult result;
    result.targetUser = user;
    result.neighborhood = similarUsers(user, config_.neighborhoodSize);
    result.predictions =
        RatingPredictor::predict(*ratings_, result.neighborhood, user);
    result.recommendation = Recommender::topN(result.predictions, topN);

    spdlog::info("Recommended {} of {} predicted items for user {}",
                 result.recommendation.size(), result.predictions.size(),
                 user);
    return result;
}

void CollaborativeFilter::invalidate() {
    std::unique_lock lock(mtx_);
    similarity_.reset();
    if (cache_ && cache_->remove(config_.metric)) {
        spdlog::debug("Removed cached {} similarity matrix",
                      metricToString(config_.metric));
    }
    spdlog::info("CollaborativeFilter similarity matrix invalidated");
}

auto CollaborativeFilter::getStats() const -> std::string {
    bool computed = false;
    {
        std::shared_lock lock(mtx_);
        computed = static_cast<bool>(similarity_);
    }

    std::stringstream ss;
    ss << "Collaborative Filter Statistics:\n"
       << "  Module Version: " << getRecommendationModuleVersion() << "\n"
       << "  Users: " << ratings_->userCount() << "\n"
       << "  Items: " << ratings_->itemCount() << "\n"
       << "  Total Ratings: " << ratings_->size() << "\n"
       << "  Merged Duplicates: " << ratings_->duplicateCount() << "\n"
       << "  Similarity Metric: " << metricToString(config_.metric) << "\n"
       << "  Neighborhood Size: " << config_.neighborhoodSize << "\n"
       << "  Top N: " << config_.topN << "\n"
       << "  Similarity Ready: " << (computed ? "yes" : "no");
    return ss.str();
}

}  // namespace affinity::recommendation
