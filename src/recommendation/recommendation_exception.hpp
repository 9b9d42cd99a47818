#ifndef AFFINITY_RECOMMENDATION_RECOMMENDATION_EXCEPTION_HPP
#define AFFINITY_RECOMMENDATION_RECOMMENDATION_EXCEPTION_HPP

#include <stdexcept>
#include <string>

namespace affinity::recommendation {

/**
 * @brief Base exception class for recommendation pipeline errors
 */
class RecommendationException : public std::runtime_error {
public:
    explicit RecommendationException(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Malformed or empty input data
 */
class InvalidInputError : public RecommendationException {
public:
    explicit InvalidInputError(const std::string& message)
        : RecommendationException(message) {}
};

/**
 * @brief Requested user is absent from the similarity index
 */
class UnknownUserError : public RecommendationException {
public:
    explicit UnknownUserError(const std::string& message)
        : RecommendationException(message) {}
};

/**
 * @brief Target user has no ratings to center predictions against
 */
class InsufficientDataError : public RecommendationException {
public:
    explicit InsufficientDataError(const std::string& message)
        : RecommendationException(message) {}
};

/**
 * @brief Similarity is undefined for a pair of users
 *
 * Raised for zero-variance (Pearson) or zero-norm (cosine) rating vectors
 * when the engine runs with DegeneratePolicy::Throw.
 */
class DegenerateInputError : public RecommendationException {
public:
    explicit DegenerateInputError(const std::string& message)
        : RecommendationException(message) {}
};

}  // namespace affinity::recommendation

#endif  // AFFINITY_RECOMMENDATION_RECOMMENDATION_EXCEPTION_HPP
