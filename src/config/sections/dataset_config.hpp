/*
 * dataset_config.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12-08

Description: Rating dataset location and column names

**************************************************/

#ifndef AFFINITY_CONFIG_SECTIONS_DATASET_CONFIG_HPP
#define AFFINITY_CONFIG_SECTIONS_DATASET_CONFIG_HPP

#include <string>
#include <utility>

#include "../core/config_section.hpp"

namespace affinity::config {

/**
 * @brief Dataset configuration
 *
 * Points at the ratings table (user, item, rating) and the items table
 * (item, title) joined on the item column.
 */
struct DatasetConfig : ConfigSection<DatasetConfig> {
    static constexpr std::string_view PATH = "/affinity/dataset";

    std::string ratingsPath{"ml-latest-small/ratings.csv"};
    std::string itemsPath{"ml-latest-small/movies.csv"};

    std::string userColumn{"userId"};
    std::string itemColumn{"movieId"};
    std::string ratingColumn{"rating"};
    std::string titleColumn{"title"};

    [[nodiscard]] json serialize() const {
        return {{"ratingsPath", ratingsPath},   {"itemsPath", itemsPath},
                {"userColumn", userColumn},     {"itemColumn", itemColumn},
                {"ratingColumn", ratingColumn}, {"titleColumn", titleColumn}};
    }

    [[nodiscard]] static DatasetConfig deserialize(const json& j) {
        DatasetConfig cfg;
        cfg.ratingsPath = j.value("ratingsPath", cfg.ratingsPath);
        cfg.itemsPath = j.value("itemsPath", cfg.itemsPath);
        cfg.userColumn = j.value("userColumn", cfg.userColumn);
        cfg.itemColumn = j.value("itemColumn", cfg.itemColumn);
        cfg.ratingColumn = j.value("ratingColumn", cfg.ratingColumn);
        cfg.titleColumn = j.value("titleColumn", cfg.titleColumn);

        for (const auto& [key, value] :
             {std::pair{"ratingsPath", &cfg.ratingsPath},
              std::pair{"itemsPath", &cfg.itemsPath},
              std::pair{"userColumn", &cfg.userColumn},
              std::pair{"itemColumn", &cfg.itemColumn},
              std::pair{"ratingColumn", &cfg.ratingColumn},
              std::pair{"titleColumn", &cfg.titleColumn}}) {
            if (value->empty()) {
                throw InvalidConfigException(
                    std::string(PATH) + "/" + key, "must not be empty");
            }
        }
        return cfg;
    }
};

}  // namespace affinity::config

#endif  // AFFINITY_CONFIG_SECTIONS_DATASET_CONFIG_HPP
