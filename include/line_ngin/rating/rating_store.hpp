// include/line_ngin/rating/rating_store.hpp
#pragma once

#include <optional>
#include <unordered_map>
#include <vector>
#include "line_ngin/core/types.hpp"

namespace line_ngin {

/**
 * @brief Scoring totals a team has accumulated within one run
 */
struct TeamStats {
    double points_scored{0.0};
    double points_allowed{0.0};
    int games_played{0};

    double points_scored_avg() const {
        return games_played > 0 ? points_scored / games_played : 0.0;
    }
    double points_allowed_avg() const {
        return games_played > 0 ? points_allowed / games_played : 0.0;
    }
};

/**
 * @brief Per-run team state: rating plus rolling scoring totals
 *
 * Owned by exactly one backtest invocation. Unseen teams read as the default rating.
 */
class RatingStore {
public:
    explicit RatingStore(Rating default_rating = DEFAULT_RATING);

    /**
     * @brief Seed a store from team records (carry-over from a prior season)
     * @param teams Teams whose rating field becomes the starting rating
     * @param default_rating Rating returned for teams not in the list
     */
    static RatingStore from_teams(const std::vector<Team>& teams,
                                  Rating default_rating = DEFAULT_RATING);

    Rating get(const TeamId& team_id) const;
    void set(const TeamId& team_id, Rating rating);
    bool contains(const TeamId& team_id) const;

    TeamStats get_stats(const TeamId& team_id) const;
    void set_stats(const TeamId& team_id, const TeamStats& stats);

    Rating default_rating() const {
        return default_rating_;
    }

    const std::unordered_map<TeamId, Rating>& ratings() const {
        return ratings_;
    }

    size_t size() const {
        return ratings_.size();
    }

private:
    Rating default_rating_;
    std::unordered_map<TeamId, Rating> ratings_;
    std::unordered_map<TeamId, TeamStats> stats_;
};

}  // namespace line_ngin
