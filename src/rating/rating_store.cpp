#include "line_ngin/rating/rating_store.hpp"

namespace line_ngin {

RatingStore::RatingStore(Rating default_rating) : default_rating_(default_rating) {}

RatingStore RatingStore::from_teams(const std::vector<Team>& teams, Rating default_rating) {
    RatingStore store(default_rating);
    for (const auto& team : teams) {
        store.set(team.id, team.rating);
    }
    return store;
}

Rating RatingStore::get(const TeamId& team_id) const {
    auto it = ratings_.find(team_id);
    return it != ratings_.end() ? it->second : default_rating_;
}

void RatingStore::set(const TeamId& team_id, Rating rating) {
    ratings_[team_id] = rating;
}

bool RatingStore::contains(const TeamId& team_id) const {
    return ratings_.find(team_id) != ratings_.end();
}

TeamStats RatingStore::get_stats(const TeamId& team_id) const {
    auto it = stats_.find(team_id);
    return it != stats_.end() ? it->second : TeamStats{};
}

void RatingStore::set_stats(const TeamId& team_id, const TeamStats& stats) {
    stats_[team_id] = stats;
}

}  // namespace line_ngin
