#include "line_ngin/prediction/pace_projector.hpp"
#include <algorithm>
#include <cmath>
#include <cstdlib>

namespace line_ngin {

PaceConfig PaceConfig::for_sport(Sport sport) {
    PaceConfig config;
    switch (sport) {
        case Sport::NBA:
            config.regulation_periods = 4;
            config.period_minutes = 12.0;
            break;
        case Sport::NHL:
            config.regulation_periods = 3;
            config.period_minutes = 20.0;
            config.min_elapsed_minutes = 1.0;  // Goals are too sparse before that
            break;
        case Sport::NFL:
            config.regulation_periods = 4;
            config.period_minutes = 15.0;
            config.overtime_minutes = 10.0;
            break;
        case Sport::CBB:
            config.regulation_periods = 2;
            config.period_minutes = 20.0;
            break;
    }
    return config;
}

Result<void> PaceConfig::validate() const {
    if (regulation_periods <= 0) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT, "regulation_periods must be positive",
                                "PaceConfig");
    }
    if (!std::isfinite(period_minutes) || period_minutes <= 0.0) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT, "period_minutes must be positive",
                                "PaceConfig");
    }
    if (!std::isfinite(overtime_minutes) || overtime_minutes < 0.0) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                "overtime_minutes cannot be negative", "PaceConfig");
    }
    if (!std::isfinite(min_elapsed_minutes) || min_elapsed_minutes < 0.0) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                "min_elapsed_minutes cannot be negative", "PaceConfig");
    }
    return Result<void>();
}

nlohmann::json PaceConfig::to_json() const {
    nlohmann::json j;
    j["regulation_periods"] = regulation_periods;
    j["period_minutes"] = period_minutes;
    j["overtime_minutes"] = overtime_minutes;
    j["min_elapsed_minutes"] = min_elapsed_minutes;
    return j;
}

void PaceConfig::from_json(const nlohmann::json& j) {
    if (j.contains("regulation_periods"))
        regulation_periods = j.at("regulation_periods").get<int>();
    if (j.contains("period_minutes"))
        period_minutes = j.at("period_minutes").get<double>();
    if (j.contains("overtime_minutes"))
        overtime_minutes = j.at("overtime_minutes").get<double>();
    if (j.contains("min_elapsed_minutes"))
        min_elapsed_minutes = j.at("min_elapsed_minutes").get<double>();
}

std::string to_string(GapBucket bucket) {
    switch (bucket) {
        case GapBucket::CLOSE:
            return "close";
        case GapBucket::SMALL:
            return "small";
        case GapBucket::MEDIUM:
            return "medium";
        case GapBucket::LARGE:
            return "large";
    }
    return "unknown";
}

std::string to_string(Checkpoint checkpoint) {
    switch (checkpoint) {
        case Checkpoint::FIRST_PERIOD:
            return "Q1";
        case Checkpoint::HALF:
            return "HALF";
        case Checkpoint::LATE:
            return "Q3";
    }
    return "unknown";
}

PaceProjector::PaceProjector(PaceConfig config) : config_(std::move(config)) {}

GapBucket PaceProjector::gap_bucket(int gap) {
    gap = std::abs(gap);
    if (gap <= 4) return GapBucket::CLOSE;
    if (gap <= 9) return GapBucket::SMALL;
    if (gap <= 14) return GapBucket::MEDIUM;
    return GapBucket::LARGE;
}

double PaceProjector::elapsed_minutes(int period, double minutes_remaining) const {
    if (period < 1) {
        return 0.0;
    }
    if (period <= config_.regulation_periods) {
        double in_period = std::clamp(config_.period_minutes - minutes_remaining, 0.0,
                                      config_.period_minutes);
        return (period - 1) * config_.period_minutes + in_period;
    }
    int overtime_index = period - config_.regulation_periods;
    double in_overtime = std::clamp(config_.overtime_minutes - minutes_remaining, 0.0,
                                    config_.overtime_minutes);
    return config_.regulation_minutes() + (overtime_index - 1) * config_.overtime_minutes +
           in_overtime;
}

Checkpoint PaceProjector::checkpoint_for(int current_period) const {
    if (current_period <= 1) {
        return Checkpoint::FIRST_PERIOD;
    }
    if (current_period <= config_.regulation_periods / 2) {
        return Checkpoint::HALF;
    }
    return Checkpoint::LATE;
}

Result<PaceProjection> PaceProjector::project(
    const LiveGameState& state, const std::optional<PeriodCalibration>& calibration) const {
    auto valid = config_.validate();
    if (valid.is_error()) {
        return forward_error<PaceProjection>(*valid.error(), "PaceProjector");
    }
    const double elapsed = state.minutes_elapsed;
    if (!std::isfinite(elapsed)) {
        return make_error<PaceProjection>(ErrorCode::INVALID_ARGUMENT,
                                          "minutes_elapsed must be finite", "PaceProjector");
    }

    PaceProjection projection;
    if (elapsed <= 0.0 || elapsed < config_.min_elapsed_minutes) {
        return projection;
    }

    const int points = state.home_score + state.away_score;
    projection.run_rate = points / elapsed;
    projection.raw_projected_total = *projection.run_rate * config_.regulation_minutes();
    projection.projected_total = projection.raw_projected_total;

    const double regulation_remaining = config_.regulation_minutes() - elapsed;
    if (!calibration || state.period > config_.regulation_periods || regulation_remaining <= 0.0) {
        return projection;
    }

    auto home_it = calibration->team_period_averages.find(state.home_team_id);
    auto away_it = calibration->team_period_averages.find(state.away_team_id);
    if (home_it == calibration->team_period_averages.end() ||
        away_it == calibration->team_period_averages.end()) {
        return projection;
    }

    // elapsed < regulation minutes here, so the quotient fits an int
    const int current_period =
        std::min(config_.regulation_periods,
                 static_cast<int>(std::floor(elapsed / config_.period_minutes)) + 1);
    const size_t index = static_cast<size_t>(current_period - 1);
    const double minutes_into_period = std::fmod(elapsed, config_.period_minutes);
    const double period_fraction_left =
        (config_.period_minutes - minutes_into_period) / config_.period_minutes;

    auto remaining_for = [&](const std::vector<double>& averages) {
        double remaining = 0.0;
        for (size_t p = index + 1; p < averages.size(); ++p) {
            remaining += averages[p];
        }
        if (index < averages.size()) {
            remaining += averages[index] * period_fraction_left;
        }
        return remaining;
    };

    const double home_remaining = remaining_for(home_it->second);
    const double away_remaining = remaining_for(away_it->second);
    if (home_remaining + away_remaining <= 0.0) {
        return projection;
    }

    const double multiplier = calibration->multiplier(
        checkpoint_for(current_period), gap_bucket(state.home_score - state.away_score));

    projection.projected_home = state.home_score + home_remaining * multiplier;
    projection.projected_away = state.away_score + away_remaining * multiplier;
    projection.projected_total = points + (home_remaining + away_remaining) * multiplier;
    projection.calibrated = true;
    return projection;
}

}  // namespace line_ngin
