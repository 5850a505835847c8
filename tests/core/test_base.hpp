//===== test_base.hpp =====
#pragma once

#ifndef TESTING
#define TESTING
#endif

#include <gtest/gtest.h>
#include <chrono>
#include <optional>
#include <string>
#include "line_ngin/core/logger.hpp"
#include "line_ngin/core/types.hpp"

namespace line_ngin {
namespace testing {

class TestBase : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::reset_for_tests();
        LoggerConfig config;
        config.min_level = LogLevel::ERR;
        config.destination = LogDestination::CONSOLE;
        Logger::instance().initialize(config);
    }

    void TearDown() override {
        Logger::reset_for_tests();
    }

    static Timestamp day(int n) {
        // 2024-09-05T00:00:00Z plus n days
        return std::chrono::system_clock::from_time_t(1725494400) + std::chrono::hours(24 * n);
    }

    static Team make_team(const std::string& id, double scored = 0.0, double allowed = 0.0) {
        Team team;
        team.id = id;
        team.abbreviation = id;
        team.points_scored_avg = scored;
        team.points_allowed_avg = allowed;
        return team;
    }

    static Game make_final(const std::string& id, const std::string& home,
                           const std::string& away, int home_score, int away_score,
                           Timestamp when) {
        Game game;
        game.id = id;
        game.home_team_id = home;
        game.away_team_id = away;
        game.scheduled_time = when;
        game.status = GameStatus::FINAL;
        game.home_score = home_score;
        game.away_score = away_score;
        return game;
    }

    static MarketLine make_line(const std::string& game_id, std::optional<double> spread,
                                std::optional<double> total) {
        MarketLine line;
        line.game_id = game_id;
        line.spread = spread;
        line.total = total;
        line.captured_at = day(0);
        return line;
    }
};

}  // namespace testing
}  // namespace line_ngin
