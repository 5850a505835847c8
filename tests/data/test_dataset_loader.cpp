#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include "../core/test_base.hpp"
#include "line_ngin/data/dataset_loader.hpp"
#include "line_ngin/data/record_codec.hpp"

using namespace line_ngin;
using namespace line_ngin::testing;
using nlohmann::json;

class DatasetLoaderTest : public TestBase {
protected:
    void SetUp() override {
        TestBase::SetUp();
        test_dir_ = std::filesystem::temp_directory_path() / "line_ngin_dataset_test";
        std::filesystem::create_directories(test_dir_);
    }

    void TearDown() override {
        std::filesystem::remove_all(test_dir_);
        TestBase::TearDown();
    }

    static json sample_dataset() {
        json j;
        j["sport"] = "nfl";
        j["teams"] =
            json::array({codec::encode(make_team("KC")), codec::encode(make_team("BAL"))});
        j["games"] = json::array({codec::encode(make_final("g1", "KC", "BAL", 27, 20, day(1))),
                                  codec::encode(make_final("g2", "BAL", "KC", 24, 24, day(8)))});
        j["lines"] = json::array({codec::encode(make_line("g1", -3.0, 46.5))});
        return j;
    }

    std::filesystem::path test_dir_;
};

TEST_F(DatasetLoaderTest, ParsesDataset) {
    auto result = DatasetLoader::parse(sample_dataset());
    ASSERT_TRUE(result.is_ok()) << result.error()->what();

    const Dataset& dataset = result.value();
    EXPECT_EQ(dataset.sport, Sport::NFL);
    EXPECT_EQ(dataset.teams.size(), 2u);
    EXPECT_EQ(dataset.games.size(), 2u);
    ASSERT_EQ(dataset.lines.count("g1"), 1u);
    EXPECT_DOUBLE_EQ(*dataset.lines.at("g1").spread, -3.0);
}

TEST_F(DatasetLoaderTest, SectionsAreOptional) {
    auto result = DatasetLoader::parse(json{{"sport", "nhl"}});
    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value().sport, Sport::NHL);
    EXPECT_TRUE(result.value().games.empty());
}

TEST_F(DatasetLoaderTest, RejectsMalformedDocuments) {
    json unknown = sample_dataset();
    unknown["injuries"] = json::array();
    EXPECT_TRUE(DatasetLoader::parse(unknown).is_error());

    json no_sport = sample_dataset();
    no_sport.erase("sport");
    EXPECT_TRUE(DatasetLoader::parse(no_sport).is_error());

    json bad_sport = sample_dataset();
    bad_sport["sport"] = "mlb";
    EXPECT_TRUE(DatasetLoader::parse(bad_sport).is_error());

    json not_array = sample_dataset();
    not_array["games"] = json::object();
    EXPECT_TRUE(DatasetLoader::parse(not_array).is_error());

    EXPECT_TRUE(DatasetLoader::parse(json::array()).is_error());
}

TEST_F(DatasetLoaderTest, RejectsInconsistentRecords) {
    json duplicate_game = sample_dataset();
    duplicate_game["games"].push_back(duplicate_game["games"][0]);
    auto dup_result = DatasetLoader::parse(duplicate_game);
    ASSERT_TRUE(dup_result.is_error());
    EXPECT_EQ(dup_result.error()->code(), ErrorCode::INVALID_DATA);

    json orphan_line = sample_dataset();
    orphan_line["lines"].push_back(codec::encode(make_line("g9", -1.0, 40.0)));
    EXPECT_TRUE(DatasetLoader::parse(orphan_line).is_error());

    json duplicate_line = sample_dataset();
    duplicate_line["lines"].push_back(codec::encode(make_line("g1", -3.5, 46.5)));
    EXPECT_TRUE(DatasetLoader::parse(duplicate_line).is_error());

    json bad_game = sample_dataset();
    bad_game["games"][1]["home_score"] = "24";
    auto bad_result = DatasetLoader::parse(bad_game);
    ASSERT_TRUE(bad_result.is_error());
    EXPECT_EQ(bad_result.error()->component(), "DatasetLoader");
}

TEST_F(DatasetLoaderTest, WriteThenLoad) {
    std::filesystem::path path = test_dir_ / "nfl.json";
    ASSERT_TRUE(DatasetLoader::write_json(path.string(), sample_dataset()).is_ok());

    auto result = DatasetLoader::load_file(path.string());
    ASSERT_TRUE(result.is_ok()) << result.error()->what();
    EXPECT_EQ(result.value().games.size(), 2u);
    ASSERT_TRUE(result.value().games[1].home_score.has_value());
    EXPECT_EQ(*result.value().games[1].home_score, 24);
}

TEST_F(DatasetLoaderTest, FileErrors) {
    auto missing = DatasetLoader::load_file((test_dir_ / "missing.json").string());
    ASSERT_TRUE(missing.is_error());
    EXPECT_EQ(missing.error()->code(), ErrorCode::FILE_NOT_FOUND);

    std::filesystem::path broken = test_dir_ / "broken.json";
    {
        std::ofstream file(broken);
        file << "{ \"sport\": \"nfl\", \"games\": [";
    }
    auto parse_error = DatasetLoader::load_file(broken.string());
    ASSERT_TRUE(parse_error.is_error());
    EXPECT_EQ(parse_error.error()->code(), ErrorCode::JSON_PARSE_ERROR);

    auto unwritable = DatasetLoader::write_json((test_dir_ / "no_dir" / "out.json").string(),
                                                json::object());
    ASSERT_TRUE(unwritable.is_error());
    EXPECT_EQ(unwritable.error()->code(), ErrorCode::FILE_IO_ERROR);
}
