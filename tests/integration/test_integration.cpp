#include "beadview/application/beadview_app.hpp"
#include "beadview/io/jsonl_review_saver.hpp"
#include "beadview/parsers/jsonl_issue_parser.hpp"
#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>

namespace beadview {

// Mock implementations for testing
class MockTerminal : public ITerminal {
public:
    MOCK_METHOD(bool, is_interactive, (), (override));
    MOCK_METHOD(DashboardModel, run_session, (const DashboardModel& initial_model, UpdateFunction update_function),
                (override));
    MOCK_METHOD(void, restore_terminal_state, (), (override));
};

class MockClipboard : public IClipboard {
public:
    MOCK_METHOD(bool, write_all, (const std::string& text), (override));
};

class IntegrationTest : public ::testing::Test {
protected:
    void SetUp() override
    {
        dir_ = std::filesystem::temp_directory_path() / "beadview_integration_test";
        std::filesystem::remove_all(dir_);
        std::filesystem::create_directories(dir_);

        std::ofstream issues(dir_ / "issues.jsonl");
        issues << R"({"id":"bv-1","title":"Storage rewrite","status":"open","issue_type":"epic","priority":1})"
               << "\n"
               << R"({"id":"bv-1.1","title":"Index format","status":"open","issue_type":"task","priority":2,)"
               << R"("dependencies":[{"issue_id":"bv-1.1","depends_on_id":"bv-1","type":"parent-child"}]})"
               << "\n";
        issues.close();

        config_.issues_file = (dir_ / "issues.jsonl").string();
        config_.reviews_file = (dir_ / "reviews" / "reviews.jsonl").string();
        config_.root_id = "bv-1";
        config_.reviewer = "alice";

        mock_terminal_ = std::make_unique<MockTerminal>();
        mock_clipboard_ = std::make_unique<MockClipboard>();
        terminal_ptr_ = mock_terminal_.get();
        clipboard_ptr_ = mock_clipboard_.get();
    }

    void TearDown() override
    {
        std::error_code ec;
        std::filesystem::remove_all(dir_, ec);
    }

    auto make_app() -> BeadviewApp
    {
        return BeadviewApp(std::move(mock_terminal_), std::make_unique<JsonlIssueParser>(),
                           std::make_unique<JsonlReviewSaver>(config_.reviews_file), std::move(mock_clipboard_),
                           nullptr);
    }

    // The session feeds the given keys through the update function
    void replay_keys(const std::string& keys)
    {
        EXPECT_CALL(*terminal_ptr_, is_interactive()).WillOnce(testing::Return(true));
        EXPECT_CALL(*terminal_ptr_, restore_terminal_state()).Times(testing::AtLeast(1));
        EXPECT_CALL(*terminal_ptr_, run_session(testing::_, testing::_))
            .WillOnce(testing::Invoke([keys](const DashboardModel& initial, UpdateFunction update_function) {
                auto model = initial;
                for (char key : keys) {
                    if (model.is_quitting()) {
                        break;
                    }
                    model = update_function(std::move(model), KeyPress::character(key));
                }
                return model;
            }));
    }

    auto run_captured(BeadviewApp& app) -> int
    {
        std::ostringstream buffer;
        auto* old = std::cout.rdbuf(buffer.rdbuf());
        int result = app.run(config_);
        std::cout.rdbuf(old);
        output_ = buffer.str();
        return result;
    }

    std::filesystem::path dir_;
    Config config_;
    std::string output_;

    std::unique_ptr<MockTerminal> mock_terminal_;
    std::unique_ptr<MockClipboard> mock_clipboard_;
    MockTerminal* terminal_ptr_;
    MockClipboard* clipboard_ptr_;
};

TEST_F(IntegrationTest, ApproveAndSaveWritesReviewLog)
{
    replay_keys("aqq");

    auto app = make_app();
    EXPECT_EQ(run_captured(app), 0);
    EXPECT_THAT(output_, testing::HasSubstr("Saved 1 review actions to " + config_.reviews_file));

    JsonlReviewSaver saver(config_.reviews_file);
    auto records = saver.load_records();
    ASSERT_EQ(records.size(), 1);
    EXPECT_EQ(records[0].issue_id, "bv-1");
    EXPECT_EQ(records[0].author, "alice");
    EXPECT_THAT(records[0].text, testing::HasSubstr("status: approved"));
}

TEST_F(IntegrationTest, SavedReviewsAreRestoredOnNextRun)
{
    replay_keys("aqq");
    {
        auto app = make_app();
        ASSERT_EQ(run_captured(app), 0);
    }

    mock_terminal_ = std::make_unique<MockTerminal>();
    mock_clipboard_ = std::make_unique<MockClipboard>();
    config_.interactive = false;
    auto app = make_app();
    EXPECT_EQ(run_captured(app), 0);

    EXPECT_THAT(output_, testing::HasSubstr("[✓] bv-1 Storage rewrite"));
    EXPECT_THAT(output_, testing::HasSubstr("1/2 reviewed"));
}

TEST_F(IntegrationTest, DryRunSkipsSaving)
{
    config_.dry_run = true;
    replay_keys("aqq");

    auto app = make_app();
    EXPECT_EQ(run_captured(app), 0);

    EXPECT_THAT(output_, testing::HasSubstr("Dry run - 1 review actions not saved."));
    EXPECT_FALSE(std::filesystem::exists(config_.reviews_file));
}

TEST_F(IntegrationTest, DiscardLeavesLogUntouched)
{
    replay_keys("aqQ");

    auto app = make_app();
    EXPECT_EQ(run_captured(app), 0);

    EXPECT_THAT(output_, testing::HasSubstr("Discarded 1 review actions."));
    EXPECT_FALSE(std::filesystem::exists(config_.reviews_file));
}

TEST_F(IntegrationTest, QuitWithoutActionsSavesNothing)
{
    replay_keys("q");

    auto app = make_app();
    EXPECT_EQ(run_captured(app), 0);

    EXPECT_THAT(output_, testing::Not(testing::HasSubstr("Saved")));
    EXPECT_FALSE(std::filesystem::exists(config_.reviews_file));
}

TEST_F(IntegrationTest, CopyPromptWritesClipboard)
{
    EXPECT_CALL(*clipboard_ptr_, write_all(testing::HasSubstr("bv-1 → approved"))).WillOnce(testing::Return(true));
    replay_keys("aqpQ");

    auto app = make_app();
    EXPECT_EQ(run_captured(app), 0);
}

} // namespace beadview
