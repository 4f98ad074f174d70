#include "beadview/application/beadview_app.hpp"
#include "beadview/core/review_comment.hpp"
#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>

namespace beadview {

// Mock implementations for testing batch mode
class MockTerminalBatch : public ITerminal {
public:
    MOCK_METHOD(bool, is_interactive, (), (override));
    MOCK_METHOD(DashboardModel, run_session, (const DashboardModel&, UpdateFunction), (override));
    MOCK_METHOD(void, restore_terminal_state, (), (override));
};

class MockIssueParserBatch : public IIssueParser {
public:
    MOCK_METHOD(std::vector<Issue>, parse_issues, (const std::string&), (override));
};

class MockReviewSaverBatch : public IReviewSaver {
public:
    MOCK_METHOD(SaveResult, save, (const std::vector<ReviewAction>&), (override));
    MOCK_METHOD(std::vector<ReviewRecord>, load_records, (), (override));
};

class MockClipboardBatch : public IClipboard {
public:
    MOCK_METHOD(bool, write_all, (const std::string&), (override));
};

// Redirects a stream into a string for the lifetime of the object
class StreamCapture {
public:
    explicit StreamCapture(std::ostream& stream) : stream_(stream), old_(stream.rdbuf(buffer_.rdbuf())) {}
    ~StreamCapture() { stream_.rdbuf(old_); }

    auto str() const -> std::string { return buffer_.str(); }

private:
    std::ostream& stream_;
    std::ostringstream buffer_;
    std::streambuf* old_;
};

class BatchModeTest : public ::testing::Test {
protected:
    void SetUp() override {
        mock_terminal_ = std::make_unique<MockTerminalBatch>();
        mock_parser_ = std::make_unique<MockIssueParserBatch>();
        mock_saver_ = std::make_unique<MockReviewSaverBatch>();
        mock_clipboard_ = std::make_unique<MockClipboardBatch>();

        // Capture raw pointers before moving to app
        terminal_ptr_ = mock_terminal_.get();
        parser_ptr_ = mock_parser_.get();
        saver_ptr_ = mock_saver_.get();

        issues_path_ = std::filesystem::temp_directory_path() / "beadview_batch_issues.jsonl";
        std::ofstream(issues_path_) << "{}\n";

        config_.issues_file = issues_path_.string();
        config_.root_id = "bv-1";
        config_.reviewer = "alice";
        config_.interactive = false;
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove(issues_path_, ec);
    }

    auto make_app() -> BeadviewApp {
        return BeadviewApp(std::move(mock_terminal_), std::move(mock_parser_), std::move(mock_saver_),
                           std::move(mock_clipboard_), nullptr);
    }

    static auto make_issue(const std::string& id, const std::string& title, const std::string& parent = "")
        -> Issue {
        Issue issue;
        issue.id = id;
        issue.title = title;
        if (!parent.empty()) {
            issue.dependencies.push_back(
                Dependency{.issue_id = id, .depends_on_id = parent, .type = DependencyType::PARENT_CHILD});
        }
        return issue;
    }

    std::unique_ptr<MockTerminalBatch> mock_terminal_;
    std::unique_ptr<MockIssueParserBatch> mock_parser_;
    std::unique_ptr<MockReviewSaverBatch> mock_saver_;
    std::unique_ptr<MockClipboardBatch> mock_clipboard_;

    // Raw pointers for setting expectations
    MockTerminalBatch* terminal_ptr_;
    MockIssueParserBatch* parser_ptr_;
    MockReviewSaverBatch* saver_ptr_;

    std::filesystem::path issues_path_;
    Config config_;
};

TEST_F(BatchModeTest, PrintsTreeAndReviewCount)
{
    auto approved = make_issue("bv-1.1", "Index format", "bv-1");
    auto blocked = make_issue("bv-1.2", "Cache", "bv-1");
    blocked.dependencies.push_back(
        Dependency{.issue_id = "bv-1.2", .depends_on_id = "bv-9", .type = DependencyType::BLOCKS});
    auto blocker = make_issue("bv-9", "Compiler upgrade");
    blocker.status = Status::IN_PROGRESS;

    std::vector<Issue> issues = {make_issue("bv-1", "Storage rewrite"), approved, blocked, blocker};

    ReviewAction action{.issue_id = "bv-1.1",
                        .outcome = ReviewOutcome::APPROVED,
                        .reviewer = "bob",
                        .notes = "",
                        .review_type = "plan",
                        .timestamp = Clock::from_time_t(1'767'621'780)};
    std::vector<ReviewRecord> records = {ReviewRecord{
        .issue_id = "bv-1.1", .author = "bob", .text = format_review_comment(action), .created_at = ""}};

    EXPECT_CALL(*parser_ptr_, parse_issues(testing::_)).WillOnce(testing::Return(issues));
    EXPECT_CALL(*saver_ptr_, load_records()).WillOnce(testing::Return(records));
    EXPECT_CALL(*terminal_ptr_, run_session(testing::_, testing::_)).Times(0);
    EXPECT_CALL(*saver_ptr_, save(testing::_)).Times(0);

    auto app = make_app();
    int result = 0;
    std::string output;
    {
        StreamCapture capture(std::cout);
        result = app.run(config_);
        output = capture.str();
    }

    EXPECT_EQ(result, 0);
    EXPECT_THAT(output, testing::HasSubstr("Reviewing bv-1 (3 issues, 1 external blockers)"));
    EXPECT_THAT(output, testing::HasSubstr("[ ] bv-1 Storage rewrite\n"));
    EXPECT_THAT(output, testing::HasSubstr("[✓] ├─ bv-1.1 Index format\n"));
    EXPECT_THAT(output, testing::HasSubstr("[ ] └─ bv-1.2 Cache\n"));
    EXPECT_THAT(output, testing::HasSubstr("BLOCKERS (external)\n  bv-9 Compiler upgrade [in_progress]\n"));
    EXPECT_THAT(output, testing::HasSubstr("1/3 reviewed"));
}

TEST_F(BatchModeTest, NonInteractiveTerminalFallsBackToBatch)
{
    config_.interactive = true;

    EXPECT_CALL(*parser_ptr_, parse_issues(testing::_))
        .WillOnce(testing::Return(std::vector<Issue>{make_issue("bv-1", "Storage rewrite")}));
    EXPECT_CALL(*saver_ptr_, load_records()).WillOnce(testing::Return(std::vector<ReviewRecord>{}));
    EXPECT_CALL(*terminal_ptr_, is_interactive()).WillOnce(testing::Return(false));
    EXPECT_CALL(*terminal_ptr_, run_session(testing::_, testing::_)).Times(0);

    auto app = make_app();
    std::string output;
    {
        StreamCapture capture(std::cout);
        EXPECT_EQ(app.run(config_), 0);
        output = capture.str();
    }

    EXPECT_THAT(output, testing::HasSubstr("0/1 reviewed"));
}

TEST_F(BatchModeTest, MissingRootReportsError)
{
    config_.root_id = "bv-404";

    EXPECT_CALL(*parser_ptr_, parse_issues(testing::_))
        .WillOnce(testing::Return(std::vector<Issue>{make_issue("bv-1", "Storage rewrite")}));
    EXPECT_CALL(*saver_ptr_, load_records()).WillOnce(testing::Return(std::vector<ReviewRecord>{}));

    auto app = make_app();
    std::string errors;
    {
        StreamCapture capture(std::cerr);
        EXPECT_EQ(app.run(config_), 1);
        errors = capture.str();
    }

    EXPECT_THAT(errors, testing::HasSubstr("issue not found: bv-404"));
}

TEST_F(BatchModeTest, UnreadableIssuesFileReportsError)
{
    config_.issues_file = (std::filesystem::temp_directory_path() / "beadview_missing" / "issues.jsonl").string();

    EXPECT_CALL(*parser_ptr_, parse_issues(testing::_)).Times(0);

    auto app = make_app();
    std::string errors;
    {
        StreamCapture capture(std::cerr);
        EXPECT_EQ(app.run(config_), 1);
        errors = capture.str();
    }

    EXPECT_THAT(errors, testing::HasSubstr("Could not read issues from"));
}

TEST_F(BatchModeTest, MergeAttachesRecordsToKnownIssues)
{
    std::vector<Issue> issues = {make_issue("bv-1", "Storage rewrite"), make_issue("bv-2", "Other")};
    std::vector<ReviewRecord> records = {
        ReviewRecord{.issue_id = "bv-2", .author = "bob", .text = "looks fine", .created_at = "2026-01-05T14:03:00Z"},
        ReviewRecord{.issue_id = "bv-99", .author = "bob", .text = "stale", .created_at = ""}};

    EXPECT_EQ(merge_review_records(issues, records), 1);
    EXPECT_TRUE(issues[0].comments.empty());
    ASSERT_EQ(issues[1].comments.size(), 1);
    EXPECT_EQ(issues[1].comments[0].author, "bob");
    EXPECT_EQ(issues[1].comments[0].created_at, Clock::from_time_t(1'767'621'780));
}

} // namespace beadview
