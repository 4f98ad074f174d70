#include "beadview/ui/label_selector.hpp"
#include "beadview/io/subsequence_fuzzy_matcher.hpp"
#include <gtest/gtest.h>

namespace beadview {

class LabelSelectorTest : public ::testing::Test {
protected:
    static auto make_issue(const std::string& id, const std::string& title, std::vector<std::string> labels,
                           IssueType type = IssueType::TASK) -> Issue
    {
        Issue issue;
        issue.id = id;
        issue.title = title;
        issue.labels = std::move(labels);
        issue.issue_type = type;
        return issue;
    }

    void SetUp() override
    {
        auto catalog = build_selector_catalog({
            make_issue("bv-1", "Storage rewrite", {}, IssueType::EPIC),
            make_issue("bv-1.1", "Index format", {"backend", "urgent"}),
            make_issue("bv-1.2", "Query planner", {"backend", "api"}),
            make_issue("bv-1.3", "Cache layer", {"backend", "urgent", "api"}),
            make_issue("bv-2", "Landing page", {"frontend"}),
        });
        selector_ = LabelSelector(catalog, std::make_shared<SubsequenceFuzzyMatcher>());
    }

    auto type(const std::string& text) -> void
    {
        for (char c : text) {
            selector_.handle_key(KeyPress::character(c));
        }
    }

    auto press(InputEvent event) -> void { selector_.handle_key(KeyPress::of(event)); }

    static auto values(const std::vector<LabelItem>& items) -> std::vector<std::string>
    {
        std::vector<std::string> result;
        for (const auto& item : items) {
            result.push_back(item.value);
        }
        return result;
    }

    LabelSelector selector_;
};

TEST_F(LabelSelectorTest, StartsInNormalModeWithEverything)
{
    EXPECT_FALSE(selector_.is_insert_mode());
    EXPECT_EQ(selector_.outcome(), SelectorOutcome::PENDING);
    EXPECT_EQ(values(selector_.candidates()),
              (std::vector<std::string>{"bv-1", "api", "backend", "frontend", "urgent"}));
}

TEST_F(LabelSelectorTest, SearchThenConfirm)
{
    type("i");
    EXPECT_EQ(selector_.insert_variant(), InsertVariant::SEARCH);

    type("frnt");
    EXPECT_EQ(values(selector_.candidates()), (std::vector<std::string>{"frontend"}));

    press(InputEvent::ENTER);
    EXPECT_EQ(selector_.outcome(), SelectorOutcome::CONFIRMED);
    ASSERT_TRUE(selector_.selected_item().has_value());
    EXPECT_EQ(selector_.selected_item()->value, "frontend");
    EXPECT_TRUE(selector_.scoped_labels().empty());
    EXPECT_FALSE(selector_.is_insert_mode());
}

TEST_F(LabelSelectorTest, NavigationKeysAreTextInInsertMode)
{
    type("/");
    type("jk");

    EXPECT_EQ(selector_.search_text(), "jk");
    EXPECT_EQ(selector_.selected_index(), 0);
}

TEST_F(LabelSelectorTest, EscapeFromSearchKeepsText)
{
    type("ibackend");
    press(InputEvent::ESCAPE);

    EXPECT_FALSE(selector_.is_insert_mode());
    EXPECT_EQ(selector_.search_text(), "backend");
    EXPECT_EQ(selector_.outcome(), SelectorOutcome::PENDING);

    // Backspace in normal mode drops the whole search
    press(InputEvent::BACKSPACE);
    EXPECT_TRUE(selector_.search_text().empty());
    EXPECT_EQ(selector_.candidates().size(), 5);
}

TEST_F(LabelSelectorTest, BackspaceRemovesWholeUtf8Character)
{
    type("i");
    selector_.handle_key(KeyPress{InputEvent::CHARACTER, "é"});
    type("x");
    press(InputEvent::BACKSPACE);
    press(InputEvent::BACKSPACE);

    EXPECT_TRUE(selector_.search_text().empty());
}

TEST_F(LabelSelectorTest, ScopeAddStaysInScopeMode)
{
    type("s");
    EXPECT_EQ(selector_.insert_variant(), InsertVariant::SCOPE_ADD);

    type("backend");
    ASSERT_FALSE(selector_.candidates().empty());
    EXPECT_EQ(selector_.candidates()[0].value, "backend");
    press(InputEvent::ENTER);

    EXPECT_EQ(selector_.insert_variant(), InsertVariant::SCOPE_ADD);
    EXPECT_EQ(selector_.scope_labels(), (std::vector<std::string>{"backend"}));
    EXPECT_TRUE(selector_.search_text().empty());
    EXPECT_EQ(values(selector_.candidates()), (std::vector<std::string>{"api", "urgent"}));
    EXPECT_EQ(selector_.outcome(), SelectorOutcome::PENDING);
}

TEST_F(LabelSelectorTest, ConfirmInsideScopeReportsScopedLabels)
{
    type("sbackend");
    press(InputEvent::ENTER);
    press(InputEvent::ESCAPE);
    press(InputEvent::ARROW_DOWN);
    press(InputEvent::ENTER);

    EXPECT_EQ(selector_.outcome(), SelectorOutcome::CONFIRMED);
    EXPECT_EQ(selector_.selected_item()->value, "urgent");
    EXPECT_EQ(selector_.scoped_labels(), (std::vector<std::string>{"backend", "urgent"}));
}

TEST_F(LabelSelectorTest, SearchRunsInsideScope)
{
    type("sbackend");
    press(InputEvent::ENTER);
    press(InputEvent::ESCAPE);

    type("i");
    type("end");

    // frontend matches the text but is outside the scope
    EXPECT_TRUE(selector_.candidates().empty());
}

TEST_F(LabelSelectorTest, EscapeClearsScopeBeforeCancelling)
{
    type("sbackend");
    press(InputEvent::ENTER);
    press(InputEvent::ESCAPE);
    ASSERT_TRUE(selector_.is_scope_active());

    press(InputEvent::ESCAPE);
    EXPECT_FALSE(selector_.is_scope_active());
    EXPECT_EQ(selector_.outcome(), SelectorOutcome::PENDING);
    EXPECT_EQ(selector_.candidates().size(), 5);

    press(InputEvent::ESCAPE);
    EXPECT_EQ(selector_.outcome(), SelectorOutcome::CANCELLED);
    EXPECT_FALSE(selector_.selected_item().has_value());
}

TEST_F(LabelSelectorTest, BackspacePopsLastScopeLabel)
{
    type("sbackend");
    press(InputEvent::ENTER);
    type("urgent");
    press(InputEvent::ENTER);
    press(InputEvent::ESCAPE);
    ASSERT_EQ(selector_.scope_labels().size(), 2);

    press(InputEvent::BACKSPACE);

    EXPECT_EQ(selector_.scope_labels(), (std::vector<std::string>{"backend"}));
    EXPECT_EQ(values(selector_.candidates()), (std::vector<std::string>{"api", "urgent"}));
}

TEST_F(LabelSelectorTest, ReviewLookupByIdPrefixThenTitle)
{
    type("r");
    EXPECT_EQ(selector_.insert_variant(), InsertVariant::REVIEW_LOOKUP);
    EXPECT_TRUE(selector_.candidates().empty());

    type("BV-1.");
    EXPECT_EQ(values(selector_.candidates()), (std::vector<std::string>{"bv-1.1", "bv-1.2", "bv-1.3"}));
    EXPECT_EQ(selector_.candidates()[0].type, SelectorItemType::BEAD);

    for (size_t i = 0; i < 5; ++i) {
        press(InputEvent::BACKSPACE);
    }
    type("layer");
    EXPECT_EQ(values(selector_.candidates()), (std::vector<std::string>{"bv-1.3"}));

    press(InputEvent::ENTER);
    EXPECT_EQ(selector_.outcome(), SelectorOutcome::CONFIRMED);
    EXPECT_EQ(selector_.selected_item()->type, SelectorItemType::BEAD);
}

TEST_F(LabelSelectorTest, EscapeFromLookupRestoresList)
{
    type("rbv");
    press(InputEvent::ESCAPE);

    EXPECT_FALSE(selector_.is_insert_mode());
    EXPECT_TRUE(selector_.search_text().empty());
    EXPECT_EQ(selector_.candidates().size(), 5);
}

TEST_F(LabelSelectorTest, NormalModeNavigationIsClamped)
{
    type("k");
    EXPECT_EQ(selector_.selected_index(), 0);

    type("jjjjjjjj");
    EXPECT_EQ(selector_.selected_index(), 4);

    press(InputEvent::ARROW_UP);
    EXPECT_EQ(selector_.selected_index(), 3);
}

TEST_F(LabelSelectorTest, QuitCancelsAndResetStartsOver)
{
    type("q");
    EXPECT_EQ(selector_.outcome(), SelectorOutcome::CANCELLED);
    EXPECT_FALSE(selector_.handle_key(KeyPress::character('j')));

    selector_.reset();
    EXPECT_EQ(selector_.outcome(), SelectorOutcome::PENDING);
    EXPECT_EQ(selector_.candidates().size(), 5);
}

TEST_F(LabelSelectorTest, EnterWithNoCandidatesDoesNothing)
{
    type("izzzz");
    press(InputEvent::ENTER);

    EXPECT_EQ(selector_.outcome(), SelectorOutcome::PENDING);
    EXPECT_TRUE(selector_.is_insert_mode());
}

} // namespace beadview
