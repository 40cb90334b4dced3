#include <gtest/gtest.h>

#include "warden/stores/rule_store.hpp"
#include "warden/analyzers/correlation_engine.hpp"

using namespace warden;
using analyzers::CorrelationRule;

using CorrelationRules = stores::RuleStore<CorrelationRule>;

class RuleStoreTest : public ::testing::Test {
protected:
    CorrelationRules store_{analyzers::ValidateRule, analyzers::DefaultCorrelationRules()};
};

TEST_F(RuleStoreTest, LoadsDefaultsInOrder) {
    auto rules = store_.List();
    ASSERT_EQ(rules.size(), 6u);
    EXPECT_EQ(rules.front().id, "coordinated_brute_force");
    EXPECT_EQ(rules.back().id, "session_manipulation");
}

TEST_F(RuleStoreTest, AddRejectsDuplicateIds) {
    auto duplicate = *store_.Get("lateral_movement");
    EXPECT_THROW(store_.Add(duplicate), core::ValidationError);
    EXPECT_EQ(store_.Size(), 6u);
}

TEST_F(RuleStoreTest, InvalidRuleLeavesStoreUnchanged) {
    auto rule = *store_.Get("lateral_movement");
    rule.min_events = 0;
    EXPECT_THROW(store_.Update(rule), core::ValidationError);
    EXPECT_EQ(store_.Get("lateral_movement")->min_events, 5);
}

TEST_F(RuleStoreTest, UpdateUnknownIdFails) {
    auto rule = *store_.Get("lateral_movement");
    rule.id = "not_there";
    EXPECT_THROW(store_.Update(rule), core::ValidationError);
}

TEST_F(RuleStoreTest, EnableDisableAndRemove) {
    EXPECT_TRUE(store_.SetEnabled("reconnaissance_activity", false));
    EXPECT_FALSE(store_.Get("reconnaissance_activity")->enabled);
    EXPECT_FALSE(store_.SetEnabled("missing", false));

    EXPECT_TRUE(store_.Remove("reconnaissance_activity"));
    EXPECT_FALSE(store_.Remove("reconnaissance_activity"));
    EXPECT_FALSE(store_.Get("reconnaissance_activity").has_value());
}

TEST_F(RuleStoreTest, ReplaceIsAllOrNothing) {
    auto rules = analyzers::DefaultCorrelationRules();
    rules.resize(2);
    rules.push_back(rules.front());   // duplicate id

    EXPECT_THROW(store_.Replace(rules), core::ValidationError);
    EXPECT_EQ(store_.Size(), 6u);

    rules.pop_back();
    store_.Replace(rules);
    EXPECT_EQ(store_.Size(), 2u);
}

TEST_F(RuleStoreTest, ListIsASnapshot) {
    auto snapshot = store_.List();
    store_.Remove("coordinated_brute_force");
    EXPECT_EQ(snapshot.size(), 6u);
    EXPECT_EQ(store_.Size(), 5u);
}
