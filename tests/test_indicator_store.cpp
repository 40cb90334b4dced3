#include <gtest/gtest.h>

#include "warden/stores/indicator_store.hpp"
#include "test_helpers.hpp"

using namespace warden;
using namespace warden::stores;
using core::IndicatorType;

namespace {

IntelIndicator Make(IndicatorType type, const std::string& value,
                    core::Severity severity = core::Severity::MEDIUM) {
    IntelIndicator indicator;
    indicator.type = type;
    indicator.value = value;
    indicator.severity = severity;
    indicator.confidence = 80;
    indicator.source = "unit";
    return indicator;
}

} // namespace

class IndicatorStoreTest : public ::testing::Test {
protected:
    test::ManualClock clock_;
    IndicatorStore store_{clock_.Function()};
};

TEST_F(IndicatorStoreTest, LookupReturnsMatch) {
    store_.Add(Make(IndicatorType::IP, "203.0.113.7", core::Severity::CRITICAL));

    auto match = store_.Lookup(IndicatorType::IP, "203.0.113.7");
    ASSERT_TRUE(match.has_value());
    EXPECT_EQ(match->severity, core::Severity::CRITICAL);
    EXPECT_EQ(match->indicator.confidence, 80);

    EXPECT_FALSE(store_.Lookup(IndicatorType::IP, "203.0.113.8").has_value());
    EXPECT_FALSE(store_.Lookup(IndicatorType::USER, "203.0.113.7").has_value());
}

TEST_F(IndicatorStoreTest, DomainsAreCaseInsensitive) {
    store_.Add(Make(IndicatorType::DOMAIN, "Evil.Example.COM"));
    EXPECT_TRUE(store_.Lookup(IndicatorType::DOMAIN, "evil.example.com").has_value());
}

TEST_F(IndicatorStoreTest, AddReplacesExisting) {
    store_.Add(Make(IndicatorType::USER, "42", core::Severity::LOW));
    store_.Add(Make(IndicatorType::USER, "42", core::Severity::HIGH));

    EXPECT_EQ(store_.Size(), 1u);
    EXPECT_EQ(store_.Get(IndicatorType::USER, "42")->severity, core::Severity::HIGH);
}

TEST_F(IndicatorStoreTest, RejectsInvalidIndicators) {
    EXPECT_THROW(store_.Add(Make(IndicatorType::IP, "   ")), core::ValidationError);

    auto bad = Make(IndicatorType::IP, "10.0.0.1");
    bad.confidence = 150;
    EXPECT_THROW(store_.Add(bad), core::ValidationError);
    EXPECT_EQ(store_.Size(), 0u);
}

TEST_F(IndicatorStoreTest, ExpiredEntriesAreDroppedOnLookup) {
    auto temporary = Make(IndicatorType::IP, "10.0.0.1");
    temporary.expires_at = clock_.Now() + std::chrono::hours(1);
    store_.Add(temporary);

    EXPECT_TRUE(store_.Lookup(IndicatorType::IP, "10.0.0.1").has_value());

    clock_.Advance(std::chrono::hours(2));
    EXPECT_FALSE(store_.Lookup(IndicatorType::IP, "10.0.0.1").has_value());
    EXPECT_EQ(store_.Size(), 0u);
    EXPECT_EQ(store_.GetStats().expired_removed, 1u);
}

TEST_F(IndicatorStoreTest, PurgeExpiredRemovesOnlyExpired) {
    auto temporary = Make(IndicatorType::IP, "10.0.0.1");
    temporary.expires_at = clock_.Now() + std::chrono::minutes(5);
    store_.Add(temporary);
    store_.Add(Make(IndicatorType::IP, "10.0.0.2"));

    clock_.Advance(std::chrono::minutes(10));
    EXPECT_EQ(store_.PurgeExpired(), 1u);
    EXPECT_EQ(store_.Size(), 1u);
    EXPECT_TRUE(store_.Get(IndicatorType::IP, "10.0.0.2").has_value());
}

TEST_F(IndicatorStoreTest, StatsCountLookupsAndHits) {
    store_.Add(Make(IndicatorType::IP, "10.0.0.1", core::Severity::HIGH));
    store_.Add(Make(IndicatorType::USER, "42", core::Severity::HIGH));

    store_.Lookup(IndicatorType::IP, "10.0.0.1");
    store_.Lookup(IndicatorType::IP, "10.0.0.9");

    auto stats = store_.GetStats();
    EXPECT_EQ(stats.total, 2u);
    EXPECT_EQ(stats.by_type.at("ip"), 1u);
    EXPECT_EQ(stats.by_severity.at("high"), 2u);
    EXPECT_EQ(stats.lookups, 2u);
    EXPECT_EQ(stats.hits, 1u);
}
