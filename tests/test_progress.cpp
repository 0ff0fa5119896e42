#include <gtest/gtest.h>
#include <cmath>
#include <limits>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "relay/progress.hpp"
#include "test_support.hpp"

using namespace relay;

// --- Test Suite ---
class ProgressTest : public ::testing::Test {
protected:
    void SetUp() override {
        reporter_.on_progress_changed().connect_with_type(
            [this](float value) { progress_.push_back(value); }, connection_type::direct);
        reporter_.on_message_changed().connect_with_type(
            [this](const std::string& text) { messages_.push_back(text); }, connection_type::direct);
        reporter_.on_updated().connect_with_type(
            [this](const progress_update& update) { updates_.push_back(update); }, connection_type::direct);
    }

    progress_reporter            reporter_;
    std::vector<float>           progress_;
    std::vector<std::string>     messages_;
    std::vector<progress_update> updates_;
};

// 1. Values are clamped into [0, 1]
TEST_F(ProgressTest, ClampsValues) {
    reporter_.set_progress(1.5f);
    EXPECT_FLOAT_EQ(reporter_.progress(), 1.0f);

    reporter_.set_progress(-0.5f);
    EXPECT_FLOAT_EQ(reporter_.progress(), 0.0f);

    reporter_.set_progress(0.3f);
    reporter_.set_progress(std::numeric_limits<float>::quiet_NaN());
    EXPECT_FLOAT_EQ(reporter_.progress(), 0.0f);

    EXPECT_EQ(progress_, (std::vector<float>{1.0f, 0.0f, 0.3f, 0.0f}));
}

// 2. Only changes are emitted
TEST_F(ProgressTest, NoRedundantEmits) {
    reporter_.set_progress(0.5f);
    reporter_.set_progress(0.5f);
    reporter_.set_progress(0.0f);
    reporter_.set_progress(-1.0f);

    EXPECT_EQ(progress_, (std::vector<float>{0.5f, 0.0f}));
    EXPECT_EQ(updates_.size(), 2u);
}

TEST_F(ProgressTest, StartsAtZeroWithoutMessage) {
    EXPECT_FLOAT_EQ(reporter_.progress(), 0.0f);
    EXPECT_FALSE(reporter_.message().has_value());

    reporter_.set_progress(0.0f);
    EXPECT_TRUE(progress_.empty());
}

// 3. Messages
TEST_F(ProgressTest, SetMessage) {
    reporter_.set_message("loading");
    reporter_.set_message("loading");
    reporter_.set_message("parsing");

    EXPECT_EQ(reporter_.message(), "parsing");
    EXPECT_EQ(messages_, (std::vector<std::string>{"loading", "parsing"}));
    ASSERT_EQ(updates_.size(), 2u);
    EXPECT_EQ(updates_[1], (progress_update{0.0f, std::string("parsing")}));
}

// 4. update emits on_updated once
TEST_F(ProgressTest, UpdateEmitsOnce) {
    reporter_.update(0.4f, "step 2");

    ASSERT_EQ(updates_.size(), 1u);
    EXPECT_EQ(updates_[0], (progress_update{0.4f, std::string("step 2")}));
    EXPECT_EQ(progress_, (std::vector<float>{0.4f}));
    EXPECT_EQ(messages_, (std::vector<std::string>{"step 2"}));

    reporter_.update(0.4f, "step 2");
    EXPECT_EQ(updates_.size(), 1u);

    reporter_.update(0.4f, "step 3");
    EXPECT_EQ(updates_.size(), 2u);
    EXPECT_EQ(progress_.size(), 1u);
}

// 5. reset always notifies
TEST_F(ProgressTest, ResetNotifies) {
    reporter_.update(0.7f, "almost");
    reporter_.reset();

    EXPECT_FLOAT_EQ(reporter_.progress(), 0.0f);
    EXPECT_FALSE(reporter_.message().has_value());
    EXPECT_EQ(progress_.back(), 0.0f);
    EXPECT_EQ(updates_.back(), progress_update{});

    reporter_.reset();
    EXPECT_EQ(progress_.size(), 3u);
}

// 6. Copies share state
TEST_F(ProgressTest, CopiesShareState) {
    progress_reporter copy = reporter_;
    copy.set_progress(0.6f);

    EXPECT_TRUE(copy == reporter_);
    EXPECT_FLOAT_EQ(reporter_.progress(), 0.6f);
    EXPECT_EQ(progress_, (std::vector<float>{0.6f}));
    EXPECT_FALSE(progress_reporter{} == reporter_);
}

// --- Aggregate Progress ---
class AggregateProgressTest : public ::testing::Test {
protected:
    aggregate_progress aggregate_;
};

// 7. Weighted mean
TEST_F(AggregateProgressTest, WeightedMean) {
    auto a = aggregate_.add_task("a", 3.0f);
    auto b = aggregate_.add_task("b", 1.0f);
    EXPECT_EQ(aggregate_.task_count(), 2u);
    EXPECT_FLOAT_EQ(aggregate_.progress(), 0.0f);

    a.set_progress(1.0f);
    EXPECT_FLOAT_EQ(aggregate_.progress(), 0.75f);

    b.set_progress(1.0f);
    EXPECT_FLOAT_EQ(aggregate_.progress(), 1.0f);
}

TEST_F(AggregateProgressTest, EqualWeights) {
    auto a = aggregate_.add_task("a", 1.0f);
    auto b = aggregate_.add_task("b", 1.0f);

    a.set_progress(0.5f);
    EXPECT_FLOAT_EQ(aggregate_.progress(), 0.25f);
    b.set_progress(0.5f);
    EXPECT_FLOAT_EQ(aggregate_.progress(), 0.5f);
}

TEST_F(AggregateProgressTest, EmptyAggregateIsZero) {
    EXPECT_FLOAT_EQ(aggregate_.progress(), 0.0f);
    EXPECT_EQ(aggregate_.task_count(), 0u);
}

// 8. Sub-task changes are re-emitted
TEST_F(AggregateProgressTest, ReemitsOnSubTaskChange) {
    std::vector<float> seen;
    aggregate_.on_progress_changed().connect_with_type(
        [&](float value) { seen.push_back(value); }, connection_type::direct);

    auto a = aggregate_.add_task("a", 3.0f);
    auto b = aggregate_.add_task("b", 1.0f);
    a.set_progress(1.0f);
    a.set_progress(1.0f);
    b.set_progress(1.0f);

    ASSERT_EQ(seen.size(), 2u);
    EXPECT_FLOAT_EQ(seen[0], 0.75f);
    EXPECT_FLOAT_EQ(seen[1], 1.0f);

    aggregate_.emit_progress();
    ASSERT_EQ(seen.size(), 3u);
    EXPECT_FLOAT_EQ(seen[2], 1.0f);
}

// 9. Weights must be positive and finite
TEST_F(AggregateProgressTest, RejectsInvalidWeight) {
    EXPECT_THROW(aggregate_.add_task("zero", 0.0f), std::invalid_argument);
    EXPECT_THROW(aggregate_.add_task("negative", -1.0f), std::invalid_argument);
    EXPECT_THROW(aggregate_.add_task("nan", std::numeric_limits<float>::quiet_NaN()), std::invalid_argument);
    EXPECT_THROW(aggregate_.add_task("inf", std::numeric_limits<float>::infinity()), std::invalid_argument);
    EXPECT_EQ(aggregate_.task_count(), 0u);
}

// 10. reset clears every sub-task
TEST_F(AggregateProgressTest, ResetClearsSubTasks) {
    auto a = aggregate_.add_task("a", 1.0f);
    auto b = aggregate_.add_task("b", 2.0f);
    a.set_progress(1.0f);
    b.set_progress(0.5f);

    aggregate_.reset();

    EXPECT_FLOAT_EQ(a.progress(), 0.0f);
    EXPECT_FLOAT_EQ(b.progress(), 0.0f);
    EXPECT_FLOAT_EQ(aggregate_.progress(), 0.0f);
}

// 11. Sub-task reporters may outlive the aggregate
TEST(AggregateLifetimeTest, ReporterOutlivesAggregate) {
    progress_reporter survivor;
    {
        aggregate_progress aggregate;
        survivor = aggregate.add_task("survivor", 1.0f);
        EXPECT_EQ(survivor.on_progress_changed().connection_count(), 1u);
    }
    EXPECT_EQ(survivor.on_progress_changed().connection_count(), 0u);
    EXPECT_NO_THROW(survivor.set_progress(1.0f));
}
