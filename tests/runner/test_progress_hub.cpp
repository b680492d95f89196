/*
 * test_progress_hub.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include <gtest/gtest.h>
#include "runner/progress_hub.hpp"

#include <stdexcept>

using namespace enclave::runner;
using namespace enclave::protocol;

class ProgressHubTest : public ::testing::Test {
protected:
    std::shared_ptr<ProgressHub> hub_ = std::make_shared<ProgressHub>();
    ProgressEvent event_{ProgressType::Executing, "Running script…", Language::Python, "exec_1"};
};

TEST_F(ProgressHubTest, DeliversToEveryListener) {
    int first = 0;
    int second = 0;
    hub_->subscribe([&](const ProgressEvent&) { ++first; });
    hub_->subscribe([&](const ProgressEvent& e) {
        ++second;
        EXPECT_EQ(e.requestId, "exec_1");
    });
    hub_->publish(event_);
    EXPECT_EQ(first, 1);
    EXPECT_EQ(second, 1);
}

TEST_F(ProgressHubTest, ThrowingListenerDoesNotStopOthers) {
    int delivered = 0;
    hub_->subscribe([](const ProgressEvent&) { throw std::runtime_error("listener bug"); });
    hub_->subscribe([](const ProgressEvent&) { throw 42; });
    hub_->subscribe([&](const ProgressEvent&) { ++delivered; });
    EXPECT_NO_THROW(hub_->publish(event_));
    EXPECT_EQ(delivered, 1);
}

TEST_F(ProgressHubTest, UnsubscribeStopsDelivery) {
    int delivered = 0;
    auto unsubscribe = hub_->subscribe([&](const ProgressEvent&) { ++delivered; });
    EXPECT_EQ(hub_->listenerCount(), 1u);
    unsubscribe();
    EXPECT_EQ(hub_->listenerCount(), 0u);
    hub_->publish(event_);
    EXPECT_EQ(delivered, 0);
}

TEST_F(ProgressHubTest, UnsubscribeAfterHubIsGone) {
    auto unsubscribe = hub_->subscribe([](const ProgressEvent&) {});
    hub_.reset();
    EXPECT_NO_THROW(unsubscribe());
}

TEST_F(ProgressHubTest, ListenerMayUnsubscribeItself) {
    int delivered = 0;
    Unsubscribe unsubscribe;
    unsubscribe = hub_->subscribe([&](const ProgressEvent&) {
        ++delivered;
        unsubscribe();
    });
    hub_->publish(event_);
    hub_->publish(event_);
    EXPECT_EQ(delivered, 1);
}
