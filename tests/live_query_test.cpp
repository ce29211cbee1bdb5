// SPDX-License-Identifier: MIT

// tests/live_query_test.cpp
#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "lib/stream/epoll_event_loop.hpp"
#include "src/live_query.hpp"
#include "tests/fake_connection.hpp"
#include "tests/test_util.hpp"

using namespace query_pipe;
using namespace std::chrono_literals;
using query_pipe::test::FakeConnection;
using query_pipe::test::MakeEvent;
using query_pipe::test::MockConnection;
using query_pipe::test::RunUntil;
using ::testing::_;
using ::testing::DoAll;
using ::testing::Return;
using ::testing::SaveArg;

class LiveQueryTest : public ::testing::Test {
protected:
    std::shared_ptr<StreamSource<LiveEvent>> Start(StreamConfig config = StreamConfig::LiveDefaults()) {
        auto source = LiveQuery("LIVE SELECT FROM Person", config).Execute(loop_, conn_);
        EXPECT_TRUE(source.has_value());
        auto s = source.value();
        s->OnNext([this](LiveEvent&& e) { rids_.push_back(e.record.rid); });
        s->OnError([this](const Error& e) { errors_.push_back(e); });
        s->OnComplete([this]() { ++completions_; });
        return s;
    }

    EpollEventLoop loop_;
    std::shared_ptr<FakeConnection> conn_ = std::make_shared<FakeConnection>();
    std::vector<std::string> rids_;
    std::vector<Error> errors_;
    int completions_ = 0;
};

TEST_F(LiveQueryTest, SubscribesWithQueryText) {
    auto source = Start();
    EXPECT_EQ(conn_->subscribed(), (std::vector<std::string>{"LIVE SELECT FROM Person"}));
    EXPECT_EQ(source->config().buffer_size, 10000u);
}

TEST_F(LiveQueryTest, InvalidConfigFailsSynchronously) {
    auto source = LiveQuery("LIVE SELECT FROM Person", StreamConfig{.buffer_size = 0})
                      .Execute(loop_, conn_);
    ASSERT_FALSE(source.has_value());
    EXPECT_EQ(source.error().code, ErrorCode::InvalidConfig);
    EXPECT_TRUE(conn_->subscribed().empty());
}

TEST_F(LiveQueryTest, DeliversEventsFromProducerThreadInOrder) {
    auto source = Start();
    source->Request(100);

    std::thread producer([this] {
        conn_->EmitToken(21);
        for (int i = 0; i < 20; ++i) {
            conn_->EmitEvent(MakeEvent("#10:" + std::to_string(i)));
        }
    });
    producer.join();

    ASSERT_TRUE(RunUntil(loop_, [&] { return rids_.size() == 20; }));
    for (int i = 0; i < 20; ++i) {
        EXPECT_EQ(rids_[i], "#10:" + std::to_string(i));
    }
    EXPECT_EQ(source->GetToken(), 21);
}

TEST_F(LiveQueryTest, EventsBeforeTokenAreHeldBack) {
    auto source = Start();
    source->Request(10);

    conn_->EmitEvent(MakeEvent("#10:0"));
    conn_->EmitEvent(MakeEvent("#10:1"));
    loop_.Poll(0);
    EXPECT_TRUE(rids_.empty());
    EXPECT_EQ(source->GetBuffered(), 2u);

    conn_->EmitToken(4);
    conn_->EmitEvent(MakeEvent("#10:2"));
    ASSERT_TRUE(RunUntil(loop_, [&] { return rids_.size() == 3; }));
    EXPECT_EQ(rids_, (std::vector<std::string>{"#10:0", "#10:1", "#10:2"}));
}

TEST_F(LiveQueryTest, TaggedEventBindsToken) {
    auto source = Start();
    conn_->EmitEvent(MakeEvent("#10:0", 33));
    ASSERT_TRUE(RunUntil(loop_, [&] { return source->GetToken().has_value(); }));
    EXPECT_EQ(source->GetToken(), 33);
    EXPECT_EQ(source->GetBuffered(), 1u);
}

TEST_F(LiveQueryTest, CancelUnsubscribesOnForkedConnectionFromLoopThread) {
    auto source = Start();
    conn_->EmitToken(8);
    loop_.Poll(0);

    source->Cancel();
    ASSERT_TRUE(RunUntil(loop_, [&] { return completions_ == 1; }));

    EXPECT_EQ(conn_->unsubscribed(), (std::vector<Token>{8}));
    EXPECT_EQ(conn_->shared().forks.load(), 1);
    ASSERT_EQ(conn_->unsubscribe_threads().size(), 1u);
    EXPECT_EQ(conn_->unsubscribe_threads()[0], std::this_thread::get_id());
}

TEST_F(LiveQueryTest, CancelBeforeTokenUnsubscribesOnceTokenArrives) {
    auto source = Start();
    source->Request(10);
    conn_->EmitEvent(MakeEvent("#10:0"));
    source->Cancel();
    loop_.Poll(0);
    EXPECT_TRUE(conn_->unsubscribed().empty());

    conn_->EmitToken(15);
    ASSERT_TRUE(RunUntil(loop_, [&] { return completions_ == 1; }));

    EXPECT_EQ(conn_->unsubscribed(), (std::vector<Token>{15}));
    EXPECT_TRUE(rids_.empty());
}

TEST_F(LiveQueryTest, OverflowWithFailPolicyErrorsAndUnsubscribes) {
    auto source = Start(StreamConfig{.buffer_size = 2, .overflow = OverflowPolicy::Fail});
    conn_->EmitToken(3);
    conn_->EmitEvent(MakeEvent("A"));
    conn_->EmitEvent(MakeEvent("B"));
    conn_->EmitEvent(MakeEvent("C"));
    source->Request(10);

    ASSERT_TRUE(RunUntil(loop_, [&] { return !errors_.empty(); }));
    EXPECT_EQ(errors_[0].code, ErrorCode::BufferOverflow);
    EXPECT_TRUE(rids_.empty());
    EXPECT_EQ(conn_->unsubscribed(), (std::vector<Token>{3}));
}

TEST_F(LiveQueryTest, ProducerErrorIsDelivered) {
    auto source = Start();
    conn_->EmitToken(3);
    conn_->EmitError(Error{ErrorCode::ConnectionLost, "server went away"});

    ASSERT_TRUE(RunUntil(loop_, [&] { return !errors_.empty(); }));
    EXPECT_EQ(errors_[0].code, ErrorCode::ConnectionLost);
    EXPECT_TRUE(conn_->unsubscribed().empty());
}

TEST_F(LiveQueryTest, MissingTokenTimesOut) {
    auto source = Start(StreamConfig{.buffer_size = 8, .gate_timeout = 30ms});
    ASSERT_TRUE(RunUntil(loop_, [&] { return !errors_.empty(); }));
    EXPECT_EQ(errors_[0].code, ErrorCode::GateTimeout);

    // The subscription may still register; it is released exactly once
    conn_->EmitToken(6);
    conn_->EmitToken(6);
    ASSERT_TRUE(RunUntil(loop_, [&] { return !conn_->unsubscribed().empty(); }));
    loop_.Poll(0);
    EXPECT_EQ(conn_->unsubscribed(), (std::vector<Token>{6}));
}

TEST_F(LiveQueryTest, CancelledStreamCompletesWhenTokenNeverArrives) {
    auto source = Start(StreamConfig{.buffer_size = 8, .gate_timeout = 30ms});
    source->Cancel();

    ASSERT_TRUE(RunUntil(loop_, [&] { return completions_ == 1; }));
    EXPECT_TRUE(errors_.empty());
    EXPECT_TRUE(conn_->unsubscribed().empty());

    conn_->EmitToken(6);
    conn_->EmitToken(6);
    ASSERT_TRUE(RunUntil(loop_, [&] { return !conn_->unsubscribed().empty(); }));
    loop_.Poll(0);
    EXPECT_EQ(conn_->unsubscribed(), (std::vector<Token>{6}));
    EXPECT_EQ(completions_, 1);
}

TEST_F(LiveQueryTest, SubscribeErrorAfterCancelCompletes) {
    auto source = Start();
    source->Cancel();
    conn_->EmitError(Error{ErrorCode::SubscribeFailed, "class not found"});

    ASSERT_TRUE(RunUntil(loop_, [&] { return completions_ == 1; }));
    EXPECT_TRUE(errors_.empty());
    EXPECT_TRUE(conn_->unsubscribed().empty());
    EXPECT_TRUE(source->IsTerminated());
}

TEST_F(LiveQueryTest, UnsubscribeFailureStillCompletes) {
    conn_->SetUnsubscribeError(Error{ErrorCode::QueryFailed, "unknown token"});
    auto source = Start();
    conn_->EmitToken(8);
    source->Cancel();

    ASSERT_TRUE(RunUntil(loop_, [&] { return completions_ == 1; }));
    EXPECT_TRUE(errors_.empty());
}

TEST_F(LiveQueryTest, ClosedConnectionSkipsUnsubscribe) {
    auto source = Start();
    conn_->EmitToken(8);
    loop_.Poll(0);

    conn_.reset();

    source->Cancel();
    ASSERT_TRUE(RunUntil(loop_, [&] { return completions_ == 1; }));
}

TEST(LiveQueryMockTest, SubscribeFailureIsDeliveredAsError) {
    EpollEventLoop loop;
    auto conn = std::make_shared<MockConnection>();
    EXPECT_CALL(*conn, ActivateOnCurrentThread()).Times(1);
    EXPECT_CALL(*conn, Subscribe(_, _))
        .WillOnce(Return(std::expected<void, Error>(
            std::unexpected(Error{ErrorCode::SubscribeFailed, "class not found"}))));

    auto source = LiveQuery("LIVE SELECT FROM Nope").Execute(loop, conn);
    ASSERT_TRUE(source.has_value());

    std::vector<Error> errors;
    (*source)->OnError([&](const Error& e) { errors.push_back(e); });

    ASSERT_TRUE(RunUntil(loop, [&] { return !errors.empty(); }));
    EXPECT_EQ(errors[0].code, ErrorCode::SubscribeFailed);
    EXPECT_EQ((*source)->GetPhase(), SubscriptionPhase::Failed);
}

TEST(LiveQueryMockTest, UnsubscribeActivatesForkBeforeUnsubscribing) {
    EpollEventLoop loop;
    auto conn = std::make_shared<MockConnection>();
    auto fork = std::make_shared<MockConnection>();
    std::shared_ptr<ILiveListener> listener;

    EXPECT_CALL(*conn, ActivateOnCurrentThread()).Times(1);
    EXPECT_CALL(*conn, Subscribe(_, _))
        .WillOnce(DoAll(SaveArg<1>(&listener), Return(std::expected<void, Error>{})));
    EXPECT_CALL(*conn, Fork()).WillOnce(Return(fork));
    {
        ::testing::InSequence seq;
        EXPECT_CALL(*fork, ActivateOnCurrentThread());
        EXPECT_CALL(*fork, Unsubscribe(12)).WillOnce(Return(std::expected<void, Error>{}));
    }
    EXPECT_CALL(*conn, Unsubscribe(_)).Times(0);

    auto source = LiveQuery("LIVE SELECT FROM Person").Execute(loop, conn);
    ASSERT_TRUE(source.has_value());
    bool completed = false;
    (*source)->OnComplete([&] { completed = true; });

    ASSERT_NE(listener, nullptr);
    listener->OnToken(12);
    (*source)->Cancel();

    EXPECT_TRUE(RunUntil(loop, [&] { return completed; }));
}
