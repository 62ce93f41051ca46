#include <atomic>
#include <gtest/gtest.h>
#include <set>
#include <thread>
#include <vector>
#include "../../src/engine/frontier/url_frontier.hpp"

using namespace Arachne::Engine;

TEST(FrontierTest, AcceptsSeedAndRejectsDuplicates) {
    UrlFrontier frontier("run-1", 2);
    EXPECT_EQ(frontier.offer("https://example.com", 0), OfferResult::Accepted);
    EXPECT_EQ(frontier.offer("https://example.com/", 1), OfferResult::Duplicate);
    EXPECT_EQ(frontier.offer("HTTPS://EXAMPLE.COM:443/#top", 1), OfferResult::Duplicate);
    EXPECT_EQ(frontier.snapshot().pending, 1u);
}

TEST(FrontierTest, RejectsByDepthAndScheme) {
    UrlFrontier frontier("run-1", 1);
    EXPECT_EQ(frontier.offer("https://example.com/a", 1), OfferResult::Accepted);
    EXPECT_EQ(frontier.offer("https://example.com/b", 2), OfferResult::DepthExceeded);
    EXPECT_EQ(frontier.offer("ftp://example.com/file", 1), OfferResult::SchemeUnsupported);
    EXPECT_EQ(frontier.offer("mailto:someone@example.com", 1), OfferResult::SchemeUnsupported);
    EXPECT_EQ(frontier.offer("not a url", 1), OfferResult::Malformed);
    EXPECT_EQ(frontier.offer("http:///nohost", 1), OfferResult::Malformed);
}

TEST(FrontierTest, TakeMovesTaskInFlight) {
    UrlFrontier frontier("run-7", 3);
    frontier.offer("http://example.com/page", 2);

    auto task = frontier.take();
    ASSERT_TRUE(task.has_value());
    EXPECT_EQ(task->url, "http://example.com/page");
    EXPECT_EQ(task->depth, 2);
    EXPECT_EQ(task->host, "example.com");
    EXPECT_EQ(task->run_id, "run-7");

    auto snap = frontier.snapshot();
    EXPECT_EQ(snap.pending, 0u);
    EXPECT_EQ(snap.in_flight, 1u);
    EXPECT_FALSE(frontier.drained());

    frontier.mark_done(*task);
    snap = frontier.snapshot();
    EXPECT_EQ(snap.in_flight, 0u);
    EXPECT_EQ(snap.visited, 1u);
    EXPECT_TRUE(frontier.drained());
    EXPECT_FALSE(frontier.take().has_value());
}

TEST(FrontierTest, VisitedUrlIsNeverReenqueued) {
    UrlFrontier frontier("run", 5);
    frontier.offer("http://example.com/a", 0);
    auto task = frontier.take();
    ASSERT_TRUE(task);
    EXPECT_EQ(frontier.offer("http://example.com/a", 1), OfferResult::Duplicate);
    frontier.mark_done(*task);
    EXPECT_EQ(frontier.offer("http://example.com/a", 1), OfferResult::Duplicate);
}

TEST(FrontierTest, RoundRobinAcrossHosts) {
    UrlFrontier frontier("run", 5);
    for (int i = 0; i < 5; ++i)
        frontier.offer("http://big.example/" + std::to_string(i), 1);
    frontier.offer("http://small.example/only", 1);

    auto first  = frontier.take();
    auto second = frontier.take();
    ASSERT_TRUE(first && second);
    EXPECT_EQ(first->host, "big.example");
    EXPECT_EQ(second->host, "small.example");
}

TEST(FrontierTest, EligibilityFilterSkipsHosts) {
    UrlFrontier frontier("run", 5);
    frontier.offer("http://busy.example/1", 0);
    frontier.offer("http://free.example/1", 0);

    auto task = frontier.take([](const std::string& host) { return host != "busy.example"; });
    ASSERT_TRUE(task);
    EXPECT_EQ(task->host, "free.example");

    EXPECT_FALSE(frontier.take([](const std::string&) { return false; }).has_value());
    EXPECT_EQ(frontier.snapshot().pending, 1u);
}

TEST(FrontierTest, RequeueDefersHost) {
    UrlFrontier frontier("run", 5);
    frontier.offer("http://slow.example/1", 0);
    frontier.offer("http://other.example/1", 0);

    auto task = frontier.take();
    ASSERT_TRUE(task);
    EXPECT_EQ(task->host, "slow.example");
    frontier.requeue(*task, std::chrono::milliseconds(200));

    auto snap = frontier.snapshot();
    EXPECT_EQ(snap.pending, 2u);
    EXPECT_EQ(snap.in_flight, 0u);

    auto next = frontier.take();
    ASSERT_TRUE(next);
    EXPECT_EQ(next->host, "other.example");
    EXPECT_FALSE(frontier.take().has_value());

    auto wait = frontier.next_ready_in();
    ASSERT_TRUE(wait.has_value());
    EXPECT_GT(*wait, std::chrono::milliseconds(0));

    std::this_thread::sleep_for(std::chrono::milliseconds(250));
    auto again = frontier.take();
    ASSERT_TRUE(again);
    EXPECT_EQ(again->url, "http://slow.example/1");
}

TEST(FrontierTest, HugeRetryKeepsHostDeferred) {
    UrlFrontier frontier("run", 5);
    frontier.offer("http://slow.example/1", 0);

    auto task = frontier.take();
    ASSERT_TRUE(task);
    frontier.requeue(*task, std::chrono::milliseconds(10'000'000'000'000LL));

    EXPECT_FALSE(frontier.take().has_value());
    auto wait = frontier.next_ready_in();
    ASSERT_TRUE(wait.has_value());
    EXPECT_GT(*wait, std::chrono::hours(1));
    EXPECT_LE(*wait, std::chrono::hours(24));
}

TEST(FrontierTest, ClaimReservesUrlOnce) {
    UrlFrontier frontier("run", 5);
    frontier.offer("https://example.com/a", 0);

    EXPECT_FALSE(frontier.claim("https://example.com/a#top"));
    EXPECT_TRUE(frontier.claim("https://example.com/b"));
    EXPECT_FALSE(frontier.claim("https://example.com/b"));
    EXPECT_FALSE(frontier.claim("not a url"));
    EXPECT_EQ(frontier.offer("https://example.com/b", 1), OfferResult::Duplicate);
}

TEST(FrontierTest, ClaimedUrlBlocksLaterOffers) {
    UrlFrontier frontier("run", 5);
    EXPECT_TRUE(frontier.claim("https://example.com/final#x"));
    EXPECT_EQ(frontier.offer("https://example.com/final", 1), OfferResult::Duplicate);
}

TEST(FrontierTest, ClearPendingDropsQueuedWork) {
    UrlFrontier frontier("run", 5);
    frontier.offer("http://a.example/", 0);
    frontier.offer("http://b.example/", 0);
    auto task = frontier.take();
    ASSERT_TRUE(task);

    EXPECT_EQ(frontier.clear_pending(), 1u);
    auto snap = frontier.snapshot();
    EXPECT_EQ(snap.pending, 0u);
    EXPECT_EQ(snap.in_flight, 1u);
    EXPECT_FALSE(frontier.take().has_value());
}

TEST(FrontierTest, ConcurrentOffersAcceptEachUrlOnce) {
    UrlFrontier              frontier("run", 5);
    std::atomic<int>         accepted{0};
    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([&]() {
            for (int i = 0; i < 200; ++i) {
                if (frontier.offer("http://example.com/p" + std::to_string(i), 1)
                    == OfferResult::Accepted)
                    accepted++;
            }
        });
    }
    for (auto& t : threads)
        t.join();

    EXPECT_EQ(accepted.load(), 200);

    std::set<std::string> taken;
    while (auto task = frontier.take()) {
        EXPECT_TRUE(taken.insert(task->url).second);
        frontier.mark_done(*task);
    }
    EXPECT_EQ(taken.size(), 200u);
    EXPECT_TRUE(frontier.drained());
}
