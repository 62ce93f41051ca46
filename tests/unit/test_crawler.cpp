#include <gtest/gtest.h>
#include <algorithm>
#include <atomic>
#include <memory>
#include <regex>
#include <set>
#include <thread>
#include "../../src/core/logger/logger.hpp"
#include "../../src/engine/crawler/crawler.hpp"
#include "../fakes/fake_http_client.hpp"
#include "../fakes/recording_sink.hpp"

using namespace Arachne::Core;
using namespace Arachne::Engine;
using Arachne::Testing::FakeHttpClient;
using Arachne::Testing::FakeWeb;
using Arachne::Testing::RecordingSink;

class CrawlerTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::set_level(LOG_NONE);
        web  = std::make_shared<FakeWeb>();
        sink = std::make_shared<RecordingSink>();
    }

    void TearDown() override {
        Logger::set_level(LOG_ALL & ~LOG_DEBUG);
    }

    CrawlerOptions options(int workers = 4, int host_concurrency = 2) {
        CrawlerOptions opts;
        opts.threads          = 2;
        opts.virtual_threads  = workers;
        opts.host_concurrency = host_concurrency;
        opts.delivery_threads = 1;

        auto fake_web       = web;
        opts.client_factory = [fake_web](boost::asio::io_context&, const RunConfig&) {
            return std::make_unique<FakeHttpClient>(fake_web);
        };
        auto recorder     = sink;
        opts.sink_factory = [recorder](const RunConfig&) { return recorder; };
        return opts;
    }

    RunConfig run_config(const std::string& seed, int depth = 2) {
        RunConfig config;
        config.url            = seed;
        config.maximum_depth  = depth;
        config.crawl_delay_ms = 0;
        return config;
    }

    // Runs to completion and waits until the summary has been delivered.
    RunState crawl(Crawler& crawler, const RunConfig& config) {
        last_run_  = crawler.start_run(config);
        auto state = crawler.wait(last_run_);
        crawler.dispatcher().wait_idle();
        return state;
    }

    // Polls until `done` holds or two seconds pass.
    template <typename Predicate>
    bool eventually(Predicate done) {
        auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);
        while (std::chrono::steady_clock::now() < deadline) {
            if (done())
                return true;
            std::this_thread::sleep_for(std::chrono::milliseconds(2));
        }
        return done();
    }

    std::set<std::string> result_urls() const {
        std::set<std::string> urls;
        for (const auto& r : sink->results())
            urls.insert(r.url);
        return urls;
    }

    std::shared_ptr<FakeWeb>       web;
    std::shared_ptr<RecordingSink> sink;
    std::string                    last_run_;
};

TEST_F(CrawlerTest, DepthZeroFetchesOnlySeed) {
    web->page("https://example.com/", R"(<a href="/a">a</a><a href="/b">b</a>)");
    web->page("https://example.com/a", "a");
    web->page("https://example.com/b", "b");

    Crawler crawler(options());
    EXPECT_EQ(crawl(crawler, run_config("https://example.com", 0)), RunState::Completed);

    auto results = sink->results();
    ASSERT_EQ(results.size(), 1);
    EXPECT_EQ(results[0].url, "https://example.com/");
    EXPECT_EQ(results[0].depth, 0);
    EXPECT_EQ(results[0].links.size(), 2);
    EXPECT_EQ(web->count("https://example.com/a"), 0);
    EXPECT_EQ(web->count("https://example.com/b"), 0);
}

TEST_F(CrawlerTest, SelfLinkIsNotRefetched) {
    web->page("http://example.com/", R"(<a href="/">home</a><a href="#top">top</a>)");

    Crawler crawler(options());
    EXPECT_EQ(crawl(crawler, run_config("http://example.com/", 3)), RunState::Completed);

    EXPECT_EQ(sink->results().size(), 1);
    EXPECT_EQ(web->count("http://example.com/"), 1);
}

TEST_F(CrawlerTest, RobotsDisallowedPathIsNeverFetched) {
    web->text("http://example.com/robots.txt", "User-agent: *\nDisallow: /private\n", "text/plain");
    web->page("http://example.com/", R"(<a href="/private">p</a>)");
    web->page("http://example.com/private", "secret");

    Crawler crawler(options());
    EXPECT_EQ(crawl(crawler, run_config("http://example.com/", 2)), RunState::Completed);

    EXPECT_EQ(web->count("http://example.com/private"), 0);
    EXPECT_EQ(result_urls(), std::set<std::string>{"http://example.com/"});
    EXPECT_EQ(web->count("http://example.com/robots.txt"), 1);
}

TEST_F(CrawlerTest, IgnoreRobotsSkipsRobotsFetch) {
    web->text("http://example.com/robots.txt", "User-agent: *\nDisallow: /\n", "text/plain");
    web->page("http://example.com/", R"(<a href="/private">p</a>)");
    web->page("http://example.com/private", "secret");

    auto config              = run_config("http://example.com/", 1);
    config.ignore_robots_txt = true;

    Crawler crawler(options());
    EXPECT_EQ(crawl(crawler, config), RunState::Completed);

    EXPECT_EQ(web->count("http://example.com/robots.txt"), 0);
    EXPECT_EQ(sink->results().size(), 2);
}

TEST_F(CrawlerTest, SeedTimeoutIsReported) {
    web->fail("http://example.com/", ErrorType::Timeout);

    Crawler crawler(options());
    EXPECT_EQ(crawl(crawler, run_config("http://example.com/", 2)), RunState::Completed);

    auto results = sink->results();
    ASSERT_EQ(results.size(), 1);
    EXPECT_EQ(results[0].status, FetchStatus::Timeout);
    EXPECT_EQ(results[0].http_status, 0);
    EXPECT_FALSE(results[0].error.empty());
    EXPECT_TRUE(results[0].links.empty());
}

TEST_F(CrawlerTest, RedirectLimitStopsChain) {
    web->redirect("http://example.com/", "/r1");
    web->redirect("http://example.com/r1", "/r2");
    web->redirect("http://example.com/r2", "/final");
    web->page("http://example.com/final", "done");

    auto config              = run_config("http://example.com/", 2);
    config.maximum_redirects = 2;

    Crawler crawler(options());
    EXPECT_EQ(crawl(crawler, config), RunState::Completed);

    auto results = sink->results();
    ASSERT_EQ(results.size(), 1);
    EXPECT_EQ(results[0].status, FetchStatus::RedirectLimit);
    EXPECT_EQ(results[0].redirects.size(), 2);
    EXPECT_EQ(web->count("http://example.com/final"), 0);
}

TEST_F(CrawlerTest, DepthGrowsByOnePerHop) {
    web->page("http://example.com/", R"(<a href="/a">a</a>)");
    web->page("http://example.com/a", R"(<a href="/b">b</a>)");
    web->page("http://example.com/b", R"(<a href="/c">c</a>)");
    web->page("http://example.com/c", "too deep");

    Crawler crawler(options());
    EXPECT_EQ(crawl(crawler, run_config("http://example.com/", 2)), RunState::Completed);

    EXPECT_EQ(sink->find("http://example.com/")->depth, 0);
    EXPECT_EQ(sink->find("http://example.com/a")->depth, 1);
    auto last = sink->find("http://example.com/b");
    ASSERT_TRUE(last.has_value());
    EXPECT_EQ(last->depth, 2);
    EXPECT_EQ(last->links.size(), 1);
    EXPECT_EQ(web->count("http://example.com/c"), 0);
}

TEST_F(CrawlerTest, SharedLinkFetchedOnce) {
    web->page("http://example.com/", R"(<a href="/a">a</a><a href="/b">b</a>)");
    web->page("http://example.com/a", R"(<a href="/c">c</a><a href="/">home</a>)");
    web->page("http://example.com/b", R"(<a href="/c#frag">c</a><a href="/a">a</a>)");
    web->page("http://example.com/c", "leaf");

    Crawler crawler(options());
    EXPECT_EQ(crawl(crawler, run_config("http://example.com/", 5)), RunState::Completed);

    EXPECT_EQ(sink->results().size(), 4);
    for (const auto& url : {"http://example.com/", "http://example.com/a", "http://example.com/b",
                            "http://example.com/c"}) {
        EXPECT_EQ(web->count(url), 1) << url;
    }
}

TEST_F(CrawlerTest, RedirectTargetIsNotFetchedAgain) {
    web->page("http://example.com/", R"(<a href="/old">old</a>)");
    web->redirect("http://example.com/old", "/new");
    web->page("http://example.com/new", R"(<a href="/new">self</a><a href="/">home</a>)");

    Crawler crawler(options(1));
    EXPECT_EQ(crawl(crawler, run_config("http://example.com/", 4)), RunState::Completed);

    EXPECT_EQ(web->count("http://example.com/new"), 1);
    auto moved = sink->find("http://example.com/old");
    ASSERT_TRUE(moved.has_value());
    EXPECT_EQ(moved->final_url, "http://example.com/new");
    ASSERT_EQ(moved->redirects.size(), 1);
    EXPECT_EQ(moved->redirects[0].status_code, 301);
    EXPECT_EQ(sink->results().size(), 2);
}

TEST_F(CrawlerTest, RedirectToKnownUrlIsNotFollowed) {
    web->page("http://example.com/", R"(<a href="/a">a</a><a href="/b">b</a>)");
    web->page("http://example.com/a", "a");
    web->redirect("http://example.com/b", "/a", 301);

    Crawler crawler(options());
    EXPECT_EQ(crawl(crawler, run_config("http://example.com/", 2)), RunState::Completed);

    EXPECT_EQ(web->count("http://example.com/a"), 1);
    auto moved = sink->find("http://example.com/b");
    ASSERT_TRUE(moved.has_value());
    EXPECT_EQ(moved->status, FetchStatus::DuplicateRedirect);
    EXPECT_EQ(moved->http_status, 301);
    ASSERT_EQ(moved->redirects.size(), 1);
    EXPECT_EQ(moved->redirects[0].destination, "http://example.com/a");
    EXPECT_EQ(sink->results().size(), 3);
}

TEST_F(CrawlerTest, RedirectIntoDisallowedPathIsNotFollowed) {
    web->text("http://example.com/robots.txt", "User-agent: *\nDisallow: /private\n", "text/plain");
    web->page("http://example.com/", R"(<a href="/a">a</a>)");
    web->redirect("http://example.com/a", "/private", 302);
    web->page("http://example.com/private", "secret");

    Crawler crawler(options());
    EXPECT_EQ(crawl(crawler, run_config("http://example.com/", 2)), RunState::Completed);

    EXPECT_EQ(web->count("http://example.com/private"), 0);
    auto blocked = sink->find("http://example.com/a");
    ASSERT_TRUE(blocked.has_value());
    EXPECT_EQ(blocked->status, FetchStatus::RobotsBlocked);
    EXPECT_EQ(blocked->http_status, 302);
    EXPECT_FALSE(sink->find("http://example.com/private").has_value());
}

TEST_F(CrawlerTest, IgnoreRobotsFollowsRedirectIntoDisallowedPath) {
    web->text("http://example.com/robots.txt", "User-agent: *\nDisallow: /private\n", "text/plain");
    web->redirect("http://example.com/", "/private", 302);
    web->page("http://example.com/private", "secret");

    auto config              = run_config("http://example.com/", 0);
    config.ignore_robots_txt = true;

    Crawler crawler(options());
    EXPECT_EQ(crawl(crawler, config), RunState::Completed);
    EXPECT_EQ(web->count("http://example.com/private"), 1);
    ASSERT_EQ(sink->results().size(), 1);
    EXPECT_EQ(sink->results()[0].status, FetchStatus::Ok);
}

TEST_F(CrawlerTest, FailedPagesAreReported) {
    web->page("http://example.com/", R"(<a href="/missing">m</a><a href="/boom">b</a>)");
    web->status("http://example.com/boom", 503);

    Crawler crawler(options());
    EXPECT_EQ(crawl(crawler, run_config("http://example.com/", 1)), RunState::Completed);

    auto missing = sink->find("http://example.com/missing");
    ASSERT_TRUE(missing.has_value());
    EXPECT_EQ(missing->status, FetchStatus::HttpError);
    EXPECT_EQ(missing->http_status, 404);
    EXPECT_EQ(missing->error, "HTTP 404");

    auto boom = sink->find("http://example.com/boom");
    ASSERT_TRUE(boom.has_value());
    EXPECT_EQ(boom->http_status, 503);
}

TEST_F(CrawlerTest, NonHtmlContentIsNotParsed) {
    web->page("http://example.com/", R"(<a href="/notes.txt">notes</a>)");
    web->text("http://example.com/notes.txt", R"(<a href="/hidden">x</a>)", "text/plain");

    Crawler crawler(options());
    EXPECT_EQ(crawl(crawler, run_config("http://example.com/", 3)), RunState::Completed);

    auto notes = sink->find("http://example.com/notes.txt");
    ASSERT_TRUE(notes.has_value());
    EXPECT_TRUE(notes->links.empty());
    EXPECT_EQ(notes->content_type, "text/plain");
    EXPECT_EQ(web->count("http://example.com/hidden"), 0);
}

TEST_F(CrawlerTest, KeepHtmlControlsContent) {
    web->page("http://example.com/", "<p>hello</p>");

    Crawler crawler(options());
    crawl(crawler, run_config("http://example.com/", 0));
    ASSERT_EQ(sink->results().size(), 1);
    EXPECT_FALSE(sink->results()[0].content.has_value());

    auto config                = run_config("http://example.com/", 0);
    config.keep_html_in_memory = true;
    crawl(crawler, config);
    ASSERT_EQ(sink->results().size(), 2);
    ASSERT_TRUE(sink->results()[1].content.has_value());
    EXPECT_EQ(*sink->results()[1].content, "<p>hello</p>");
}

TEST_F(CrawlerTest, UserAgentIsSentEverywhere) {
    web->page("http://example.com/", "<p>hi</p>");

    auto config       = run_config("http://example.com/", 0);
    config.user_agent = "AgentSmith/3.1";

    Crawler crawler(options());
    crawl(crawler, config);

    auto hits = web->hits();
    ASSERT_EQ(hits.size(), 2);
    for (const auto& hit : hits)
        EXPECT_EQ(hit.user_agent, "AgentSmith/3.1");
}

TEST_F(CrawlerTest, SummaryFollowsAllResults) {
    web->page("http://example.com/", R"(<a href="/a">a</a><a href="/b">b</a>)");
    web->page("http://example.com/a", "a");
    web->page("http://example.com/b", "b");
    sink->set_delay(std::chrono::milliseconds(20));

    Crawler crawler(options());
    crawl(crawler, run_config("http://example.com/", 1));

    auto events = sink->events();
    ASSERT_EQ(events.size(), 4);
    EXPECT_EQ(events.back(), "summary:" + last_run_);

    auto summaries = sink->summaries();
    ASSERT_EQ(summaries.size(), 1);
    EXPECT_EQ(summaries[0].state, RunState::Completed);
    EXPECT_EQ(summaries[0].pages, 3);
    EXPECT_EQ(summaries[0].visited, 3);
    EXPECT_EQ(summaries[0].seed, "http://example.com/");
}

TEST_F(CrawlerTest, StatusAfterCompletion) {
    web->page("http://example.com/", R"(<a href="/a">a</a>)");
    web->page("http://example.com/a", "a");

    Crawler crawler(options());
    crawl(crawler, run_config("http://example.com/", 1));

    auto status = crawler.status(last_run_);
    ASSERT_TRUE(status.has_value());
    EXPECT_EQ(status->run_id, last_run_);
    EXPECT_EQ(status->state, RunState::Completed);
    EXPECT_EQ(status->pages_emitted, 2);
    EXPECT_EQ(status->pending, 0);
    EXPECT_EQ(status->in_flight, 0);
    EXPECT_EQ(status->visited, 2);

    EXPECT_FALSE(crawler.status("no-such-run").has_value());
    EXPECT_THROW(crawler.wait("no-such-run"), std::out_of_range);
    EXPECT_FALSE(crawler.cancel_run(last_run_));
}

TEST_F(CrawlerTest, FinishedRunIsEvicted) {
    web->page("http://example.com/", "<p>hi</p>");

    Crawler crawler(options());
    crawl(crawler, run_config("http://example.com/", 0));

    {
        std::lock_guard<std::mutex> lock(crawler.runs_mutex_);
        EXPECT_EQ(crawler.runs_.count(last_run_), 0u);
        ASSERT_EQ(crawler.finished_runs_.count(last_run_), 1u);
        EXPECT_EQ(crawler.finished_runs_.at(last_run_).state, RunState::Completed);
    }
    EXPECT_EQ(crawler.wait(last_run_), RunState::Completed);
    EXPECT_EQ(crawler.status(last_run_)->visited, 1);
}

TEST_F(CrawlerTest, ClientReleasedOnCompletion) {
    web->page("http://example.com/", R"(<a href="/a">a</a>)");
    web->page("http://example.com/a", "a");

    class CountedClient : public FakeHttpClient {
    public:
        CountedClient(std::shared_ptr<FakeWeb> web, std::shared_ptr<std::atomic<int>> alive)
            : FakeHttpClient(std::move(web)), alive_(std::move(alive)) {
            ++*alive_;
        }
        ~CountedClient() override {
            --*alive_;
        }

    private:
        std::shared_ptr<std::atomic<int>> alive_;
    };

    auto alive          = std::make_shared<std::atomic<int>>(0);
    auto opts           = options();
    auto fake_web       = web;
    opts.client_factory = [fake_web, alive](boost::asio::io_context&, const RunConfig&) {
        return std::make_unique<CountedClient>(fake_web, alive);
    };

    Crawler crawler(opts);
    crawl(crawler, run_config("http://example.com/", 1));
    crawl(crawler, run_config("http://example.com/", 1));

    EXPECT_EQ(alive->load(), 0);
    EXPECT_EQ(sink->summaries().size(), 2u);
}

TEST_F(CrawlerTest, CancelStopsRunWithoutResults) {
    web->page("http://example.com/", R"(<a href="/a">a</a><a href="/b">b</a>)");
    web->set_delay("http://example.com/", std::chrono::milliseconds(300));

    auto config              = run_config("http://example.com/", 3);
    config.ignore_robots_txt = true;

    Crawler crawler(options());
    auto    id = crawler.start_run(config);
    EXPECT_TRUE(crawler.cancel_run(id));
    EXPECT_FALSE(crawler.cancel_run(id));

    EXPECT_EQ(crawler.wait(id), RunState::Cancelled);
    crawler.dispatcher().wait_idle();

    EXPECT_TRUE(sink->results().empty());
    EXPECT_EQ(web->count("http://example.com/a"), 0);
    auto summaries = sink->summaries();
    ASSERT_EQ(summaries.size(), 1);
    EXPECT_EQ(summaries[0].state, RunState::Cancelled);
    EXPECT_EQ(crawler.status(id)->state, RunState::Cancelled);
}

TEST_F(CrawlerTest, CancelDuringInFlightFetchEmitsNothing) {
    web->page("http://example.com/", R"(<a href="/a">a</a><a href="/b">b</a>)");
    web->set_delay("http://example.com/", std::chrono::milliseconds(300));
    web->page("http://example.com/a", "a");
    web->page("http://example.com/b", "b");

    auto config              = run_config("http://example.com/", 3);
    config.ignore_robots_txt = true;

    Crawler crawler(options());
    auto    id = crawler.start_run(config);
    ASSERT_TRUE(eventually([this] { return web->count("http://example.com/") == 1; }));
    EXPECT_TRUE(crawler.cancel_run(id));

    EXPECT_EQ(crawler.wait(id), RunState::Cancelled);
    crawler.dispatcher().wait_idle();

    EXPECT_TRUE(sink->results().empty());
    EXPECT_EQ(web->count("http://example.com/a"), 0);
    EXPECT_EQ(web->count("http://example.com/b"), 0);
    auto summaries = sink->summaries();
    ASSERT_EQ(summaries.size(), 1);
    EXPECT_EQ(summaries[0].state, RunState::Cancelled);
    EXPECT_EQ(summaries[0].pages, 0);
}

TEST_F(CrawlerTest, DrainsWhileOnlyInFlightWorkRemains) {
    web->page("http://example.com/", R"(<a href="/a">a</a><a href="/b">b</a>)");
    web->page("http://example.com/a", "a");
    web->page("http://example.com/b", "b");
    for (const auto& url : {"http://example.com/", "http://example.com/a", "http://example.com/b"})
        web->set_delay(url, std::chrono::milliseconds(300));

    auto config              = run_config("http://example.com/", 1);
    config.ignore_robots_txt = true;

    Crawler crawler(options(4, 1));
    auto    id    = crawler.start_run(config);
    auto    state = [&crawler, &id] { return crawler.status(id)->state; };

    // Seed in flight, nothing pending.
    ASSERT_TRUE(eventually([&] {
        return web->count("http://example.com/") == 1 && state() == RunState::Draining;
    }));
    EXPECT_EQ(web->count("http://example.com/a") + web->count("http://example.com/b"), 0);

    // One child in flight, its sibling queued behind the host cap.
    ASSERT_TRUE(eventually([&] {
        return web->count("http://example.com/a") + web->count("http://example.com/b") == 1
               && state() == RunState::Running;
    }));
    EXPECT_EQ(crawler.status(id)->pending, 1);

    EXPECT_EQ(crawler.wait(id), RunState::Completed);
    crawler.dispatcher().wait_idle();
    EXPECT_EQ(sink->results().size(), 3);
}

TEST_F(CrawlerTest, RunIdsAreUniqueUuids) {
    web->page("http://example.com/", "<p>hi</p>");

    Crawler    crawler(options());
    auto       first  = crawler.start_run(run_config("http://example.com/", 0));
    auto       second = crawler.start_run(run_config("http://example.com/", 0));
    std::regex uuid("^[0-9a-f]{8}-[0-9a-f]{4}-[0-9a-f]{4}-[0-9a-f]{4}-[0-9a-f]{12}$");

    EXPECT_NE(first, second);
    EXPECT_TRUE(std::regex_match(first, uuid));
    EXPECT_TRUE(std::regex_match(second, uuid));
    crawler.wait_all();
}

TEST_F(CrawlerTest, InvalidSeedIsRejected) {
    Crawler crawler(options());
    EXPECT_THROW(crawler.start_run(run_config("ftp://example.com/", 1)), RunConfigError);
    EXPECT_THROW(crawler.start_run(run_config("", 1)), RunConfigError);

    auto config          = run_config("http://example.com/", 1);
    config.maximum_depth = -2;
    EXPECT_THROW(crawler.start_run(config), RunConfigError);
    EXPECT_TRUE(web->hits().empty());
}

TEST_F(CrawlerTest, HostConcurrencyIsCapped) {
    std::string links;
    for (int i = 0; i < 8; ++i) {
        std::string path = "/p" + std::to_string(i);
        links += "<a href=\"" + path + "\">x</a>";
        web->page("http://example.com" + path, "leaf");
        web->set_delay("http://example.com" + path, std::chrono::milliseconds(30));
    }
    web->page("http://example.com/", links);

    auto config              = run_config("http://example.com/", 1);
    config.ignore_robots_txt = true;

    Crawler crawler(options(8, 1));
    EXPECT_EQ(crawl(crawler, config), RunState::Completed);

    EXPECT_EQ(sink->results().size(), 9);
    EXPECT_EQ(web->max_concurrent("example.com"), 1);
}

TEST_F(CrawlerTest, CrawlDelaySpacesRequests) {
    web->page("http://example.com/", R"(<a href="/a">a</a><a href="/b">b</a>)");
    web->page("http://example.com/a", "a");
    web->page("http://example.com/b", "b");

    auto config              = run_config("http://example.com/", 1);
    config.ignore_robots_txt = true;
    config.crawl_delay_ms    = 100;

    Crawler crawler(options(4, 4));
    crawl(crawler, config);

    auto hits = web->hits_for_host("example.com");
    ASSERT_EQ(hits.size(), 3);
    for (std::size_t i = 1; i < hits.size(); ++i) {
        auto gap = std::chrono::duration_cast<std::chrono::milliseconds>(hits[i].at - hits[i - 1].at);
        EXPECT_GE(gap.count(), 90);
    }
}

TEST_F(CrawlerTest, HostsAreCrawledIndependently) {
    web->page("http://one.example/", R"(<a href="http://two.example/">two</a>)");
    web->page("http://two.example/", R"(<a href="http://one.example/">one</a>)");

    auto config             = run_config("http://one.example/", 3);
    config.same_domain_only = false;

    Crawler crawler(options());
    EXPECT_EQ(crawl(crawler, config), RunState::Completed);

    EXPECT_EQ(result_urls(), (std::set<std::string>{"http://one.example/", "http://two.example/"}));
    EXPECT_EQ(web->count("http://one.example/robots.txt"), 1);
    EXPECT_EQ(web->count("http://two.example/robots.txt"), 1);
}

TEST_F(CrawlerTest, ExternalLinksStayInSeedDomain) {
    web->page("http://www.example.com/",
              R"(<a href="/a">a</a><a href="http://blog.example.com/">blog</a>)"
              R"(<a href="http://other.org/">other</a>)");
    web->page("http://www.example.com/a", "a");
    web->page("http://blog.example.com/", "blog");
    web->page("http://other.org/", "other");

    auto config              = run_config("http://www.example.com/", 2);
    config.ignore_robots_txt = true;

    Crawler crawler(options());
    EXPECT_EQ(crawl(crawler, config), RunState::Completed);

    EXPECT_EQ(web->count("http://other.org/"), 0);
    EXPECT_EQ(result_urls(),
              (std::set<std::string>{"http://www.example.com/", "http://www.example.com/a",
                                     "http://blog.example.com/"}));

    auto seed = sink->find("http://www.example.com/");
    ASSERT_TRUE(seed.has_value());
    ASSERT_EQ(seed->links.size(), 3);
    EXPECT_EQ(seed->links[0].scope, Arachne::Utils::Html::LinkScope::SameDomain);
    EXPECT_EQ(seed->links[1].scope, Arachne::Utils::Html::LinkScope::DifferentSubDomain);
    EXPECT_EQ(seed->links[2].url, "http://other.org/");
    EXPECT_EQ(seed->links[2].scope, Arachne::Utils::Html::LinkScope::External);
}

TEST_F(CrawlerTest, AllDomainsFollowsExternalLinks) {
    web->page("http://example.com/", R"(<a href="http://other.org/">other</a>)");
    web->page("http://other.org/", "other");

    auto config              = run_config("http://example.com/", 1);
    config.ignore_robots_txt = true;
    config.same_domain_only  = false;

    Crawler crawler(options());
    EXPECT_EQ(crawl(crawler, config), RunState::Completed);
    EXPECT_EQ(web->count("http://other.org/"), 1);
}

TEST_F(CrawlerTest, ConcurrentRunsShareRobotsCache) {
    web->page("http://example.com/", R"(<a href="/a">a</a>)");
    web->page("http://example.com/a", "a");
    web->set_delay("http://example.com/robots.txt", std::chrono::milliseconds(50));

    Crawler crawler(options());
    auto    first  = crawler.start_run(run_config("http://example.com/", 1));
    auto    second = crawler.start_run(run_config("http://example.com/a", 0));
    EXPECT_EQ(crawler.wait(first), RunState::Completed);
    EXPECT_EQ(crawler.wait(second), RunState::Completed);
    crawler.dispatcher().wait_idle();

    EXPECT_EQ(web->count("http://example.com/robots.txt"), 1);
    EXPECT_EQ(crawler.robots().fetch_count(), 1);

    std::size_t first_results = 0;
    for (const auto& r : sink->results())
        first_results += r.run_id == first ? 1 : 0;
    EXPECT_EQ(first_results, 2);
    EXPECT_EQ(sink->summaries().size(), 2);
}
