#include <gtest/gtest.h>
#include <boxhunt/source/source_manager.hpp>
#include "fake_http_client.hpp"

#include <chrono>
#include <condition_variable>
#include <stdexcept>

using namespace boxhunt;
using namespace boxhunt::source;

namespace {

// Blocks until `expected` clients are inside search() at once
class Rendezvous {
public:
    explicit Rendezvous(int expected) : expected_(expected) {}

    bool arrive_and_wait() {
        std::unique_lock<std::mutex> lock(mutex_);
        ++arrived_;
        cv_.notify_all();
        return cv_.wait_for(lock, std::chrono::seconds(5),
                            [&] { return arrived_ >= expected_; });
    }

private:
    int expected_;
    int arrived_ = 0;
    std::mutex mutex_;
    std::condition_variable cv_;
};

enum class Behavior { SUCCEED, FAIL, THROW };

class StubClient : public SourceClient {
public:
    StubClient(std::string name, Behavior behavior, int results, Rendezvous* rendezvous = nullptr)
        : name_(std::move(name)), behavior_(behavior), results_(results), rendezvous_(rendezvous) {}

    std::string name() const override { return name_; }
    SourceKind kind() const override { return SourceKind::KEYWORD_API; }

    Result<std::vector<Candidate>> search(const std::string& query, int limit) override {
        last_limit = limit;
        if (rendezvous_) {
            met_others = rendezvous_->arrive_and_wait();
        }
        if (behavior_ == Behavior::THROW) {
            throw std::runtime_error("client blew up");
        }
        if (behavior_ == Behavior::FAIL) {
            return Error(ErrorCode::RATE_LIMITED, "slow down");
        }
        std::vector<Candidate> out;
        for (int i = 0; i < std::min(results_, limit); ++i) {
            Candidate c;
            c.url = "https://" + name_ + ".test/" + query + "/" + std::to_string(i) + ".jpg";
            c.source = name_;
            out.push_back(c);
        }
        return out;
    }

    int last_limit = 0;
    bool met_others = false;

private:
    std::string name_;
    Behavior behavior_;
    int results_;
    Rendezvous* rendezvous_;
};

}  // namespace

TEST(SourceManagerTest, ConcatenatesInRegistrationOrder) {
    SourceManager manager;
    manager.add_client(std::make_unique<StubClient>("alpha", Behavior::SUCCEED, 2));
    manager.add_client(std::make_unique<StubClient>("beta", Behavior::SUCCEED, 3));

    auto results = manager.search("box", 10);
    ASSERT_EQ(results.size(), 5u);
    EXPECT_EQ(results[0].source, "alpha");
    EXPECT_EQ(results[1].source, "alpha");
    EXPECT_EQ(results[2].source, "beta");
    EXPECT_EQ(results[4].source, "beta");

    auto names = manager.available_sources();
    ASSERT_EQ(names.size(), 2u);
    EXPECT_EQ(names[0], "alpha");
    EXPECT_EQ(names[1], "beta");
}

TEST(SourceManagerTest, FailingClientsAreIsolated) {
    SourceManager manager;
    manager.add_client(std::make_unique<StubClient>("good", Behavior::SUCCEED, 4));
    manager.add_client(std::make_unique<StubClient>("throws", Behavior::THROW, 4));
    manager.add_client(std::make_unique<StubClient>("errors", Behavior::FAIL, 4));

    auto results = manager.search("box", 10);
    ASSERT_EQ(results.size(), 4u);
    for (const auto& c : results) {
        EXPECT_EQ(c.source, "good");
    }
}

TEST(SourceManagerTest, ClientsRunConcurrently) {
    Rendezvous rendezvous(3);
    auto a = std::make_unique<StubClient>("a", Behavior::SUCCEED, 1, &rendezvous);
    auto b = std::make_unique<StubClient>("b", Behavior::THROW, 1, &rendezvous);
    auto c = std::make_unique<StubClient>("c", Behavior::SUCCEED, 1, &rendezvous);
    StubClient* a_ptr = a.get();
    StubClient* c_ptr = c.get();

    SourceManager manager;
    manager.add_client(std::move(a));
    manager.add_client(std::move(b));
    manager.add_client(std::move(c));

    auto results = manager.search("box", 5);
    EXPECT_EQ(results.size(), 2u);
    EXPECT_TRUE(a_ptr->met_others);
    EXPECT_TRUE(c_ptr->met_others);
    EXPECT_EQ(a_ptr->last_limit, 5);
}

TEST(SourceManagerTest, NoClientsOrBadArgumentsGiveEmpty) {
    SourceManager empty;
    EXPECT_TRUE(empty.search("box", 10).empty());

    SourceManager manager;
    manager.add_client(std::make_unique<StubClient>("alpha", Behavior::SUCCEED, 2));
    EXPECT_TRUE(manager.search("", 10).empty());
    EXPECT_TRUE(manager.search("box", 0).empty());
}

TEST(SourceManagerTest, TestSourcesReportsPerClient) {
    SourceManager manager;
    manager.add_client(std::make_unique<StubClient>("good", Behavior::SUCCEED, 9));
    manager.add_client(std::make_unique<StubClient>("bad", Behavior::FAIL, 9));

    auto results = manager.test_sources("cardboard box", 5);
    ASSERT_EQ(results.size(), 2u);
    EXPECT_TRUE(results[0].ok);
    EXPECT_EQ(results[0].candidates, 5u);
    EXPECT_FALSE(results[1].ok);
    EXPECT_NE(results[1].error.find("RATE_LIMITED"), std::string::npos);
}

TEST(SourceManagerTest, FromConfigSkipsSourcesWithoutKeys) {
    boxhunt::testing::FakeHttpClient http;
    HarvestConfig config;
    config.pexels_api_key = "key";
    config.unsplash_access_key = "";

    auto manager = SourceManager::from_config(config, &http, nullptr);
    auto names = manager->available_sources();
    ASSERT_EQ(names.size(), 1u);
    EXPECT_EQ(names[0], "pexels");

    config.unsplash_access_key = "other";
    config.enabled_sources = {"unsplash"};
    manager = SourceManager::from_config(config, &http, nullptr);
    names = manager->available_sources();
    ASSERT_EQ(names.size(), 1u);
    EXPECT_EQ(names[0], "unsplash");
}
