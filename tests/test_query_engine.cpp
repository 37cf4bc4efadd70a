#include "test_fixtures.hpp"
#include "core/query/query_contract.hpp"
#include <condition_variable>
#include <thread>

using namespace trustpath;
using namespace trustpath::core;
using namespace trustpath::test_support;

namespace {

// Holds open_snapshot() callers until release(); everything else forwards
class HeldPort : public GraphAccessPort {
public:
    explicit HeldPort(std::shared_ptr<GraphAccessPort> inner)
        : inner_(std::move(inner))
    {}

    std::shared_ptr<const GraphSnapshot> open_snapshot() const override {
        std::unique_lock<std::mutex> lock(mutex_);
        ++waiting_;
        cv_.notify_all();
        cv_.wait(lock, [this]() { return released_; });
        return inner_->open_snapshot();
    }

    SubscriptionId subscribe(ChangeListener listener) override {
        return inner_->subscribe(std::move(listener));
    }

    void unsubscribe(SubscriptionId id) override {
        inner_->unsubscribe(id);
    }

    void wait_for_caller() {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this]() { return waiting_ > 0; });
    }

    void release() {
        std::lock_guard<std::mutex> lock(mutex_);
        released_ = true;
        cv_.notify_all();
    }

private:
    std::shared_ptr<GraphAccessPort> inner_;
    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;
    mutable int waiting_ = 0;
    bool released_ = false;
};

} // namespace

class QueryEngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        graph.domain("D").domain("E");
    }

    std::unique_ptr<TrustQueryEngine> make_engine(EngineConfig config = sequential_config()) {
        return std::make_unique<TrustQueryEngine>(graph.store(), config, fixed_clock());
    }

    static TrustQuery query(const std::string& source, const std::string& target,
                            const std::string& domain = "D") {
        TrustQuery q;
        q.source = source;
        q.target = target;
        q.domain = domain;
        return q;
    }

    GraphBuilder graph;
};

TEST_F(QueryEngineTest, NoPathIsDefiniteZero) {
    graph.principal("A").principal("B");
    auto engine = make_engine();

    auto result = engine->evaluate(query("A", "B"));
    ASSERT_TRUE(result.is_ok());
    EXPECT_DOUBLE_EQ(result.value().score, 0.0);
    EXPECT_DOUBLE_EQ(result.value().confidence, 1.0);
    EXPECT_TRUE(result.value().explanation.empty());
    EXPECT_FALSE(result.value().truncated);
    EXPECT_EQ(result.value().computed_at, kNow);
}

TEST_F(QueryEngineTest, SelfTrustIsFull) {
    graph.principal("A");
    auto engine = make_engine();

    auto result = engine->evaluate(query("A", "A"));
    ASSERT_TRUE(result.is_ok());
    EXPECT_DOUBLE_EQ(result.value().score, 1.0);
    ASSERT_EQ(result.value().explanation.size(), 1u);
    EXPECT_EQ(result.value().explanation[0].path, (std::vector<std::string>{"A"}));
}

TEST_F(QueryEngineTest, TwoHopScore) {
    graph.chain({"A", "B"}, 0.9).chain({"B", "C"}, 0.8);
    auto engine = make_engine();

    auto result = engine->evaluate(query("A", "C"));
    ASSERT_TRUE(result.is_ok());
    const auto& r = result.value();
    EXPECT_NEAR(r.score, 0.5832, 1e-9);
    ASSERT_EQ(r.explanation.size(), 1u);
    EXPECT_EQ(r.explanation[0].path, (std::vector<std::string>{"A", "B", "C"}));
    EXPECT_NEAR(r.explanation[0].raw_confidence, 0.5832, 1e-9);
    EXPECT_DOUBLE_EQ(r.explanation[0].applied_discount, 0.0);
    EXPECT_EQ(r.target_kind, TargetKind::Principal);
    EXPECT_EQ(r.max_depth, constants::DEFAULT_MAX_DEPTH);
    EXPECT_EQ(r.stats.edges_considered, 2u);
    EXPECT_GT(r.confidence, 0.0);
    EXPECT_LT(r.confidence, 1.0);
}

TEST_F(QueryEngineTest, SubjectTargetScoredThroughEndorsement) {
    graph.chain({"A", "B"}, 0.9).subject("S").endorse("B", "S", 0.8);
    auto engine = make_engine();

    auto result = engine->evaluate(query("A", "S"));
    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value().target_kind, TargetKind::Subject);
    EXPECT_NEAR(result.value().score, 0.5832, 1e-9);
    ASSERT_EQ(result.value().explanation.size(), 1u);
    EXPECT_EQ(result.value().explanation[0].path, (std::vector<std::string>{"A", "B", "S"}));
}

TEST_F(QueryEngineTest, MorePathsNeverLowerScore) {
    graph.chain({"A", "B", "T"}, 0.8);
    auto engine = make_engine();
    double before = engine->evaluate(query("A", "T")).value().score;

    graph.chain({"A", "C", "T"}, 0.6);
    double after = engine->evaluate(query("A", "T")).value().score;
    EXPECT_GT(after, before);
}

TEST_F(QueryEngineTest, SharedIntermediaryDiscounted) {
    graph.chain({"A", "M"}, 0.9)
         .chain({"M", "X1", "T"}, 0.9)
         .chain({"M", "X2", "T"}, 0.9);
    GraphBuilder independent;
    independent.domain("D")
               .chain({"A", "M1", "X1", "T"}, 0.9)
               .chain({"A", "M2", "X2", "T"}, 0.9);

    auto shared_engine = make_engine();
    TrustQueryEngine independent_engine(independent.store(), sequential_config(), fixed_clock());

    auto shared = shared_engine->evaluate(query("A", "T"));
    auto separate = independent_engine.evaluate(query("A", "T"));
    ASSERT_TRUE(shared.is_ok());
    ASSERT_TRUE(separate.is_ok());

    ASSERT_EQ(shared.value().explanation.size(), 2u);
    EXPECT_DOUBLE_EQ(shared.value().explanation[1].applied_discount, 0.5);
    EXPECT_LT(shared.value().score, separate.value().score);
    EXPECT_LT(shared.value().confidence, separate.value().confidence);

    double p = 0.9 * 0.9 * 0.9 * 0.729;
    EXPECT_NEAR(shared.value().score, 1.0 - (1.0 - p) * (1.0 - 0.5 * p), 1e-9);
    EXPECT_NEAR(separate.value().score, 1.0 - (1.0 - p) * (1.0 - p), 1e-9);
}

TEST_F(QueryEngineTest, TamperedEdgeIgnored) {
    graph.principal("A").principal("B").principal("C");
    graph.trust("A", "B", 0.9);
    auto forged = graph.make_trust("B", "C", 0.2);
    forged.weight = 0.95;
    graph.add(forged);
    auto engine = make_engine();

    auto result = engine->evaluate(query("A", "C"));
    ASSERT_TRUE(result.is_ok());
    EXPECT_DOUBLE_EQ(result.value().score, 0.0);
    EXPECT_EQ(result.value().stats.invalid_signature, 1u);
    EXPECT_EQ(engine->stats().invalid_signature, 1u);
}

TEST_F(QueryEngineTest, RepeatedQueryServedFromCache) {
    graph.chain({"A", "B", "C"}, 0.8);
    auto engine = make_engine();

    auto first = engine->evaluate(query("A", "C"));
    auto second = engine->evaluate(query("A", "C"));
    ASSERT_TRUE(first.is_ok());
    ASSERT_TRUE(second.is_ok());
    EXPECT_FALSE(first.value().from_cache);
    EXPECT_TRUE(second.value().from_cache);
    EXPECT_DOUBLE_EQ(first.value().score, second.value().score);
    EXPECT_EQ(engine->stats().cache_hits, 1u);
    EXPECT_EQ(engine->stats().computations, 1u);
    EXPECT_EQ(engine->cache_size(), 1u);
}

TEST_F(QueryEngineTest, EdgeChangeInvalidatesDependentResults) {
    graph.chain({"A", "B", "C"}, 0.8);
    auto engine = make_engine();
    double before = engine->evaluate(query("A", "C")).value().score;

    // A change in an unrelated domain leaves the entry alone
    graph.trust("A", "C", 0.9, "E");
    EXPECT_TRUE(engine->evaluate(query("A", "C")).value().from_cache);

    graph.trust("A", "C", 0.9);
    auto after = engine->evaluate(query("A", "C"));
    ASSERT_TRUE(after.is_ok());
    EXPECT_FALSE(after.value().from_cache);
    EXPECT_GT(after.value().score, before);
}

TEST_F(QueryEngineTest, DistrustChangeInvalidatesAndExcludes) {
    graph.chain({"A", "B", "C"}, 0.8);
    auto engine = make_engine();
    EXPECT_GT(engine->evaluate(query("A", "C")).value().score, 0.0);

    graph.distrust("A", "B");
    auto result = engine->evaluate(query("A", "C"));
    ASSERT_TRUE(result.is_ok());
    EXPECT_FALSE(result.value().from_cache);
    EXPECT_DOUBLE_EQ(result.value().score, 0.0);
    EXPECT_EQ(result.value().stats.distrust_excluded, 1u);
}

TEST_F(QueryEngineTest, ParentDomainChangeInvalidatesChild) {
    graph.domain("D.child", std::string("D"));
    graph.chain({"A", "B"}, 0.8);
    auto engine = make_engine();
    ASSERT_TRUE(engine->evaluate(query("A", "B", "D.child")).is_ok());

    graph.trust("A", "B", 0.5);
    EXPECT_FALSE(engine->evaluate(query("A", "B", "D.child")).value().from_cache);
}

TEST_F(QueryEngineTest, KeyRotationClearsCache) {
    graph.chain({"A", "B", "C"}, 0.8);
    auto engine = make_engine();
    EXPECT_GT(engine->evaluate(query("A", "C")).value().score, 0.0);

    // New key for B: B's stored edge no longer verifies
    graph.principal("B");
    auto result = engine->evaluate(query("A", "C"));
    ASSERT_TRUE(result.is_ok());
    EXPECT_FALSE(result.value().from_cache);
    EXPECT_DOUBLE_EQ(result.value().score, 0.0);
    EXPECT_EQ(result.value().stats.invalid_signature, 1u);
}

TEST_F(QueryEngineTest, ExpiredCacheEntryRecomputed) {
    graph.chain({"A", "B"}, 0.8);
    uint64_t now = kNow;
    EngineConfig config = sequential_config();
    config.cache_ttl_seconds = 60;
    TrustQueryEngine engine(graph.store(), config, [&now]() { return now; });

    ASSERT_TRUE(engine.evaluate(query("A", "B")).is_ok());
    now += 30;
    EXPECT_TRUE(engine.evaluate(query("A", "B")).value().from_cache);
    now += 60;
    auto result = engine.evaluate(query("A", "B"));
    EXPECT_FALSE(result.value().from_cache);
    EXPECT_EQ(result.value().computed_at, now);
}

TEST_F(QueryEngineTest, ExpiredEdgeNotServedFromCache) {
    graph.principal("A").principal("B");
    graph.trust("A", "B", 0.9, "D", kNow - kDay, kNow + 100);
    uint64_t now = kNow;
    TrustQueryEngine engine(graph.store(), sequential_config(), [&now]() { return now; });

    auto live = engine.evaluate(query("A", "B"));
    ASSERT_TRUE(live.is_ok());
    EXPECT_GT(live.value().score, 0.0);
    EXPECT_EQ(engine.cache_size(), 1u);

    // Still inside the edge's validity window
    now = kNow + 50;
    EXPECT_TRUE(engine.evaluate(query("A", "B")).value().from_cache);

    now = kNow + 200;
    auto expired = engine.evaluate(query("A", "B"));
    ASSERT_TRUE(expired.is_ok());
    EXPECT_FALSE(expired.value().from_cache);
    EXPECT_DOUBLE_EQ(expired.value().score, 0.0);
    EXPECT_EQ(expired.value().stats.expired, 1u);
}

TEST_F(QueryEngineTest, EdgeBecomingLiveNotMaskedByCache) {
    graph.principal("A").principal("B");
    graph.trust("A", "B", 0.9, "D", kNow + 100);
    uint64_t now = kNow;
    TrustQueryEngine engine(graph.store(), sequential_config(), [&now]() { return now; });

    auto early = engine.evaluate(query("A", "B"));
    ASSERT_TRUE(early.is_ok());
    EXPECT_DOUBLE_EQ(early.value().score, 0.0);
    EXPECT_EQ(early.value().stats.expired, 1u);

    now = kNow + 100;
    auto live = engine.evaluate(query("A", "B"));
    ASSERT_TRUE(live.is_ok());
    EXPECT_FALSE(live.value().from_cache);
    EXPECT_NEAR(live.value().score, 0.9 * 0.9, 1e-9);
}

TEST_F(QueryEngineTest, MinConfidenceReportsWithoutSuppressing) {
    graph.chain({"A", "B", "C"}, 0.8);
    auto engine = make_engine();

    auto q = query("A", "C");
    q.min_confidence = 0.99;
    auto result = engine->evaluate(q);
    ASSERT_TRUE(result.is_ok());
    EXPECT_TRUE(result.value().below_min_confidence);
    EXPECT_DOUBLE_EQ(result.value().score, 0.0);
    EXPECT_EQ(result.value().explanation.size(), 1u);

    // The cached result is unaffected by the filter of an earlier caller
    auto plain = engine->evaluate(query("A", "C"));
    EXPECT_TRUE(plain.value().from_cache);
    EXPECT_FALSE(plain.value().below_min_confidence);
    EXPECT_GT(plain.value().score, 0.0);
}

TEST_F(QueryEngineTest, InvalidQueriesRejected) {
    graph.principal("A").principal("B");
    auto engine = make_engine();

    auto missing = engine->evaluate(query("", "B"));
    ASSERT_TRUE(missing.is_err());
    EXPECT_EQ(missing.error().code(), ErrorCode::InvalidArgument);

    auto zero = query("A", "B");
    zero.max_depth = 0;
    EXPECT_EQ(engine->evaluate(zero).error().code(), ErrorCode::InvalidArgument);

    auto deep = query("A", "B");
    deep.max_depth = constants::MAX_DEPTH_LIMIT + 1;
    EXPECT_EQ(engine->evaluate(deep).error().code(), ErrorCode::OutOfRange);

    auto bad_confidence = query("A", "B");
    bad_confidence.min_confidence = 1.5;
    EXPECT_EQ(engine->evaluate(bad_confidence).error().code(), ErrorCode::InvalidArgument);

    auto unknown = engine->evaluate(query("A", "B", "nowhere"));
    ASSERT_TRUE(unknown.is_err());
    EXPECT_EQ(unknown.error().code(), ErrorCode::UnknownDomain);
    EXPECT_FALSE(unknown.error().retryable());

    EXPECT_EQ(engine->stats().rejected_queries, 5u);
}

TEST_F(QueryEngineTest, StorageOutageIsRetryable) {
    graph.chain({"A", "B"}, 0.8);
    auto engine = make_engine();

    graph.store()->set_available(false);
    auto failed = engine->evaluate(query("A", "B"));
    ASSERT_TRUE(failed.is_err());
    EXPECT_EQ(failed.error().code(), ErrorCode::PortUnavailable);
    EXPECT_TRUE(failed.error().retryable());
    EXPECT_EQ(engine->stats().port_failures, 1u);
    EXPECT_EQ(engine->cache_size(), 0u);

    graph.store()->set_available(true);
    auto recovered = engine->evaluate(query("A", "B"));
    ASSERT_TRUE(recovered.is_ok());
    EXPECT_NEAR(recovered.value().score, 0.8 * 0.9, 1e-9);
}

TEST_F(QueryEngineTest, OutageDuringParallelEnumeration) {
    for (int i = 0; i < 6; ++i) {
        graph.chain({"A", "P" + std::to_string(i), "T"}, 0.8);
    }
    EngineConfig config = sequential_config();
    config.parallel_branches = 4;
    auto engine = make_engine(config);

    graph.store()->set_available(false);
    auto failed = engine->evaluate(query("A", "T"));
    ASSERT_TRUE(failed.is_err());
    EXPECT_TRUE(failed.error().retryable());
}

TEST_F(QueryEngineTest, TruncatedResultsFlaggedAndNotCached) {
    graph.chain({"A", "B", "C", "D1", "E1"}, 0.9);
    EngineConfig config = sequential_config();
    config.max_nodes_visited = 2;
    auto engine = make_engine(config);

    auto first = engine->evaluate(query("A", "E1"));
    ASSERT_TRUE(first.is_ok());
    EXPECT_TRUE(first.value().truncated);
    EXPECT_EQ(first.value().stats.truncation_reason, TruncationReason::NodeBudget);
    EXPECT_DOUBLE_EQ(first.value().confidence, 0.0);

    auto second = engine->evaluate(query("A", "E1"));
    EXPECT_FALSE(second.value().from_cache);
    EXPECT_EQ(engine->stats().truncated, 2u);
    EXPECT_EQ(engine->cache_size(), 0u);
}

TEST_F(QueryEngineTest, CancelledQueryReturnsPartialResult) {
    graph.chain({"A", "B", "C"}, 0.9);
    auto engine = make_engine();

    CancellationToken token;
    token.cancel();
    auto result = engine->evaluate(query("A", "C"), &token);
    ASSERT_TRUE(result.is_ok());
    EXPECT_TRUE(result.value().truncated);
    EXPECT_EQ(result.value().stats.truncation_reason, TruncationReason::Cancelled);
}

TEST_F(QueryEngineTest, FollowerDoesNotInheritLeaderCancellation) {
    graph.chain({"A", "B", "C"}, 0.9);
    auto port = std::make_shared<HeldPort>(graph.store());
    TrustQueryEngine engine(port, sequential_config(), fixed_clock());

    CancellationToken token;
    token.cancel();
    Result<TrustResult> leader = Result<TrustResult>::Err(ErrorCode::Unknown, "not run");
    Result<TrustResult> follower = Result<TrustResult>::Err(ErrorCode::Unknown, "not run");

    std::thread leading([&]() { leader = engine.evaluate(query("A", "C"), &token); });
    port->wait_for_caller();
    std::thread following([&]() { follower = engine.evaluate(query("A", "C")); });
    while (engine.stats().coalesced == 0) {
        std::this_thread::yield();
    }
    port->release();
    leading.join();
    following.join();

    ASSERT_TRUE(leader.is_ok());
    EXPECT_TRUE(leader.value().truncated);
    EXPECT_EQ(leader.value().stats.truncation_reason, TruncationReason::Cancelled);

    ASSERT_TRUE(follower.is_ok());
    EXPECT_FALSE(follower.value().truncated);
    EXPECT_EQ(follower.value().stats.truncation_reason, TruncationReason::None);
    EXPECT_NEAR(follower.value().score, 0.9 * 0.9 * 0.81, 1e-9);
    EXPECT_EQ(engine.stats().computations, 2u);
    EXPECT_EQ(engine.cache_size(), 1u);
}

TEST_F(QueryEngineTest, ParallelAndSequentialAgree) {
    for (int j = 0; j < 3; ++j) {
        graph.chain({"Q" + std::to_string(j), "T"}, 0.85 - 0.05 * j);
    }
    for (int i = 0; i < 4; ++i) {
        std::string p = "P" + std::to_string(i);
        graph.chain({"A", p}, 0.9 - 0.1 * i);
        for (int j = 0; j < 3; ++j) {
            graph.trust(p, "Q" + std::to_string(j), 0.8);
        }
    }
    EngineConfig parallel = sequential_config();
    parallel.parallel_branches = 4;

    auto sequential_engine = make_engine();
    auto parallel_engine = make_engine(parallel);
    auto a = sequential_engine->evaluate(query("A", "T"));
    auto b = parallel_engine->evaluate(query("A", "T"));
    ASSERT_TRUE(a.is_ok());
    ASSERT_TRUE(b.is_ok());
    EXPECT_EQ(a.value().score, b.value().score);
    EXPECT_EQ(a.value().confidence, b.value().confidence);
    ASSERT_EQ(a.value().explanation.size(), b.value().explanation.size());
    for (size_t i = 0; i < a.value().explanation.size(); ++i) {
        EXPECT_EQ(a.value().explanation[i].path, b.value().explanation[i].path);
    }
}

TEST_F(QueryEngineTest, ConcurrentCallersAgree) {
    graph.chain({"A", "B", "C", "D1"}, 0.8);
    auto engine = make_engine();

    std::vector<std::thread> threads;
    std::vector<double> scores(8, -1.0);
    for (size_t i = 0; i < scores.size(); ++i) {
        threads.emplace_back([&, i]() {
            auto result = engine->evaluate(query("A", "D1"));
            if (result.is_ok()) {
                scores[i] = result.value().score;
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }
    for (double score : scores) {
        EXPECT_NEAR(score, 0.8 * 0.8 * 0.8 * 0.729, 1e-9);
    }
    auto stats = engine->stats();
    EXPECT_EQ(stats.queries, 8u);
    EXPECT_EQ(stats.computations + stats.cache_hits + stats.coalesced, 8u);
}

TEST_F(QueryEngineTest, InvalidConfigRejectedAtConstruction) {
    EngineConfig config;
    config.decay_factor = 1.5;
    EXPECT_THROW(TrustQueryEngine(graph.store(), config), ConfigException);
}

TEST_F(QueryEngineTest, EngineUnsubscribesOnDestruction) {
    graph.chain({"A", "B"}, 0.8);
    {
        auto engine = make_engine();
        ASSERT_TRUE(engine->evaluate(query("A", "B")).is_ok());
    }
    // Publishing after the engine is gone must not reach it
    graph.trust("A", "B", 0.4);
    SUCCEED();
}

// ---------------------------------------------------------------------------
// JSON contract
// ---------------------------------------------------------------------------

TEST(QueryContractTest, ParsesRequest) {
    auto parsed = query_from_json(json{
        {"source", "A"}, {"target", "B"}, {"domain", "D"}, {"maxDepth", 3}, {"minConfidence", 0.2}
    });
    ASSERT_TRUE(parsed.is_ok());
    EXPECT_EQ(parsed.value().source, "A");
    ASSERT_TRUE(parsed.value().max_depth.has_value());
    EXPECT_EQ(*parsed.value().max_depth, 3u);
    EXPECT_DOUBLE_EQ(*parsed.value().min_confidence, 0.2);

    auto minimal = query_from_json(json{{"source", "A"}, {"target", "B"}, {"domain", "D"}});
    ASSERT_TRUE(minimal.is_ok());
    EXPECT_FALSE(minimal.value().max_depth.has_value());
    EXPECT_FALSE(minimal.value().min_confidence.has_value());
}

TEST(QueryContractTest, RejectsMalformedRequest) {
    EXPECT_TRUE(query_from_json(json::array()).is_err());
    EXPECT_TRUE(query_from_json(json{{"source", "A"}, {"domain", "D"}}).is_err());
    EXPECT_TRUE(query_from_json(json{{"source", 1}, {"target", "B"}, {"domain", "D"}}).is_err());

    json base{{"source", "A"}, {"target", "B"}, {"domain", "D"}};
    auto negative = base;
    negative["maxDepth"] = -1;
    EXPECT_EQ(query_from_json(negative).error().code(), ErrorCode::InvalidArgument);
    auto fractional = base;
    fractional["maxDepth"] = 2.5;
    EXPECT_TRUE(query_from_json(fractional).is_err());
    auto text = base;
    text["minConfidence"] = "high";
    EXPECT_TRUE(query_from_json(text).is_err());
}

TEST(QueryContractTest, ResultBody) {
    TrustResult result;
    result.score = 0.5;
    result.confidence = 0.25;
    result.computed_at = kNow;
    result.target_kind = TargetKind::Subject;
    result.max_depth = 4;
    result.explanation.push_back(ExplanationEntry{{"A", "B", "S"}, 0.5, 0.0});
    result.stats.truncation_reason = TruncationReason::Deadline;
    result.truncated = true;

    json body = to_json(result);
    EXPECT_DOUBLE_EQ(body["score"].get<double>(), 0.5);
    EXPECT_EQ(body["computedAt"], "2026-01-01T00:00:00.000Z");
    EXPECT_EQ(body["targetKind"], "subject");
    EXPECT_EQ(body["explanation"][0]["path"], json({"A", "B", "S"}));
    EXPECT_TRUE(body["truncated"].get<bool>());
    EXPECT_EQ(body["stats"]["truncationReason"], "deadline");
    EXPECT_FALSE(body["fromCache"].get<bool>());

    result.stats.truncation_reason = TruncationReason::None;
    EXPECT_FALSE(to_json(result)["stats"].contains("truncationReason"));
}

TEST(QueryContractTest, ErrorBody) {
    json retry = error_to_json(Error(ErrorCode::PortUnavailable, "Graph store unavailable", "offline"));
    EXPECT_TRUE(retry["retryable"].get<bool>());
    EXPECT_EQ(retry["details"], "offline");

    json terminal = error_to_json(Error(ErrorCode::UnknownDomain, "Unknown domain 'x'"));
    EXPECT_FALSE(terminal["retryable"].get<bool>());
    EXPECT_FALSE(terminal.contains("details"));
}
