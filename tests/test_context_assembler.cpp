#include <catch2/catch_test_macros.hpp>
#include "context_assembler.hpp"
#include "config.hpp"
#include "errors.hpp"
#include "test_helpers.hpp"
#include <limits>

using namespace engram;

static constexpr uint32_t kDims = 4;

static Deadline soon() { return deadline_after(std::chrono::seconds(5)); }

struct AssemblerFixture {
    ManualClock clock;
    MemoryStore store;
    FakeEmbedder embedder{kDims};

    AssemblerFixture()
        : store(std::make_shared<InMemoryStore>(), options(), clock) {}

    static StoreOptions options() {
        StoreOptions opts;
        opts.dimensions = kDims;
        return opts;
    }

    void add_intervention(const std::string& text, Outcome outcome, Embedding emb) {
        Intervention rec;
        rec.user_id = "alice";
        rec.intervention_text = text;
        rec.context_text = "ctx";
        rec.outcome = outcome;
        rec.embedding = std::move(emb);
        store.put(rec);
        clock.advance(1);
    }

    void add_reflection(const std::string& insight) {
        Reflection r;
        r.user_id = "alice";
        r.insight_text = insight;
        store.put(r);
        clock.advance(1);
    }
};

TEST_CASE("ContextOptions: from_config copies limits", "[context]") {
    ContextConfig cfg;
    cfg.max_reflections = 5;
    cfg.max_similar = 1;
    cfg.similarity_threshold = 0.5;
    auto opts = ContextOptions::from_config(cfg);
    REQUIRE(opts.max_reflections == 5);
    REQUIRE(opts.max_similar == 1);
    REQUIRE(opts.similarity_threshold == 0.5);
}

TEST_CASE("ContextAssembler: new user gets an empty bundle", "[context]") {
    AssemblerFixture f;
    ContextAssembler assembler(f.store, &f.embedder);

    auto bundle = assembler.assemble("nobody", "hello", soon());
    REQUIRE(bundle.empty());
    REQUIRE(render_bundle(bundle) == "New user - no history yet.");
}

TEST_CASE("ContextAssembler: keeps only the most recent reflections", "[context]") {
    AssemblerFixture f;
    f.add_reflection("R1");
    f.add_reflection("R2");
    f.add_reflection("R3");
    f.add_reflection("R4");
    ContextAssembler assembler(f.store, &f.embedder);

    auto bundle = assembler.assemble("alice");
    REQUIRE(bundle.recent_reflections.size() == 3);
    REQUIRE(bundle.recent_reflections[0] == "R4");
    REQUIRE(bundle.recent_reflections[2] == "R2");
}

TEST_CASE("ContextAssembler: reflections ordered newest first", "[context]") {
    AssemblerFixture f;
    f.add_reflection("R1");
    f.add_reflection("R2");
    ContextAssembler assembler(f.store, nullptr);

    auto bundle = assembler.assemble("alice");
    REQUIRE(bundle.recent_reflections.size() == 2);
    REQUIRE(bundle.recent_reflections[0] == "R2");
    REQUIRE(bundle.recent_reflections[1] == "R1");
}

TEST_CASE("ContextAssembler: count covers every live intervention", "[context]") {
    AssemblerFixture f;
    f.add_intervention("a", Outcome::Distracted, axis_vector(kDims, 0));
    f.add_intervention("b", Outcome::TaskCompleted, axis_vector(kDims, 1));
    ContextAssembler assembler(f.store, &f.embedder);

    REQUIRE(assembler.assemble("alice").intervention_count == 2);
}

TEST_CASE("ContextAssembler: similar successes filtered by outcome and threshold", "[context]") {
    AssemblerFixture f;
    f.embedder.set("I can't start my essay", axis_vector(kDims, 0));
    f.add_intervention("close win", Outcome::TaskCompleted, axis_vector(kDims, 0, 0.2f));
    f.add_intervention("close loss", Outcome::Abandoned, axis_vector(kDims, 0));
    f.add_intervention("unrelated win", Outcome::ReEngaged, axis_vector(kDims, 2));
    ContextAssembler assembler(f.store, &f.embedder);

    auto bundle = assembler.assemble("alice", "I can't start my essay", soon());
    REQUIRE(bundle.similar_successes.size() == 1);
    REQUIRE(bundle.similar_successes[0].intervention_text == "close win");
    REQUIRE(bundle.similar_successes[0].similarity >= 0.7);
    REQUIRE(bundle.intervention_count == 3);
}

TEST_CASE("ContextAssembler: similar successes capped at max_similar", "[context]") {
    AssemblerFixture f;
    f.embedder.set("msg", axis_vector(kDims, 0));
    for (int i = 0; i < 5; ++i) {
        f.add_intervention("win " + std::to_string(i), Outcome::TaskCompleted,
                           axis_vector(kDims, 0, 0.01f * static_cast<float>(i)));
    }
    ContextAssembler assembler(f.store, &f.embedder);

    auto bundle = assembler.assemble("alice", "msg", soon());
    REQUIRE(bundle.similar_successes.size() == 3);
    REQUIRE(bundle.similar_successes[0].intervention_text == "win 0");
}

TEST_CASE("ContextAssembler: blank message skips embedding", "[context]") {
    AssemblerFixture f;
    f.add_intervention("a", Outcome::TaskCompleted, axis_vector(kDims, 0));
    ContextAssembler assembler(f.store, &f.embedder);

    auto bundle = assembler.assemble("alice", "   ", soon());
    REQUIRE(f.embedder.calls.load() == 0);
    REQUIRE(bundle.similar_successes.empty());
    REQUIRE(bundle.intervention_count == 1);
}

TEST_CASE("ContextAssembler: embedding failure leaves a partial bundle", "[context]") {
    AssemblerFixture f;
    f.add_reflection("R1");
    f.add_intervention("a", Outcome::TaskCompleted, axis_vector(kDims, 0));
    f.embedder.fail_next(1);
    ContextAssembler assembler(f.store, &f.embedder);

    PersonalizationBundle bundle;
    REQUIRE_NOTHROW(bundle = assembler.assemble("alice", "help", soon()));
    REQUIRE(bundle.recent_reflections.size() == 1);
    REQUIRE(bundle.intervention_count == 1);
    REQUIRE(bundle.similar_successes.empty());
}

TEST_CASE("ContextAssembler: expired deadline leaves a partial bundle", "[context]") {
    AssemblerFixture f;
    f.add_reflection("R1");
    ContextAssembler assembler(f.store, &f.embedder);

    auto past = std::chrono::steady_clock::now() - std::chrono::milliseconds(1);
    auto bundle = assembler.assemble("alice", "help", past);
    REQUIRE(bundle.recent_reflections.size() == 1);
    REQUIRE(bundle.similar_successes.empty());
}

TEST_CASE("ContextAssembler: embedder with wrong dimensions is ignored", "[context]") {
    AssemblerFixture f;
    f.add_intervention("a", Outcome::TaskCompleted, axis_vector(kDims, 0));
    FakeEmbedder wide(kDims + 2);
    ContextAssembler assembler(f.store, &wide);

    auto bundle = assembler.assemble("alice", "help", soon());
    REQUIRE(bundle.similar_successes.empty());
    REQUIRE(bundle.intervention_count == 1);
}

TEST_CASE("ContextAssembler: non-finite query embedding leaves a partial bundle", "[context]") {
    AssemblerFixture f;
    f.add_reflection("R1");
    f.add_intervention("a", Outcome::TaskCompleted, axis_vector(kDims, 0));
    Embedding bad = axis_vector(kDims, 0);
    bad[1] = std::numeric_limits<float>::infinity();
    f.embedder.set("help", bad);
    ContextAssembler assembler(f.store, &f.embedder);

    PersonalizationBundle bundle;
    REQUIRE_NOTHROW(bundle = assembler.assemble("alice", "help", soon()));
    REQUIRE(bundle.recent_reflections.size() == 1);
    REQUIRE(bundle.intervention_count == 1);
    REQUIRE(bundle.similar_successes.empty());
}

TEST_CASE("ContextAssembler: store outage propagates", "[context]") {
    ManualClock clock;
    StoreOptions opts;
    opts.dimensions = kDims;
    MemoryStore store(std::make_shared<UnavailableStore>(), opts, clock);
    ContextAssembler assembler(store, nullptr);
    REQUIRE_THROWS_AS(assembler.assemble("alice"), StoreUnavailableError);
}

// ── Rendering ────────────────────────────────────────────────

TEST_CASE("render_bundle: sections appear in order", "[context][render]") {
    PersonalizationBundle bundle;
    bundle.recent_reflections = {"Prefers mornings."};
    bundle.intervention_count = 4;
    SimilarSuccess s;
    s.intervention_text = "Set a 10 minute timer";
    s.context_text = "procrastinating on email";
    s.outcome = Outcome::TaskCompleted;
    s.similarity = 0.912;
    bundle.similar_successes.push_back(s);

    auto text = render_bundle(bundle);
    auto insights = text.find("## Key insights from past sessions:\n- Prefers mornings.");
    auto worked = text.find("## What worked in similar situations:\n- Set a 10 minute timer"
                            " (context: procrastinating on email) [task_completed, similarity 0.91]");
    auto status = text.find("## Memory status:\n- 4 past interventions stored");
    REQUIRE(insights != std::string::npos);
    REQUIRE(worked != std::string::npos);
    REQUIRE(status != std::string::npos);
    REQUIRE(insights < worked);
    REQUIRE(worked < status);
}

TEST_CASE("render_bundle: count-only bundle", "[context][render]") {
    PersonalizationBundle bundle;
    bundle.intervention_count = 1;
    REQUIRE(render_bundle(bundle) == "## Memory status:\n- 1 past interventions stored");
}
