#include <gtest/gtest.h>
#include "../include/rag.hpp"
#include "test_support.hpp"
#include <algorithm>

class KnowledgeBaseTest : public ::testing::Test {
protected:
    void SetUp() override { build_site(*fetcher_); }

    std::unique_ptr<KnowledgeBase> make_kb(std::shared_ptr<FakeFetcher> fetcher = nullptr) {
        return std::make_unique<KnowledgeBase>(cfg_, fetcher ? fetcher : fetcher_, embedder_, answerer_,
                                               std::make_shared<SessionStore>(cfg_.store.db_path));
    }

    TempDir dir_;
    SiteRagConfig cfg_{test_rag_config(dir_)};
    std::shared_ptr<FakeFetcher> fetcher_{std::make_shared<FakeFetcher>()};
    std::shared_ptr<FakeEmbedder> embedder_{std::make_shared<FakeEmbedder>()};
    std::shared_ptr<FakeAnswerer> answerer_{std::make_shared<FakeAnswerer>()};
};

TEST_F(KnowledgeBaseTest, BuildsFromPagesAndPdfs) {
    auto kb = make_kb();
    ASSERT_TRUE(kb->start_build(BuildMode::Update));
    kb->wait_for_build();

    auto st = kb->status();
    ASSERT_TRUE(st.ready) << st.last_error;
    EXPECT_FALSE(st.building);
    EXPECT_EQ(st.pages_crawled, 2);
    EXPECT_EQ(st.pdfs_processed, 1);
    EXPECT_GE(st.chunk_count, 3u);
    EXPECT_EQ(st.source, "fresh crawl");
    EXPECT_GT(st.last_build_time, 0.0);

    auto snap = kb->snapshot();
    ASSERT_TRUE(snap);
    auto starts_with = [&](const std::string& prefix) {
        return std::any_of(snap->chunks.begin(), snap->chunks.end(),
                           [&](const Chunk& c) { return c.text.rfind(prefix, 0) == 0; });
    };
    EXPECT_TRUE(starts_with("SOURCE: Page A (WEB: https://site.test/)"));
    EXPECT_TRUE(starts_with("SOURCE: Page B (WEB: https://site.test/b)"));
    EXPECT_TRUE(starts_with("SOURCE: Doc (PDF: doc.pdf)"));
    EXPECT_EQ(snap->index.size(), snap->chunks.size());
    EXPECT_TRUE(std::filesystem::exists(std::filesystem::path(cfg_.crawl.pdf_dir) / "doc.pdf"));
    EXPECT_EQ(kb->store_stats().total_pdfs, 1);
}

TEST_F(KnowledgeBaseTest, RefusesQueriesUntilReady) {
    auto kb = make_kb();
    EXPECT_EQ(kb->query("   ", {}).error, "No question provided");
    auto res = kb->query("When are fees due?", {});
    EXPECT_EQ(res.error, "System is still loading the knowledge base");
    EXPECT_TRUE(res.answer.empty());
}

TEST_F(KnowledgeBaseTest, AnswersWithFormattedTextAndLinks) {
    answerer_->set_reply("- **Fees** are due in March.\n- Pay online.");
    auto kb = make_kb();
    kb->start_build(BuildMode::Update);
    kb->wait_for_build();

    auto res = kb->query("When are fees due?", {});
    ASSERT_TRUE(res.error.empty()) << res.error;
    EXPECT_EQ(res.answer.rfind("Fees are due in March. Pay online.", 0), 0u);
    EXPECT_NE(res.answer.find("**Helpful Links:**"), std::string::npos);
    EXPECT_EQ(res.suggestions, default_suggestions());
    EXPECT_EQ(answerer_->last_prompt(), "When are fees due?");
    EXPECT_EQ(answerer_->last_context().size(), std::min<std::size_t>(3, kb->status().chunk_count));
    EXPECT_EQ(res.sources.size(), answerer_->last_context().size());
}

TEST_F(KnowledgeBaseTest, SingleChunkStillAnswers) {
    auto f = std::make_shared<FakeFetcher>();
    f->page("https://site.test/",
            html_page("Only", {"There is exactly one page of content on this tiny site today.",
                               "It still has to be long enough for the extractor to keep."}));
    auto kb = make_kb(f);
    kb->start_build(BuildMode::Update);
    kb->wait_for_build();
    ASSERT_EQ(kb->status().chunk_count, 1u);

    auto res = kb->query("What is here?", {});
    ASSERT_TRUE(res.error.empty()) << res.error;
    EXPECT_EQ(res.sources.size(), 1u);
}

TEST_F(KnowledgeBaseTest, HistoryShapesPromptButNotRetrieval) {
    answerer_->set_suggestions({"Can I pay late?"});
    auto kb = make_kb();
    kb->start_build(BuildMode::Update);
    kb->wait_for_build();

    std::vector<Exchange> history = {{"What are the fees?", "They are due in March."}};
    auto res = kb->query("How do I pay?", history);
    ASSERT_TRUE(res.error.empty());
    EXPECT_EQ(answerer_->last_prompt(),
              "Context: Previous: What are the fees? Answer: They are due in March.\n\nCurrent question: How do I pay?");
    EXPECT_EQ(res.suggestions, (std::vector<std::string>{"Can I pay late?"}));
}

TEST_F(KnowledgeBaseTest, ReloadsSavedSessionWithoutCrawling) {
    std::size_t built_chunks = 0;
    {
        auto kb = make_kb();
        kb->start_build(BuildMode::Update);
        kb->wait_for_build();
        built_chunks = kb->status().chunk_count;
    }
    auto offline = std::make_shared<FakeFetcher>();
    auto kb = make_kb(offline);
    ASSERT_TRUE(kb->start_build(BuildMode::LoadOrBuild));
    kb->wait_for_build();

    auto st = kb->status();
    ASSERT_TRUE(st.ready);
    EXPECT_EQ(st.source, "database");
    EXPECT_EQ(st.chunk_count, built_chunks);
    EXPECT_EQ(st.pages_crawled, 2);
    EXPECT_TRUE(offline->requests().empty());
    EXPECT_TRUE(kb->query("When are fees due?", {}).error.empty());
}

TEST_F(KnowledgeBaseTest, LoadOrBuildCrawlsWhenStoreIsEmpty) {
    auto kb = make_kb();
    kb->start_build(BuildMode::LoadOrBuild);
    kb->wait_for_build();
    EXPECT_EQ(kb->status().source, "fresh crawl");
}

TEST_F(KnowledgeBaseTest, SecondBuildIsRefusedWhileRunning) {
    auto kb = make_kb();
    auto gate = fetcher_->hold();
    ASSERT_TRUE(kb->start_build(BuildMode::Update));
    EXPECT_FALSE(kb->start_build(BuildMode::ForceRebuild));
    EXPECT_TRUE(kb->status().building);
    gate.set_value();
    kb->wait_for_build();

    EXPECT_FALSE(kb->status().building);
    EXPECT_TRUE(kb->status().ready);
    EXPECT_EQ(kb->store_stats().total_sessions, 1);
}

TEST_F(KnowledgeBaseTest, FailedBuildIsReported) {
    auto kb = make_kb();
    kb->start_build(BuildMode::Update);
    kb->wait_for_build();
    ASSERT_TRUE(kb->status().ready);

    embedder_->fail = true;
    kb->start_build(BuildMode::Update);
    kb->wait_for_build();
    auto st = kb->status();
    EXPECT_FALSE(st.ready);
    EXPECT_NE(st.last_error.find("embedding service unavailable"), std::string::npos);
    EXPECT_EQ(kb->query("When are fees due?", {}).error, "System is still loading the knowledge base");

    embedder_->fail = false;
    kb->start_build(BuildMode::Update);
    kb->wait_for_build();
    EXPECT_TRUE(kb->status().ready);
    EXPECT_TRUE(kb->status().last_error.empty());
}

TEST_F(KnowledgeBaseTest, ForceRebuildKeepsOneActiveSession) {
    auto kb = make_kb();
    kb->start_build(BuildMode::Update);
    kb->wait_for_build();
    kb->start_build(BuildMode::ForceRebuild);
    kb->wait_for_build();

    auto stats = kb->store_stats();
    EXPECT_EQ(stats.total_sessions, 2);
    EXPECT_EQ(stats.active_sessions, 1);
    EXPECT_TRUE(kb->status().ready);
    EXPECT_TRUE(std::filesystem::exists(std::filesystem::path(cfg_.crawl.pdf_dir) / "doc.pdf"));
}

TEST(ConversationHistory, KeepsNewestWithinCapacity) {
    ConversationHistory h(2);
    h.add({"q1", "a1"});
    h.add({"q2", "a2"});
    h.add({"q3", "a3"});
    auto recent = h.recent();
    ASSERT_EQ(recent.size(), 2u);
    EXPECT_EQ(recent[0].question, "q2");
    EXPECT_EQ(recent[1].question, "q3");
    h.clear();
    EXPECT_TRUE(h.recent().empty());
}

TEST(BuildSupervisor, CapturesTaskErrorsAndFreesSlot) {
    BuildSupervisor sup;
    ASSERT_TRUE(sup.try_start([]() { throw std::runtime_error("crawl exploded"); }));
    sup.wait();
    EXPECT_FALSE(sup.busy());
    EXPECT_EQ(sup.last_error(), "crawl exploded");

    bool ran = false;
    ASSERT_TRUE(sup.try_start([&ran]() { ran = true; }));
    sup.wait();
    EXPECT_TRUE(ran);
    EXPECT_TRUE(sup.last_error().empty());
}

TEST(ReadinessGuard, PublishClearsFailure) {
    ReadinessGuard guard;
    EXPECT_FALSE(guard.ready());
    guard.publish(std::make_shared<KnowledgeSnapshot>());
    EXPECT_TRUE(guard.ready());
    guard.mark_failed("boom");
    EXPECT_FALSE(guard.ready());
    EXPECT_TRUE(guard.snapshot() != nullptr);
    guard.publish(std::make_shared<KnowledgeSnapshot>());
    EXPECT_TRUE(guard.ready());
    EXPECT_TRUE(guard.last_error().empty());
}
