/**
 * Tests for TaskQueue and annotate_batch
 */

#include <gtest/gtest.h>
#include "annotator.hpp"
#include "task_queue.hpp"
#include "test_helpers.hpp"

#include <atomic>
#include <stdexcept>

using namespace loctogene;
using namespace loctogene_test;

// ============================================================================
// TaskQueue
// ============================================================================

namespace {

class CountTask : public Task {
public:
    explicit CountTask(std::atomic<int>& counter) : counter_(counter) {}
    void execute() override { ++counter_; }
private:
    std::atomic<int>& counter_;
};

class ThrowingTask : public Task {
public:
    void execute() override { throw std::runtime_error("task blew up"); }
};

class NonStandardThrowTask : public Task {
public:
    void execute() override { throw 42; }
};

} // namespace

TEST(TaskQueue, RunsEverySubmittedTask) {
    std::atomic<int> counter{0};
    TaskQueue queue(4);
    EXPECT_EQ(queue.num_workers(), 4u);

    for (int i = 0; i < 100; ++i) {
        ASSERT_TRUE(queue.submit(std::make_unique<CountTask>(counter)));
    }
    queue.wait();
    EXPECT_EQ(counter.load(), 100);
    EXPECT_EQ(queue.size(), 0u);
}

TEST(TaskQueue, SubmitAfterCloseIsRejected) {
    std::atomic<int> counter{0};
    TaskQueue queue(2);
    queue.close();
    EXPECT_FALSE(queue.submit(std::make_unique<CountTask>(counter)));
    queue.wait();
    EXPECT_EQ(counter.load(), 0);
}

TEST(TaskQueue, ThrowingTaskStillCountsAsDone) {
    std::atomic<int> counter{0};
    TaskQueue queue(2);
    queue.submit(std::make_unique<ThrowingTask>());
    queue.submit(std::make_unique<CountTask>(counter));
    queue.wait();
    EXPECT_EQ(counter.load(), 1);
}

TEST(TaskQueue, NonStandardThrowStillCountsAsDone) {
    std::atomic<int> counter{0};
    TaskQueue queue(1);
    queue.submit(std::make_unique<NonStandardThrowTask>());
    queue.submit(std::make_unique<CountTask>(counter));
    queue.wait();
    EXPECT_EQ(counter.load(), 1);
}

TEST(TaskQueue, WorkerCountClampedToOne) {
    TaskQueue queue(0);
    EXPECT_EQ(queue.num_workers(), 1u);
}

TEST(TaskQueue, DestructorDrainsQueuedTasks) {
    std::atomic<int> counter{0};
    {
        TaskQueue queue(1);
        for (int i = 0; i < 10; ++i) {
            queue.submit(std::make_unique<CountTask>(counter));
        }
    }
    EXPECT_EQ(counter.load(), 10);
}

// ============================================================================
// annotate_batch
// ============================================================================

class BatchTest : public ::testing::Test {
protected:
    void SetUp() override {
        store_ = std::make_shared<MemoryGeneStore>();
        for (int i = 0; i < 20; ++i) {
            uint32_t start = 100000 + static_cast<uint32_t>(i) * 50000;
            add_gene(*store_, "G" + std::to_string(100 + i), "SYM" + std::to_string(i),
                     "chr1", start, start + 10000, '+');
        }
        add_gene(*store_, "BAD1", "BADSYM", "chrBad", 1000, 5000, '+');
        store_->build_index();

        for (int i = 0; i < 20; ++i) {
            uint32_t tss = 100000 + static_cast<uint32_t>(i) * 50000;
            locations_.emplace_back("chr1", tss + 100, tss + 100);
        }
    }

    std::shared_ptr<MemoryGeneStore> store_;
    std::vector<Location> locations_;
};

TEST_F(BatchTest, ResultsKeepInputOrder) {
    Annotator annotator(store_, TSSRegion(2000, 1000), 3);
    BatchOptions options;
    options.threads = 4;

    auto results = annotate_batch(annotator, locations_, options);

    ASSERT_EQ(results.size(), locations_.size());
    for (size_t i = 0; i < results.size(); ++i) {
        EXPECT_TRUE(results[i].ok);
        EXPECT_FALSE(results[i].skipped);
        EXPECT_EQ(results[i].location, locations_[i]);
        ASSERT_EQ(results[i].annotation.gene_ids.size(), 1u);
        EXPECT_EQ(results[i].annotation.gene_ids[0], "G" + std::to_string(100 + i));
        EXPECT_EQ(results[i].annotation.tss_dists[0], "-100");
    }
}

TEST_F(BatchTest, MatchesSequentialAnnotation) {
    Annotator annotator(store_, TSSRegion(2000, 1000), 3);
    BatchOptions options;
    options.threads = 8;

    auto results = annotate_batch(annotator, locations_, options);
    for (size_t i = 0; i < results.size(); ++i) {
        GeneAnnotation expected = annotator.annotate(locations_[i]);
        EXPECT_EQ(results[i].annotation.gene_ids, expected.gene_ids);
        EXPECT_EQ(results[i].annotation.labels, expected.labels);
        ASSERT_EQ(results[i].annotation.closest_genes.size(), expected.closest_genes.size());
        for (size_t j = 0; j < expected.closest_genes.size(); ++j) {
            EXPECT_EQ(results[i].annotation.closest_genes[j].gene_id,
                      expected.closest_genes[j].gene_id);
        }
    }
}

TEST_F(BatchTest, FailureIsIsolatedToItsLocation) {
    auto failing = std::make_shared<FailingGeneStore>(
        store_, FailingGeneStore::Fail::OVERLAP, "chrBad");
    Annotator annotator(failing, TSSRegion(2000, 1000), 3);

    std::vector<Location> locations = locations_;
    locations.insert(locations.begin() + 5, Location("chrBad", 1500, 1500));

    BatchOptions options;
    options.threads = 4;
    auto results = annotate_batch(annotator, locations, options);

    ASSERT_EQ(results.size(), locations.size());
    for (size_t i = 0; i < results.size(); ++i) {
        if (i == 5) {
            EXPECT_FALSE(results[i].ok);
            EXPECT_FALSE(results[i].skipped);
            EXPECT_NE(results[i].error.find("connection lost"), std::string::npos);
            EXPECT_NE(results[i].error.find("chrBad:1500-1500"), std::string::npos);
        } else {
            EXPECT_TRUE(results[i].ok) << results[i].location.to_string();
        }
    }
}

TEST_F(BatchTest, FailFastRethrowsStoreError) {
    auto failing = std::make_shared<FailingGeneStore>(
        store_, FailingGeneStore::Fail::CLOSEST, "chrBad");
    Annotator annotator(failing, TSSRegion(2000, 1000), 3);

    std::vector<Location> locations = locations_;
    locations.push_back(Location("chrBad", 1500, 1500));

    BatchOptions options;
    options.threads = 2;
    options.fail_fast = true;

    EXPECT_THROW(annotate_batch(annotator, locations, options), StoreError);
}

TEST_F(BatchTest, CancelledBatchSkipsEveryLocation) {
    Annotator annotator(store_, TSSRegion(2000, 1000), 3);
    std::atomic<bool> cancel{true};

    BatchOptions options;
    options.threads = 4;
    options.cancel = &cancel;

    auto results = annotate_batch(annotator, locations_, options);
    ASSERT_EQ(results.size(), locations_.size());
    for (const auto& r : results) {
        EXPECT_TRUE(r.skipped);
        EXPECT_FALSE(r.ok);
        EXPECT_TRUE(r.error.empty());
    }
}

TEST_F(BatchTest, EmptyInputGivesEmptyResult) {
    Annotator annotator(store_, TSSRegion(2000, 1000), 3);
    auto results = annotate_batch(annotator, std::vector<Location>());
    EXPECT_TRUE(results.empty());
}

TEST_F(BatchTest, MoreThreadsThanLocations) {
    Annotator annotator(store_, TSSRegion(2000, 1000), 3);
    BatchOptions options;
    options.threads = 64;

    std::vector<Location> one = {locations_[0]};
    auto results = annotate_batch(annotator, one, options);
    ASSERT_EQ(results.size(), 1u);
    EXPECT_TRUE(results[0].ok);
}
