#include <page_turner/fetch_task_set.hpp>
//
#include <page_turner/fetch_task_set.hpp>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <page_turner/util/debug_log.hpp>

#include <batteries/async/watch.hpp>
#include <batteries/stream_util.hpp>

#include <atomic>
#include <chrono>
#include <memory>
#include <set>
#include <thread>

namespace {

using namespace page_turner::int_types;

using page_turner::FetchTaskSet;
using page_turner::make_status;
using page_turner::RuntimeOptions;
using page_turner::StatusCode;
using page_turner::StatusOr;

using TaskSet = FetchTaskSet<StatusOr<usize>>;

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
TEST(FetchTaskSetTest, AwaitAnyReturnsEveryCompletionOnce)
{
  TaskSet tasks{RuntimeOptions::with_default_values()};

  EXPECT_TRUE(tasks.empty());

  for (usize i = 0; i < 10; ++i) {
    tasks.schedule(i, [i]() -> StatusOr<usize> {
      return i * i;
    });
  }

  EXPECT_EQ(tasks.size(), 10u);

  std::set<usize> seen;
  while (!tasks.empty()) {
    StatusOr<TaskSet::Completion> completion = tasks.await_any();
    ASSERT_TRUE(completion.ok()) << completion.status();
    ASSERT_TRUE(completion->result.ok());
    EXPECT_EQ(*completion->result, completion->index * completion->index);
    EXPECT_TRUE(seen.insert(completion->index).second) << BATT_INSPECT(completion->index);
  }

  EXPECT_EQ(seen.size(), 10u);
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
TEST(FetchTaskSetTest, AwaitIndexInRequestOrder)
{
  batt::Watch<bool> release_first{false};

  TaskSet tasks{RuntimeOptions::with_default_values()};

  // Index 0 completes last; the others must be kept until asked for.
  //
  tasks.schedule(0, [&release_first]() -> StatusOr<usize> {
    BATT_REQUIRE_OK(release_first.await_true([](bool released) {
      return released;
    }));
    return usize{100};
  });

  for (usize i = 1; i < 4; ++i) {
    tasks.schedule(i, [i]() -> StatusOr<usize> {
      if (i == 2) {
        return {batt::StatusCode::kUnavailable};
      }
      return 100 + i;
    });
  }

  EXPECT_THAT(tasks.pending_indices(), ::testing::ElementsAre(0, 1, 2, 3));
  EXPECT_EQ(batt::to_string(page_turner::DumpIndices::of(tasks.pending_indices())),
            "{0, 1, 2, 3}");

  release_first.set_value(true);

  StatusOr<usize> result = tasks.await_index(0);
  ASSERT_TRUE(result.ok()) << result.status();
  EXPECT_EQ(*result, 100u);
  EXPECT_EQ(tasks.size(), 3u);
  EXPECT_THAT(tasks.pending_indices(), ::testing::ElementsAre(1, 2, 3));

  result = tasks.await_index(1);
  ASSERT_TRUE(result.ok()) << result.status();
  EXPECT_EQ(*result, 101u);

  result = tasks.await_index(2);
  EXPECT_EQ(result.status(), batt::Status{batt::StatusCode::kUnavailable});

  result = tasks.await_index(3);
  ASSERT_TRUE(result.ok()) << result.status();
  EXPECT_EQ(*result, 103u);

  EXPECT_TRUE(tasks.empty());
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
TEST(FetchTaskSetTest, HaltDropsResults)
{
  batt::Watch<bool> release{false};
  std::atomic<usize> finished{0};

  auto tasks = std::make_unique<TaskSet>(RuntimeOptions::with_default_values());

  for (usize i = 0; i < 3; ++i) {
    tasks->schedule(i, [&release, &finished, i]() -> StatusOr<usize> {
      BATT_REQUIRE_OK(release.await_true([](bool released) {
        return released;
      }));
      finished.fetch_add(1);
      return i;
    });
  }

  tasks->halt();
  tasks->halt();

  EXPECT_TRUE(tasks->is_halted());
  EXPECT_EQ(tasks->await_any().status(), make_status(StatusCode::kFetchAbandoned));
  EXPECT_EQ(tasks->await_index(1).status(), make_status(StatusCode::kFetchAbandoned));

  // Tasks that already started run to completion; destroying the set waits for them.
  //
  release.set_value(true);
  tasks = nullptr;

  const usize finished_after_join = finished.load();
  EXPECT_LE(finished_after_join, 3u);

  std::this_thread::sleep_for(std::chrono::milliseconds(20));

  EXPECT_EQ(finished.load(), finished_after_join);
}

}  // namespace
