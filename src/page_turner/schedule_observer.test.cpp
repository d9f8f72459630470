#include <page_turner/schedule_observer.hpp>
//
#include <page_turner/schedule_observer.hpp>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <page_turner/runtime_options.hpp>

#include <batteries/stream_util.hpp>

namespace {

using namespace page_turner::int_types;

using page_turner::kMinFetchTaskStackSize;
using page_turner::LoggingScheduleObserver;
using page_turner::MetricsScheduleObserver;
using page_turner::NullScheduleObserver;
using page_turner::OkStatus;
using page_turner::RuntimeOptions;
using page_turner::ScheduleMetrics;
using page_turner::Status;

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
TEST(ScheduleObserverTest, MetricsCounts)
{
  ScheduleMetrics metrics;
  MetricsScheduleObserver observer{metrics};

  EXPECT_EQ(&observer.metrics(), &metrics);

  for (usize i = 0; i < 5; ++i) {
    observer.on_schedule(i);
  }
  observer.on_complete(0, OkStatus());
  observer.on_complete(2, Status{batt::StatusCode::kUnavailable});
  observer.on_discard(2, Status{batt::StatusCode::kUnavailable});
  observer.on_complete(1, OkStatus());

  EXPECT_EQ(metrics.scheduled_count.load(), 5u);
  EXPECT_EQ(metrics.completed_count.load(), 3u);
  EXPECT_EQ(metrics.failed_count.load(), 1u);
  EXPECT_EQ(metrics.discarded_count.load(), 1u);
  EXPECT_EQ(metrics.outstanding_count(), 2u);
  EXPECT_EQ(metrics.terminated_count.load(), 0u);

  observer.on_terminate(Status{batt::StatusCode::kUnavailable});

  EXPECT_EQ(metrics.terminated_count.load(), 1u);
  EXPECT_EQ(metrics.terminated_with_error_count.load(), 1u);

  EXPECT_THAT(batt::to_string(metrics), ::testing::HasSubstr(".scheduled=5"));

  metrics.reset();

  EXPECT_EQ(metrics.scheduled_count.load(), 0u);
  EXPECT_EQ(metrics.outstanding_count(), 0u);
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
TEST(ScheduleObserverTest, NullAndLoggingAcceptEverything)
{
  auto null_observer = NullScheduleObserver::instance();

  ASSERT_NE(null_observer, nullptr);
  EXPECT_EQ(null_observer, NullScheduleObserver::instance());

  LoggingScheduleObserver logging_observer;

  for (page_turner::ScheduleObserver* observer : {null_observer.get(),
                                                   static_cast<page_turner::ScheduleObserver*>(
                                                       &logging_observer)}) {
    observer->on_schedule(7);
    observer->on_complete(7, OkStatus());
    observer->on_discard(8, Status{batt::StatusCode::kOutOfRange});
    observer->on_terminate(OkStatus());
  }
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
TEST(RuntimeOptionsTest, DefaultValues)
{
  RuntimeOptions options = RuntimeOptions::with_default_values();

  EXPECT_NE(options.task_scheduler, nullptr);
  EXPECT_NE(options.observer, nullptr);
  EXPECT_GE(options.fetch_task_stack_size, kMinFetchTaskStackSize);

  ScheduleMetrics metrics;
  options.set_observer(std::make_shared<MetricsScheduleObserver>(metrics));

  EXPECT_NE(dynamic_cast<MetricsScheduleObserver*>(options.observer.get()), nullptr);
  EXPECT_THAT(batt::to_string(options), ::testing::HasSubstr("RuntimeOptions{"));
}

}  // namespace
