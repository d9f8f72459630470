#include <page_turner/runtime_options.hpp>
//

#include <page_turner/import/env.hpp>
#include <page_turner/import/logging.hpp>

#include <batteries/assert.hpp>
#include <batteries/runtime.hpp>

#include <algorithm>

namespace page_turner {

namespace {

usize fetch_task_stack_size_from_env()
{
  static const usize cached_value = [] {
    const usize page_turner_fetch_stack_kb =
        getenv_as<usize>("page_turner_fetch_stack_kb").value_or(kDefaultFetchTaskStackSize / 1024);

    LOG(INFO) << BATT_INSPECT(page_turner_fetch_stack_kb);

    return std::max(page_turner_fetch_stack_kb * 1024, kMinFetchTaskStackSize);
  }();

  return cached_value;
}

bool trace_schedule_from_env()
{
  static const bool cached_value = [] {
    const bool page_turner_trace_schedule =
        getenv_as<bool>("page_turner_trace_schedule").value_or(false);

    LOG(INFO) << BATT_INSPECT(page_turner_trace_schedule);

    return page_turner_trace_schedule;
  }();

  return cached_value;
}

}  // namespace

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
/*static*/ RuntimeOptions RuntimeOptions::with_default_values() noexcept
{
  std::shared_ptr<ScheduleObserver> observer;
  if (trace_schedule_from_env()) {
    observer = std::make_shared<LoggingScheduleObserver>();
  } else {
    observer = NullScheduleObserver::instance();
  }

  return RuntimeOptions{
      .task_scheduler = &batt::Runtime::instance().default_scheduler(),
      .fetch_task_stack_size = fetch_task_stack_size_from_env(),
      .observer = std::move(observer),
  };
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
std::ostream& operator<<(std::ostream& out, const RuntimeOptions& t)
{
  return out << "RuntimeOptions{.task_scheduler=" << (const void*)t.task_scheduler  //
             << ", .fetch_task_stack_size=" << t.fetch_task_stack_size              //
             << ", .observer=" << (const void*)t.observer.get()                    //
             << ",}";
}

}  // namespace page_turner
