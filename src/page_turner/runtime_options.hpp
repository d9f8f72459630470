#pragma once

#include <page_turner/config.hpp>
#include <page_turner/schedule_observer.hpp>

#include <page_turner/import/int_types.hpp>

#include <batteries/async/task_scheduler.hpp>

#include <memory>
#include <ostream>

namespace page_turner {

/** \brief How look-ahead streams run their fetches.
 */
struct RuntimeOptions {
  /** \brief Scheduler for fetch tasks; defaults to the batteries runtime's default scheduler.  Must
   * outlive every stream created with these options.
   */
  batt::TaskScheduler* task_scheduler;

  /** \brief Stack size of each fetch task, in bytes.
   */
  usize fetch_task_stack_size;

  /** \brief Receives scheduling events; never null.
   */
  std::shared_ptr<ScheduleObserver> observer;

  //+++++++++++-+-+--+----- --- -- -  -  -   -

  /** \brief Returns the default options; environment overrides (`page_turner_fetch_stack_kb`,
   * `page_turner_trace_schedule`) are read once per process.
   */
  static RuntimeOptions with_default_values() noexcept;

  //+++++++++++-+-+--+----- --- -- -  -  -   -

  RuntimeOptions& set_observer(std::shared_ptr<ScheduleObserver> new_observer)
  {
    this->observer = std::move(new_observer);
    return *this;
  }

  RuntimeOptions& set_task_scheduler(batt::TaskScheduler& scheduler)
  {
    this->task_scheduler = &scheduler;
    return *this;
  }
};

std::ostream& operator<<(std::ostream& out, const RuntimeOptions& t);

}  // namespace page_turner
