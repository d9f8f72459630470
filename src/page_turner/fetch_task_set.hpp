#pragma once

#include <page_turner/runtime_options.hpp>
#include <page_turner/status.hpp>

#include <page_turner/import/int_types.hpp>
#include <page_turner/import/logging.hpp>
#include <page_turner/import/status.hpp>

#include <batteries/assert.hpp>
#include <batteries/async/queue.hpp>
#include <batteries/async/task.hpp>
#include <batteries/stream_util.hpp>
#include <batteries/utility.hpp>

#include <algorithm>
#include <atomic>
#include <map>
#include <memory>
#include <unordered_map>
#include <utility>
#include <vector>

namespace page_turner {

/** \brief The set of in-flight fetches of one look-ahead stream.
 *
 * Each fetch runs in its own batt::Task; results are delivered through a completion queue whose
 * only consumer is the owner of this object.  All member functions other than `halt()` must be
 * called from that single consumer.
 *
 * `ResultT` must be constructible from a Status.  Objects of this class capture `this` in their
 * tasks, so they are neither copyable nor movable; hold them by pointer to make a stream movable.
 */
template <typename ResultT>
class FetchTaskSet
{
 public:
  struct Completion {
    usize index;
    ResultT result;
  };

  //+++++++++++-+-+--+----- --- -- -  -  -   -

  explicit FetchTaskSet(const RuntimeOptions& options) noexcept
      : task_scheduler_{options.task_scheduler}
      , stack_size_{options.fetch_task_stack_size}
  {
    BATT_CHECK_NOT_NULLPTR(this->task_scheduler_);
  }

  FetchTaskSet(const FetchTaskSet&) = delete;
  FetchTaskSet& operator=(const FetchTaskSet&) = delete;

  /** \brief Halts and joins; no task of this set outlives it.
   */
  ~FetchTaskSet() noexcept
  {
    this->halt();
    this->join();
  }

  //+++++++++++-+-+--+----- --- -- -  -  -   -

  /** \brief The number of scheduled fetches whose results have not yet been taken.
   */
  usize size() const noexcept
  {
    return this->in_flight_;
  }

  bool empty() const noexcept
  {
    return this->in_flight_ == 0;
  }

  bool is_halted() const noexcept
  {
    return this->halted_.load();
  }

  /** \brief The indices of all scheduled fetches whose results have not yet been taken.
   */
  std::vector<usize> pending_indices() const
  {
    std::vector<usize> indices;
    for (const auto& entry : this->tasks_) {
      indices.emplace_back(entry.first);
    }
    for (const auto& entry : this->arrived_) {
      indices.emplace_back(entry.first);
    }
    std::sort(indices.begin(), indices.end());
    return indices;
  }

  /** \brief Starts a task that runs `fetch_fn()` (which must return ResultT) for the request at
   * `index`.
   */
  template <typename FetchFn>
  void schedule(usize index, FetchFn&& fetch_fn)
  {
    BATT_CHECK(!this->is_halted());
    BATT_CHECK_EQ(this->tasks_.count(index), 0u) << BATT_INSPECT(index);
    BATT_CHECK_EQ(this->arrived_.count(index), 0u) << BATT_INSPECT(index);

    auto task = std::make_unique<batt::Task>(
        this->task_scheduler_->schedule_task(),
        [this, index, fetch_fn = BATT_FORWARD(fetch_fn)]() mutable {
          this->fetch_task_main(index, fetch_fn);
        },
        batt::to_string("page_turner::fetch[", index, "]"),
        batt::StackSize{this->stack_size_});

    this->tasks_.emplace(index, std::move(task));
    this->in_flight_ += 1;
  }

  /** \brief Waits for the next fetch to complete, in completion order, and returns it.
   *
   * Returns StatusCode::kFetchAbandoned if the set has been halted.
   */
  StatusOr<Completion> await_any()
  {
    BATT_CHECK(!this->empty());

    if (!this->arrived_.empty()) {
      auto iter = this->arrived_.begin();
      Completion completion{iter->first, std::move(iter->second)};
      this->arrived_.erase(iter);
      this->in_flight_ -= 1;
      return completion;
    }

    BATT_ASSIGN_OK_RESULT(Completion completion, this->pop_completion());
    this->in_flight_ -= 1;

    return completion;
  }

  /** \brief Waits for the fetch of the request at `index` to complete and returns its result.
   * Results for other indices that complete in the meantime are kept until they are asked for.
   *
   * Returns StatusCode::kFetchAbandoned if the set has been halted.
   */
  ResultT await_index(usize index)
  {
    BATT_CHECK(this->tasks_.count(index) != 0 || this->arrived_.count(index) != 0)
        << BATT_INSPECT(index);

    for (;;) {
      auto iter = this->arrived_.find(index);
      if (iter != this->arrived_.end()) {
        ResultT result = std::move(iter->second);
        this->arrived_.erase(iter);
        this->in_flight_ -= 1;
        return result;
      }

      BATT_ASSIGN_OK_RESULT(Completion completion, this->pop_completion());
      this->arrived_.emplace(completion.index, std::move(completion.result));
    }
  }

  /** \brief Stops delivery: tasks that have not started yet will skip their fetch, and results of
   * fetches already running are dropped.  Safe to call from any thread, any number of times.
   */
  void halt() noexcept
  {
    const bool prior_value = this->halted_.exchange(true);
    if (!prior_value) {
      this->completions_.close();
    }
  }

  /** \brief Waits for every task to exit.  Does not wait for halt(); a fetch that is running when
   * this is called runs to completion first.
   */
  void join() noexcept
  {
    for (auto& entry : this->tasks_) {
      entry.second->join();
    }
    this->tasks_.clear();
    this->arrived_.clear();
    this->in_flight_ = 0;
  }

 private:
  template <typename FetchFn>
  void fetch_task_main(usize index, FetchFn& fetch_fn)
  {
    if (this->is_halted()) {
      VLOG(1) << "skipping fetch; " << BATT_INSPECT(index) << " "
              << make_status(StatusCode::kFetchAbandoned);
      return;
    }

    if (!this->completions_.push(Completion{index, fetch_fn()})) {
      VLOG(1) << "dropping fetch result; the stream was halted " << BATT_INSPECT(index);
    }
  }

  StatusOr<Completion> pop_completion()
  {
    if (this->is_halted()) {
      return make_status(StatusCode::kFetchAbandoned);
    }

    StatusOr<Completion> completion = this->completions_.await_next();
    if (!completion.ok()) {
      return make_status(StatusCode::kFetchAbandoned);
    }

    // The task pushed its result as its last action, so this join returns promptly.
    //
    auto iter = this->tasks_.find(completion->index);
    BATT_CHECK(iter != this->tasks_.end()) << BATT_INSPECT(completion->index);
    iter->second->join();
    this->tasks_.erase(iter);

    return completion;
  }

  //+++++++++++-+-+--+----- --- -- -  -  -   -

  batt::TaskScheduler* task_scheduler_;
  usize stack_size_;
  std::atomic<bool> halted_{false};
  batt::Queue<Completion> completions_;
  std::unordered_map<usize, std::unique_ptr<batt::Task>> tasks_;
  std::map<usize, ResultT> arrived_;
  usize in_flight_ = 0;
};

}  // namespace page_turner
