#pragma once

#include <page_turner/chunker.hpp>
#include <page_turner/fetch_task_set.hpp>
#include <page_turner/limit.hpp>
#include <page_turner/page_fetcher.hpp>
#include <page_turner/request_sequence.hpp>
#include <page_turner/runtime_options.hpp>
#include <page_turner/schedule_observer.hpp>
#include <page_turner/turned_page.hpp>

#include <page_turner/util/debug_log.hpp>

#include <page_turner/import/int_types.hpp>
#include <page_turner/import/optional.hpp>
#include <page_turner/import/status.hpp>

#include <batteries/assert.hpp>

#include <memory>
#include <utility>

namespace page_turner {

/** \brief The scheduling state shared by PagesAhead and PagesAheadUnordered: the request cursor,
 * the in-flight fetch set, and the termination flag.
 *
 * The number of fetches in flight never exceeds the window size, and no request is scheduled
 * after terminate().
 */
template <typename RequestT, typename ItemT, typename NextFn>
class LookAheadWindow
{
 public:
  using Page = TurnedPage<RequestT, ItemT>;
  using PageResult = StatusOr<Page>;
  using TaskSet = FetchTaskSet<PageResult>;
  using Completion = typename TaskSet::Completion;
  using IndexedRequests = Enumerate<RequestSequence<RequestT, NextFn>>;

  //+++++++++++-+-+--+----- --- -- -  -  -   -

  explicit LookAheadWindow(FetcherHandle<RequestT, ItemT>&& fetcher,
                           usize window_size,
                           const Limit& limit,
                           RequestT&& first,
                           NextFn&& next_fn,
                           const RuntimeOptions& options)
      : fetcher_{std::move(fetcher)}
      , observer_{options.observer ? options.observer : NullScheduleObserver::instance()}
      , requests_{make_chunker(enumerate(RequestSequence<RequestT, NextFn>{std::move(first),
                                                                            limit,
                                                                            std::move(next_fn)}),
                               window_size)}
      , tasks_{std::make_unique<TaskSet>(options)}
  {
  }

  //+++++++++++-+-+--+----- --- -- -  -  -   -

  usize window_size() const noexcept
  {
    return this->requests_->chunk_size();
  }

  TaskSet& tasks() noexcept
  {
    return *this->tasks_;
  }

  ScheduleObserver& observer() noexcept
  {
    return *this->observer_;
  }

  bool is_terminated() const noexcept
  {
    return this->terminated_;
  }

  /** \brief Tops up the in-flight set: if it is empty, schedules the next chunk of up to
   * window_size() requests in request order; otherwise schedules at most one more request.
   *
   * Returns false iff the set was empty and there are no requests left to schedule.
   */
  bool refill()
  {
    BATT_CHECK(!this->terminated_);

    if (this->tasks_->empty()) {
      Optional<typename Chunker<IndexedRequests>::Chunk> chunk = this->requests_->next_chunk();
      if (!chunk) {
        return false;
      }
      while (Optional<std::pair<usize, RequestT>> indexed_request = chunk->next()) {
        this->schedule(indexed_request->first, std::move(indexed_request->second));
      }
    } else {
      Optional<std::pair<usize, RequestT>> indexed_request = this->requests_->next_item();
      if (indexed_request) {
        this->schedule(indexed_request->first, std::move(indexed_request->second));
      }
    }

    BATT_CHECK_LE(this->tasks_->size(), this->window_size());

    PAGE_TURNER_DEBUG_LOG("refill; in_flight=" << DumpIndices::of(this->tasks_->pending_indices())
                                                << BATT_INSPECT(this->window_size()));
    return true;
  }

  /** \brief Stops all scheduling; fetches still in flight are abandoned.  Notifies the observer
   * once.
   */
  void terminate(const Status& status)
  {
    if (this->terminated_) {
      return;
    }
    this->terminated_ = true;
    this->tasks_->halt();
    this->observer_->on_terminate(status);

    PAGE_TURNER_DEBUG_LOG("terminate;" << BATT_INSPECT(status));
  }

 private:
  void schedule(usize index, RequestT&& request)
  {
    this->observer_->on_schedule(index);
    this->tasks_->schedule(index, [fetcher = this->fetcher_, request = std::move(request)] {
      return fetcher.fetch(request);
    });
  }

  //+++++++++++-+-+--+----- --- -- -  -  -   -

  FetcherHandle<RequestT, ItemT> fetcher_;
  std::shared_ptr<ScheduleObserver> observer_;
  std::unique_ptr<Chunker<IndexedRequests>> requests_;
  std::unique_ptr<TaskSet> tasks_;
  bool terminated_ = false;
};

}  // namespace page_turner
