#pragma once

#include <page_turner/limit.hpp>
#include <page_turner/look_ahead_window.hpp>
#include <page_turner/page_fetcher.hpp>
#include <page_turner/request_sequence.hpp>
#include <page_turner/runtime_options.hpp>
#include <page_turner/turned_page.hpp>

#include <page_turner/import/logging.hpp>
#include <page_turner/import/optional.hpp>
#include <page_turner/import/status.hpp>

#include <utility>

namespace page_turner {

/** \brief Fetches up to `window_size` pages concurrently and yields them in request order.
 *
 * Requests are derived ahead of time with `next_fn`, instead of waiting for each response.  When
 * nothing is in flight a whole window of requests is issued; after that, one new request is
 * issued for every page taken.  Scheduling stops at the first page with no next request, at the
 * first error, or when `limit` is reached.  An error is yielded only after every page before it,
 * and ends the stream; fetches still in flight are abandoned.  The observer is never told how an
 * abandoned fetch completed, so it stays outstanding in ScheduleMetrics.
 *
 * With window_size == 0 the stream is empty and nothing is fetched.
 *
 * Destroying the stream blocks: fetches not yet started are skipped, but the destructor waits for
 * every fetch already running to return.
 */
template <typename RequestT, typename ItemT, typename NextFn = RequestAhead<RequestT>>
class PagesAhead
{
 public:
  using Item = PageItemsResult<ItemT>;
  using Window = LookAheadWindow<RequestT, ItemT, NextFn>;
  using Page = typename Window::Page;

  //+++++++++++-+-+--+----- --- -- -  -  -   -

  explicit PagesAhead(FetcherHandle<RequestT, ItemT> fetcher,
                      usize window_size,
                      const Limit& limit,
                      RequestT first,
                      NextFn next_fn = NextFn{},
                      const RuntimeOptions& options = RuntimeOptions::with_default_values())
      : window_{std::move(fetcher),
                window_size,
                limit,
                std::move(first),
                std::move(next_fn),
                options}
  {
  }

  Optional<Item> next()
  {
    if (this->window_.is_terminated()) {
      return None;
    }

    if (!this->window_.refill()) {
      this->window_.terminate(OkStatus());
      return None;
    }

    const usize index = this->head_index_;
    StatusOr<Page> page = this->window_.tasks().await_index(index);
    this->head_index_ += 1;

    this->window_.observer().on_complete(index, page.status());

    if (!page.ok()) {
      VLOG(1) << "terminal fetch error;" << BATT_INSPECT(index) << BATT_INSPECT(page.status());
      this->window_.terminate(page.status());
      return Optional<Item>{Item{page.status()}};
    }

    if (page->is_last()) {
      this->window_.terminate(OkStatus());
    }

    return Optional<Item>{Item{std::move(page->items)}};
  }

 private:
  Window window_;

  // The index of the oldest request whose page has not been yielded.
  //
  usize head_index_ = 0;
};

}  // namespace page_turner
