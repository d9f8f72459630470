#pragma once

#include <page_turner/limit.hpp>
#include <page_turner/look_ahead_window.hpp>
#include <page_turner/page_fetcher.hpp>
#include <page_turner/request_sequence.hpp>
#include <page_turner/runtime_options.hpp>
#include <page_turner/turned_page.hpp>

#include <page_turner/util/debug_log.hpp>

#include <page_turner/import/logging.hpp>
#include <page_turner/import/optional.hpp>
#include <page_turner/import/status.hpp>

#include <algorithm>
#include <utility>

namespace page_turner {

/** \brief Like PagesAhead, but yields pages in the order their fetches complete.
 *
 * Each request is tagged with its position in the request sequence.  Because a page may arrive
 * before pages that precede it, an error is not final when it arrives: the stream keeps the
 * lowest-indexed error seen so far and stops scheduling, then drains the fetches in flight.  Once
 * the last page is known, errors for positions after it are discarded (they are requests past the
 * end of the data).  At most one error is ever yielded, and it ends the stream.
 *
 * Destroying the stream blocks until every fetch already running has returned (see PagesAhead).
 */
template <typename RequestT, typename ItemT, typename NextFn = RequestAhead<RequestT>>
class PagesAheadUnordered
{
 public:
  using Item = PageItemsResult<ItemT>;
  using Window = LookAheadWindow<RequestT, ItemT, NextFn>;
  using Page = typename Window::Page;
  using Completion = typename Window::Completion;

  //+++++++++++-+-+--+----- --- -- -  -  -   -

  explicit PagesAheadUnordered(
      FetcherHandle<RequestT, ItemT> fetcher,
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
    for (;;) {
      if (this->window_.is_terminated()) {
        return None;
      }

      // Once the last page is known (or an error is pending), no more requests are issued; the
      // fetches in flight are drained and then the stream ends.
      //
      if (this->last_page_index_ || this->retained_error_) {
        if (this->window_.tasks().empty()) {
          return this->finish();
        }
      } else if (!this->window_.refill()) {
        return this->finish();
      }

      StatusOr<Completion> completion = this->window_.tasks().await_any();
      if (!completion.ok()) {
        this->window_.terminate(completion.status());
        return Optional<Item>{Item{completion.status()}};
      }

      Optional<Item> items = this->take(std::move(*completion));
      if (items) {
        return items;
      }
    }
  }

  //+++++++++++-+-+--+----- --- -- -  -  -   -

  const Optional<usize>& last_page_index() const noexcept
  {
    return this->last_page_index_;
  }

 private:
  struct RetainedError {
    usize index;
    Status status;
  };

  // Returns the items of a successful fetch, or None if the fetch failed (its error is retained or
  // discarded).
  //
  Optional<Item> take(Completion&& completion)
  {
    const usize index = completion.index;
    this->window_.observer().on_complete(index, completion.result.status());

    PAGE_TURNER_DEBUG_LOG("take;" << BATT_INSPECT(index)
                                  << BATT_INSPECT(completion.result.status())
                                  << BATT_INSPECT(this->window_.tasks().size()));

    if (!completion.result.ok()) {
      this->retain_error(index, completion.result.status());
      return None;
    }

    Page& page = *completion.result;
    if (page.is_last()) {
      this->last_page_index_ = std::min(index, this->last_page_index_.value_or(index));
    }

    return Optional<Item>{Item{std::move(page.items)}};
  }

  void retain_error(usize index, const Status& status)
  {
    if (this->last_page_index_ && index > *this->last_page_index_) {
      this->window_.observer().on_discard(index, status);
      return;
    }

    if (this->retained_error_) {
      if (this->retained_error_->index < index) {
        this->window_.observer().on_discard(index, status);
        return;
      }
      this->window_.observer().on_discard(this->retained_error_->index,
                                          this->retained_error_->status);
    }

    this->retained_error_ = RetainedError{index, status};
  }

  // Called when nothing is in flight and nothing more will be scheduled.
  //
  Optional<Item> finish()
  {
    if (this->retained_error_) {
      RetainedError error = std::move(*this->retained_error_);
      this->retained_error_ = None;

      if (!this->last_page_index_ || error.index <= *this->last_page_index_) {
        VLOG(1) << "terminal fetch error;" << BATT_INSPECT(error.index)
                << BATT_INSPECT(error.status);
        this->window_.terminate(error.status);
        return Optional<Item>{Item{error.status}};
      }

      this->window_.observer().on_discard(error.index, error.status);
    }

    this->window_.terminate(OkStatus());
    return None;
  }

  //+++++++++++-+-+--+----- --- -- -  -  -   -

  Window window_;
  Optional<usize> last_page_index_;
  Optional<RetainedError> retained_error_;
};

}  // namespace page_turner
