#pragma once

#include <page_turner/page_fetcher.hpp>
#include <page_turner/turned_page.hpp>

#include <page_turner/import/optional.hpp>
#include <page_turner/import/status.hpp>

#include <utility>

namespace page_turner {

/** \brief Fetches pages one at a time, following the `next_request` of each response, on the
 * thread that calls `next()`.
 *
 * Yields the items of each page, then None after the last page.  A fetch error is yielded once,
 * after which the stream is exhausted.
 */
template <typename RequestT, typename ItemT>
class Pages
{
 public:
  using Item = PageItemsResult<ItemT>;
  using Page = TurnedPage<RequestT, ItemT>;

  //+++++++++++-+-+--+----- --- -- -  -  -   -

  explicit Pages(FetcherHandle<RequestT, ItemT> fetcher, RequestT first) noexcept
      : fetcher_{std::move(fetcher)}
      , next_request_{std::move(first)}
  {
  }

  Optional<Item> next()
  {
    if (!this->next_request_) {
      return None;
    }

    StatusOr<Page> page = this->fetcher_.fetch(*this->next_request_);
    if (!page.ok()) {
      this->next_request_ = None;
      return Optional<Item>{Item{page.status()}};
    }

    this->next_request_ = std::move(page->next_request);
    this->page_count_ += 1;

    return Optional<Item>{Item{std::move(page->items)}};
  }

  /** \brief The number of pages fetched successfully so far.
   */
  usize page_count() const noexcept
  {
    return this->page_count_;
  }

 private:
  FetcherHandle<RequestT, ItemT> fetcher_;
  Optional<RequestT> next_request_;
  usize page_count_ = 0;
};

}  // namespace page_turner
