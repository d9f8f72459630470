#pragma once

#include <page_turner/import/int_types.hpp>
#include <page_turner/import/optional.hpp>
#include <page_turner/import/status.hpp>

#include <utility>
#include <vector>

namespace page_turner {

/** \brief The outcome of one successful fetch: the items of the current page and, unless this was
 * the last page, the request for the next one.
 *
 * Streams stop querying once a page arrives with `next_request == None`.
 */
template <typename RequestT, typename ItemT>
struct TurnedPage {
  using Request = RequestT;
  using Item = ItemT;

  std::vector<Item> items;
  Optional<Request> next_request;

  //+++++++++++-+-+--+----- --- -- -  -  -   -

  static TurnedPage next(std::vector<Item>&& items, Request&& next_request)
  {
    return TurnedPage{std::move(items), Optional<Request>{std::move(next_request)}};
  }

  static TurnedPage last(std::vector<Item>&& items)
  {
    return TurnedPage{std::move(items), None};
  }

  //+++++++++++-+-+--+----- --- -- -  -  -   -

  bool is_last() const noexcept
  {
    return !this->next_request;
  }
};

/** \brief What a fetch produces: a page or an (opaque, caller-defined) error.
 */
template <typename RequestT, typename ItemT>
using TurnedPageResult = StatusOr<TurnedPage<RequestT, ItemT>>;

/** \brief What a pages stream yields for each page: its items or the terminal error.
 */
template <typename ItemT>
using PageItemsResult = StatusOr<std::vector<ItemT>>;

}  // namespace page_turner
