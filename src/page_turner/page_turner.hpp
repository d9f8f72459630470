#pragma once

#include <page_turner/config.hpp>
#include <page_turner/items.hpp>
#include <page_turner/limit.hpp>
#include <page_turner/page_fetcher.hpp>
#include <page_turner/pages.hpp>
#include <page_turner/pages_ahead.hpp>
#include <page_turner/pages_ahead_unordered.hpp>
#include <page_turner/request_sequence.hpp>
#include <page_turner/runtime_options.hpp>
#include <page_turner/schedule_observer.hpp>
#include <page_turner/status.hpp>
#include <page_turner/turned_page.hpp>

#include <memory>
#include <utility>

namespace page_turner {

/** \brief Entry point: turns a PageFetcher into streams of pages.
 *
 * \code
 *   auto turner = PageTurner<GetPostsRequest, Post>::share(make_page_fetcher<...>(fn));
 *
 *   auto posts = items(turner.pages_ahead(4, NoLimit{}, GetPostsRequest{.page = 1}));
 *   while (Optional<StatusOr<Post>> post = posts.next()) {
 *     BATT_REQUIRE_OK(*post);
 *     ...
 *   }
 * \endcode
 */
template <typename RequestT, typename ItemT>
class PageTurner
{
 public:
  using Request = RequestT;
  using Item = ItemT;
  using Page = TurnedPage<RequestT, ItemT>;
  using Fetcher = PageFetcher<RequestT, ItemT>;
  using Handle = FetcherHandle<RequestT, ItemT>;

  //+++++++++++-+-+--+----- --- -- -  -  -   -

  /** \brief `fetcher` must outlive this object and every stream it creates.
   */
  static PageTurner borrow(Fetcher& fetcher) noexcept
  {
    return PageTurner{Handle::borrow(fetcher)};
  }

  static PageTurner share(std::shared_ptr<Fetcher> fetcher) noexcept
  {
    return PageTurner{Handle::share(std::move(fetcher))};
  }

  explicit PageTurner(Handle&& handle) noexcept : handle_{std::move(handle)}
  {
  }

  //+++++++++++-+-+--+----- --- -- -  -  -   -

  const Handle& handle() const noexcept
  {
    return this->handle_;
  }

  /** \brief Fetches a single page on the calling thread.
   */
  StatusOr<Page> turn_page(const RequestT& request) const
  {
    return this->handle_.fetch(request);
  }

  /** \brief One page at a time, each request taken from the previous response.
   */
  Pages<RequestT, ItemT> pages(RequestT first) const
  {
    return Pages<RequestT, ItemT>{this->handle_, std::move(first)};
  }

  /** \brief Up to `window_size` concurrent fetches, pages yielded in request order.
   */
  template <typename NextFn = RequestAhead<RequestT>>
  PagesAhead<RequestT, ItemT, NextFn> pages_ahead(
      usize window_size,
      const Limit& limit,
      RequestT first,
      NextFn next_fn = NextFn{},
      const RuntimeOptions& options = RuntimeOptions::with_default_values()) const
  {
    return PagesAhead<RequestT, ItemT, NextFn>{this->handle_,
                                               window_size,
                                               limit,
                                               std::move(first),
                                               std::move(next_fn),
                                               options};
  }

  /** \brief Up to `window_size` concurrent fetches, pages yielded as they complete.
   */
  template <typename NextFn = RequestAhead<RequestT>>
  PagesAheadUnordered<RequestT, ItemT, NextFn> pages_ahead_unordered(
      usize window_size,
      const Limit& limit,
      RequestT first,
      NextFn next_fn = NextFn{},
      const RuntimeOptions& options = RuntimeOptions::with_default_values()) const
  {
    return PagesAheadUnordered<RequestT, ItemT, NextFn>{this->handle_,
                                                        window_size,
                                                        limit,
                                                        std::move(first),
                                                        std::move(next_fn),
                                                        options};
  }

 private:
  Handle handle_;
};

}  // namespace page_turner
