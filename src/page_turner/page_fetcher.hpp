#pragma once

#include <page_turner/status.hpp>
#include <page_turner/turned_page.hpp>

#include <page_turner/import/logging.hpp>
#include <page_turner/import/status.hpp>

#include <batteries/assert.hpp>
#include <batteries/utility.hpp>

#include <exception>
#include <memory>
#include <type_traits>
#include <utility>

namespace page_turner {

/** \brief Turns one request into one page.
 *
 * Implementations used with look-ahead streams must tolerate concurrent calls to `fetch` from many
 * tasks; the sequential `Pages` stream only ever makes one call at a time, from the thread that
 * pulls the stream.  Errors are returned, not thrown; a thrown `std::exception` is converted to
 * `StatusCode::kFetchException` by FetcherHandle.
 */
template <typename RequestT, typename ItemT>
class PageFetcher
{
 public:
  using Request = RequestT;
  using Item = ItemT;
  using Page = TurnedPage<RequestT, ItemT>;

  PageFetcher(const PageFetcher&) = delete;
  PageFetcher& operator=(const PageFetcher&) = delete;

  virtual ~PageFetcher() = default;

  virtual StatusOr<Page> fetch(const RequestT& request) = 0;

 protected:
  PageFetcher() = default;
};

//=#=#==#==#===============+=+=+=+=++=++++++++++++++-++-+--+-+----+---------------
//
/** \brief A PageFetcher that calls a function object.
 */
template <typename RequestT, typename ItemT, typename FetchFn>
class FnPageFetcher : public PageFetcher<RequestT, ItemT>
{
 public:
  using Page = TurnedPage<RequestT, ItemT>;

  explicit FnPageFetcher(FetchFn&& fn) noexcept : fn_{std::move(fn)}
  {
  }

  StatusOr<Page> fetch(const RequestT& request) override
  {
    return this->fn_(request);
  }

 private:
  FetchFn fn_;
};

/** \brief Wraps `fn` (signature `StatusOr<TurnedPage<RequestT, ItemT>>(const RequestT&)`) as a
 * shared PageFetcher.
 */
template <typename RequestT, typename ItemT, typename FetchFn>
inline std::shared_ptr<PageFetcher<RequestT, ItemT>> make_page_fetcher(FetchFn&& fn)
{
  return std::make_shared<FnPageFetcher<RequestT, ItemT, std::decay_t<FetchFn>>>(
      std::decay_t<FetchFn>{BATT_FORWARD(fn)});
}

//=#=#==#==#===============+=+=+=+=++=++++++++++++++-++-+--+-+----+---------------
//
/** \brief A cheap-to-copy reference to a PageFetcher, either shared or borrowed.
 *
 * A borrowed handle does not keep its fetcher alive: the caller promises the fetcher outlives
 * every stream (and therefore every fetch task) created from the handle.  A shared handle holds a
 * reference count, so streams may outlive the code that created them.
 */
template <typename RequestT, typename ItemT>
class FetcherHandle
{
 public:
  using Fetcher = PageFetcher<RequestT, ItemT>;
  using Page = TurnedPage<RequestT, ItemT>;

  //+++++++++++-+-+--+----- --- -- -  -  -   -

  static FetcherHandle borrow(Fetcher& fetcher) noexcept
  {
    // Aliasing constructor with an empty owner: no reference count, never deletes.
    //
    return FetcherHandle{std::shared_ptr<Fetcher>{std::shared_ptr<Fetcher>{}, &fetcher},
                         /*is_borrowed=*/true};
  }

  static FetcherHandle share(std::shared_ptr<Fetcher> fetcher) noexcept
  {
    BATT_CHECK_NOT_NULLPTR(fetcher);

    return FetcherHandle{std::move(fetcher), /*is_borrowed=*/false};
  }

  //+++++++++++-+-+--+----- --- -- -  -  -   -

  bool is_borrowed() const noexcept
  {
    return this->is_borrowed_;
  }

  Fetcher& fetcher() const noexcept
  {
    return *this->fetcher_;
  }

  /** \brief Calls the fetcher, converting a thrown exception into an error Status.
   */
  StatusOr<Page> fetch(const RequestT& request) const
  {
    try {
      return this->fetcher_->fetch(request);
    } catch (const std::exception& e) {
      LOG(WARNING) << "page fetcher threw: " << e.what();
      return make_status(StatusCode::kFetchException);
    }
  }

 private:
  explicit FetcherHandle(std::shared_ptr<Fetcher>&& fetcher, bool is_borrowed) noexcept
      : fetcher_{std::move(fetcher)}
      , is_borrowed_{is_borrowed}
  {
  }

  std::shared_ptr<Fetcher> fetcher_;
  bool is_borrowed_;
};

}  // namespace page_turner
