#pragma once

#include <page_turner/page_fetcher.hpp>
#include <page_turner/turned_page.hpp>

#include <page_turner/import/int_types.hpp>
#include <page_turner/import/optional.hpp>
#include <page_turner/import/status.hpp>

#include <batteries/assert.hpp>
#include <batteries/async/mutex.hpp>
#include <batteries/async/watch.hpp>

#include <algorithm>
#include <atomic>
#include <map>
#include <memory>
#include <ostream>
#include <vector>

namespace page_turner {
namespace testing {

struct BlogRecord {
  usize index;
};

inline bool operator==(const BlogRecord& l, const BlogRecord& r)
{
  return l.index == r.index;
}

inline std::ostream& operator<<(std::ostream& out, const BlogRecord& t)
{
  return out << "BlogRecord{" << t.index << "}";
}

struct GetContentRequest {
  usize page = 0;

  GetContentRequest next_request() const
  {
    return GetContentRequest{this->page + 1};
  }
};

//=#=#==#==#===============+=+=+=+=++=++++++++++++++-++-+--+-+----+---------------
//
/** \brief One BlogRecord per page; page `i` holds `BlogRecord{i}` unless an error was set for it.
 * Pages past the end fail with batt::StatusCode::kOutOfRange.
 *
 * All configuration (set_error, hold) must happen before any stream is created from this fetcher.
 */
class BlogFetcher : public PageFetcher<GetContentRequest, BlogRecord>
{
 public:
  explicit BlogFetcher(usize record_count) noexcept
  {
    for (usize i = 0; i < record_count; ++i) {
      this->content_.emplace_back(BlogRecord{i});
    }
  }

  //+++++++++++-+-+--+----- --- -- -  -  -   -

  usize size() const noexcept
  {
    return this->content_.size();
  }

  void set_error(usize page, const Status& status = Status{batt::StatusCode::kInternal})
  {
    BATT_CHECK_LT(page, this->content_.size());
    this->content_[page] = status;
  }

  /** \brief The fetch of `page` will not complete until release(page) is called.
   */
  void hold(usize page)
  {
    this->holds_.emplace(page, std::make_unique<batt::Watch<bool>>(false));
  }

  void release(usize page)
  {
    auto iter = this->holds_.find(page);
    BATT_CHECK(iter != this->holds_.end()) << BATT_INSPECT(page);
    iter->second->set_value(true);
  }

  /** \brief The pages fetched so far, in ascending order (one entry per fetch).
   */
  std::vector<usize> fetched_pages() const
  {
    std::vector<usize> pages = *this->fetched_pages_.lock();
    std::sort(pages.begin(), pages.end());
    return pages;
  }

  usize fetch_count() const
  {
    return this->fetched_pages_.lock()->size();
  }

  /** \brief The number of fetches that have started, including those waiting on a hold.
   */
  usize started_count() const noexcept
  {
    return this->started_count_.load();
  }

  Optional<usize> max_page_fetched() const
  {
    std::vector<usize> pages = this->fetched_pages();
    if (pages.empty()) {
      return None;
    }
    return pages.back();
  }

  //+++++++++++-+-+--+----- --- -- -  -  -   -

  StatusOr<Page> fetch(const GetContentRequest& request) override
  {
    this->started_count_.fetch_add(1);

    auto iter = this->holds_.find(request.page);
    if (iter != this->holds_.end()) {
      BATT_REQUIRE_OK(iter->second->await_true([](bool released) {
        return released;
      }));
    }

    this->fetched_pages_.lock()->emplace_back(request.page);

    if (request.page >= this->content_.size()) {
      return Status{batt::StatusCode::kOutOfRange};
    }

    const StatusOr<BlogRecord>& record = this->content_[request.page];
    BATT_REQUIRE_OK(record);

    if (request.page + 1 < this->content_.size()) {
      return Page::next({*record}, request.next_request());
    }
    return Page::last({*record});
  }

 private:
  std::vector<StatusOr<BlogRecord>> content_;
  std::map<usize, std::unique_ptr<batt::Watch<bool>>> holds_;
  mutable batt::Mutex<std::vector<usize>> fetched_pages_;
  std::atomic<usize> started_count_{0};
};

}  // namespace testing
}  // namespace page_turner
