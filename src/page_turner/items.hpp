#pragma once

#include <page_turner/import/int_types.hpp>
#include <page_turner/import/optional.hpp>
#include <page_turner/import/status.hpp>

#include <batteries/utility.hpp>

#include <type_traits>
#include <utility>
#include <vector>

namespace page_turner {

/** \brief Flattens a stream of pages (any type whose `next()` returns
 * `Optional<StatusOr<std::vector<T>>>`) into a stream of its items.
 *
 * Items keep the order in which the pages stream yields them; empty pages are skipped.  The pages
 * stream's error is yielded in place of the items that would follow it, and ends the stream.
 */
template <typename PagesSeq>
class ItemsOf
{
 public:
  using PageItems = RemoveStatusOr<typename PagesSeq::Item>;
  using Value = typename PageItems::value_type;
  using Item = StatusOr<Value>;

  //+++++++++++-+-+--+----- --- -- -  -  -   -

  explicit ItemsOf(PagesSeq&& pages) noexcept : pages_{std::move(pages)}
  {
  }

  Optional<Item> next()
  {
    for (;;) {
      if (this->pos_ < this->current_.size()) {
        Value value = std::move(this->current_[this->pos_]);
        this->pos_ += 1;
        return Optional<Item>{Item{std::move(value)}};
      }

      if (this->done_) {
        return None;
      }

      Optional<typename PagesSeq::Item> page = this->pages_.next();
      if (!page) {
        this->done_ = true;
        return None;
      }

      if (!page->ok()) {
        this->done_ = true;
        return Optional<Item>{Item{page->status()}};
      }

      this->current_ = std::move(**page);
      this->pos_ = 0;
    }
  }

  PagesSeq& pages() noexcept
  {
    return this->pages_;
  }

 private:
  PagesSeq pages_;
  PageItems current_;
  usize pos_ = 0;
  bool done_ = false;
};

template <typename PagesSeq>
inline ItemsOf<std::decay_t<PagesSeq>> items(PagesSeq&& pages)
{
  return ItemsOf<std::decay_t<PagesSeq>>{std::decay_t<PagesSeq>{BATT_FORWARD(pages)}};
}

//=#=#==#==#===============+=+=+=+=++=++++++++++++++-++-+--+-+----+---------------

/** \brief Drains a pages stream, returning every page's items or the stream's error.
 */
template <typename PagesSeq>
inline StatusOr<std::vector<RemoveStatusOr<typename PagesSeq::Item>>> collect_pages(
    PagesSeq& pages)
{
  std::vector<RemoveStatusOr<typename PagesSeq::Item>> collected;
  while (Optional<typename PagesSeq::Item> page = pages.next()) {
    BATT_REQUIRE_OK(*page);
    collected.emplace_back(std::move(**page));
  }
  return collected;
}

/** \brief Drains a pages stream, returning all items concatenated in stream order, or the stream's
 * error.
 */
template <typename PagesSeq>
inline StatusOr<RemoveStatusOr<typename PagesSeq::Item>> collect_items(PagesSeq& pages)
{
  RemoveStatusOr<typename PagesSeq::Item> collected;
  while (Optional<typename PagesSeq::Item> page = pages.next()) {
    BATT_REQUIRE_OK(*page);
    for (auto& item : **page) {
      collected.emplace_back(std::move(item));
    }
  }
  return collected;
}

}  // namespace page_turner
