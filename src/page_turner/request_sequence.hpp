#pragma once

#include <page_turner/limit.hpp>

#include <page_turner/import/int_types.hpp>
#include <page_turner/import/optional.hpp>

#include <batteries/utility.hpp>

#include <type_traits>
#include <utility>

namespace page_turner {

//=#=#==#==#===============+=+=+=+=++=++++++++++++++-++-+--+-+----+---------------
//
/** \brief The default way of deriving the request for the next page from the current one: calls
 * `request.next_request()`.
 *
 * Any functor with the signature `RequestT(const RequestT&)` can be used in its place.  It must be
 * pure and deterministic, and it must agree with the `next_request` produced by the fetcher
 * itself; look-ahead streams only look at whether a page is the last one, never at the value of
 * its next_request.  If the two disagree, look-ahead streams silently return a different result
 * set than `pages`.
 */
template <typename RequestT>
struct RequestAhead {
  RequestT operator()(const RequestT& request) const
  {
    return request.next_request();
  }
};

//=#=#==#==#===============+=+=+=+=++=++++++++++++++-++-+--+-+----+---------------
//
/** \brief A lazy, single-pass sequence of requests: `first`, `next_fn(first)`,
 * `next_fn(next_fn(first))`, ..., capped by a Limit.  Never performs I/O.
 *
 * Models the batteries Seq protocol (peek/next), so it composes with `batt::seq` operators.
 */
template <typename RequestT, typename NextFn = RequestAhead<RequestT>>
class RequestSequence
{
 public:
  using Item = RequestT;

  //+++++++++++-+-+--+----- --- -- -  -  -   -

  explicit RequestSequence(RequestT first, const Limit& limit, NextFn next_fn = NextFn{})
      : current_{std::move(first)}
      , max_pages_{max_pages_of(limit)}
      , next_fn_{std::move(next_fn)}
  {
  }

  //+++++++++++-+-+--+----- --- -- -  -  -   -

  Optional<Item> peek()
  {
    if (this->limit_reached()) {
      return None;
    }
    return this->current_;
  }

  Optional<Item> next()
  {
    if (this->limit_reached() || !this->current_) {
      return None;
    }

    Optional<Item> request{std::move(*this->current_)};
    this->current_.emplace(this->next_fn_(*request));
    this->count_ += 1;

    return request;
  }

  /** \brief The number of requests produced so far.
   */
  usize count() const noexcept
  {
    return this->count_;
  }

  //+++++++++++-+-+--+----- --- -- -  -  -   -
 private:
  bool limit_reached() const noexcept
  {
    return this->max_pages_ && this->count_ >= *this->max_pages_;
  }

  Optional<RequestT> current_;
  Optional<usize> max_pages_;
  usize count_ = 0;
  NextFn next_fn_;
};

//=#=#==#==#===============+=+=+=+=++=++++++++++++++-++-+--+-+----+---------------
//
/** \brief Pairs each item of `Seq` with its 0-based position in the sequence.
 */
template <typename Seq>
class Enumerate
{
 public:
  using Item = std::pair<usize, typename Seq::Item>;

  explicit Enumerate(Seq&& seq) noexcept : seq_{std::move(seq)}
  {
  }

  Optional<Item> peek()
  {
    Optional<typename Seq::Item> item = this->seq_.peek();
    if (!item) {
      return None;
    }
    return Item{this->next_index_, std::move(*item)};
  }

  Optional<Item> next()
  {
    Optional<typename Seq::Item> item = this->seq_.next();
    if (!item) {
      return None;
    }
    const usize index = this->next_index_;
    this->next_index_ += 1;

    return Item{index, std::move(*item)};
  }

 private:
  Seq seq_;
  usize next_index_ = 0;
};

template <typename Seq>
inline Enumerate<std::decay_t<Seq>> enumerate(Seq&& seq)
{
  return Enumerate<std::decay_t<Seq>>{std::decay_t<Seq>{BATT_FORWARD(seq)}};
}

}  // namespace page_turner
