#pragma once

#include <page_turner/import/int_types.hpp>
#include <page_turner/import/optional.hpp>

#include <batteries/utility.hpp>

#include <memory>
#include <type_traits>
#include <utility>

namespace page_turner {

//=#=#==#==#===============+=+=+=+=++=++++++++++++++-++-+--+-+----+---------------
//
/** \brief Groups the items of a Seq into batches of at most `chunk_size`, pulled lazily.
 *
 * Look-ahead streams use this to issue a full window of requests at once (next_chunk), and then
 * to refill the window one request at a time as earlier ones complete (next_item).
 */
template <typename Seq>
class Chunker
{
 public:
  using Item = typename Seq::Item;

  //==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
  //
  /** \brief One batch of items.  Yields the seed item plus up to `chunk_size - 1` more, pulled
   * from the underlying Seq on demand; items not pulled stay in the Seq for the next chunk.
   *
   * A Chunk must not outlive the Chunker that produced it.
   */
  class Chunk
  {
   public:
    using Item = typename Chunker::Item;

    explicit Chunk(Chunker* chunker, Item&& first) noexcept
        : chunker_{chunker}
        , first_{std::move(first)}
    {
    }

    Optional<Item> next()
    {
      if (this->yielded_count_ >= this->chunker_->chunk_size()) {
        return None;
      }
      this->yielded_count_ += 1;

      if (this->first_) {
        Optional<Item> first = std::move(this->first_);
        this->first_ = None;
        return first;
      }
      return this->chunker_->next_item();
    }

    usize yielded_count() const noexcept
    {
      return this->yielded_count_;
    }

   private:
    Chunker* chunker_;
    Optional<Item> first_;
    usize yielded_count_ = 0;
  };

  //+++++++++++-+-+--+----- --- -- -  -  -   -

  explicit Chunker(Seq&& seq, usize chunk_size) noexcept
      : seq_{std::move(seq)}
      , chunk_size_{chunk_size}
  {
  }

  Chunker(const Chunker&) = delete;
  Chunker& operator=(const Chunker&) = delete;

  //+++++++++++-+-+--+----- --- -- -  -  -   -

  usize chunk_size() const noexcept
  {
    return this->chunk_size_;
  }

  /** \brief Returns the next chunk, or None if the Seq is exhausted or `chunk_size` is 0.
   */
  Optional<Chunk> next_chunk()
  {
    if (this->chunk_size_ == 0) {
      return None;
    }

    Optional<Item> first = this->seq_.next();
    if (!first) {
      return None;
    }

    return Chunk{this, std::move(*first)};
  }

  /** \brief Pulls a single item from the underlying Seq, ignoring chunk boundaries.
   */
  Optional<Item> next_item()
  {
    return this->seq_.next();
  }

  //+++++++++++-+-+--+----- --- -- -  -  -   -
 private:
  Seq seq_;
  usize chunk_size_;
};

template <typename Seq>
inline auto make_chunker(Seq&& seq, usize chunk_size)
{
  using SeqT = std::decay_t<Seq>;
  return std::make_unique<Chunker<SeqT>>(SeqT{BATT_FORWARD(seq)}, chunk_size);
}

}  // namespace page_turner
