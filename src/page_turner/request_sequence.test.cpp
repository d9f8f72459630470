#include <page_turner/request_sequence.hpp>
//
#include <page_turner/request_sequence.hpp>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <page_turner/import/seq.hpp>

#include <batteries/stream_util.hpp>

#include <vector>

namespace {

using namespace page_turner::int_types;

using page_turner::enumerate;
using page_turner::Limit;
using page_turner::MaxPages;
using page_turner::NoLimit;
using page_turner::Optional;
using page_turner::RequestSequence;

namespace seq = page_turner::seq;

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -

struct DumbRequest {
  usize page = 1;

  DumbRequest next_request() const
  {
    return DumbRequest{this->page + 1};
  }
};

Optional<usize> last_page_of(RequestSequence<DumbRequest>&& requests, usize take_n)
{
  Optional<usize> last;
  for (usize i = 0; i < take_n; ++i) {
    Optional<DumbRequest> request = requests.next();
    if (!request) {
      break;
    }
    last = request->page;
  }
  return last;
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
TEST(RequestSequenceTest, Unbounded)
{
  EXPECT_EQ(last_page_of(RequestSequence<DumbRequest>{DumbRequest{}, NoLimit{}}, 20),
            Optional<usize>{20});
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
TEST(RequestSequenceTest, MaxPages)
{
  EXPECT_EQ(last_page_of(RequestSequence<DumbRequest>{DumbRequest{}, MaxPages{8}}, 20),
            Optional<usize>{8});

  EXPECT_FALSE(last_page_of(RequestSequence<DumbRequest>{DumbRequest{}, MaxPages{0}}, 20));

  // For any n, an infinite chain capped at n produces exactly n requests.
  //
  for (usize n = 0; n < 50; ++n) {
    RequestSequence<DumbRequest> requests{DumbRequest{}, MaxPages{n}};
    usize count = 0;
    while (requests.next()) {
      ++count;
      ASSERT_LE(count, n);
    }
    EXPECT_EQ(count, n);
    EXPECT_EQ(requests.count(), n);
    EXPECT_FALSE(requests.next());
    EXPECT_FALSE(requests.peek());
  }
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
TEST(RequestSequenceTest, PeekDoesNotAdvance)
{
  RequestSequence<DumbRequest> requests{DumbRequest{}, MaxPages{2}};

  ASSERT_TRUE(requests.peek());
  EXPECT_EQ(requests.peek()->page, 1u);
  EXPECT_EQ(requests.next()->page, 1u);
  EXPECT_EQ(requests.peek()->page, 2u);
  EXPECT_EQ(requests.count(), 1u);
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
TEST(RequestSequenceTest, CustomNextFn)
{
  auto skip_by_ten = [](const usize& offset) -> usize {
    return offset + 10;
  };

  RequestSequence<usize, decltype(skip_by_ten)> offsets{usize{0}, MaxPages{4}, skip_by_ten};

  std::vector<usize> collected = std::move(offsets) | seq::collect_vec();

  EXPECT_THAT(collected, ::testing::ElementsAre(0, 10, 20, 30));
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
TEST(RequestSequenceTest, Enumerate)
{
  auto numbered = enumerate(RequestSequence<DumbRequest>{DumbRequest{5}, MaxPages{3}});

  for (usize expected_index = 0; expected_index < 3; ++expected_index) {
    auto item = numbered.next();
    ASSERT_TRUE(item);
    EXPECT_EQ(item->first, expected_index);
    EXPECT_EQ(item->second.page, 5 + expected_index);
  }
  EXPECT_FALSE(numbered.next());
}

}  // namespace
