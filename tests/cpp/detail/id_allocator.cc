#define SUITE detail.id_allocator

#include "sortfeed/detail/id_allocator.hh"

#include "test.hh"

#include "sortfeed/detail/memory_backend.hh"

#include <memory>

using namespace sortfeed;

TEST(IDs start at one and increase strictly) {
  auto backend = std::make_shared<detail::memory_backend>();
  detail::id_allocator uut{backend, "feed.idincr:test"};
  CHECK_EQUAL(unbox(uut.last_id()), 0u);
  CHECK_EQUAL(unbox(uut.next_id()), 1u);
  CHECK_EQUAL(unbox(uut.next_id()), 2u);
  CHECK_EQUAL(unbox(uut.last_id()), 2u);
  MESSAGE("allocators on the same key share the sequence");
  detail::id_allocator other{backend, "feed.idincr:test"};
  CHECK_EQUAL(unbox(other.next_id()), 3u);
  MESSAGE("allocators on different keys are independent");
  detail::id_allocator unrelated{backend, "feed.idincr:other"};
  CHECK_EQUAL(unbox(unrelated.next_id()), 1u);
}
