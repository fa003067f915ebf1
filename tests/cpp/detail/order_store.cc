#define SUITE detail.order_store

#include "sortfeed/detail/order_store.hh"

#include "test.hh"

#include "sortfeed/detail/memory_backend.hh"
#include "sortfeed/detail/transaction.hh"

#include <memory>
#include <string>
#include <vector>

using namespace sortfeed;

using id_list = std::vector<item_id>;

namespace {

struct fixture {
  std::shared_ptr<detail::memory_backend> backend;
  detail::order_store uut;

  fixture()
    : backend(std::make_shared<detail::memory_backend>()),
      uut(backend, "feed.ids:test") {
    // nop
  }

  void commit(const detail::transaction& tx) {
    if (!unbox(backend->commit(tx)))
      FAIL("commit conflicted");
  }
};

} // namespace

FIXTURE_SCOPE(order_store_tests, fixture)

TEST(writes take effect only after committing the transaction) {
  detail::transaction tx;
  uut.append_tail(tx, 1);
  CHECK_EQUAL(unbox(uut.ids()), id_list{});
  commit(tx);
  CHECK_EQUAL(unbox(uut.ids()), id_list{1});
}

TEST(the order reflects head tail and relative placements) {
  detail::transaction tx;
  uut.append_tail(tx, 1);
  uut.append_tail(tx, 2);
  uut.append_head(tx, 3);
  uut.insert_relative(tx, 4, 2, insert_position::before);
  uut.insert_relative(tx, 5, 3, insert_position::after);
  commit(tx);
  CHECK_EQUAL(unbox(uut.ids()), (id_list{3, 5, 1, 4, 2}));
  tx.clear();
  uut.remove(tx, 5);
  uut.remove(tx, 2);
  commit(tx);
  CHECK_EQUAL(unbox(uut.ids()), (id_list{3, 1, 4}));
}

TEST(entries are stored in decimal notation) {
  detail::transaction tx;
  uut.append_tail(tx, 1234567890123);
  commit(tx);
  CHECK_EQUAL(unbox(backend->range(uut.key())),
              std::vector<std::string>{"1234567890123"});
}

TEST(non-numeric entries are invalid data) {
  detail::transaction tx;
  tx.push_back(uut.key(), "12x");
  commit(tx);
  CHECK_EQUAL(uut.ids().error(), ec::invalid_data);
}

FIXTURE_SCOPE_END()
