#include "sortfeed/detail/transaction.hh"

#include "sortfeed/detail/overload.hh"
#include "sortfeed/event_sink.hh"

namespace sortfeed::detail {

void transaction::watch(std::string key, version_type version) {
  watches_.emplace_back(std::move(key), version);
}

void transaction::push_back(std::string list, std::string value) {
  ops_.emplace_back(push_back_op{std::move(list), std::move(value)});
}

void transaction::push_front(std::string list, std::string value) {
  ops_.emplace_back(push_front_op{std::move(list), std::move(value)});
}

void transaction::insert(std::string list, std::string pivot,
                         std::string value, insert_position position) {
  ops_.emplace_back(
    insert_op{std::move(list), std::move(pivot), std::move(value), position});
}

void transaction::remove(std::string list, std::string value) {
  ops_.emplace_back(remove_op{std::move(list), std::move(value)});
}

void transaction::set_field(std::string hash, std::string field,
                            std::string value) {
  ops_.emplace_back(
    set_field_op{std::move(hash), std::move(field), std::move(value)});
}

void transaction::erase_field(std::string hash, std::string field) {
  ops_.emplace_back(erase_field_op{std::move(hash), std::move(field)});
}

void transaction::increment(std::string counter) {
  ops_.emplace_back(increment_op{std::move(counter)});
}

void transaction::publish(event_sink* sink, std::string channel,
                          feed_event ev) {
  if (sink != nullptr)
    notifications_.push_back({sink, std::move(channel), std::move(ev)});
}

void transaction::deliver() const {
  for (const auto& note : notifications_)
    note.sink->emit(note.channel, note.event);
}

void transaction::clear() {
  watches_.clear();
  ops_.clear();
  notifications_.clear();
}

const std::string& key_of(const transaction::operation& op) {
  auto f = overload{
    [](const transaction::push_back_op& x) -> const std::string& {
      return x.list;
    },
    [](const transaction::push_front_op& x) -> const std::string& {
      return x.list;
    },
    [](const transaction::insert_op& x) -> const std::string& {
      return x.list;
    },
    [](const transaction::remove_op& x) -> const std::string& {
      return x.list;
    },
    [](const transaction::set_field_op& x) -> const std::string& {
      return x.hash;
    },
    [](const transaction::erase_field_op& x) -> const std::string& {
      return x.hash;
    },
    [](const transaction::increment_op& x) -> const std::string& {
      return x.counter;
    },
  };
  return std::visit(f, op);
}

std::string to_string(const transaction::operation& op) {
  auto f = overload{
    [](const transaction::push_back_op& x) {
      return "push_back(" + x.list + ", " + x.value + ")";
    },
    [](const transaction::push_front_op& x) {
      return "push_front(" + x.list + ", " + x.value + ")";
    },
    [](const transaction::insert_op& x) {
      return "insert(" + x.list + ", " + to_string(x.position) + " "
             + x.pivot + ", " + x.value + ")";
    },
    [](const transaction::remove_op& x) {
      return "remove(" + x.list + ", " + x.value + ")";
    },
    [](const transaction::set_field_op& x) {
      return "set_field(" + x.hash + ", " + x.field + ")";
    },
    [](const transaction::erase_field_op& x) {
      return "erase_field(" + x.hash + ", " + x.field + ")";
    },
    [](const transaction::increment_op& x) {
      return "increment(" + x.counter + ")";
    },
  };
  return std::visit(f, op);
}

} // namespace sortfeed::detail
