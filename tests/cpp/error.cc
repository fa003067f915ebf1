#define SUITE error

#include "sortfeed/error.hh"

#include "test.hh"

#include <optional>
#include <string>
#include <string_view>

using namespace sortfeed;
using namespace std::string_literals;

namespace {

template <class T>
std::optional<T> from_string(std::string_view str) {
  T result;
  if (convert(str, result))
    return result;
  return std::nullopt;
}

} // namespace

TEST(ec is convertible to and from string) {
  CHECK_EQUAL(to_string(ec::unspecified), "unspecified"s);
  CHECK_EQUAL(to_string(ec::no_such_item), "no_such_item"s);
  CHECK_EQUAL(to_string(ec::no_such_key), "no_such_key"s);
  CHECK_EQUAL(to_string(ec::backend_failure), "backend_failure"s);
  CHECK_EQUAL(to_string(ec::invalid_data), "invalid_data"s);
  CHECK_EQUAL(to_string(ec::retry_limit_exceeded), "retry_limit_exceeded"s);
  CHECK_EQUAL(to_string(ec::invalid_message), "invalid_message"s);
  CHECK_EQUAL(to_string(ec::invalid_argument), "invalid_argument"s);
  CHECK_EQUAL(to_string(ec::cannot_open_file), "cannot_open_file"s);
  CHECK_EQUAL(to_string(ec::logic_error), "logic_error"s);
  CHECK(from_string<ec>("no_such_item") == ec::no_such_item);
  CHECK(from_string<ec>("retry_limit_exceeded") == ec::retry_limit_exceeded);
  CHECK(from_string<ec>("backend_failure") == ec::backend_failure);
  CHECK(!from_string<ec>("foo"));
}

TEST(default constructed errors are invalid) {
  error err;
  CHECK(!err.valid());
  CHECK(!err);
  CHECK(err.message() == nullptr);
  CHECK_EQUAL(to_string(err), "none"s);
}

TEST(errors store a code and an optional message) {
  auto err = make_error(ec::no_such_item);
  CHECK(err.valid());
  CHECK_EQUAL(err.category(), ec_category());
  CHECK_EQUAL(err.code(), static_cast<uint8_t>(ec::no_such_item));
  CHECK(err == ec::no_such_item);
  CHECK(err != ec::no_such_key);
  CHECK(err.message() == nullptr);
  err = make_error(ec::no_such_item, "no item with ID 42");
  REQUIRE(err.message() != nullptr);
  CHECK_EQUAL(*err.message(), "no item with ID 42"s);
  CHECK(err == ec::no_such_item);
}

TEST(errors render their code and message) {
  CHECK_EQUAL(to_string(make_error(ec::no_such_item)),
              "error(no_such_item)"s);
  CHECK_EQUAL(to_string(make_error(ec::backend_failure, "disk full")),
              "error(backend_failure, \"disk full\")"s);
}

TEST(errors are copyable and comparable) {
  auto err1 = make_error(ec::invalid_data, "bad entry");
  auto err2 = err1;
  CHECK_EQUAL(err1, err2);
  auto err3 = std::move(err2);
  CHECK_EQUAL(err1, err3);
  CHECK_NOT_EQUAL(err1, make_error(ec::invalid_message));
}

TEST(expected carries either a value or an error) {
  expected<int> x{42};
  REQUIRE(x);
  CHECK_EQUAL(*x, 42);
  expected<int> y{ec::no_such_item};
  REQUIRE(!y);
  CHECK_EQUAL(y.error(), ec::no_such_item);
  expected<void> z;
  CHECK(z);
  expected<void> w{make_error(ec::retry_limit_exceeded)};
  CHECK(!w);
  CHECK_EQUAL(w.error(), ec::retry_limit_exceeded);
}
