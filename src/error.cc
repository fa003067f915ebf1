#include "sortfeed/error.hh"

#include "sortfeed/detail/assert.hh"
#include "sortfeed/internal/native.hh"
#include "sortfeed/internal/type_id.hh"

#include <caf/const_typed_message_view.hpp>
#include <caf/message.hpp>

#include <iterator>

static_assert(sizeof(caf::error) == sizeof(sortfeed::error::impl*));
static_assert(std::is_same_v<caf::type_id_t, uint16_t>);

namespace sortfeed {

namespace {

using internal::native;
using native_t = caf::error;

constexpr std::string_view ec_names[] = {
  "none",
  "unspecified",
  "no_such_item",
  "no_such_key",
  "backend_failure",
  "invalid_data",
  "retry_limit_exceeded",
  "invalid_message",
  "invalid_argument",
  "cannot_open_file",
  "logic_error",
};

} // namespace

uint16_t ec_category() noexcept {
  return caf::type_id_v<ec>;
}

error::error() {
  new (obj_) native_t();
}

error::error(ec code) {
  new (obj_) native_t(code);
}

error::error(ec code, std::string description) {
  new (obj_) native_t(code, caf::make_message(std::move(description)));
}

error::error(const impl* other) {
  new (obj_) native_t(native(other));
}

error::error(const error& other) {
  new (obj_) native_t(native(other));
}

error::error(error&& other) noexcept {
  new (obj_) native_t(std::move(native(other)));
}

error& error::operator=(const error& other) {
  if (this != &other)
    native(*this) = native(other);
  return *this;
}

error& error::operator=(error&& other) noexcept {
  native(*this) = std::move(native(other));
  return *this;
}

error::~error() {
  native(*this).~native_t();
}

bool error::valid() const noexcept {
  return static_cast<bool>(native(*this));
}

uint8_t error::code() const noexcept {
  return native(*this).code();
}

uint16_t error::category() const noexcept {
  return native(*this).category();
}

const std::string* error::message() const noexcept {
  auto& msg = native(*this).context();
  if (auto v = caf::make_const_typed_message_view<std::string>(msg))
    return std::addressof(get<0>(v));
  else
    return nullptr;
}

error::impl* error::native_ptr() noexcept {
  return reinterpret_cast<impl*>(obj_);
}

const error::impl* error::native_ptr() const noexcept {
  return reinterpret_cast<const impl*>(obj_);
}

int error::compare(const error& other) const noexcept {
  return native(*this).compare(native(other));
}

int error::compare(uint8_t code, uint16_t category) const noexcept {
  return native(*this).compare(code, category);
}

void convert(const error& in, std::string& out) {
  if (!in) {
    out = "none";
    return;
  }
  if (in.category() != ec_category()) {
    out = caf::to_string(native(in));
    return;
  }
  out = "error(";
  out += enum_str(static_cast<ec>(in.code()));
  if (auto msg = in.message()) {
    out += ", \"";
    out += *msg;
    out += '"';
  }
  out += ')';
}

std::string to_string(const error& x) {
  std::string result;
  convert(x, result);
  return result;
}

std::string to_string(ec code) {
  return std::string{enum_str(code)};
}

std::string_view enum_str(ec code) {
  auto index = static_cast<uint8_t>(code);
  SORTFEED_ASSERT(index < std::size(ec_names));
  return ec_names[index];
}

bool convert(std::string_view str, ec& code) noexcept {
  for (size_t index = 0; index < std::size(ec_names); ++index) {
    if (ec_names[index] == str) {
      code = static_cast<ec>(index);
      return true;
    }
  }
  return false;
}

bool convertible_to_ec(uint8_t src) noexcept {
  return src < std::size(ec_names);
}

} // namespace sortfeed
