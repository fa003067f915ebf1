#pragma once

#include "sortfeed/error.hh"

#include <caf/error.hpp>

// Generates the necessary boilerplate code for `native` to work.
#define SORTFEED_MAP_CAF_TYPE(Native, Facade)                                  \
  template <>                                                                  \
  struct conversion_oracle<Facade> {                                           \
    using native_type = Native;                                                \
    using facade_type = Facade;                                                \
  };                                                                           \
  template <>                                                                  \
  struct conversion_oracle<Facade::impl> : conversion_oracle<Facade> {};       \
  template <>                                                                  \
  struct conversion_oracle<Native> : conversion_oracle<Facade> {};

namespace sortfeed::internal {

/// Metaprogramming utility for implementing `native`.
template <class Facade>
struct conversion_oracle;

SORTFEED_MAP_CAF_TYPE(caf::error, error)

template <class Facade>
using native_type_t = typename conversion_oracle<Facade>::native_type;

template <class Native>
using facade_type_t = typename conversion_oracle<Native>::facade_type;

/// Returns a reference to the native CAF type from an opaque `impl` pointer.
template <class Opaque>
auto& native(Opaque* x) {
  return *reinterpret_cast<native_type_t<Opaque>*>(x);
}

/// Returns a reference to the native CAF type from an opaque `impl` pointer.
template <class Opaque>
auto& native(const Opaque* x) {
  return *reinterpret_cast<const native_type_t<Opaque>*>(x);
}

/// Returns a reference to the native CAF type from a facade object.
template <class Facade>
auto& native(Facade& x) {
  return native(x.native_ptr());
}

/// Returns a reference to the native CAF type from a facade object.
template <class Facade>
auto& native(const Facade& x) {
  return native(x.native_ptr());
}

/// Converts a native CAF object to a facade object.
template <class Native>
auto facade(const Native& x) {
  using res_t = facade_type_t<Native>;
  return res_t{reinterpret_cast<const typename res_t::impl*>(&x)};
}

} // namespace sortfeed::internal

#undef SORTFEED_MAP_CAF_TYPE
