#pragma once

#include "sortfeed/backend.hh"
#include "sortfeed/detail/abstract_backend.hh"
#include "sortfeed/fwd.hh"

#include <memory>

namespace sortfeed::detail {

/// Creates a backend of given type.
/// @returns the new backend or `nullptr` if initialization failed.
std::unique_ptr<abstract_backend> make_backend(backend type,
                                               backend_options opts);

} // namespace sortfeed::detail
