#include "sortfeed/detail/make_backend.hh"

#include "sortfeed/detail/memory_backend.hh"
#include "sortfeed/detail/sqlite_backend.hh"
#include "sortfeed/internal/logger.hh"

namespace sortfeed::detail {

std::unique_ptr<abstract_backend> make_backend(backend type,
                                               backend_options opts) {
  switch (type) {
    case backend::memory:
      return std::make_unique<memory_backend>();
    case backend::sqlite: {
      auto rval = std::make_unique<sqlite_backend>(std::move(opts));
      if (rval->init_failed())
        return nullptr;
      return rval;
    }
  }
  internal::log::store::critical("invalid-backend-type",
                                 "cannot create backend of type {}",
                                 static_cast<int>(type));
  return nullptr;
}

} // namespace sortfeed::detail
