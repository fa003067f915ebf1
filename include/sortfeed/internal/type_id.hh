#pragma once

#include "sortfeed/error.hh"
#include "sortfeed/time.hh"

#include <caf/is_error_code_enum.hpp>
#include <caf/type_id.hpp>

// Our type aliases for `timespan` and `timestamp` are identical to
// `caf::timespan` and `caf::timestamp`. Hence, these types should have a type
// ID assigned by CAF.

static_assert(caf::has_type_id_v<sortfeed::timespan>,
              "sortfeed::timespan != caf::timespan");

static_assert(caf::has_type_id_v<sortfeed::timestamp>,
              "sortfeed::timestamp != caf::timestamp");

CAF_BEGIN_TYPE_ID_BLOCK(sortfeed, caf::first_custom_type_id)

  CAF_ADD_TYPE_ID(sortfeed, (sortfeed::ec))

CAF_END_TYPE_ID_BLOCK(sortfeed)

CAF_ERROR_CODE_ENUM(sortfeed::ec)
