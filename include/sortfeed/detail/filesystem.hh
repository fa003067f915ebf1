#pragma once

#include "sortfeed/internal/logger.hh"

#include <filesystem>
#include <system_error>

namespace sortfeed::detail {

using path = std::filesystem::path;

inline bool exists(const path& p) {
  std::error_code ec;
  return std::filesystem::exists(p, ec);
}

inline bool is_directory(const path& p) {
  std::error_code ec;
  return std::filesystem::is_directory(p, ec);
}

inline bool is_file(const path& p) {
  std::error_code ec;
  return std::filesystem::is_regular_file(p, ec);
}

inline bool mkdirs(const path& p) {
  std::error_code ec;
  auto rval = std::filesystem::create_directories(p, ec);
  if (!rval)
    internal::log::store::error("mkdirs-failed",
                                "failed to make directories {}: {}",
                                p.string(), ec.message());
  return rval;
}

inline path dirname(path p) {
  p.remove_filename();
  return p;
}

inline bool remove(const path& p) {
  std::error_code ec;
  auto rval = std::filesystem::remove(p, ec);
  if (!rval)
    internal::log::store::error("remove-failed", "failed to remove {}: {}",
                                p.string(), ec.message());
  return rval;
}

} // namespace sortfeed::detail
