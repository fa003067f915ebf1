#include "sortfeed/detail/flare.hh"

#include "sortfeed/internal/logger.hh"

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <exception>
#include <limits>

#include <fcntl.h>
#include <poll.h>
#include <unistd.h>

namespace sortfeed::detail {

namespace {

constexpr size_t stack_buffer_size = 256;

bool try_again_later() {
  if constexpr (EAGAIN == EWOULDBLOCK)
    return errno == EAGAIN || errno == EINTR;
  else
    return errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR;
}

bool add_fd_flags(int fd, int get_cmd, int set_cmd, int flags) {
  auto current = ::fcntl(fd, get_cmd);
  return current != -1 && ::fcntl(fd, set_cmd, current | flags) != -1;
}

} // namespace

flare::flare() {
  if (::pipe(fds_) != 0) {
    internal::log::notify::critical("flare-pipe-failed",
                                    "failed to create flare pipe: {}",
                                    std::strerror(errno));
    std::terminate();
  }
  if (!add_fd_flags(fds_[0], F_GETFD, F_SETFD, FD_CLOEXEC)
      || !add_fd_flags(fds_[1], F_GETFD, F_SETFD, FD_CLOEXEC))
    internal::log::notify::error("flare-cloexec-failed",
                                 "failed to set flare fds CLOEXEC: {}",
                                 std::strerror(errno));
  if (!add_fd_flags(fds_[0], F_GETFL, F_SETFL, O_NONBLOCK)) {
    internal::log::notify::critical("flare-nonblock-failed",
                                    "failed to set flare fd 0 NONBLOCK: {}",
                                    std::strerror(errno));
    std::terminate();
  }
  // Do not set the write handle to nonblock, because we want the producer to
  // slow down in case the consumer cannot keep up emptying the pipe.
}

flare::~flare() {
  ::close(fds_[0]);
  ::close(fds_[1]);
}

void flare::fire() {
  char tmp = 0;
  for (;;) {
    auto n = ::write(fds_[1], &tmp, 1);
    if (n == 1)
      return;
    if (n < 0 && errno == EINTR)
      continue;
    internal::log::notify::critical("flare-write-failed",
                                    "unable to write flare pipe: {}",
                                    std::strerror(errno));
    std::terminate();
  }
}

size_t flare::extinguish() {
  char tmp[stack_buffer_size];
  size_t result = 0;
  for (;;) {
    auto n = ::read(fds_[0], tmp, stack_buffer_size);
    if (n > 0)
      result += static_cast<size_t>(n);
    else if (n < 0 && errno == EINTR)
      continue;
    else
      return result; // Pipe is now drained.
  }
}

bool flare::extinguish_one() {
  char tmp = 0;
  for (;;) {
    auto n = ::read(fds_[0], &tmp, 1);
    if (n == 1)
      return true; // Read one byte.
    if (n < 0 && errno == EINTR)
      continue;
    return false; // No data available to read.
  }
}

void flare::await_one() {
  while (!await_one_impl(-1)) {
    // Interrupted by a signal, try again.
  }
}

bool flare::await_one(timestamp deadline) {
  for (;;) {
    auto t = now();
    if (t >= deadline)
      return await_one_impl(0);
    auto remaining = std::chrono::ceil<std::chrono::milliseconds>(deadline - t);
    auto ms = static_cast<int>(std::min<std::chrono::milliseconds::rep>(
      remaining.count(), std::numeric_limits<int>::max()));
    if (await_one_impl(ms))
      return true;
  }
}

bool flare::await_one_impl(int ms_timeout) {
  pollfd p = {fds_[0], POLLIN, 0};
  auto n = ::poll(&p, 1, ms_timeout);
  if (n < 0 && !try_again_later()) {
    internal::log::notify::critical("flare-poll-failed",
                                    "failed to poll flare: {}",
                                    std::strerror(errno));
    std::terminate();
  }
  return n == 1 && (p.revents & POLLIN) != 0;
}

} // namespace sortfeed::detail
