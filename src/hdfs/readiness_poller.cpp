#include "hdfs/readiness_poller.hpp"
#include "process/process_error.hpp"
#include <boost/log/trivial.hpp>
#include <cerrno>
#include <cstring>
#include <string>
#include <sys/epoll.h>

namespace tbstream {
namespace hdfs {

namespace {

constexpr int MAX_EVENTS = 64;

process::ProcessError poller_error(const std::string& what) {
  return process::ProcessError("ReadinessPoller: " + what + ": " + std::strerror(errno));
}

} // namespace

ReadinessPoller::ReadinessPoller()
  : epoll_fd_(::epoll_create1(EPOLL_CLOEXEC)) {
  if (!epoll_fd_.valid()) {
    throw poller_error("epoll_create1 failed");
  }
}

void ReadinessPoller::add(int fd) {
  epoll_event event{};
  event.events = EPOLLIN;
  event.data.fd = fd;
  if (::epoll_ctl(epoll_fd_.get(), EPOLL_CTL_ADD, fd, &event) != 0) {
    throw poller_error("epoll_ctl add failed for fd " + std::to_string(fd));
  }
  ++registered_;
  BOOST_LOG_TRIVIAL(trace) << "ReadinessPoller: Watching fd " << fd;
}

void ReadinessPoller::remove(int fd) {
  if (::epoll_ctl(epoll_fd_.get(), EPOLL_CTL_DEL, fd, nullptr) != 0) {
    throw poller_error("epoll_ctl del failed for fd " + std::to_string(fd));
  }
  --registered_;
  BOOST_LOG_TRIVIAL(trace) << "ReadinessPoller: Released fd " << fd;
}

std::vector<int> ReadinessPoller::wait(int timeout_ms) {
  std::vector<int> ready;
  if (registered_ == 0) {
    return ready;
  }

  epoll_event events[MAX_EVENTS];
  int count;
  do {
    count = ::epoll_wait(epoll_fd_.get(), events, MAX_EVENTS, timeout_ms);
  } while (count < 0 && errno == EINTR);

  if (count < 0) {
    throw poller_error("epoll_wait failed");
  }

  ready.reserve(static_cast<std::size_t>(count));
  for (int i = 0; i < count; ++i) {
    // EPOLLHUP and EPOLLERR mean end of stream, the decoder sees it on read
    ready.push_back(events[i].data.fd);
  }
  return ready;
}

} // namespace hdfs
} // namespace tbstream
