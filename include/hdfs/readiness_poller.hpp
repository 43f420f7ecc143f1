#pragma once

#include <vector>
#include "utils/scoped_fd.hpp"

namespace tbstream {
namespace hdfs {

// Level triggered epoll set over readable descriptors.
// A descriptor is reported while it has data or a pending end of file.
class ReadinessPoller {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  ReadinessPoller();

  ReadinessPoller(const ReadinessPoller&) = delete;
  ReadinessPoller& operator=(const ReadinessPoller&) = delete;


  // ---- REGISTRATION ----
  void add(int fd);
  void remove(int fd);


  // ---- WAITING ----
  // Returns the ready descriptors. timeout_ms < 0 blocks until one is ready,
  // 0 only collects what is ready now.
  std::vector<int> wait(int timeout_ms = -1);


  // ---- QUERY METHODS ----
  std::size_t size() const { return registered_; }
  bool empty() const { return registered_ == 0; }

private:
  // ---- PARAMETERS ----
  utils::ScopedFd epoll_fd_;
  std::size_t registered_{0};
};

} // namespace hdfs
} // namespace tbstream
