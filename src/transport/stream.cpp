#include "transport/stream.hpp"

#include <cerrno>
#include <cstring>
#include <stdexcept>

#include <fcntl.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/stat.h>
#include <unistd.h>

namespace nexsock_transport {

namespace {

std::string errno_message(const char *what, int err) {
  return std::string(what) + ": " + std::strerror(err);
}

void close_fd(int &fd) {
  if (fd >= 0) {
    ::close(fd);
    fd = -1;
  }
}

} // namespace

FdStream::FdStream(int socket_fd) : FdStream(socket_fd, socket_fd) {}

FdStream::FdStream(int read_fd, int write_fd)
    : read_fd_(read_fd), write_fd_(write_fd) {
  if (read_fd < 0 || write_fd < 0) {
    throw std::runtime_error("FdStream: invalid file descriptor");
  }
  if (::pipe2(wake_fds_, O_CLOEXEC | O_NONBLOCK) != 0) {
    throw std::runtime_error(errno_message("FdStream: pipe2 failed", errno));
  }

  struct stat st {};
  if (::fstat(write_fd_, &st) == 0) {
    is_socket_ = S_ISSOCK(st.st_mode);
  }

  // Writes never block inside the kernel; wait_writable() polls instead so
  // interrupt() can wake a writer stuck behind a peer that stopped reading.
  const int flags = ::fcntl(write_fd_, F_GETFL);
  if (flags < 0 || ::fcntl(write_fd_, F_SETFL, flags | O_NONBLOCK) != 0) {
    const int e = errno;
    close_fd(wake_fds_[0]);
    close_fd(wake_fds_[1]);
    throw std::runtime_error(errno_message("FdStream: fcntl failed", e));
  }
}

FdStream::~FdStream() { close(); }

ReadStatus FdStream::read_some(uint8_t *buf, size_t cap, size_t &n,
                               std::string &err) {
  n = 0;
  err.clear();

  pollfd fds[2];
  fds[0] = {read_fd_, POLLIN, 0};
  fds[1] = {wake_fds_[0], POLLIN, 0};

  while (true) {
    if (interrupted_.load()) {
      return ReadStatus::Interrupted;
    }

    const int rc = ::poll(fds, 2, -1);
    if (rc < 0) {
      if (errno == EINTR) {
        continue;
      }
      err = errno_message("poll failed", errno);
      return ReadStatus::Error;
    }

    if (fds[1].revents != 0) {
      return ReadStatus::Interrupted;
    }
    if ((fds[0].revents & POLLNVAL) != 0) {
      err = "read descriptor is not open";
      return ReadStatus::Error;
    }
    if (fds[0].revents == 0) {
      continue;
    }

    const ssize_t r = ::read(read_fd_, buf, cap);
    if (r > 0) {
      n = static_cast<size_t>(r);
      return ReadStatus::Ok;
    }
    if (r == 0) {
      return ReadStatus::Eof;
    }
    if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) {
      continue;
    }
    if (errno == ECONNRESET) {
      return ReadStatus::Eof;
    }
    err = errno_message("read failed", errno);
    return ReadStatus::Error;
  }
}

bool FdStream::wait_writable(std::string &err) {
  pollfd fds[2];
  fds[0] = {write_fd_, POLLOUT, 0};
  fds[1] = {wake_fds_[0], POLLIN, 0};

  while (true) {
    if (interrupted_.load()) {
      err = "write interrupted";
      return false;
    }
    if (::poll(fds, 2, -1) < 0) {
      if (errno == EINTR) {
        continue;
      }
      err = errno_message("poll failed", errno);
      return false;
    }
    if (fds[1].revents != 0) {
      err = "write interrupted";
      return false;
    }
    if (fds[0].revents != 0) {
      // POLLERR and POLLHUP surface through the next send().
      return true;
    }
  }
}

bool FdStream::write_all(const uint8_t *data, size_t len, std::string &err) {
  err.clear();
  if (write_shut_ || write_fd_ < 0) {
    err = "write half is closed";
    return false;
  }

  size_t sent = 0;
  while (sent < len) {
    if (interrupted_.load()) {
      err = "write interrupted";
      return false;
    }
    // MSG_NOSIGNAL: a vanished peer must surface as EPIPE, not SIGPIPE.
    const ssize_t w =
        is_socket_ ? ::send(write_fd_, data + sent, len - sent, MSG_NOSIGNAL)
                   : ::write(write_fd_, data + sent, len - sent);
    if (w > 0) {
      sent += static_cast<size_t>(w);
      continue;
    }
    if (w < 0 && errno == EINTR) {
      continue;
    }
    if (w < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
      if (!wait_writable(err)) {
        return false;
      }
      continue;
    }
    err = errno_message("write failed", w < 0 ? errno : EIO);
    return false;
  }
  return true;
}

void FdStream::shutdown_write() {
  if (write_shut_ || write_fd_ < 0) {
    return;
  }
  write_shut_ = true;
  if (is_socket_) {
    ::shutdown(write_fd_, SHUT_WR);
  } else if (write_fd_ != read_fd_) {
    close_fd(write_fd_);
  }
}

void FdStream::interrupt() {
  interrupted_.store(true);
  if (wake_fds_[1] >= 0) {
    const uint8_t b = 1;
    // Pipe full means a wakeup is already pending.
    (void)!::write(wake_fds_[1], &b, 1);
  }
}

void FdStream::close() {
  if (write_fd_ == read_fd_) {
    write_fd_ = -1;
  } else {
    close_fd(write_fd_);
  }
  close_fd(read_fd_);
  close_fd(wake_fds_[0]);
  close_fd(wake_fds_[1]);
}

} // namespace nexsock_transport
