#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <string>

namespace nexsock_transport {

enum class ReadStatus : uint8_t {
  Ok,          // at least one byte read
  Eof,         // peer closed its write half
  Interrupted, // interrupt() was called
  Error        // I/O error, see err
};

// Duplex byte channel driven by a session. The session's reader thread is
// the only caller of read_some(); writes are serialized by the caller.
class Stream {
public:
  virtual ~Stream() = default;

  // Blocks until some bytes arrive, EOF, interrupt() or an error.
  virtual ReadStatus read_some(uint8_t *buf, size_t cap, size_t &n,
                               std::string &err) = 0;

  // Writes all len bytes. Returns false on error and sets err.
  virtual bool write_all(const uint8_t *data, size_t len, std::string &err) = 0;

  // Half-close: the peer sees EOF, reads remain possible.
  virtual void shutdown_write() = 0;

  // Wakes a blocked read_some() or write_all(); safe from any thread.
  // Sticky: both fail fast afterwards.
  virtual void interrupt() = 0;

  // Releases the underlying handles. Must not race read_some().
  virtual void close() = 0;
};

// Stream over file descriptors supplied by the caller: one connected socket
// (read_fd == write_fd) or a pipe pair. Takes ownership of the fds and puts
// the write side in non-blocking mode.
class FdStream : public Stream {
public:
  explicit FdStream(int socket_fd);
  FdStream(int read_fd, int write_fd);
  ~FdStream() override;

  FdStream(const FdStream &) = delete;
  FdStream &operator=(const FdStream &) = delete;

  ReadStatus read_some(uint8_t *buf, size_t cap, size_t &n,
                       std::string &err) override;
  bool write_all(const uint8_t *data, size_t len, std::string &err) override;
  void shutdown_write() override;
  void interrupt() override;
  void close() override;

private:
  bool wait_writable(std::string &err);

  int read_fd_;
  int write_fd_;
  int wake_fds_[2] = {-1, -1}; // self-pipe used by interrupt()
  bool is_socket_ = false;
  bool write_shut_ = false;
  std::atomic<bool> interrupted_{false};
};

} // namespace nexsock_transport
