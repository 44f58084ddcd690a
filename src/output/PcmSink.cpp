// Repository: Schedcast-air
// Component: PcmSink
// Purpose: Bounded byte queue drained to a file descriptor by a writer thread
// Copyright (c) 2025 Schedcast

#include "schedcast/output/PcmSink.hpp"

#include <cerrno>
#include <cstring>

#include <poll.h>
#include <unistd.h>

#include "schedcast/util/Logger.hpp"

namespace schedcast::output {

PcmSink::PcmSink(int fd, bool owns_fd, const std::string& name, size_t buffer_capacity)
    : fd_(fd), owns_fd_(owns_fd), name_(name), buffer_capacity_(buffer_capacity) {
  writer_thread_ = std::thread(&PcmSink::WriterThreadLoop, this);
}

PcmSink::~PcmSink() {
  Close();
}

void PcmSink::MarkBroken(const std::string& reason) {
  bool expected = false;
  if (!broken_.compare_exchange_strong(expected, true, std::memory_order_acq_rel)) {
    return;
  }
  util::Logger::Error("[PcmSink:" + name_ + "] Output broken: " + reason +
                      " (delivered=" + std::to_string(bytes_delivered()) + " bytes)");
  drain_cv_.notify_all();
}

bool PcmSink::WaitAndConsumeBytes(const uint8_t* data, size_t len,
                                  std::chrono::milliseconds timeout) {
  if (closed_.load(std::memory_order_acquire) || broken_.load(std::memory_order_acquire)) {
    return false;
  }
  if (!data || len == 0) return true;

  std::unique_lock<std::mutex> lock(queue_mutex_);
  auto deadline = std::chrono::steady_clock::now() + timeout;

  while (current_buffer_size_ + len > buffer_capacity_ && current_buffer_size_ > 0) {
    if (closed_.load(std::memory_order_acquire) || broken_.load(std::memory_order_acquire)) {
      return false;
    }
    if (drain_cv_.wait_until(lock, deadline) == std::cv_status::timeout) {
      return false;
    }
  }

  packet_queue_.emplace(data, data + len);
  current_buffer_size_ += len;
  bytes_enqueued_.fetch_add(len, std::memory_order_relaxed);
  queue_cv_.notify_one();
  return true;
}

void PcmSink::Flush() {
  {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    std::queue<std::vector<uint8_t>> empty;
    packet_queue_.swap(empty);
    current_buffer_size_ = 0;
  }
  drain_cv_.notify_all();
}

void PcmSink::WriterThreadLoop() {
  constexpr int kPollTimeoutMs = 100;

  while (!writer_stop_.load(std::memory_order_acquire)) {
    std::vector<uint8_t> packet;
    {
      std::unique_lock<std::mutex> lock(queue_mutex_);
      queue_cv_.wait_for(lock, std::chrono::milliseconds(kPollTimeoutMs), [this] {
        return !packet_queue_.empty() || writer_stop_.load(std::memory_order_acquire);
      });
      if (writer_stop_.load(std::memory_order_acquire)) break;
      if (packet_queue_.empty()) continue;

      packet = std::move(packet_queue_.front());
      packet_queue_.pop();
      current_buffer_size_ -= packet.size();
    }
    drain_cv_.notify_one();

    if (broken_.load(std::memory_order_acquire)) continue;

    const uint8_t* ptr = packet.data();
    size_t remaining = packet.size();
    while (remaining > 0 && !writer_stop_.load(std::memory_order_acquire)) {
      struct pollfd pfd;
      pfd.fd = fd_;
      pfd.events = POLLOUT;
      pfd.revents = 0;

      int poll_ret = poll(&pfd, 1, kPollTimeoutMs);
      if (poll_ret < 0) {
        if (errno == EINTR) continue;
        MarkBroken(std::string("poll() error: ") + std::strerror(errno));
        break;
      }
      if (poll_ret == 0) continue;
      if (pfd.revents & (POLLERR | POLLHUP | POLLNVAL)) {
        MarkBroken("reader hung up");
        break;
      }

      ssize_t n = ::write(fd_, ptr, remaining);
      if (n < 0) {
        if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) continue;
        MarkBroken(std::string("write() error: ") + std::strerror(errno));
        break;
      }
      ptr += n;
      remaining -= static_cast<size_t>(n);
      bytes_delivered_.fetch_add(static_cast<uint64_t>(n), std::memory_order_relaxed);
    }
  }
}

void PcmSink::Close() {
  bool expected = false;
  if (!closed_.compare_exchange_strong(expected, true, std::memory_order_acq_rel)) {
    return;
  }

  writer_stop_.store(true, std::memory_order_release);
  queue_cv_.notify_all();
  drain_cv_.notify_all();
  if (writer_thread_.joinable()) {
    writer_thread_.join();
  }

  if (owns_fd_ && fd_ >= 0) {
    ::close(fd_);
  }
  fd_ = -1;
}

}  // namespace schedcast::output
