// Repository: Schedcast-air
// Component: PcmSink
// Purpose: Bounded byte queue drained to a file descriptor by a writer thread
// Copyright (c) 2025 Schedcast

#ifndef SCHEDCAST_OUTPUT_PCM_SINK_HPP_
#define SCHEDCAST_OUTPUT_PCM_SINK_HPP_

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <queue>
#include <string>
#include <thread>
#include <vector>

namespace schedcast::output {

// Delivers raw PCM to a pipe, FIFO, socket or stdout. The producer blocks
// in WaitAndConsumeBytes when the queue is full; the writer thread polls
// the fd for writability so Close() never hangs on a stalled reader.
//
// A write error or hangup marks the sink broken: further writes are
// rejected and the error is logged once.
class PcmSink {
 public:
  // fd: open descriptor. owns_fd: close it in Close().
  PcmSink(int fd, bool owns_fd, const std::string& name = "PcmSink",
          size_t buffer_capacity = 1024 * 1024);
  ~PcmSink();

  PcmSink(const PcmSink&) = delete;
  PcmSink& operator=(const PcmSink&) = delete;

  // Enqueues len bytes, waiting up to timeout for space. Returns false if
  // the sink is closed/broken or the wait timed out.
  bool WaitAndConsumeBytes(const uint8_t* data, size_t len, std::chrono::milliseconds timeout);

  // Drops anything queued but not yet written (used on Stop/seek).
  void Flush();

  // Stops the writer thread; closes the fd when owned. Idempotent.
  void Close();

  bool IsBroken() const { return broken_.load(std::memory_order_acquire); }
  uint64_t bytes_enqueued() const { return bytes_enqueued_.load(std::memory_order_relaxed); }
  uint64_t bytes_delivered() const { return bytes_delivered_.load(std::memory_order_relaxed); }

 private:
  void WriterThreadLoop();
  void MarkBroken(const std::string& reason);

  int fd_;
  bool owns_fd_;
  std::string name_;
  size_t buffer_capacity_;

  std::mutex queue_mutex_;
  std::condition_variable queue_cv_;
  std::condition_variable drain_cv_;
  std::queue<std::vector<uint8_t>> packet_queue_;
  size_t current_buffer_size_ = 0;

  std::atomic<bool> closed_{false};
  std::atomic<bool> broken_{false};
  std::atomic<bool> writer_stop_{false};
  std::atomic<uint64_t> bytes_enqueued_{0};
  std::atomic<uint64_t> bytes_delivered_{0};

  std::thread writer_thread_;
};

}  // namespace schedcast::output

#endif  // SCHEDCAST_OUTPUT_PCM_SINK_HPP_
