#pragma once

#include <chrono>
#include <cstdint>
#include <deque>
#include <memory>
#include <string>
#include <vector>

#include "transport/byte_transport.hpp"

namespace test_support {

// Shared view of what a ScriptedTransport saw, kept alive after the engine
// takes ownership of the transport.
struct TransportLog {
  std::vector<uint8_t> written;
  std::deque<uint8_t> pending; // Bytes the "board" will send next
  std::size_t flush_count = 0;
  std::size_t read_calls = 0;
  bool fail_writes = false;
  bool closed = false;
  std::chrono::steady_clock::time_point last_flush{};
};

// In-memory board: reads are served from a queue, short reads model timeouts.
class ScriptedTransport : public transport::ByteTransport {
public:
  explicit ScriptedTransport(std::shared_ptr<TransportLog> log)
      : log_(std::move(log)) {}

  bool write(const uint8_t *data, size_t len, std::string &err) override {
    if (log_->fail_writes) {
      err = "scripted write failure";
      return false;
    }
    log_->written.insert(log_->written.end(), data, data + len);
    return true;
  }

  std::vector<uint8_t> read_exact(size_t n,
                                  std::chrono::milliseconds) override {
    ++log_->read_calls;
    std::vector<uint8_t> out;
    while (out.size() < n && !log_->pending.empty()) {
      out.push_back(log_->pending.front());
      log_->pending.pop_front();
    }
    return out;
  }

  void flush_input() override {
    ++log_->flush_count;
    log_->pending.clear();
    log_->last_flush = std::chrono::steady_clock::now();
  }

  bool is_open() const override { return !log_->closed; }
  void close() override { log_->closed = true; }

private:
  std::shared_ptr<TransportLog> log_;
};

inline void queue_reply(TransportLog &log, const std::vector<uint8_t> &bytes) {
  log.pending.insert(log.pending.end(), bytes.begin(), bytes.end());
}

} // namespace test_support
