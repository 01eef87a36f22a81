#pragma once

#include <cstdint>
#include <deque>
#include <memory>
#include <optional>
#include <stop_token>
#include <string>

#include "buildq/core/v1/job.pb.h"
#include "internal/queue/keys.hpp"
#include "internal/queue/queue_options.hpp"
#include "internal/store/api/coordination_store.hpp"

namespace buildq::queue {

/*
  Pull iterator over one job's log stream.

  Next() replays stored lines from the starting cursor, then blocks for new
  appends. It yields nullopt only once the stop token fires; a blocked read
  wakes immediately. Cursor() is where a new tail should resume so that no
  line is lost or repeated.

  Not thread-safe: one consumer per tail.
*/
class LogTail {
 public:
  std::optional<buildq::core::v1::LogLine> Next();

  uint64_t Cursor() const;

 private:
  friend class LogStream;

  LogTail(std::shared_ptr<store::CoordinationStore> store, std::string key, uint64_t from, std::chrono::milliseconds block,
          std::stop_token stop);

  static constexpr std::size_t kBatchSize = 100;

  std::shared_ptr<store::CoordinationStore> store_;
  std::string                               key_;
  uint64_t                                  next_read_;
  std::chrono::milliseconds                 block_;
  std::stop_token                           stop_;
  std::deque<buildq::core::v1::LogLine>     buffered_;
};

class LogStream {
 public:
  LogStream(std::shared_ptr<store::CoordinationStore> store, QueueOptions options);

  // Returns the new line's cursor. Re-arms the stream's retention.
  uint64_t AppendLog(const std::string& job_id, const std::string& line);

  LogTail StreamLogs(const std::string& job_id, uint64_t from_cursor, std::stop_token stop);

 private:
  std::shared_ptr<store::CoordinationStore> store_;
  QueueOptions                              options_;
  Keys                                      keys_;
};

} // namespace buildq::queue
