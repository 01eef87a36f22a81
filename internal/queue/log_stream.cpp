#include "log_stream.hpp"

#include "internal/queue/job_codec.hpp"
#include "internal/util/errors.hpp"

namespace buildq::queue {

namespace {
constexpr const char* kLineField      = "line";
constexpr const char* kTimestampField = "timestamp";
} // namespace

// ------------------------------------------------------------------
// LogTail
// ------------------------------------------------------------------

LogTail::LogTail(std::shared_ptr<store::CoordinationStore> store, std::string key, uint64_t from, std::chrono::milliseconds block,
                 std::stop_token stop)
    : store_(std::move(store)), key_(std::move(key)), next_read_(from), block_(block), stop_(std::move(stop)) {
}

std::optional<buildq::core::v1::LogLine> LogTail::Next() {
  while (buffered_.empty()) {
    if (stop_.stop_requested()) {
      return std::nullopt;
    }

    for (auto& entry : store_->StreamRead(key_, next_read_, kBatchSize, block_, stop_)) {
      buildq::core::v1::LogLine line;
      line.set_cursor(entry.position);
      line.set_text(entry.fields[kLineField]);
      if (const auto ts = entry.fields.find(kTimestampField); ts != entry.fields.end()) {
        *line.mutable_timestamp() = util::ToProto(DecodeMillis(ts->second));
      }
      next_read_ = entry.position + 1;
      buffered_.push_back(std::move(line));
    }
  }

  auto line = std::move(buffered_.front());
  buffered_.pop_front();
  return line;
}

uint64_t LogTail::Cursor() const {
  return buffered_.empty() ? next_read_ : buffered_.front().cursor();
}

// ------------------------------------------------------------------
// LogStream
// ------------------------------------------------------------------

LogStream::LogStream(std::shared_ptr<store::CoordinationStore> store, QueueOptions options)
    : store_(std::move(store)), options_(std::move(options)), keys_(options_.key_prefix) {
  if (!store_) {
    throw std::invalid_argument("LogStream: store is null");
  }
}

uint64_t LogStream::AppendLog(const std::string& job_id, const std::string& line) {
  if (job_id.empty()) {
    throw util::ValidationError("append log: job_id is required");
  }

  const auto key    = keys_.Logs(job_id);
  const auto cursor = store_->StreamAppend(key, {{kLineField, line}, {kTimestampField, EncodeMillis(options_.clock())}});
  if (!store_->Expire(key, options_.job_retention)) {
    throw util::StoreUnavailable("log stream for job " + job_id + " vanished after append");
  }
  return cursor;
}

LogTail LogStream::StreamLogs(const std::string& job_id, uint64_t from_cursor, std::stop_token stop) {
  if (job_id.empty()) {
    throw util::ValidationError("stream logs: job_id is required");
  }
  return LogTail(store_, keys_.Logs(job_id), from_cursor, options_.log_tail_block, std::move(stop));
}

} // namespace buildq::queue
