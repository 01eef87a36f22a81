#include "job_codec.hpp"

#include <google/protobuf/util/json_util.h>

#include <charconv>

#include "internal/queue/job_status.hpp"
#include "internal/queue/keys.hpp"
#include "internal/util/errors.hpp"

namespace buildq::queue {

namespace {

std::string Encode(const google::protobuf::Message& message, const char* what) {
  google::protobuf::util::JsonPrintOptions options;
  options.preserve_proto_field_names = true;

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(message, &json, options);
  if (!status.ok()) {
    throw util::SerializationError(std::string("encode ") + what + ": " + std::string(status.message()));
  }
  return json;
}

void Decode(const std::string& raw, google::protobuf::Message* message, const char* what) {
  // tolerate fields written by newer versions
  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = true;

  auto status = google::protobuf::util::JsonStringToMessage(raw, message, options);
  if (!status.ok()) {
    throw util::SerializationError(std::string("decode ") + what + ": " + std::string(status.message()));
  }
}

std::optional<std::string> Field(const store::FieldMap& fields, const char* name) {
  const auto it = fields.find(name);
  if (it == fields.end() || it->second.empty()) return std::nullopt;
  return it->second;
}

} // namespace

std::string EncodeJob(const buildq::core::v1::BuildJob& job) {
  return Encode(job, "job");
}

std::string EncodeResult(const buildq::core::v1::BuildResult& result) {
  return Encode(result, "result");
}

std::string EncodeAttempt(const buildq::core::v1::CallbackAttempt& attempt) {
  return Encode(attempt, "callback attempt");
}

buildq::core::v1::BuildJob DecodeJob(const std::string& raw) {
  buildq::core::v1::BuildJob job;
  Decode(raw, &job, "job");
  return job;
}

buildq::core::v1::BuildResult DecodeResult(const std::string& raw) {
  buildq::core::v1::BuildResult result;
  Decode(raw, &result, "result");
  return result;
}

buildq::core::v1::CallbackAttempt DecodeAttempt(const std::string& raw) {
  buildq::core::v1::CallbackAttempt attempt;
  Decode(raw, &attempt, "callback attempt");
  return attempt;
}

std::string EncodeMillis(util::TimePoint tp) {
  return std::to_string(util::ToUnixMillis(tp));
}

util::TimePoint DecodeMillis(const std::string& raw) {
  uint64_t   ms  = 0;
  const auto end = raw.data() + raw.size();
  const auto res = std::from_chars(raw.data(), end, ms);
  if (res.ec != std::errc{} || res.ptr != end) {
    throw util::SerializationError("decode timestamp: '" + raw + "'");
  }
  return util::FromUnixMillis(ms);
}

bool HasJobRecord(const store::FieldMap& fields) {
  return Field(fields, job_field::kData) && Field(fields, job_field::kStatus);
}

JobRecord DecodeJobRecord(const store::FieldMap& fields) {
  const auto data   = Field(fields, job_field::kData);
  const auto status = Field(fields, job_field::kStatus);
  if (!data || !status) {
    throw util::SerializationError("job record is missing data or status");
  }

  JobRecord record;
  record.job = DecodeJob(*data);
  record.state.set_status(ParseJobStatus(*status));

  if (auto worker = Field(fields, job_field::kWorkerId)) {
    record.state.set_worker_id(*worker);
  }
  if (auto created = Field(fields, job_field::kCreatedAt)) {
    *record.state.mutable_created_at() = util::ToProto(DecodeMillis(*created));
  }
  if (auto started = Field(fields, job_field::kStartedAt)) {
    *record.state.mutable_started_at() = util::ToProto(DecodeMillis(*started));
  }
  if (auto completed = Field(fields, job_field::kCompletedAt)) {
    *record.state.mutable_completed_at() = util::ToProto(DecodeMillis(*completed));
  }
  if (auto result = Field(fields, job_field::kResult)) {
    record.result = DecodeResult(*result);
  }
  return record;
}

} // namespace buildq::queue
