#include <google/protobuf/util/json_util.h>
#include <grpcpp/grpcpp.h>

#include <fstream>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>

#include "buildq/v1.hpp"

using namespace buildq::v1;

static void Usage() {
  std::cout << "Usage:\n"
            << "  buildqctl <addr> enqueue <job.json>\n"
            << "  buildqctl <addr> get <job_id>\n"
            << "  buildqctl <addr> result <job_id>\n"
            << "  buildqctl <addr> cancel <job_id>\n"
            << "  buildqctl <addr> retry <job_id>\n"
            << "  buildqctl <addr> logs <job_id> [from_cursor]\n"
            << "  buildqctl <addr> workers\n"
            << "  buildqctl <addr> stats\n";
}

static std::string ToJson(const google::protobuf::Message& message) {
  google::protobuf::util::JsonPrintOptions options;
  options.add_whitespace             = true;
  options.preserve_proto_field_names = true;

  std::string json;
  if (!google::protobuf::util::MessageToJsonString(message, &json, options).ok()) {
    return "<unprintable>";
  }
  return json;
}

static int Fail(const grpc::Status& status) {
  std::cerr << status.error_code() << ": " << status.error_message() << "\n";
  return 2;
}

int main(int argc, char** argv) {
  if (argc < 3) {
    Usage();
    return 1;
  }

  std::string addr = argv[1];
  std::string cmd  = argv[2];

  auto channel = grpc::CreateChannel(addr, grpc::InsecureChannelCredentials());

  auto queue_stub = BuildQueueService::NewStub(channel);

  grpc::ClientContext ctx;

  // ------------------------------------------------------------

  if (cmd == "enqueue") {
    if (argc < 4) return 1;

    std::ifstream in(argv[3]);
    if (!in) {
      std::cerr << "cannot open " << argv[3] << "\n";
      return 1;
    }
    std::stringstream buffer;
    buffer << in.rdbuf();

    EnqueueRequest req;
    auto           parsed = google::protobuf::util::JsonStringToMessage(buffer.str(), req.mutable_job());
    if (!parsed.ok()) {
      std::cerr << "invalid job: " << parsed.message() << "\n";
      return 1;
    }

    EnqueueResponse resp;

    auto status = queue_stub->Enqueue(&ctx, req, &resp);

    if (!status.ok()) return Fail(status);

    std::cout << "job_id=" << resp.job_id() << "\n";
    std::cout << "queue_position=" << resp.queue_position() << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "get") {
    if (argc < 4) return 1;

    GetJobRequest req;
    req.set_job_id(argv[3]);

    GetJobResponse resp;

    auto status = queue_stub->GetJob(&ctx, req, &resp);

    if (!status.ok()) return Fail(status);

    std::cout << ToJson(resp) << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "result") {
    if (argc < 4) return 1;

    GetResultRequest req;
    req.set_job_id(argv[3]);

    GetResultResponse resp;

    auto status = queue_stub->GetResult(&ctx, req, &resp);

    if (!status.ok()) return Fail(status);

    if (!resp.found()) {
      std::cout << "no result yet\n";
      return 0;
    }
    std::cout << ToJson(resp.result()) << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "cancel") {
    if (argc < 4) return 1;

    CancelJobRequest req;
    req.set_job_id(argv[3]);

    google::protobuf::Empty resp;

    auto status = queue_stub->CancelJob(&ctx, req, &resp);

    if (!status.ok()) return Fail(status);

    std::cout << "cancelled\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "retry") {
    if (argc < 4) return 1;

    RetryJobRequest req;
    req.set_job_id(argv[3]);

    RetryJobResponse resp;

    auto status = queue_stub->RetryJob(&ctx, req, &resp);

    if (!status.ok()) return Fail(status);

    std::cout << "new_job_id=" << resp.new_job_id() << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "logs") {
    if (argc < 4) return 1;

    StreamLogsRequest req;
    req.set_job_id(argv[3]);
    if (argc >= 5) {
      req.set_from_cursor(std::stoull(argv[4]));
    }

    auto reader = queue_stub->StreamLogs(&ctx, req);

    LogLine line;
    while (reader->Read(&line)) {
      std::cout << line.cursor() << " " << line.text() << "\n";
    }

    auto status = reader->Finish();
    if (!status.ok()) return Fail(status);
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "workers") {
    google::protobuf::Empty req;
    ListWorkersResponse     resp;

    auto status = queue_stub->ListWorkers(&ctx, req, &resp);

    if (!status.ok()) return Fail(status);

    for (const auto& worker_id : resp.worker_ids()) {
      std::cout << worker_id << "\n";
    }
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "stats") {
    google::protobuf::Empty req;
    GetStatsResponse        resp;

    auto status = queue_stub->GetStats(&ctx, req, &resp);

    if (!status.ok()) return Fail(status);

    std::cout << "priority_depth=" << resp.priority_depth() << "\n";
    std::cout << "fifo_depth=" << resp.fifo_depth() << "\n";
    std::cout << "pending_callbacks=" << resp.pending_callbacks() << "\n";
    std::cout << "active_workers=" << resp.active_workers() << "\n";
    return 0;
  }

  Usage();
  return 1;
}
