#include <google/protobuf/util/json_util.h>
#include <grpcpp/grpcpp.h>

#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>

#include "lieko/v1.hpp"
#include "lieko/v1/document_service.grpc.pb.h"
#include "lieko/v1/project_service.grpc.pb.h"

using namespace lieko::v1;

static void Usage() {
  std::cout << "Usage (credential read from LIEKO_TOKEN):\n"
            << "  liekoctl <addr> create-project <name> [description]\n"
            << "  liekoctl <addr> list-projects\n"
            << "  liekoctl <addr> delete-project <project_id>\n"
            << "  liekoctl <addr> create-token <project_id> <name> <read|write|full>\n"
            << "  liekoctl <addr> whoami\n"
            << "  liekoctl <addr> collections [project_id]\n"
            << "  liekoctl <addr> create <collection> <json>\n"
            << "  liekoctl <addr> set <collection> <id> <json>\n"
            << "  liekoctl <addr> get <collection> <id>\n"
            << "  liekoctl <addr> update <collection> <id> <json>\n"
            << "  liekoctl <addr> delete <collection> <id>\n"
            << "  liekoctl <addr> query <collection> [filter_json] [sort] [limit] [offset]\n"
            << "  liekoctl <addr> search <collection> <term>\n"
            << "  liekoctl <addr> count <collection> [filter_json]\n"
            << "  liekoctl <addr> keys <collection>\n"
            << "  liekoctl <addr> increment <collection> <id> <field> [amount]\n"
            << "  liekoctl <addr> batch-set <collection> <json_array>\n"
            << "  liekoctl <addr> drop <collection>\n";
}

static google::protobuf::Struct ParseObject(const std::string& json) {
  google::protobuf::Struct out;
  auto                     status = google::protobuf::util::JsonStringToMessage(json, &out);
  if (!status.ok()) {
    std::cerr << "invalid JSON object: " << status.ToString() << "\n";
    std::exit(1);
  }
  return out;
}

static int Print(const grpc::Status& status, const google::protobuf::Message& resp) {
  if (!status.ok()) {
    std::cerr << status.error_details() << ": " << status.error_message() << "\n";
    return 2;
  }

  std::string                                json;
  google::protobuf::util::JsonPrintOptions options;
  options.add_whitespace = true;
  auto print_status      = google::protobuf::util::MessageToJsonString(resp, &json, options);
  if (!print_status.ok()) {
    std::cerr << print_status.ToString() << "\n";
    return 2;
  }
  std::cout << json;
  return 0;
}

int main(int argc, char** argv) {
  if (argc < 3) {
    Usage();
    return 1;
  }

  std::string addr = argv[1];
  std::string cmd  = argv[2];

  auto channel       = grpc::CreateChannel(addr, grpc::InsecureChannelCredentials());
  auto document_stub = DocumentService::NewStub(channel);
  auto project_stub  = ProjectService::NewStub(channel);

  grpc::ClientContext ctx;
  if (const char* token = std::getenv("LIEKO_TOKEN")) {
    ctx.AddMetadata("authorization", std::string("Bearer ") + token);
  }

  // ------------------------------------------------------------
  // Projects
  // ------------------------------------------------------------

  if (cmd == "create-project") {
    if (argc < 4) return 1;

    CreateProjectRequest req;
    req.set_name(argv[3]);
    if (argc >= 5) req.set_description(argv[4]);

    CreateProjectResponse resp;
    return Print(project_stub->CreateProject(&ctx, req, &resp), resp);
  }

  if (cmd == "list-projects") {
    ListProjectsResponse resp;
    return Print(project_stub->ListProjects(&ctx, ListProjectsRequest{}, &resp), resp);
  }

  if (cmd == "delete-project") {
    if (argc < 4) return 1;

    ProjectRequest req;
    req.set_project_id(argv[3]);

    google::protobuf::Empty resp;
    return Print(project_stub->DeleteProject(&ctx, req, &resp), resp);
  }

  if (cmd == "create-token") {
    if (argc < 6) return 1;

    CreateTokenRequest req;
    req.set_project_id(argv[3]);
    req.set_name(argv[4]);
    req.set_permission(argv[5]);

    Token resp;
    return Print(project_stub->CreateToken(&ctx, req, &resp), resp);
  }

  if (cmd == "whoami") {
    ValidateTokenResponse resp;
    return Print(project_stub->ValidateToken(&ctx, ValidateTokenRequest{}, &resp), resp);
  }

  if (cmd == "collections") {
    ProjectRequest req;
    if (argc >= 4) req.set_project_id(argv[3]);

    ListCollectionsResponse resp;
    return Print(project_stub->ListCollections(&ctx, req, &resp), resp);
  }

  // ------------------------------------------------------------
  // Records
  // ------------------------------------------------------------

  if (argc < 4) {
    Usage();
    return 1;
  }
  const std::string collection = argv[3];

  if (cmd == "create") {
    if (argc < 5) return 1;

    CreateRecordRequest req;
    req.set_collection(collection);
    *req.mutable_record() = ParseObject(argv[4]);

    RecordResponse resp;
    return Print(document_stub->CreateRecord(&ctx, req, &resp), resp);
  }

  if (cmd == "set" || cmd == "update") {
    if (argc < 6) return 1;

    RecordResponse resp;
    if (cmd == "set") {
      SetRecordRequest req;
      req.set_collection(collection);
      req.set_id(argv[4]);
      *req.mutable_data() = ParseObject(argv[5]);
      return Print(document_stub->SetRecord(&ctx, req, &resp), resp);
    }

    UpdateRecordRequest req;
    req.set_collection(collection);
    req.set_id(argv[4]);
    *req.mutable_patch() = ParseObject(argv[5]);
    return Print(document_stub->UpdateRecord(&ctx, req, &resp), resp);
  }

  if (cmd == "get") {
    if (argc < 5) return 1;

    GetRecordRequest req;
    req.set_collection(collection);
    req.set_id(argv[4]);

    RecordResponse resp;
    return Print(document_stub->GetRecord(&ctx, req, &resp), resp);
  }

  if (cmd == "delete") {
    if (argc < 5) return 1;

    DeleteRecordRequest req;
    req.set_collection(collection);
    req.set_id(argv[4]);

    DeleteRecordResponse resp;
    return Print(document_stub->DeleteRecord(&ctx, req, &resp), resp);
  }

  if (cmd == "query") {
    QueryRequest req;
    req.set_collection(collection);
    if (argc >= 5) req.set_filter(argv[4]);
    if (argc >= 6) req.set_sort(argv[5]);
    if (argc >= 7) req.set_limit(std::stoull(argv[6]));
    if (argc >= 8) req.set_offset(std::stoull(argv[7]));

    QueryResponse resp;
    return Print(document_stub->Query(&ctx, req, &resp), resp);
  }

  if (cmd == "search") {
    if (argc < 5) return 1;

    SearchRequest req;
    req.set_collection(collection);
    req.set_term(argv[4]);

    QueryResponse resp;
    return Print(document_stub->Search(&ctx, req, &resp), resp);
  }

  if (cmd == "count") {
    CountRequest req;
    req.set_collection(collection);
    if (argc >= 5) req.set_filter(argv[4]);

    CountResponse resp;
    return Print(document_stub->Count(&ctx, req, &resp), resp);
  }

  if (cmd == "keys") {
    CollectionRequest req;
    req.set_collection(collection);

    KeysResponse resp;
    return Print(document_stub->Keys(&ctx, req, &resp), resp);
  }

  if (cmd == "increment") {
    if (argc < 6) return 1;

    AdjustFieldRequest req;
    req.set_collection(collection);
    req.set_id(argv[4]);
    req.set_field(argv[5]);
    if (argc >= 7) req.set_amount(std::stod(argv[6]));

    RecordResponse resp;
    return Print(document_stub->Increment(&ctx, req, &resp), resp);
  }

  if (cmd == "batch-set") {
    if (argc < 5) return 1;

    google::protobuf::ListValue list;
    auto                        status = google::protobuf::util::JsonStringToMessage(argv[4], &list);
    if (!status.ok()) {
      std::cerr << "invalid JSON array: " << status.ToString() << "\n";
      return 1;
    }

    BatchSetRequest req;
    req.set_collection(collection);
    *req.mutable_records() = list.values();

    BatchResponse resp;
    return Print(document_stub->BatchSet(&ctx, req, &resp), resp);
  }

  if (cmd == "drop") {
    CollectionRequest req;
    req.set_collection(collection);

    google::protobuf::Empty resp;
    return Print(document_stub->DropCollection(&ctx, req, &resp), resp);
  }

  Usage();
  return 1;
}
