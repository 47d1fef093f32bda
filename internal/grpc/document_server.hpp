#pragma once

#include <grpcpp/grpcpp.h>

#include <memory>

#include "internal/service/document_service.hpp"
#include "lieko/v1/document_service.grpc.pb.h"

namespace lieko::grpc {

class DocumentServer final : public lieko::v1::DocumentService::Service {
 public:
  explicit DocumentServer(std::shared_ptr<lieko::service::DocumentService> svc);

  ::grpc::Status CheckCollection(::grpc::ServerContext*, const lieko::v1::CollectionRequest*, google::protobuf::Empty*) override;
  ::grpc::Status DropCollection(::grpc::ServerContext*, const lieko::v1::CollectionRequest*, google::protobuf::Empty*) override;

  ::grpc::Status Query(::grpc::ServerContext*, const lieko::v1::QueryRequest*, lieko::v1::QueryResponse*) override;
  ::grpc::Status Search(::grpc::ServerContext*, const lieko::v1::SearchRequest*, lieko::v1::QueryResponse*) override;
  ::grpc::Status GetRecord(::grpc::ServerContext*, const lieko::v1::GetRecordRequest*, lieko::v1::RecordResponse*) override;
  ::grpc::Status FindOne(::grpc::ServerContext*, const lieko::v1::FindOneRequest*, lieko::v1::FindOneResponse*) override;
  ::grpc::Status Count(::grpc::ServerContext*, const lieko::v1::CountRequest*, lieko::v1::CountResponse*) override;
  ::grpc::Status Keys(::grpc::ServerContext*, const lieko::v1::CollectionRequest*, lieko::v1::KeysResponse*) override;
  ::grpc::Status Entries(::grpc::ServerContext*, const lieko::v1::CollectionRequest*, lieko::v1::EntriesResponse*) override;
  ::grpc::Status Size(::grpc::ServerContext*, const lieko::v1::CollectionRequest*, lieko::v1::SizeResponse*) override;

  ::grpc::Status CreateRecord(::grpc::ServerContext*, const lieko::v1::CreateRecordRequest*, lieko::v1::RecordResponse*) override;
  ::grpc::Status SetRecord(::grpc::ServerContext*, const lieko::v1::SetRecordRequest*, lieko::v1::RecordResponse*) override;
  ::grpc::Status UpdateRecord(::grpc::ServerContext*, const lieko::v1::UpdateRecordRequest*, lieko::v1::RecordResponse*) override;
  ::grpc::Status DeleteRecord(::grpc::ServerContext*, const lieko::v1::DeleteRecordRequest*, lieko::v1::DeleteRecordResponse*) override;
  ::grpc::Status Increment(::grpc::ServerContext*, const lieko::v1::AdjustFieldRequest*, lieko::v1::RecordResponse*) override;
  ::grpc::Status Decrement(::grpc::ServerContext*, const lieko::v1::AdjustFieldRequest*, lieko::v1::RecordResponse*) override;

  ::grpc::Status BatchSet(::grpc::ServerContext*, const lieko::v1::BatchSetRequest*, lieko::v1::BatchResponse*) override;
  ::grpc::Status BatchGet(::grpc::ServerContext*, const lieko::v1::BatchIdsRequest*, lieko::v1::BatchResponse*) override;
  ::grpc::Status BatchDelete(::grpc::ServerContext*, const lieko::v1::BatchIdsRequest*, lieko::v1::BatchResponse*) override;
  ::grpc::Status BatchUpdate(::grpc::ServerContext*, const lieko::v1::BatchUpdateRequest*, lieko::v1::BatchResponse*) override;

 private:
  std::shared_ptr<lieko::service::DocumentService> service_;
};

} // namespace lieko::grpc
