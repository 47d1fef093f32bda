#pragma once

#include <google/protobuf/empty.pb.h>

#include <string>

#include "lieko/v1.hpp"
#include "service_context.hpp"

namespace lieko::service {

/*
  Record operations behind credential checks.

  credential is the raw authorization value of the call. Read calls need
  a read token, writes a write token, deletes and drops a full token.
*/
class DocumentService {
 public:
  explicit DocumentService(ServiceContext ctx);

  void CheckCollection(const std::string& credential, const lieko::v1::CollectionRequest& req);
  void DropCollection(const std::string& credential, const lieko::v1::CollectionRequest& req);

  lieko::v1::QueryResponse   Query(const std::string& credential, const lieko::v1::QueryRequest& req);
  lieko::v1::QueryResponse   Search(const std::string& credential, const lieko::v1::SearchRequest& req);
  lieko::v1::RecordResponse  GetRecord(const std::string& credential, const lieko::v1::GetRecordRequest& req);
  lieko::v1::FindOneResponse FindOne(const std::string& credential, const lieko::v1::FindOneRequest& req);
  lieko::v1::CountResponse   Count(const std::string& credential, const lieko::v1::CountRequest& req);
  lieko::v1::KeysResponse    Keys(const std::string& credential, const lieko::v1::CollectionRequest& req);
  lieko::v1::EntriesResponse Entries(const std::string& credential, const lieko::v1::CollectionRequest& req);
  lieko::v1::SizeResponse    Size(const std::string& credential, const lieko::v1::CollectionRequest& req);

  lieko::v1::RecordResponse       CreateRecord(const std::string& credential, const lieko::v1::CreateRecordRequest& req);
  lieko::v1::RecordResponse       SetRecord(const std::string& credential, const lieko::v1::SetRecordRequest& req);
  lieko::v1::RecordResponse       UpdateRecord(const std::string& credential, const lieko::v1::UpdateRecordRequest& req);
  lieko::v1::DeleteRecordResponse DeleteRecord(const std::string& credential, const lieko::v1::DeleteRecordRequest& req);
  lieko::v1::RecordResponse       Increment(const std::string& credential, const lieko::v1::AdjustFieldRequest& req);
  lieko::v1::RecordResponse       Decrement(const std::string& credential, const lieko::v1::AdjustFieldRequest& req);

  lieko::v1::BatchResponse BatchSet(const std::string& credential, const lieko::v1::BatchSetRequest& req);
  lieko::v1::BatchResponse BatchGet(const std::string& credential, const lieko::v1::BatchIdsRequest& req);
  lieko::v1::BatchResponse BatchDelete(const std::string& credential, const lieko::v1::BatchIdsRequest& req);
  lieko::v1::BatchResponse BatchUpdate(const std::string& credential, const lieko::v1::BatchUpdateRequest& req);

 private:
  ServiceContext ctx_;
};

} // namespace lieko::service
