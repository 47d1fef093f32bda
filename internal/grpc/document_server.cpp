#include "document_server.hpp"

#include "auth_metadata.hpp"
#include "grpc_error.hpp"

namespace lieko::grpc {

using namespace lieko::v1;

DocumentServer::DocumentServer(std::shared_ptr<lieko::service::DocumentService> svc) : service_(std::move(svc)) {
}

::grpc::Status DocumentServer::CheckCollection(::grpc::ServerContext* context, const CollectionRequest* req, google::protobuf::Empty*) {
  try {
    service_->CheckCollection(CredentialFrom(context), *req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status DocumentServer::DropCollection(::grpc::ServerContext* context, const CollectionRequest* req, google::protobuf::Empty*) {
  try {
    service_->DropCollection(CredentialFrom(context), *req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status DocumentServer::Query(::grpc::ServerContext* context, const QueryRequest* req, QueryResponse* resp) {
  try {
    *resp = service_->Query(CredentialFrom(context), *req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status DocumentServer::Search(::grpc::ServerContext* context, const SearchRequest* req, QueryResponse* resp) {
  try {
    *resp = service_->Search(CredentialFrom(context), *req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status DocumentServer::GetRecord(::grpc::ServerContext* context, const GetRecordRequest* req, RecordResponse* resp) {
  try {
    *resp = service_->GetRecord(CredentialFrom(context), *req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status DocumentServer::FindOne(::grpc::ServerContext* context, const FindOneRequest* req, FindOneResponse* resp) {
  try {
    *resp = service_->FindOne(CredentialFrom(context), *req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status DocumentServer::Count(::grpc::ServerContext* context, const CountRequest* req, CountResponse* resp) {
  try {
    *resp = service_->Count(CredentialFrom(context), *req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status DocumentServer::Keys(::grpc::ServerContext* context, const CollectionRequest* req, KeysResponse* resp) {
  try {
    *resp = service_->Keys(CredentialFrom(context), *req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status DocumentServer::Entries(::grpc::ServerContext* context, const CollectionRequest* req, EntriesResponse* resp) {
  try {
    *resp = service_->Entries(CredentialFrom(context), *req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status DocumentServer::Size(::grpc::ServerContext* context, const CollectionRequest* req, SizeResponse* resp) {
  try {
    *resp = service_->Size(CredentialFrom(context), *req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status DocumentServer::CreateRecord(::grpc::ServerContext* context, const CreateRecordRequest* req, RecordResponse* resp) {
  try {
    *resp = service_->CreateRecord(CredentialFrom(context), *req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status DocumentServer::SetRecord(::grpc::ServerContext* context, const SetRecordRequest* req, RecordResponse* resp) {
  try {
    *resp = service_->SetRecord(CredentialFrom(context), *req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status DocumentServer::UpdateRecord(::grpc::ServerContext* context, const UpdateRecordRequest* req, RecordResponse* resp) {
  try {
    *resp = service_->UpdateRecord(CredentialFrom(context), *req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status DocumentServer::DeleteRecord(::grpc::ServerContext* context, const DeleteRecordRequest* req, DeleteRecordResponse* resp) {
  try {
    *resp = service_->DeleteRecord(CredentialFrom(context), *req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status DocumentServer::Increment(::grpc::ServerContext* context, const AdjustFieldRequest* req, RecordResponse* resp) {
  try {
    *resp = service_->Increment(CredentialFrom(context), *req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status DocumentServer::Decrement(::grpc::ServerContext* context, const AdjustFieldRequest* req, RecordResponse* resp) {
  try {
    *resp = service_->Decrement(CredentialFrom(context), *req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status DocumentServer::BatchSet(::grpc::ServerContext* context, const BatchSetRequest* req, BatchResponse* resp) {
  try {
    *resp = service_->BatchSet(CredentialFrom(context), *req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status DocumentServer::BatchGet(::grpc::ServerContext* context, const BatchIdsRequest* req, BatchResponse* resp) {
  try {
    *resp = service_->BatchGet(CredentialFrom(context), *req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status DocumentServer::BatchDelete(::grpc::ServerContext* context, const BatchIdsRequest* req, BatchResponse* resp) {
  try {
    *resp = service_->BatchDelete(CredentialFrom(context), *req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status DocumentServer::BatchUpdate(::grpc::ServerContext* context, const BatchUpdateRequest* req, BatchResponse* resp) {
  try {
    *resp = service_->BatchUpdate(CredentialFrom(context), *req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace lieko::grpc
