#include "document_service.hpp"

#include "internal/auth/authenticator.hpp"
#include "internal/core/document_store.hpp"
#include "internal/query/filter.hpp"
#include "internal/query/pipeline.hpp"
#include "internal/util/errors.hpp"
#include "observe_rpc.hpp"

namespace lieko::service {

using namespace lieko::v1;
using lieko::model::PermissionTier;

namespace {

template <typename Request>
storage::CollectionRef Authorize(const ServiceContext& ctx, const std::string& credential, const Request& req, PermissionTier required) {
  const auto grant = ctx.authenticator->Resolve(credential);
  auth::RequireTier(grant, required);

  if (req.collection().empty()) {
    throw util::ValidationError(util::ErrorCode::MissingRequiredFields, "collection is required");
  }
  return {auth::ResolveProject(grant, req.project_id()), req.collection()};
}

template <typename Request>
query::PageRequest ToPageRequest(const Request& req) {
  query::PageRequest page;
  page.sort   = query::ParseSort(req.sort());
  page.offset = req.offset();
  page.limit  = req.limit();
  page.fields.assign(req.fields().begin(), req.fields().end());
  return page;
}

QueryResponse ToQueryResponse(query::Page page) {
  QueryResponse resp;
  for (auto& record : page.records) {
    *resp.add_records() = std::move(record);
  }
  resp.mutable_page()->set_total_count(page.total_count);
  resp.mutable_page()->set_page(page.page);
  resp.mutable_page()->set_max_page(page.max_page);
  return resp;
}

RecordResponse ToRecordResponse(model::Record record) {
  RecordResponse resp;
  *resp.mutable_record() = std::move(record);
  return resp;
}

} // namespace

DocumentService::DocumentService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

void DocumentService::CheckCollection(const std::string& credential, const CollectionRequest& req) {
  ObserveRpc("DocumentService.CheckCollection", req.collection(), [&] {
    ctx_.store->CheckCollection(Authorize(ctx_, credential, req, PermissionTier::kRead));
  });
}

void DocumentService::DropCollection(const std::string& credential, const CollectionRequest& req) {
  ObserveRpc("DocumentService.DropCollection", req.collection(), [&] {
    ctx_.store->DropCollection(Authorize(ctx_, credential, req, PermissionTier::kFull));
  });
}

// ------------------------------------------------------------------
// Reads
// ------------------------------------------------------------------

QueryResponse DocumentService::Query(const std::string& credential, const QueryRequest& req) {
  return ObserveRpc("DocumentService.Query", req.collection(), [&] {
    const auto ref    = Authorize(ctx_, credential, req, PermissionTier::kRead);
    const auto filter = query::ParseFilter(req.filter());
    return ToQueryResponse(ctx_.store->Query(ref, filter, ToPageRequest(req)));
  });
}

QueryResponse DocumentService::Search(const std::string& credential, const SearchRequest& req) {
  return ObserveRpc("DocumentService.Search", req.collection(), [&] {
    const auto               ref = Authorize(ctx_, credential, req, PermissionTier::kRead);
    std::vector<std::string> search_fields(req.search_fields().begin(), req.search_fields().end());
    return ToQueryResponse(ctx_.store->Search(ref, req.term(), search_fields, ToPageRequest(req)));
  });
}

RecordResponse DocumentService::GetRecord(const std::string& credential, const GetRecordRequest& req) {
  return ObserveRpc("DocumentService.GetRecord", req.collection(), [&] {
    const auto               ref = Authorize(ctx_, credential, req, PermissionTier::kRead);
    std::vector<std::string> fields(req.fields().begin(), req.fields().end());
    return ToRecordResponse(ctx_.store->GetRecord(ref, req.id(), fields));
  });
}

FindOneResponse DocumentService::FindOne(const std::string& credential, const FindOneRequest& req) {
  return ObserveRpc("DocumentService.FindOne", req.collection(), [&] {
    const auto ref    = Authorize(ctx_, credential, req, PermissionTier::kRead);
    const auto filter = query::ParseFilter(req.filter());

    FindOneResponse resp;
    if (auto record = ctx_.store->FindOne(ref, filter)) {
      resp.set_found(true);
      *resp.mutable_record() = std::move(*record);
    }
    return resp;
  });
}

CountResponse DocumentService::Count(const std::string& credential, const CountRequest& req) {
  return ObserveRpc("DocumentService.Count", req.collection(), [&] {
    const auto ref    = Authorize(ctx_, credential, req, PermissionTier::kRead);
    const auto filter = query::ParseFilter(req.filter());

    CountResponse resp;
    resp.set_count(ctx_.store->Count(ref, filter));
    return resp;
  });
}

KeysResponse DocumentService::Keys(const std::string& credential, const CollectionRequest& req) {
  return ObserveRpc("DocumentService.Keys", req.collection(), [&] {
    KeysResponse resp;
    for (auto& id : ctx_.store->Keys(Authorize(ctx_, credential, req, PermissionTier::kRead))) {
      resp.add_ids(std::move(id));
    }
    return resp;
  });
}

EntriesResponse DocumentService::Entries(const std::string& credential, const CollectionRequest& req) {
  return ObserveRpc("DocumentService.Entries", req.collection(), [&] {
    EntriesResponse resp;
    for (auto& [id, record] : ctx_.store->Entries(Authorize(ctx_, credential, req, PermissionTier::kRead))) {
      auto* entry = resp.add_entries();
      entry->set_id(id);
      *entry->mutable_record() = std::move(record);
    }
    return resp;
  });
}

SizeResponse DocumentService::Size(const std::string& credential, const CollectionRequest& req) {
  return ObserveRpc("DocumentService.Size", req.collection(), [&] {
    SizeResponse resp;
    resp.set_size(ctx_.store->Size(Authorize(ctx_, credential, req, PermissionTier::kRead)));
    return resp;
  });
}

// ------------------------------------------------------------------
// Writes
// ------------------------------------------------------------------

RecordResponse DocumentService::CreateRecord(const std::string& credential, const CreateRecordRequest& req) {
  return ObserveRpc("DocumentService.CreateRecord", req.collection(), [&] {
    const auto ref = Authorize(ctx_, credential, req, PermissionTier::kWrite);
    return ToRecordResponse(ctx_.store->Create(ref, req.record()));
  });
}

RecordResponse DocumentService::SetRecord(const std::string& credential, const SetRecordRequest& req) {
  return ObserveRpc("DocumentService.SetRecord", req.collection(), [&] {
    const auto ref = Authorize(ctx_, credential, req, PermissionTier::kWrite);
    return ToRecordResponse(ctx_.store->Set(ref, req.id(), req.data()));
  });
}

RecordResponse DocumentService::UpdateRecord(const std::string& credential, const UpdateRecordRequest& req) {
  return ObserveRpc("DocumentService.UpdateRecord", req.collection(), [&] {
    const auto ref = Authorize(ctx_, credential, req, PermissionTier::kWrite);
    return ToRecordResponse(ctx_.store->Update(ref, req.id(), req.patch()));
  });
}

DeleteRecordResponse DocumentService::DeleteRecord(const std::string& credential, const DeleteRecordRequest& req) {
  return ObserveRpc("DocumentService.DeleteRecord", req.collection(), [&] {
    const auto ref = Authorize(ctx_, credential, req, PermissionTier::kFull);

    DeleteRecordResponse resp;
    resp.set_deleted(ctx_.store->Delete(ref, req.id()));
    return resp;
  });
}

RecordResponse DocumentService::Increment(const std::string& credential, const AdjustFieldRequest& req) {
  return ObserveRpc("DocumentService.Increment", req.collection(), [&] {
    const auto ref = Authorize(ctx_, credential, req, PermissionTier::kWrite);
    return ToRecordResponse(ctx_.store->Increment(ref, req.id(), req.field(), req.has_amount() ? req.amount() : 1));
  });
}

RecordResponse DocumentService::Decrement(const std::string& credential, const AdjustFieldRequest& req) {
  return ObserveRpc("DocumentService.Decrement", req.collection(), [&] {
    const auto ref = Authorize(ctx_, credential, req, PermissionTier::kWrite);
    return ToRecordResponse(ctx_.store->Decrement(ref, req.id(), req.field(), req.has_amount() ? req.amount() : 1));
  });
}

// ------------------------------------------------------------------
// Batches
// ------------------------------------------------------------------

BatchResponse DocumentService::BatchSet(const std::string& credential, const BatchSetRequest& req) {
  return ObserveRpc("DocumentService.BatchSet", req.collection(), [&] {
    return ctx_.store->Batch().BatchSet(Authorize(ctx_, credential, req, PermissionTier::kWrite), req.records());
  });
}

BatchResponse DocumentService::BatchGet(const std::string& credential, const BatchIdsRequest& req) {
  return ObserveRpc("DocumentService.BatchGet", req.collection(), [&] {
    return ctx_.store->Batch().BatchGet(Authorize(ctx_, credential, req, PermissionTier::kRead), req.ids());
  });
}

BatchResponse DocumentService::BatchDelete(const std::string& credential, const BatchIdsRequest& req) {
  return ObserveRpc("DocumentService.BatchDelete", req.collection(), [&] {
    return ctx_.store->Batch().BatchDelete(Authorize(ctx_, credential, req, PermissionTier::kFull), req.ids());
  });
}

BatchResponse DocumentService::BatchUpdate(const std::string& credential, const BatchUpdateRequest& req) {
  return ObserveRpc("DocumentService.BatchUpdate", req.collection(), [&] {
    return ctx_.store->Batch().BatchUpdate(Authorize(ctx_, credential, req, PermissionTier::kWrite), req.updates());
  });
}

} // namespace lieko::service
