#pragma once

#include <google/protobuf/repeated_ptr_field.h>

#include <string>

#include "internal/core/engine_context.hpp"
#include "lieko/v1.hpp"

namespace lieko::core {

/*
  Many-item operations on one collection.

  Each item succeeds or fails on its own; a failed item never aborts its
  siblings. results and errors each keep input order and total is the
  input length. An error for an item with no usable id names it by
  input position instead ("#0", "#1", ...). An empty batch is rejected as a whole before storage
  is touched. Mutating batches persist once, and only when some item
  changed the collection.
*/
class BatchProcessor {
 public:
  explicit BatchProcessor(EngineContext ctx);

  // Creates the collection when missing.
  lieko::v1::BatchResponse BatchSet(const storage::CollectionRef& ref, const google::protobuf::RepeatedPtrField<model::Value>& records);

  lieko::v1::BatchResponse BatchGet(const storage::CollectionRef& ref, const google::protobuf::RepeatedPtrField<std::string>& ids);

  lieko::v1::BatchResponse BatchDelete(const storage::CollectionRef& ref, const google::protobuf::RepeatedPtrField<std::string>& ids);

  lieko::v1::BatchResponse BatchUpdate(const storage::CollectionRef& ref,
                                       const google::protobuf::RepeatedPtrField<lieko::v1::BatchUpdateItem>& updates);

 private:
  EngineContext ctx_;
};

} // namespace lieko::core
