#pragma once

#include <memory>
#include <string>
#include <string_view>

#include "internal/model/record.hpp"

namespace lieko::storage {

/*
  Identity of one collection container.
*/
struct CollectionRef {
  std::string project_id;
  std::string name;

  // write-lock key
  std::string ResourceKey() const {
    return project_id + "/" + name;
  }
};

/*
  Collection storage abstraction.

  A collection is read and written as one unit: Load returns the whole
  record map and Persist replaces it. Writers of the same collection are
  serialized by the caller (lock::WriteSerializer), not by the backend.

  Implementations:
    DISK → one JSON document per collection, atomic replace
    RAM  → process memory, for tests and throwaway deployments

  I/O failures surface as util::StorageError.
*/
class StorageBackend {
 public:
  virtual ~StorageBackend() = default;

  // Empty map when the collection was never written.
  virtual model::RecordMap Load(const CollectionRef& ref) = 0;

  virtual void Persist(const CollectionRef& ref, const model::RecordMap& records) = 0;

  virtual bool Exists(const CollectionRef& ref) = 0;

  // Missing containers are not an error.
  virtual void Remove(const CollectionRef& ref) = 0;

  virtual void RemoveProject(const std::string& project_id) = 0;

  virtual std::string_view Name() const = 0;
};

using StorageBackendPtr = std::shared_ptr<StorageBackend>;

} // namespace lieko::storage
