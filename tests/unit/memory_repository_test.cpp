#include "internal/db/memory/memory_repository.hpp"

#include <cassert>
#include <iostream>

namespace {

using namespace lieko::db;
using lieko::model::PermissionTier;

model::ProjectRecord Project(const std::string& id, uint64_t created) {
  model::ProjectRecord r;
  r.id            = id;
  r.name          = "project " + id;
  r.created_at_ms = created;
  r.updated_at_ms = created;
  return r;
}

model::TokenRecord Token(const std::string& id, const std::string& project, const std::string& secret) {
  model::TokenRecord r;
  r.id         = id;
  r.project_id = project;
  r.name       = id;
  r.secret     = secret;
  r.permission = PermissionTier::kWrite;
  return r;
}

void TestUncommittedWritesAreDiscarded() {
  memory::MemoryRepository repo;
  {
    auto tx = repo.Begin();
    assert(repo.InsertProject(*tx, Project("p1", 1)));
    assert(repo.GetProject(*tx, "p1").has_value());
  }

  auto tx = repo.Begin();
  assert(!repo.GetProject(*tx, "p1").has_value());
}

void TestProjectsListInCreationOrder() {
  memory::MemoryRepository repo;
  auto                     tx = repo.Begin();
  assert(repo.InsertProject(*tx, Project("b", 20)));
  assert(repo.InsertProject(*tx, Project("a", 30)));
  assert(repo.InsertProject(*tx, Project("c", 10)));
  assert(repo.InsertProject(*tx, Project("a", 40)).code == ErrorCode::AlreadyExists);
  tx->Commit();

  auto read     = repo.Begin();
  auto projects = repo.ListProjects(*read);
  assert(projects.size() == 3);
  assert(projects[0].id == "c" && projects[1].id == "b" && projects[2].id == "a");

  assert(repo.TouchProject(*read, "b", 99));
  assert(repo.GetProject(*read, "b")->updated_at_ms == 99);
  assert(repo.TouchProject(*read, "zz", 99).code == ErrorCode::NotFound);
}

void TestCollectionRegistrationKeepsFirstEntry() {
  memory::MemoryRepository repo;
  auto                     tx = repo.Begin();
  assert(repo.InsertProject(*tx, Project("p1", 1)));

  assert(repo.RegisterCollection(*tx, {"p1", "users", 5, 5}));
  assert(repo.RegisterCollection(*tx, {"p1", "users", 9, 9}));
  assert(repo.RegisterCollection(*tx, {"p1", "orders", 6, 6}));
  assert(repo.RegisterCollection(*tx, {"ghost", "users", 1, 1}).code == ErrorCode::ConstraintViolation);

  auto listed = repo.ListCollections(*tx, "p1");
  assert(listed.size() == 2);
  assert(listed[0].name == "orders");
  assert(listed[1].name == "users" && listed[1].created_at_ms == 5);

  assert(repo.DeleteCollection(*tx, "p1", "users"));
  assert(repo.DeleteCollection(*tx, "p1", "users"));
  assert(repo.ListAllCollections(*tx).size() == 1);
}

void TestTokens() {
  memory::MemoryRepository repo;
  auto                     tx = repo.Begin();
  assert(repo.InsertProject(*tx, Project("p1", 1)));

  assert(repo.InsertToken(*tx, Token("t1", "p1", "s1")));
  assert(repo.InsertToken(*tx, Token("t2", "p1", "s1")).code == ErrorCode::AlreadyExists);
  assert(repo.InsertToken(*tx, Token("t3", "ghost", "s3")).code == ErrorCode::ConstraintViolation);

  auto found = repo.FindTokenBySecret(*tx, "s1");
  assert(found && found->id == "t1" && found->permission == PermissionTier::kWrite);
  assert(!repo.FindTokenBySecret(*tx, "nope"));

  assert(repo.DeleteToken(*tx, "other", "t1").code == ErrorCode::NotFound);
  assert(repo.DeleteToken(*tx, "p1", "t1"));
  assert(repo.ListTokens(*tx, "p1").empty());
}

void TestDeleteProjectCascades() {
  memory::MemoryRepository repo;
  {
    auto tx = repo.Begin();
    assert(repo.InsertProject(*tx, Project("p1", 1)));
    assert(repo.InsertProject(*tx, Project("p2", 2)));
    assert(repo.RegisterCollection(*tx, {"p1", "users", 1, 1}));
    assert(repo.RegisterCollection(*tx, {"p2", "users", 1, 1}));
    assert(repo.InsertToken(*tx, Token("t1", "p1", "s1")));
    tx->Commit();
  }

  auto tx = repo.Begin();
  assert(repo.DeleteProject(*tx, "p1"));
  assert(repo.DeleteProject(*tx, "p1").code == ErrorCode::NotFound);
  assert(repo.ListCollections(*tx, "p1").empty());
  assert(repo.ListCollections(*tx, "p2").size() == 1);
  assert(!repo.FindTokenBySecret(*tx, "s1"));
}

} // namespace

int main() {
  TestUncommittedWritesAreDiscarded();
  TestProjectsListInCreationOrder();
  TestCollectionRegistrationKeepsFirstEntry();
  TestTokens();
  TestDeleteProjectCascades();

  std::cout << "lieko_unit_memory_repository: pass\n";
  return 0;
}
