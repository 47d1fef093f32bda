#include "internal/query/filter.hpp"

#include <google/protobuf/util/json_util.h>

#include <cassert>
#include <iostream>
#include <string>

#include "internal/util/errors.hpp"

namespace {

using lieko::model::Record;
using lieko::query::Matches;
using lieko::query::ParseFilter;

Record Json(const std::string& json) {
  Record record;
  auto   status = google::protobuf::util::JsonStringToMessage(json, &record);
  assert(status.ok());
  return record;
}

bool Match(const std::string& record, const std::string& filter) {
  return Matches(Json(record), ParseFilter(filter));
}

const char* kAnn = R"({"id":"a","name":"Ann","age":30,"active":true,"tags":["x","y"],"address":{"city":"Oslo"}})";

void TestEmptyFilterMatchesEverything() {
  assert(Match(kAnn, ""));
  assert(Match(kAnn, "{}"));
}

void TestEqualityAndNestedPaths() {
  assert(Match(kAnn, R"({"name":"Ann"})"));
  assert(!Match(kAnn, R"({"name":"ann"})"));
  assert(Match(kAnn, R"({"address.city":"Oslo"})"));
  assert(Match(kAnn, R"({"address":{"city":"Oslo"}})"));
  assert(Match(kAnn, R"({"tags":["x","y"]})"));
  assert(!Match(kAnn, R"({"tags":["y","x"]})"));
  assert(Match(kAnn, R"({"age":{"$eq":30},"active":true})"));
}

void TestComparisonOperators() {
  assert(Match(kAnn, R"({"age":{"$gt":29,"$lte":30}})"));
  assert(!Match(kAnn, R"({"age":{"$gt":30}})"));
  assert(Match(kAnn, R"({"age":{"$gte":30,"$lt":31}})"));
  assert(Match(kAnn, R"({"name":{"$lt":"Bob"}})"));

  // different kinds never order
  assert(!Match(kAnn, R"({"age":{"$gt":"10"}})"));
  assert(!Match(kAnn, R"({"age":{"$lt":"99"}})"));
}

void TestMembershipAndStringOperators() {
  assert(Match(kAnn, R"({"name":{"$in":["Bob","Ann"]}})"));
  assert(!Match(kAnn, R"({"name":{"$nin":["Bob","Ann"]}})"));
  assert(Match(kAnn, R"({"name":{"$nin":["Bob"]}})"));
  assert(Match(kAnn, R"({"name":{"$ne":"Bob"}})"));

  assert(Match(kAnn, R"({"name":{"$contains":"nn"}})"));
  assert(!Match(kAnn, R"({"name":{"$contains":"NN"}})"));
  assert(Match(kAnn, R"({"name":{"$regex":"^A.n$"}})"));
  assert(!Match(kAnn, R"({"name":{"$regex":"("}})"));
  assert(!Match(kAnn, R"({"age":{"$contains":"3"}})"));
}

void TestRegexOnLongSubjectCompletes() {
  const std::string bio(200000, 'a');
  const Record      record = Json(R"({"id":"a","bio":")" + bio + R"("})");

  assert(!Matches(record, ParseFilter(R"({"bio":{"$regex":"(a|b)*c"}})")));
  assert(Matches(record, ParseFilter(R"({"bio":{"$regex":"^(a|b)*$"}})")));
  assert(!Matches(record, ParseFilter(R"({"bio":{"$regex":"(a)\\1"}})")));
}

void TestMatcherReusesPatternsAcrossRecords() {
  const Record filter = ParseFilter(R"({"$or":[{"name":{"$regex":"^A"}},{"name":{"$regex":"^B"}}]})");
  const lieko::query::Matcher matcher(filter);

  assert(matcher.Matches(Json(R"({"id":"1","name":"Ann"})")));
  assert(matcher.Matches(Json(R"({"id":"2","name":"Bob"})")));
  assert(!matcher.Matches(Json(R"({"id":"3","name":"Cid"})")));
  assert(!matcher.Matches(Json(R"({"id":"4"})")));
}

void TestMissingFieldFailsEveryOperator() {
  const char* ops[] = {
      R"({"missing":{"$eq":null}})",
      R"({"missing":{"$ne":"x"}})",
      R"({"missing":{"$nin":["x"]}})",
      R"({"missing":{"$lt":1}})",
      R"({"missing":{"$regex":".*"}})",
      R"({"address.zip":{"$ne":1}})",
      R"({"name.first":"Ann"})",
  };
  for (const char* filter : ops) {
    assert(!Match(kAnn, filter));
  }
}

void TestUnknownOperatorFails() {
  assert(!Match(kAnn, R"({"name":{"$like":"Ann"}})"));
}

void TestLogicalOperators() {
  assert(Match(kAnn, R"({"$and":[]})"));
  assert(!Match(kAnn, R"({"$or":[]})"));

  assert(Match(kAnn, R"({"$and":[{"name":"Ann"},{"age":30}]})"));
  assert(!Match(kAnn, R"({"$and":[{"name":"Ann"},{"age":31}]})"));
  assert(Match(kAnn, R"({"$or":[{"name":"Bob"},{"age":30}]})"));
  assert(!Match(kAnn, R"({"$or":[{"name":"Bob"},{"age":31}]})"));

  assert(Match(kAnn, R"({"$or":[{"$and":[{"name":"Ann"},{"active":true}]},{"name":"Bob"}]})"));
}

void TestSearchIsCaseInsensitiveAndRecursive() {
  const char* bob_smith = R"({"id":"1","name":"Bob Smith"})";
  const char* bob_mail  = R"({"id":"2","email":"bob@x.com"})";
  const char* other     = R"({"id":"3","name":"Carl","score":5})";

  assert(Match(bob_smith, R"({"$search":"bob"})"));
  assert(Match(bob_mail, R"({"$search":"BOB"})"));
  assert(!Match(other, R"({"$search":"bob"})"));

  assert(Match(kAnn, R"({"$search":"oslo"})"));
  assert(Match(kAnn, R"({"$search":"Y"})"));
  assert(!Match(other, R"({"$search":"5"})"));
}

void TestParseFilterRejectsBadInput() {
  const char* bad[] = {"{", "[1,2]", "\"name\"", "42"};
  for (const char* input : bad) {
    bool threw = false;
    try {
      (void)ParseFilter(input);
    } catch (const lieko::util::ValidationError& e) {
      threw = e.Code() == lieko::util::ErrorCode::InvalidFilter;
    }
    assert(threw);
  }
}

} // namespace

int main() {
  TestEmptyFilterMatchesEverything();
  TestEqualityAndNestedPaths();
  TestComparisonOperators();
  TestMembershipAndStringOperators();
  TestRegexOnLongSubjectCompletes();
  TestMatcherReusesPatternsAcrossRecords();
  TestMissingFieldFailsEveryOperator();
  TestUnknownOperatorFails();
  TestLogicalOperators();
  TestSearchIsCaseInsensitiveAndRecursive();
  TestParseFilterRejectsBadInput();

  std::cout << "lieko_unit_filter: pass\n";
  return 0;
}
