#include "internal/observability/logging.hpp"

#include <cassert>
#include <iostream>

namespace {

using routebid::observability::BoolField;
using routebid::observability::DoubleField;
using routebid::observability::FormatFields;
using routebid::observability::IntField;
using routebid::observability::StringField;

void TestPlainValuesStayBare() {
  assert(FormatFields({}).empty());
  assert(FormatFields({StringField("package_id", "p-1"), IntField("attempts", 3), BoolField("eligible", true)}) ==
         "package_id=p-1 attempts=3 eligible=true");
  assert(FormatFields({DoubleField("max_deviation_km", 5.0)}) == "max_deviation_km=5.000");
}

void TestValuesWithSeparatorsAreQuoted() {
  assert(FormatFields({StringField("error", "bid message exceeds 500 characters")}) ==
         "error=\"bid message exceeds 500 characters\"");
  assert(FormatFields({StringField("detail", "a=b")}) == "detail=\"a=b\"");
  assert(FormatFields({StringField("courier_id", "")}) == "courier_id=\"\"");
  assert(FormatFields({StringField("message", "say \"hi\" \\ bye")}) == "message=\"say \\\"hi\\\" \\\\ bye\"");
}

} // namespace

int main() {
  TestPlainValuesStayBare();
  TestValuesWithSeparatorsAreQuoted();

  std::cout << "routebid_unit_logging: pass\n";
  return 0;
}
