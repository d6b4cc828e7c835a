#include <pathrules.hpp>

int main() {
  pathrules::rule_engine engine(pathrules::build_rules(
    "/{*any}\n  X-Test: 1\n", "/from /to 301\n"));
  auto r = engine.resolve_redirect("/from");
  if (!r || r->location != "/to" || r->status != 301) {
    return 1;
  }
  if (engine.resolve_headers("/x").size() != 1) {
    return 1;
  }
}
