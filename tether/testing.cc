// This Source Code Form is licensed MPL-2.0: http://mozilla.org/MPL/2.0
#include "testing.hh"
#include <algorithm>
#include <cstdlib>

namespace Tether {
namespace Test {

IntegrityCheck *IntegrityCheck::first_ = nullptr;

void
test_failed (const String &msg, const char *file, int line, const char *func)
{
  assertion_failed_fatal = true;
  assertion_failed (msg.c_str(), file, line, func);
  for (;;)
    abort();
}

/// Execute integrity checks in registration order.
int
IntegrityCheck::run (const StringS &filters)
{
  std::vector<IntegrityCheck*> checks;
  for (IntegrityCheck *t = first_; t; t = t->next_)
    checks.push_back (t);
  std::reverse (checks.begin(), checks.end());
  int n = 0;
  for (IntegrityCheck *t : checks)
    {
      const String name = t->name_;
      if (!filters.empty() &&
          std::none_of (filters.begin(), filters.end(), [&name] (const String &f) { return name.find (f) != String::npos; }))
        continue;
      printout ("  RUN…     %s\n", name);
      t->func_();
      printout ("  PASS     %s\n", name);
      n++;
    }
  return n;
}

int
run (const StringS &filters)
{
  return IntegrityCheck::run (filters);
}

} // Test
} // Tether
