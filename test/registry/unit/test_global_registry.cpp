/***
 * Name: test_global_registry
 * Purpose: The process-wide registry is initialised exactly once.
 */
#include <gtest/gtest.h>

#include <thread>
#include <vector>

#include "tycast/exceptions/precondition_error.h"
#include "tycast/registry/BuiltinRegistry.h"

using namespace tycast;
using registry::BuiltinRegistry;

TEST(GlobalRegistry, LazyDefaultsThenInstallIsRejected) {
  const BuiltinRegistry& reg = BuiltinRegistry::Global();
  EXPECT_TRUE(reg.signatureExists(types::QualifiedName("\\strlen")));
  EXPECT_THROW(BuiltinRegistry::InitializeGlobal(BuiltinRegistry{}), exceptions::PreconditionError);
  EXPECT_EQ(&BuiltinRegistry::Global(), &reg);
}

TEST(GlobalRegistry, ConcurrentReadersSeeOneInstance) {
  constexpr int kThreads = 6;
  std::vector<const BuiltinRegistry*> seen(kThreads, nullptr);
  std::vector<std::thread> workers;
  for (int t = 0; t < kThreads; ++t) {
    workers.emplace_back([t, &seen] { seen[t] = &BuiltinRegistry::Global(); });
  }
  for (auto& w : workers) { w.join(); }
  for (const auto* r : seen) { EXPECT_EQ(r, seen.front()); }
}
