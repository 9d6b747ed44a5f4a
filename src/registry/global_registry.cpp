/***
 * Name: tycast::registry::BuiltinRegistry::Global / InitializeGlobal
 * Purpose: One process-wide registry, built exactly once.
 * Inputs: Optional explicit registry installed before first use
 * Outputs: Shared read-only instance
 * Theory of Operation:
 *   Both entry points race on the same once_flag, so whichever runs first decides
 *   the contents and the build happens-before every reader returned by Global().
 */
#include "tycast/registry/BuiltinRegistry.h"

#include <memory>
#include <mutex>

#include "tycast/exceptions/precondition_error.h"
#include "tycast/metrics/metrics.h"

namespace tycast::registry {

namespace {
std::once_flag g_initOnce;                    // NOLINT(cppcoreguidelines-avoid-non-const-global-variables)
std::unique_ptr<BuiltinRegistry> g_registry;  // NOLINT(cppcoreguidelines-avoid-non-const-global-variables)
}  // namespace

const BuiltinRegistry& BuiltinRegistry::Global() {
  std::call_once(g_initOnce, [] {
    const metrics::Metrics::ScopedTimer timer(metrics::Metrics::Phase::RegistryLoad);
    g_registry = std::make_unique<BuiltinRegistry>(Defaults());
  });
  return *g_registry;
}

void BuiltinRegistry::InitializeGlobal(BuiltinRegistry registry) {
  bool installed = false;
  std::call_once(g_initOnce, [&] {
    g_registry = std::make_unique<BuiltinRegistry>(std::move(registry));
    installed = true;
  });
  if (!installed) {
    throw exceptions::PreconditionError("precondition violated: builtin registry is already initialized");
  }
}

}  // namespace tycast::registry
