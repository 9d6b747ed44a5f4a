/***
 * Name: tycast::driver::RunCommand
 * Purpose: Dispatch a parsed command and print its answer.
 * Inputs:
 *   - opts: parsed options (command and operands already validated by ParseCli)
 *   - out: answer stream
 *   - err: diagnostics stream
 * Outputs: Process exit status
 * Theory of Operation: Each command is a short query against UnionType or the
 *   global BuiltinRegistry. Unknown builtins are reported through the registry's
 *   existence checks, never by catching a failed lookup.
 */
#include "tycast/driver/app.h"

#include <ostream>

#include "tycast/metrics/metrics.h"
#include "tycast/registry/BuiltinRegistry.h"
#include "tycast/types/QualifiedName.h"
#include "tycast/types/TypeInterner.h"

namespace tycast::driver {

namespace {

int runCast(const CliOptions& opts, std::ostream& out, std::ostream& err) {
  const types::UnionType source = ParseUnionArgument(opts.args[0], opts, err);
  const types::UnionType target = ParseUnionArgument(opts.args[1], opts, err);
  bool castable = false;
  {
    const metrics::Metrics::ScopedTimer timer(metrics::Metrics::Phase::CastCheck);
    castable = source.canCastTo(target);
  }
  metrics::Metrics::IncCounter(castable ? "cast.castable" : "cast.rejected");
  out << (castable ? "castable" : "not castable") << '\n';
  return castable ? 0 : 1;
}

int runProjection(const CliOptions& opts, std::ostream& out, std::ostream& err) {
  const types::UnionType input = ParseUnionArgument(opts.args[0], opts, err);
  if (opts.command == "generic") {
    out << input.genericTypes().toString() << '\n';
  } else if (opts.command == "array-of") {
    out << input.asGenericTypes().toString() << '\n';
  } else if (opts.command == "non-generic") {
    out << input.nonGenericTypes().toString() << '\n';
  } else {
    out << input.toString() << '\n';
  }
  return 0;
}

int runSignature(const CliOptions& opts, std::ostream& out, std::ostream& err) {
  const auto& builtins = registry::BuiltinRegistry::Global();
  const types::QualifiedName name(opts.args[0]);
  if (!builtins.signatureExists(name)) {
    err << "tycast: error: unknown builtin function '" << name.toString() << "'" << '\n';
    return 1;
  }
  out << "return: " << builtins.functionReturnType(name).toString() << '\n';
  for (const auto& [param, type] : builtins.functionParameterTypes(name)) {
    out << param << ": " << type.toString() << '\n';
  }
  return 0;
}

int runProperty(const CliOptions& opts, std::ostream& out, std::ostream& err) {
  const auto& builtins = registry::BuiltinRegistry::Global();
  const std::string& cls = opts.args[0];
  const std::string& prop = opts.args[1];
  if (!builtins.hasClassProperty(cls, prop)) {
    err << "tycast: error: unknown builtin property '" << cls << "::$" << prop << "'" << '\n';
    return 1;
  }
  out << builtins.classPropertyType(cls, prop).toString() << '\n';
  return 0;
}

}  // namespace

auto RunCommand(const CliOptions& opts, std::ostream& out, std::ostream& err) -> int {
  int status = 2;
  {
    const metrics::Metrics::ScopedTimer timer(metrics::Metrics::Phase::Query);
    if (opts.command == "cast") {
      status = runCast(opts, out, err);
    } else if (opts.command == "signature") {
      status = runSignature(opts, out, err);
    } else if (opts.command == "property") {
      status = runProperty(opts, out, err);
    } else if (CommandArity(opts.command) == 1) {
      status = runProjection(opts, out, err);
    } else {
      err << "tycast: error: unknown command '" << opts.command << "'" << '\n';
    }
  }
  metrics::Metrics::SetCounter("types.interned", types::TypeInterner::Global().size());
  return status;
}

}  // namespace tycast::driver
