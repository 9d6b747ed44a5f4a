/***
 * Name: tycast::main
 * Purpose: Entry point for the tycast type query CLI.
 * Inputs:
 *   - argc, argv: Standard process arguments.
 * Outputs:
 *   - int: process status code (0 success/castable, 1 negative answer, 2 error).
 * Theory of Operation:
 *   Parses options, enables metrics if requested, runs one command against the
 *   process-wide builtin registry and reports metrics on stderr.
 */
#include <exception>
#include <iostream>

#include "tycast/driver/app.h"
#include "tycast/driver/cli.h"
#include "tycast/exceptions/tycast_exception.h"
#include "tycast/metrics/metrics.h"

using tycast::driver::CliOptions;

int main(int argc, char** argv) {
  try {
    using tycast::driver::ParseCli;
    using tycast::driver::PrintUsage;
    CliOptions opts;
    if (!ParseCli(argc, (const char* const*)argv, opts, std::cerr)) {
      PrintUsage(std::cerr, argv[0]); // NOLINT(*-pro-bounds-pointer-arithmetic)
      return 2;
    }
    if (opts.show_help) {
      PrintUsage(std::cout, argv[0]); // NOLINT(*-pro-bounds-pointer-arithmetic)
      return 0;
    }
    tycast::metrics::Metrics::Enable(opts.metrics);
    const int ret_code = tycast::driver::RunCommand(opts, std::cout, std::cerr);
    tycast::driver::ReportMetricsIfRequested(opts, std::cerr);
    return ret_code;
  }
  catch (const tycast::exceptions::TycastException& ex) {
    std::cerr << "tycast: " << ex.what() << '\n';
    return 2;
  }
  catch (const std::exception& ex) {
    std::cerr << "tycast: internal error: " << ex.what() << '\n';
    return 2;
  }
}
