#include <stylefix/cli_exit_codes.h>

namespace stylefix {

int FormatExitCode(const FormatResult &result, const FormatOptions &options) {
  if (!options.save_formatted_files && options.changes_are_errors &&
      result.diagnostic_count > 0) {
    return kExitDiagnosticErrors;
  }
  if (result.failed_projects > 0) {
    return kExitFailure;
  }
  return kExitClean;
}

} // namespace stylefix
