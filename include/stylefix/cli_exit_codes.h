#pragma once

#include <stylefix/interfaces.h>

namespace stylefix {

constexpr int kExitClean = 0;
constexpr int kExitFailure = 1;
constexpr int kExitDiagnosticErrors = 2;

int FormatExitCode(const FormatResult &result, const FormatOptions &options);

} // namespace stylefix
