#ifndef FIXBENCH_EVALUATOR_RESULTWRITER_H
#define FIXBENCH_EVALUATOR_RESULTWRITER_H

#include "Evaluator.h"

#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"

#include <nlohmann/json.hpp>

namespace fixbench {

nlohmann::json toJSON(const SanitizerReport &Report);
nlohmann::json toJSON(const TestOutcome &Outcome);
nlohmann::json toJSON(const EvaluationResult &Result);
nlohmann::json toJSON(const TaskValidation &Validation);

/// Writes toJSON(Result), indented, to Path.
llvm::Error writeResultJSON(const EvaluationResult &Result, llvm::StringRef Path);
llvm::Error writeValidationJSON(const TaskValidation &Validation,
                                llvm::StringRef Path);

} // namespace fixbench

#endif // FIXBENCH_EVALUATOR_RESULTWRITER_H
