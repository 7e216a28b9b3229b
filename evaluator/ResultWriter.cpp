#include "ResultWriter.h"

#include "support/FileUtils.h"

using namespace llvm;

namespace fixbench {

static nlohmann::json toJSON(const SanitizerError &Error) {
  nlohmann::json J;
  J["type"] = getSanitizerErrorKindName(Error.Kind).str();
  J["summary"] = Error.Summary;
  J["description"] = Error.Description;
  J["address"] = Error.Address ? nlohmann::json(*Error.Address) : nlohmann::json();
  J["size"] = Error.Size ? nlohmann::json(*Error.Size) : nlohmann::json();
  Optional<std::string> Location = Error.getLocation();
  J["location"] = Location ? nlohmann::json(*Location) : nlohmann::json();
  J["stack_traces"] = nlohmann::json::array();
  for (const StackTrace &Trace : Error.Traces) {
    nlohmann::json T;
    T["description"] = Trace.Description;
    T["frames"] = nlohmann::json::array();
    for (const StackFrame &F : Trace.Frames) {
      nlohmann::json Frame;
      Frame["index"] = F.Index;
      Frame["address"] = F.Address;
      Frame["function"] = F.Function;
      if (F.File)
        Frame["file"] = *F.File;
      if (F.Line)
        Frame["line"] = *F.Line;
      if (F.Column)
        Frame["column"] = *F.Column;
      if (F.Module)
        Frame["module"] = *F.Module;
      T["frames"].push_back(Frame);
    }
    J["stack_traces"].push_back(T);
  }
  return J;
}

nlohmann::json toJSON(const SanitizerReport &Report) {
  nlohmann::json J;
  J["has_errors"] = Report.hasErrors();
  J["has_leaks"] = Report.hasLeaks();
  J["errors"] = nlohmann::json::array();
  for (const SanitizerError &E : Report.Errors)
    J["errors"].push_back(toJSON(E));
  J["leaks"] = nlohmann::json::array();
  for (const SanitizerError &E : Report.Leaks)
    J["leaks"].push_back(toJSON(E));
  return J;
}

nlohmann::json toJSON(const TestOutcome &Outcome) {
  nlohmann::json J;
  J["passed"] = Outcome.Passed;
  J["failed"] = Outcome.Failed;
  J["errors"] = Outcome.Errors;
  J["skipped"] = Outcome.Skipped;
  J["total"] = Outcome.Total;
  J["success"] = Outcome.Success;
  J["timed_out"] = Outcome.TimedOut;
  J["elapsed_time"] = Outcome.ElapsedSeconds;
  J["compilation_error"] = Outcome.CompilationError
                               ? nlohmann::json(*Outcome.CompilationError)
                               : nlohmann::json();
  if (!Outcome.Cases.empty()) {
    J["test_cases"] = nlohmann::json::array();
    for (const NamedTestResult &Case : Outcome.Cases)
      J["test_cases"].push_back({{"name", Case.Name}, {"passed", Case.Passed}});
  }
  return J;
}

nlohmann::json toJSON(const EvaluationResult &Result) {
  nlohmann::json J;
  J["task_id"] = Result.TaskId;
  J["generator"] = Result.GeneratorName;
  J["success"] = Result.Success;
  J["scores"] = {{"compiles", Result.Compiles},
                 {"no_sanitizer_errors", Result.NoSanitizerErrors},
                 {"tests_pass", Result.TestsPass},
                 {"matches_reference", Result.MatchesReference},
                 {"total", Result.TotalScore},
                 {"max", Result.MaxScore},
                 {"percentage", Result.getScorePercentage()}};
  J["patch_similarity"] = Result.PatchSimilarity;
  J["elapsed_time"] = Result.ElapsedSeconds;
  J["error"] = Result.Error ? nlohmann::json(*Result.Error) : nlohmann::json();
  J["tests"] = Result.Tests ? toJSON(*Result.Tests) : nlohmann::json();
  J["sanitizer_report"] =
      Result.Sanitizers ? toJSON(*Result.Sanitizers) : nlohmann::json();
  if (Result.ExpectedErrorObserved)
    J["expected_error_observed"] = *Result.ExpectedErrorObserved;
  J["metadata"] = {{"category", Result.Category},
                   {"tier", Result.Tier},
                   {"commit", Result.Commit}};
  J["applied_patch"] = Result.AppliedPatch;
  return J;
}

nlohmann::json toJSON(const TaskValidation &Validation) {
  nlohmann::json J;
  J["valid"] = Validation.Valid;
  J["fixed"] = Validation.Fixed ? toJSON(*Validation.Fixed) : nlohmann::json();
  J["buggy"] = Validation.Buggy ? toJSON(*Validation.Buggy) : nlohmann::json();
  J["error"] = Validation.Error.empty() ? nlohmann::json()
                                        : nlohmann::json(Validation.Error);
  return J;
}

static Error writeJSON(const nlohmann::json &J, StringRef Path) {
  std::string Text;
  try {
    Text = J.dump(2, ' ', false, nlohmann::json::error_handler_t::replace);
  } catch (const nlohmann::json::exception &E) {
    return createStringError(std::errc::invalid_argument,
                             "cannot encode result: %s", E.what());
  }
  Text += "\n";
  if (std::error_code EC = writeTextFile(Path, Text))
    return createStringError(EC, "cannot write %s: %s", Path.str().c_str(),
                             EC.message().c_str());
  return Error::success();
}

Error writeResultJSON(const EvaluationResult &Result, StringRef Path) {
  return writeJSON(toJSON(Result), Path);
}

Error writeValidationJSON(const TaskValidation &Validation, StringRef Path) {
  return writeJSON(toJSON(Validation), Path);
}

} // namespace fixbench
