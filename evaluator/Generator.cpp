#include "Generator.h"

#include "support/Debug.h"
#include "support/FileUtils.h"

#include "llvm/ADT/SmallString.h"
#include "llvm/Support/FileSystem.h"
#include "llvm/Support/FileUtilities.h"
#include "llvm/Support/Path.h"
#include "llvm/Support/raw_ostream.h"

#include <nlohmann/json.hpp>

using namespace llvm;

namespace fixbench {

std::string ResponseFileGenerator::getName() const {
  return "response-file:" + sys::path::filename(Path).str();
}

Expected<std::string>
ResponseFileGenerator::generate(StringRef, const GenerationContext &) {
  return readTextFile(Path);
}

std::string serializeGenerationRequest(StringRef Prompt,
                                       const GenerationContext &Context) {
  nlohmann::json Request;
  Request["prompt"] = Prompt.str();
  Request["system"] = Context.System;
  Request["files"] = nlohmann::json::object();
  for (const auto &File : Context.Files)
    Request["files"][File.first] = File.second;
  return Request.dump(2, ' ', false,
                      nlohmann::json::error_handler_t::replace);
}

std::string CommandGenerator::getName() const {
  return "command:" + sys::path::filename(Program).str();
}

Expected<std::string>
CommandGenerator::generate(StringRef Prompt, const GenerationContext &Context) {
  SmallString<128> RequestPath;
  if (std::error_code EC =
          sys::fs::createTemporaryFile("fixbench-request", "json", RequestPath))
    return createStringError(EC, "cannot create request file: %s",
                             EC.message().c_str());
  FileRemover RequestRemover(RequestPath);

  std::string Request;
  try {
    Request = serializeGenerationRequest(Prompt, Context);
  } catch (const nlohmann::json::exception &E) {
    return createStringError(std::errc::invalid_argument,
                             "cannot encode generation request: %s", E.what());
  }
  if (std::error_code EC = writeTextFile(RequestPath, Request))
    return createStringError(EC, "cannot write request file: %s",
                             EC.message().c_str());

  Command Cmd;
  Cmd.Program = Program;
  Cmd.Args = {RequestPath.str().str()};
  Cmd.TimeoutSeconds = TimeoutSeconds;
  if (isDebugLoggingEnabled())
    errs() << "Generator: " << describeCommand(Cmd) << "\n";

  ProcessResult Result = Runner.run(Cmd);
  if (Result.TimedOut)
    return createStringError(std::errc::timed_out,
                             "generator timed out after %us", TimeoutSeconds);
  if (!Result.succeeded())
    return createStringError(std::errc::io_error,
                             "generator exited with status %d: %s",
                             Result.ExitCode,
                             (Result.Stderr.empty() ? Result.ErrorMessage
                                                    : Result.Stderr)
                                 .c_str());
  return Result.Stdout;
}

} // namespace fixbench
