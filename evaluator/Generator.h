#ifndef FIXBENCH_EVALUATOR_GENERATOR_H
#define FIXBENCH_EVALUATOR_GENERATOR_H

#include "support/Process.h"

#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"

#include <map>
#include <string>

namespace fixbench {

/// What the patch producer sees besides the prompt.
struct GenerationContext {
  std::string System;
  /// Path relative to the repository root -> current (buggy) content.
  std::map<std::string, std::string> Files;
};

/// Produces free text, possibly containing fenced code blocks, for a task
/// prompt.
class Generator {
public:
  virtual ~Generator() = default;
  virtual std::string getName() const = 0;
  virtual llvm::Expected<std::string>
  generate(llvm::StringRef Prompt, const GenerationContext &Context) = 0;
};

/// Replays a response stored on disk.
class ResponseFileGenerator : public Generator {
public:
  explicit ResponseFileGenerator(std::string Path) : Path(std::move(Path)) {}

  std::string getName() const override;
  llvm::Expected<std::string> generate(llvm::StringRef Prompt,
                                       const GenerationContext &Context) override;

private:
  std::string Path;
};

/// Runs an external program as `<program> <request.json>` and takes its
/// stdout as the response. The request holds "prompt", "system" and "files".
class CommandGenerator : public Generator {
public:
  CommandGenerator(std::string Program, CommandRunner &Runner,
                   unsigned TimeoutSeconds = 300)
      : Program(std::move(Program)), Runner(Runner),
        TimeoutSeconds(TimeoutSeconds) {}

  std::string getName() const override;
  llvm::Expected<std::string> generate(llvm::StringRef Prompt,
                                       const GenerationContext &Context) override;

  void setTimeout(unsigned Seconds) { TimeoutSeconds = Seconds; }

private:
  std::string Program;
  CommandRunner &Runner;
  unsigned TimeoutSeconds;
};

/// Request document handed to a CommandGenerator program.
std::string serializeGenerationRequest(llvm::StringRef Prompt,
                                       const GenerationContext &Context);

} // namespace fixbench

#endif // FIXBENCH_EVALUATOR_GENERATOR_H
