#include "BuildCache.h"

#include "support/Debug.h"
#include "support/FileUtils.h"

#include "llvm/ADT/SmallString.h"
#include "llvm/ADT/StringExtras.h"
#include "llvm/Support/FileSystem.h"
#include "llvm/Support/Path.h"
#include "llvm/Support/SHA256.h"
#include "llvm/Support/raw_ostream.h"

using namespace llvm;

namespace fixbench {

BuildCache::BuildCache(std::string Root) : Root(std::move(Root)) {}

std::string BuildCache::getDefaultRoot() {
  SmallString<256> Path;
  if (!sys::path::home_directory(Path))
    sys::path::system_temp_directory(/*ErasedOnReboot=*/false, Path);
  sys::path::append(Path, ".cache", "fixbench");
  return std::string(Path.str());
}

std::string BuildCache::keyFor(StringRef Commit) {
  SHA256 Hasher;
  Hasher.update(Commit);
  return toHex(Hasher.final(), /*LowerCase=*/true).substr(0, 16);
}

std::string BuildCache::getEntryPath(StringRef Commit) const {
  SmallString<256> Path(Root);
  sys::path::append(Path, "repo_" + keyFor(Commit));
  return std::string(Path.str());
}

bool BuildCache::contains(StringRef Commit) const {
  return sys::fs::is_directory(getEntryPath(Commit));
}

static void discardStaging(StringRef Staging) {
  if (std::error_code EC = sys::fs::remove_directories(Staging, false))
    errs() << "BuildCache: warning: cannot remove " << Staging << ": "
           << EC.message() << "\n";
}

Expected<bool> BuildCache::restore(StringRef Commit, StringRef Dest) {
  std::string Entry = getEntryPath(Commit);
  if (!sys::fs::is_directory(Entry)) {
    ++Misses;
    return false;
  }
  if (std::error_code EC = copyDirectoryTree(Entry, Dest))
    return createStringError(EC, "failed to copy cache entry %s: %s",
                             Entry.c_str(), EC.message().c_str());
  ++Hits;
  if (isDebugLoggingEnabled())
    errs() << "BuildCache: hit for " << Commit << " (" << Entry << ")\n";
  return true;
}

Expected<bool> BuildCache::store(StringRef Commit, StringRef Tree) {
  std::string Entry = getEntryPath(Commit);
  if (sys::fs::exists(Entry))
    return false;

  if (std::error_code EC = sys::fs::create_directories(Root))
    return createStringError(EC, "cannot create cache directory %s: %s",
                             Root.c_str(), EC.message().c_str());

  SmallString<256> Staging;
  if (std::error_code EC =
          createUniqueWorkDir(Root, ".staging_" + keyFor(Commit), Staging))
    return createStringError(EC, "cannot create staging directory: %s",
                             EC.message().c_str());

  if (std::error_code EC = copyDirectoryTree(Tree, Staging)) {
    discardStaging(Staging);
    return createStringError(EC, "failed to copy %s into the cache: %s",
                             Tree.str().c_str(), EC.message().c_str());
  }

  if (sys::fs::exists(Entry) || sys::fs::rename(Staging, Entry)) {
    // Someone else published this commit first.
    discardStaging(Staging);
    return false;
  }
  ++Stores;
  if (isDebugLoggingEnabled())
    errs() << "BuildCache: stored " << Commit << " at " << Entry << "\n";
  return true;
}

} // namespace fixbench
