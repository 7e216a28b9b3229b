#ifndef FIXBENCH_SANDBOX_BUILDCACHE_H
#define FIXBENCH_SANDBOX_BUILDCACHE_H

#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"

#include <atomic>
#include <string>

namespace fixbench {

/// Directory snapshots of checked-out repositories, keyed by commit.
///
/// Each entry lives at <root>/repo_<key> where key is a prefix of the
/// SHA-256 of the commit string. Entries are populated in a private
/// temporary directory and renamed into place, so a reader never observes a
/// partially written entry. An existing entry is never replaced: when two
/// sessions race on the same commit the first rename wins and the loser
/// discards its copy.
class BuildCache {
public:
  explicit BuildCache(std::string Root);

  /// $HOME/.cache/fixbench, or a directory under the system temp dir when
  /// HOME is unset.
  static std::string getDefaultRoot();

  static std::string keyFor(llvm::StringRef Commit);

  const std::string &getRoot() const { return Root; }
  std::string getEntryPath(llvm::StringRef Commit) const;
  bool contains(llvm::StringRef Commit) const;

  /// Copies the entry for Commit to Dest. Returns false on a miss.
  llvm::Expected<bool> restore(llvm::StringRef Commit, llvm::StringRef Dest);

  /// Publishes a copy of Tree as the entry for Commit. Returns false when an
  /// entry already existed or another writer published first.
  llvm::Expected<bool> store(llvm::StringRef Commit, llvm::StringRef Tree);

  unsigned getHits() const { return Hits; }
  unsigned getMisses() const { return Misses; }
  unsigned getStores() const { return Stores; }

private:
  std::string Root;
  std::atomic<unsigned> Hits{0};
  std::atomic<unsigned> Misses{0};
  std::atomic<unsigned> Stores{0};
};

} // namespace fixbench

#endif // FIXBENCH_SANDBOX_BUILDCACHE_H
