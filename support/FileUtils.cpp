#include "FileUtils.h"

#include "llvm/ADT/SmallString.h"
#include "llvm/Support/ErrorOr.h"
#include "llvm/Support/FileSystem.h"
#include "llvm/Support/MemoryBuffer.h"
#include "llvm/Support/Path.h"
#include "llvm/Support/raw_ostream.h"

#include <cerrno>
#include <limits.h>
#include <unistd.h>

using namespace llvm;

namespace fixbench {

Expected<std::string> readTextFile(StringRef Path) {
  ErrorOr<std::unique_ptr<MemoryBuffer>> Buffer =
      MemoryBuffer::getFile(Path, /*IsText=*/true);
  if (std::error_code EC = Buffer.getError())
    return createStringError(EC, "cannot read %s: %s", Path.str().c_str(),
                             EC.message().c_str());
  return (*Buffer)->getBuffer().str();
}

std::error_code writeTextFile(StringRef Path, StringRef Content) {
  StringRef Parent = sys::path::parent_path(Path);
  if (!Parent.empty())
    if (std::error_code EC = sys::fs::create_directories(Parent))
      return EC;

  std::error_code EC;
  raw_fd_ostream OS(Path, EC, sys::fs::OF_None);
  if (EC)
    return EC;
  OS << Content;
  OS.close();
  return OS.error();
}

static std::error_code copySymlink(StringRef From, StringRef To) {
  char Target[PATH_MAX];
  ssize_t Len = ::readlink(From.str().c_str(), Target, sizeof(Target) - 1);
  if (Len < 0)
    return std::error_code(errno, std::generic_category());
  Target[Len] = '\0';
  return sys::fs::create_link(Target, To);
}

std::error_code copyDirectoryTree(StringRef From, StringRef To) {
  if (std::error_code EC = sys::fs::create_directories(To))
    return EC;

  std::error_code EC;
  for (sys::fs::recursive_directory_iterator I(From, EC, /*follow_symlinks=*/false),
       E;
       I != E && !EC; I.increment(EC)) {
    SmallString<256> Dest(I->path());
    if (!sys::path::replace_path_prefix(Dest, From, To))
      return std::make_error_code(std::errc::invalid_argument);

    sys::fs::file_status Status;
    if (std::error_code StatEC = sys::fs::status(I->path(), Status,
                                                 /*follow=*/false))
      return StatEC;

    switch (Status.type()) {
    case sys::fs::file_type::directory_file:
      if (std::error_code DirEC = sys::fs::create_directories(Dest))
        return DirEC;
      break;
    case sys::fs::file_type::symlink_file:
      if (std::error_code LinkEC = copySymlink(I->path(), Dest))
        return LinkEC;
      break;
    case sys::fs::file_type::regular_file:
      if (std::error_code CopyEC = sys::fs::copy_file(I->path(), Dest))
        return CopyEC;
      if (std::error_code PermEC =
              sys::fs::setPermissions(Dest, Status.permissions()))
        return PermEC;
      break;
    default:
      // Sockets, fifos and devices have no place in a source tree.
      break;
    }
  }
  return EC;
}

std::error_code createUniqueWorkDir(StringRef Root, StringRef Prefix,
                                    SmallVectorImpl<char> &ResultPath) {
  if (Root.empty())
    return sys::fs::createUniqueDirectory(Prefix, ResultPath);

  if (std::error_code EC = sys::fs::create_directories(Root))
    return EC;
  SmallString<256> Model(Root);
  sys::path::append(Model, Prefix);
  return sys::fs::createUniqueDirectory(Model, ResultPath);
}

} // namespace fixbench
