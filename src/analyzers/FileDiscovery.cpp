#include "analyzers/FileDiscovery.hpp"
#include <algorithm>
#include <filesystem>

namespace fs = std::filesystem;

namespace kwl {

static bool isManifestSource(const fs::path& p) {
  if (p.extension() != ".go") return false;
  return !llvm::StringRef(p.filename().string()).endswith("_test.go");
}

llvm::Expected<std::vector<std::string>> discoverSources(llvm::StringRef path) {
  std::error_code ec;
  fs::file_status st = fs::status(path.str(), ec);
  if (ec || !fs::exists(st))
    return llvm::createStringError(std::make_error_code(std::errc::no_such_file_or_directory),
                                   "path does not exist: %s", path.str().c_str());

  std::vector<std::string> files;
  if (!fs::is_directory(st)) {
    files.push_back(path.str());
    return files;
  }

  fs::recursive_directory_iterator it(path.str(), fs::directory_options::follow_directory_symlink,
                                      ec);
  for (fs::recursive_directory_iterator end; !ec && it != end; it.increment(ec)) {
    std::error_code entryEc;
    if (it->is_regular_file(entryEc) && isManifestSource(it->path()))
      files.push_back(it->path().string());
  }
  if (ec)
    return llvm::createStringError(ec, "cannot walk %s: %s", path.str().c_str(),
                                   ec.message().c_str());
  std::sort(files.begin(), files.end());
  return files;
}

} // namespace kwl
