#include "scanner/Scanner.hpp"
#include "support/FileIO.hpp"

#include "llvm/ADT/STLExtras.h"
#include "llvm/Support/WithColor.h"

#include <algorithm>
#include <filesystem>

namespace fs = std::filesystem;
namespace aicw {

namespace {

// Version control metadata, dependency caches and build output.
constexpr llvm::StringLiteral IgnoredDirs[] = {
  ".git", ".hg", ".svn", ".venv", "venv", "node_modules", "__pycache__",
  ".mypy_cache", ".pytest_cache", "dist", "build", "out", ".cache",
};

} // namespace

bool isIgnoredDirectory(llvm::StringRef name, bool includeTests) {
  if (llvm::is_contained(IgnoredDirs, name)) return true;
  return !includeTests && name == "tests";
}

std::vector<std::string>
collectSourceFiles(const std::string& repoRoot, const ScanOptions& opts,
                   const std::vector<std::unique_ptr<EntityExtractor>>& extractors)
{
  std::vector<std::string> files;
  const fs::path root(repoRoot);

  // One directory at a time, so a directory that cannot be listed costs only
  // its own subtree.
  std::vector<fs::path> pending{root};
  while (!pending.empty()) {
    fs::path dir = std::move(pending.back());
    pending.pop_back();

    std::error_code ec;
    fs::directory_iterator it(dir, ec), end;
    if (ec) {
      if (opts.verbose) llvm::WithColor::note() << "cannot list " << dir.string() << ": " << ec.message() << "\n";
      continue;
    }
    for (; it != end; it.increment(ec)) {
      std::error_code statEc;
      const auto& path = it->path();
      if (it->is_directory(statEc)) {
        if (!it->is_symlink(statEc) &&
            !isIgnoredDirectory(path.filename().string(), opts.includeTests))
          pending.push_back(path);
        continue;
      }
      if (!it->is_regular_file(statEc)) continue;

      std::string rel = path.lexically_relative(root).generic_string();
      bool supported = llvm::any_of(extractors, [&](const std::unique_ptr<EntityExtractor>& x) {
        return x->handles(rel);
      });
      if (supported) files.push_back(std::move(rel));
    }
    if (ec && opts.verbose)
      llvm::WithColor::note() << "listing of " << dir.string() << " stopped early: " << ec.message() << "\n";
  }

  std::sort(files.begin(), files.end());
  return files;
}

std::vector<Entity> scanRepository(const std::string& repoRoot, const ScanOptions& opts) {
  std::error_code ec;
  fs::path root = fs::weakly_canonical(fs::absolute(repoRoot, ec), ec);
  if (ec) root = fs::path(repoRoot);
  const std::string rootStr = root.string();

  std::vector<std::unique_ptr<EntityExtractor>> extractors;
  extractors.push_back(makeClangExtractor(rootStr, opts));
  extractors.push_back(makeScriptExtractor());

  std::vector<Entity> entities;
  unsigned skipped = 0;
  for (const auto& rel : collectSourceFiles(rootStr, opts, extractors)) {
    const std::string abs = (root / rel).string();
    std::string content;
    if (!readFile(abs, content)) {
      if (opts.verbose) llvm::WithColor::note() << "unreadable, skipped: " << rel << "\n";
      continue;
    }
    if (content.find('\0') != std::string::npos) {
      if (opts.verbose) llvm::WithColor::note() << "binary content, skipped: " << rel << "\n";
      continue;
    }
    for (auto& extractor : extractors) {
      if (!extractor->handles(rel)) continue;
      if (!extractor->extractFile(abs, rel, content, entities)) ++skipped;
      break;
    }
  }
  if (opts.verbose && skipped > 0)
    llvm::WithColor::note() << skipped << " file(s) contributed no entities\n";

  std::stable_sort(entities.begin(), entities.end(), [](const Entity& a, const Entity& b) {
    if (a.filePath != b.filePath) return a.filePath < b.filePath;
    return a.line < b.line;
  });
  return entities;
}

} // namespace aicw
