#pragma once
#include "model/Entity.hpp"
#include "llvm/ADT/StringRef.h"
#include <string>
#include <vector>

namespace aicw {
namespace test {

// Scratch directory removed with everything in it on destruction.
class TempRepo {
public:
  TempRepo();
  ~TempRepo();
  TempRepo(const TempRepo&) = delete;
  TempRepo& operator=(const TempRepo&) = delete;

  const std::string& root() const { return Root; }

  // Writes `content` at `relativePath`, creating directories. Returns the
  // absolute path.
  std::string write(llvm::StringRef relativePath, llvm::StringRef content);

private:
  std::string Root;
};

// Two near-identical validators and one small helper.
extern const char SampleLogicJs[];
extern const char SampleRuntimeJson[];

// The same shape as SampleLogicJs, written in C++.
extern const char OrderServiceCpp[];
extern const char OrderRuntimeJson[];

// Runs the script extractor over `content` as if it lived at `relativePath`.
std::vector<Entity> extractScript(llvm::StringRef relativePath, llvm::StringRef content);

const Entity* findByName(const std::vector<Entity>& entities, llvm::StringRef name);

} // namespace test
} // namespace aicw
