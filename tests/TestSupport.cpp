#include "TestSupport.hpp"
#include "scanner/Extractor.hpp"
#include "support/FileIO.hpp"

#include <gtest/gtest.h>
#include "llvm/ADT/SmallString.h"
#include "llvm/Support/FileSystem.h"
#include "llvm/Support/Path.h"
#include "llvm/Support/raw_ostream.h"

namespace aicw {
namespace test {

const char SampleLogicJs[] = R"JS(function validateOrderPayload(payload) {
  if (payload == null) {
    throw new Error("invalid payload");
  }
  if (!payload.orderId) {
    throw new Error("invalid payload");
  }
  if (!payload.items) {
    throw new Error("invalid payload");
  }

  const data = payload;
  const result = {};
  result.orderId = data.orderId;
  result.itemCount = data.items.length;
  return result;
}

const validateOrderRequest = (data) => {
  if (data == null) {
    throw new Error("invalid payload");
  }
  if (!data.orderId) {
    throw new Error("invalid payload");
  }
  if (!data.items) {
    throw new Error("invalid payload");
  }

  const input = data;
  const response = {};
  response.orderId = input.orderId;
  response.itemCount = input.items.length;
  return response;
};

function helper(flag) {
  if (flag) {
    return true;
  }
  return false;
}
)JS";

const char SampleRuntimeJson[] = R"({
  "functions": {
    "sample_logic.validateOrderPayload": {"invocations": 1200, "last_invoked_at": "2026-09-30T12:00:00Z"},
    "sample_logic.validateOrderRequest": 800,
    "helper": {"count": 0}
  }
})";

const char OrderServiceCpp[] = R"CPP(struct Order { int orderId; int itemCount; };
struct Payload { int orderId; int items; bool valid; };

class InvalidPayload {
public:
  explicit InvalidPayload(const char* message) : message_(message) {}
  const char* message_;
};

Order validateOrderRequest(const Payload* payload) {
  if (payload == nullptr) throw InvalidPayload("invalid payload");
  if (payload->orderId <= 0) throw InvalidPayload("invalid payload");
  if (payload->items <= 0) throw InvalidPayload("invalid payload");
  const Payload* data = payload;
  Order result;
  result.orderId = data->orderId;
  result.itemCount = data->items;
  return result;
}

Order validateOrderPayload(const Payload* request) {
  if (request == nullptr) throw InvalidPayload("invalid payload");
  if (request->orderId <= 0) throw InvalidPayload("invalid payload");
  if (request->items <= 0) throw InvalidPayload("invalid payload");
  const Payload* input = request;
  Order response;
  response.orderId = input->orderId;
  response.itemCount = input->items;
  return response;
}

bool legacyHelper(bool flag) {
  if (flag) {
    return true;
  }
  return false;
}
)CPP";

const char OrderRuntimeJson[] = R"([
  {"name": "service.validateOrderRequest", "invocations": 1200},
  {"function": "validateOrderPayload", "count": "800"},
  {"name": "legacyHelper", "invocations": 0}
])";

TempRepo::TempRepo() {
  llvm::SmallString<128> dir;
  if (auto ec = llvm::sys::fs::createUniqueDirectory("aicw-test", dir))
    ADD_FAILURE() << "cannot create temp dir: " << ec.message();
  Root = std::string(dir.str());
}

TempRepo::~TempRepo() {
  if (Root.empty()) return;
  if (auto ec = llvm::sys::fs::remove_directories(Root, /*IgnoreErrors=*/false))
    llvm::errs() << "cannot remove " << Root << ": " << ec.message() << "\n";
}

std::string TempRepo::write(llvm::StringRef relativePath, llvm::StringRef content) {
  llvm::SmallString<256> path(Root);
  llvm::sys::path::append(path, relativePath);
  std::string error;
  if (!writeFile(std::string(path.str()), content.str(), &error))
    ADD_FAILURE() << error;
  return std::string(path.str());
}

std::vector<Entity> extractScript(llvm::StringRef relativePath, llvm::StringRef content) {
  auto extractor = makeScriptExtractor();
  std::vector<Entity> out;
  EXPECT_TRUE(extractor->extractFile("/virtual/" + relativePath.str(), relativePath.str(),
                                     content, out));
  return out;
}

const Entity* findByName(const std::vector<Entity>& entities, llvm::StringRef name) {
  for (const auto& e : entities)
    if (e.name == name) return &e;
  return nullptr;
}

} // namespace test
} // namespace aicw
