#include "internal/util/path.hpp"

#include <cassert>
#include <iostream>
#include <stdexcept>

namespace {

using namespace dockyard::util;

void TestNormalizeCollapsesDotsAndSlashes() {
  assert(NormalizeContainerPath("/") == "/");
  assert(NormalizeContainerPath("//app//src/") == "/app/src");
  assert(NormalizeContainerPath("/app/./src/../lib") == "/app/lib");
  assert(NormalizeContainerPath("app") == "/app");

  bool threw = false;
  try {
    NormalizeContainerPath("/app/../../etc");
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);
}

void TestJoinResolvesRelativeAgainstBase() {
  assert(JoinContainerPath("/app", "src/main.c") == "/app/src/main.c");
  assert(JoinContainerPath("/app", "/etc/hosts") == "/etc/hosts");
  assert(JoinContainerPath("/app/bin", "..") == "/app");
  assert(JoinContainerPath("", "x") == "/x");
}

void TestWithinIsSegmentWise() {
  assert(IsWithin("/app", "/app"));
  assert(IsWithin("/app/data/x", "/app"));
  assert(!IsWithin("/apple", "/app"));
  assert(IsWithin("/anything", "/"));

  assert(RelativeTo("/app/data/x", "/app") == "data/x");
  assert(RelativeTo("/app", "/app").empty());
  assert(RelativeTo("/etc/hosts", "/") == "etc/hosts");
}

void TestDepthAndBaseName() {
  assert(PathDepth("/") == 0);
  assert(PathDepth("/app/data") == 2);
  assert(PathSegments("/a/b/c").size() == 3);
  assert(BaseName("/app/main.c") == "main.c");
  assert(NormalizeRelativePath("./src//a/../b.c") == "src/b.c");
}

} // namespace

int main() {
  TestNormalizeCollapsesDotsAndSlashes();
  TestJoinResolvesRelativeAgainstBase();
  TestWithinIsSegmentWise();
  TestDepthAndBaseName();

  std::cout << "dockyard_unit_path: pass\n";
  return 0;
}
