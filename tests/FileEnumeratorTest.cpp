#include "discovery/FileEnumerator.hpp"
#include "support/ScanError.hpp"
#include "TestTree.hpp"

#include "llvm/Support/FileSystem.h"
#include <gtest/gtest.h>

#include <algorithm>

using namespace skscan;
using skscan::test::TestTree;

static std::vector<std::string> sorted(std::vector<std::string> v) {
  std::sort(v.begin(), v.end());
  return v;
}

TEST(FileEnumeratorTest, MissingRootIsPathNotFound) {
  TestTree tree;
  auto e = FileEnumerator::create(tree.path("does/not/exist"));
  ASSERT_FALSE(static_cast<bool>(e));
  EXPECT_EQ(ScanErrc::PathNotFound, takeErrorKind(e.takeError()));
}

TEST(FileEnumeratorTest, EmptyRootIsPathNotFound) {
  auto e = FileEnumerator::create("");
  ASSERT_FALSE(static_cast<bool>(e));
  EXPECT_EQ(ScanErrc::PathNotFound, takeErrorKind(e.takeError()));
}

TEST(FileEnumeratorTest, FileRootIsNotADirectory) {
  TestTree tree;
  std::string file = tree.write("Program.cs", "class P {}\n");
  auto e = FileEnumerator::create(file);
  ASSERT_FALSE(static_cast<bool>(e));
  EXPECT_EQ(ScanErrc::NotADirectory, takeErrorKind(e.takeError()));
}

TEST(FileEnumeratorTest, FindsSourceFilesRecursively) {
  TestTree tree;
  std::string a = tree.write("Program.cs", "");
  std::string b = tree.write("Controllers/ProductsController.cs", "");
  std::string c = tree.write("Services/Deep/Nested/TokenService.CS", "");
  tree.write("appsettings.json", "{}");
  tree.write("README.md", "");
  tree.write("Services/Notes.cs.txt", "");

  auto e = FileEnumerator::create(tree.root());
  ASSERT_TRUE(static_cast<bool>(e));
  EXPECT_EQ(sorted({a, b, c}), sorted(e->collect()));
}

TEST(FileEnumeratorTest, ExcludedDirectoriesAtAnyDepth) {
  TestTree tree;
  std::string keep = tree.write("src/Api/Startup.cs", "");
  tree.write("bin/Debug/Generated.cs", "");
  tree.write("obj/Release/net8.0/AssemblyInfo.cs", "");
  tree.write("src/Api/obj/Api.AssemblyInfo.cs", "");
  tree.write("src/Api/BIN/Copy.cs", "");
  tree.write("packages/Newtonsoft.Json/Src.cs", "");
  tree.write("src/web/node_modules/x/y.cs", "");
  tree.write(".git/hooks/Hook.cs", "");
  std::string binary = tree.write("src/Binary/Reader.cs", "");

  auto e = FileEnumerator::create(tree.root());
  ASSERT_TRUE(static_cast<bool>(e));
  EXPECT_EQ(sorted({keep, binary}), sorted(e->collect()));
}

TEST(FileEnumeratorTest, RootInsideExcludedDirYieldsNothing) {
  TestTree tree;
  std::string root = tree.mkdir("bin/project");
  tree.write("bin/project/App.cs", "");

  auto e = FileEnumerator::create(root);
  ASSERT_TRUE(static_cast<bool>(e));
  EXPECT_TRUE(e->collect().empty());

  auto upper = FileEnumerator::create(tree.mkdir("Work/OBJ"));
  ASSERT_TRUE(static_cast<bool>(upper));
  tree.write("Work/OBJ/Gen.cs", "");
  EXPECT_TRUE(upper->collect().empty());
}

TEST(FileEnumeratorTest, ExcludedSegmentMatchesWholeNamesOnly) {
  TestTree tree;
  std::string root = tree.mkdir("binaries/project");
  std::string f = tree.write("binaries/project/App.cs", "");

  auto e = FileEnumerator::create(root);
  ASSERT_TRUE(static_cast<bool>(e));
  EXPECT_EQ(std::vector<std::string>{f}, e->collect());
}

TEST(FileEnumeratorTest, CustomExtensionsAndExclusions) {
  TestTree tree;
  std::string razor = tree.write("Pages/Index.cshtml", "");
  std::string cs = tree.write("Pages/Index.cshtml.cs", "");
  std::string gen = tree.write("Generated/Auto.cs", "");
  std::string obj = tree.write("obj/Keep.cs", "");

  EnumerateOptions opts;
  opts.extensions = {".cs", ".CSHTML"};
  opts.excludedDirs = {"generated"};
  auto e = FileEnumerator::create(tree.root(), opts);
  ASSERT_TRUE(static_cast<bool>(e));
  EXPECT_EQ(sorted({razor, cs, obj}), sorted(e->collect()));
  (void)gen;
}

TEST(FileEnumeratorTest, ForEachFileMatchesCollect) {
  TestTree tree;
  tree.write("A.cs", "");
  tree.write("B/C.cs", "");
  auto e = FileEnumerator::create(tree.root());
  ASSERT_TRUE(static_cast<bool>(e));

  std::vector<std::string> visited;
  e->forEachFile([&](llvm::StringRef p) { visited.push_back(p.str()); });
  EXPECT_EQ(sorted(e->collect()), sorted(visited));
  EXPECT_EQ(2u, visited.size());
}

TEST(FileEnumeratorTest, SymlinkedFilesAreFollowedDirectoriesAreNot) {
  TestTree tree;
  std::string real = tree.write("outside/Real.cs", "");
  std::string root = tree.mkdir("root");
  std::string own = tree.write("root/Own.cs", "");
  std::string fileLink = tree.path("root/Linked.cs");
  std::string dirLink = tree.path("root/loop");
  ASSERT_FALSE(llvm::sys::fs::create_link(real, fileLink));
  ASSERT_FALSE(llvm::sys::fs::create_link(root, dirLink));

  auto e = FileEnumerator::create(root);
  ASSERT_TRUE(static_cast<bool>(e));
  EXPECT_EQ(sorted({own, fileLink}), sorted(e->collect()));
}
