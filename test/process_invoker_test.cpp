#include <fcntl.h>
#include <unistd.h>
#include <cstdlib>

#include <gtest/gtest.h>
#include <lmsjudge/paths.h>
#include <lmsjudge/invoker.h>
#include <lmsjudge/dispatcher.h>

namespace {

bool HasCommand(const std::string& name) {
  return std::system(("command -v " + name + " >/dev/null 2>&1").c_str()) == 0;
}

#define REQUIRE_COMMAND(name) \
  if (!HasCommand(name)) GTEST_SKIP() << name << " not available"

// forces the dispatcher to simulate stdin
class NoStdinInvoker : public ProcessInvoker {
 public:
  bool SupportsStdin(Language) const override { return false; }
};

} // namespace

class ProcessInvokerTest : public ::testing::Test {
 protected:
  void TearDown() override {
    kInvokeWallLimit = orig_wall_limit_;
    // every box is removed after its invocation
    if (fs::exists(kBoxRoot)) EXPECT_TRUE(fs::is_empty(kBoxRoot));
  }

  ProcessInvoker invoker;
  long orig_wall_limit_ = kInvokeWallLimit;
};

TEST_F(ProcessInvokerTest, CEcho) {
  REQUIRE_COMMAND("gcc");
  auto res = invoker.Invoke(Language::C, R"(#include <stdio.h>
int main() { int a, b; scanf("%d%d", &a, &b); printf("%d\n", a + b); })", "3 4\n");
  EXPECT_FALSE(res.error) << *res.error;
  EXPECT_EQ(res.output, "7\n");
  ASSERT_TRUE(res.memory_kb);
  EXPECT_GT(*res.memory_kb, 0);
}

TEST_F(ProcessInvokerTest, CppCompileError) {
  REQUIRE_COMMAND("g++");
  auto res = invoker.Invoke(Language::CPP, "int main() { return x; }", "");
  ASSERT_TRUE(res.error);
  EXPECT_NE(res.error->find("x"), std::string::npos);
  EXPECT_EQ(res.output, "");
}

TEST_F(ProcessInvokerTest, NonZeroExit) {
  REQUIRE_COMMAND("g++");
  auto res = invoker.Invoke(Language::CPP, R"(#include <cstdio>
int main() { puts("half"); return 3; })", "");
  ASSERT_TRUE(res.error);
  EXPECT_EQ(*res.error, "Exited with status 3");
  EXPECT_EQ(res.output, "half\n");
}

TEST_F(ProcessInvokerTest, Signal) {
  REQUIRE_COMMAND("gcc");
  auto res = invoker.Invoke(Language::C, "#include <stdlib.h>\nint main() { abort(); }", "");
  ASSERT_TRUE(res.error);
  EXPECT_NE(res.error->find("signal"), std::string::npos);
}

TEST_F(ProcessInvokerTest, WallLimitKill) {
  REQUIRE_COMMAND("gcc");
  kInvokeWallLimit = 300;
  auto res = invoker.Invoke(Language::C, "int main() { for (;;); }", "");
  ASSERT_TRUE(res.error);
  EXPECT_NE(res.error->find("killed"), std::string::npos);
}

TEST_F(ProcessInvokerTest, PythonStdin) {
  REQUIRE_COMMAND("python3");
  auto res = invoker.Invoke(Language::PYTHON, "a = input()\nb = input()\nprint(int(a) * int(b))\n", "6\n7\n");
  EXPECT_FALSE(res.error) << *res.error;
  EXPECT_EQ(res.output, "42\n");
}

TEST_F(ProcessInvokerTest, PythonStderrOnFailure) {
  REQUIRE_COMMAND("python3");
  auto res = invoker.Invoke(Language::PYTHON, "print('x')\nraise ValueError('bad value')\n", "");
  ASSERT_TRUE(res.error);
  EXPECT_NE(res.error->find("bad value"), std::string::npos);
  EXPECT_EQ(res.output, "x\n");
}

TEST_F(ProcessInvokerTest, PythonPreambleThroughDispatcher) {
  REQUIRE_COMMAND("python3");
  ExecutionDispatcher dispatcher(invoker);
  std::string code = PythonInputPreamble("1\n2\n") +
      "print(input())\nprint(input())\nprint(repr(input()))\n";
  auto res = invoker.Invoke(Language::PYTHON, code, "");
  EXPECT_FALSE(res.error) << *res.error;
  EXPECT_EQ(res.output, "1\n2\n''\n");
  auto outcome = dispatcher.Execute("print(input())", Language::PYTHON, "9\n", 10000);
  EXPECT_EQ(outcome.status, ExecutionStatus::SUCCESS);
  EXPECT_EQ(outcome.output, "9\n");
}

TEST_F(ProcessInvokerTest, PythonPreambleAstralInput) {
  REQUIRE_COMMAND("python3");
  NoStdinInvoker no_stdin;
  ExecutionDispatcher dispatcher(no_stdin);
  const std::string smiley = "\xf0\x9f\x98\x80";
  auto outcome = dispatcher.Execute("print(input())", Language::PYTHON, smiley + "\n", 10000);
  EXPECT_EQ(outcome.status, ExecutionStatus::SUCCESS) << outcome.error;
  EXPECT_EQ(outcome.output, smiley + "\n");
}

TEST_F(ProcessInvokerTest, DescriptorsNotInherited) {
  REQUIRE_COMMAND("python3");
  int fd = open("/dev/null", O_RDONLY);
  ASSERT_GE(fd, 0);
  ASSERT_EQ(dup2(fd, 57), 57);
  auto res = invoker.Invoke(Language::PYTHON,
      "import os\nprint(os.path.exists('/proc/self/fd/57'))\n", "");
  close(57);
  close(fd);
  EXPECT_FALSE(res.error) << *res.error;
  EXPECT_EQ(res.output, "False\n");
}

TEST_F(ProcessInvokerTest, Unsupported) {
  auto res = invoker.Invoke(Language::UNSUPPORTED, "x", "");
  ASSERT_TRUE(res.error);
  EXPECT_EQ(*res.error, "Unsupported language");
}
