/**
 * @file classifier_test.cpp
 * @brief 结果分类与输出缓冲测试
 *
 * stderr 样本取自 CPython 3.11 的真实输出。
 */

#include <gtest/gtest.h>

#include <csignal>

#include "pybox.h"

using namespace pybox;
using sandbox::RawExecutionResult;
using sandbox::RunStatus;

namespace {

RawExecutionResult failed_with(const std::string &stderr_text, int exit_code = 1) {
    RawExecutionResult raw;
    raw.context_id = "ctx_test_1";
    raw.status = RunStatus::RUNTIME_ERROR;
    raw.exit_code = exit_code;
    raw.stderr_data = stderr_text;
    raw.message = "exit code " + std::to_string(exit_code);
    return raw;
}

const char *SYNTAX_SAMPLE =
    "  File \"/tmp/pybox_ctx_1_2_abc/main.py\", line 1\n"
    "    def f(:\n"
    "          ^\n"
    "SyntaxError: invalid syntax\n";

const char *INDENT_SAMPLE =
    "  File \"/tmp/pybox_ctx_1_2_abc/main.py\", line 2\n"
    "    return 1\n"
    "    ^\n"
    "IndentationError: expected an indented block after function definition on line 1\n";

const char *TAB_SAMPLE =
    "  File \"/tmp/pybox_ctx_1_2_abc/main.py\", line 3\n"
    "    y = 2\n"
    "TabError: inconsistent use of tabs and spaces in indentation\n";

const char *NESTED_SAMPLE =
    "Traceback (most recent call last):\n"
    "  File \"/tmp/w/main.py\", line 7, in <module>\n"
    "    f()\n"
    "  File \"/tmp/w/main.py\", line 5, in f\n"
    "    return g({\"k\": None})\n"
    "           ^^^^^^^^^^^^^^\n"
    "  File \"/tmp/w/main.py\", line 2, in g\n"
    "    return x[\"k\"] + 1\n"
    "           ~~~~~~~^~~\n"
    "TypeError: unsupported operand type(s) for +: 'NoneType' and 'int'\n";

const char *CHAINED_SAMPLE =
    "Traceback (most recent call last):\n"
    "  File \"/tmp/w/main.py\", line 2, in <module>\n"
    "    {}[\"a\"]\n"
    "    ~~^^^^^\n"
    "KeyError: 'a'\n"
    "\n"
    "The above exception was the direct cause of the following exception:\n"
    "\n"
    "Traceback (most recent call last):\n"
    "  File \"/tmp/w/main.py\", line 4, in <module>\n"
    "    raise ValueError(\"bad value\") from e\n"
    "ValueError: bad value\n";

const char *RECURSION_SAMPLE =
    "Traceback (most recent call last):\n"
    "  File \"/tmp/w/main.py\", line 3, in <module>\n"
    "    r(0)\n"
    "  File \"/tmp/w/main.py\", line 2, in r\n"
    "    return r(n+1)\n"
    "           ^^^^^^\n"
    "  File \"/tmp/w/main.py\", line 2, in r\n"
    "    return r(n+1)\n"
    "           ^^^^^^\n"
    "  [Previous line repeated 996 more times]\n"
    "RecursionError: maximum recursion depth exceeded\n";

const char *EXEC_SYNTAX_SAMPLE =
    "Traceback (most recent call last):\n"
    "  File \"/tmp/w/main.py\", line 1, in <module>\n"
    "    exec(\"def f(:\")\n"
    "  File \"<string>\", line 1\n"
    "    def f(:\n"
    "          ^\n"
    "SyntaxError: invalid syntax\n";

const char *MEMORY_SAMPLE =
    "Traceback (most recent call last):\n"
    "  File \"/tmp/w/main.py\", line 1, in <module>\n"
    "    x = bytearray(10**10)\n"
    "        ^^^^^^^^^^^^^^^^^\n"
    "MemoryError\n";

const char *FILE_SIZE_SAMPLE =
    "Traceback (most recent call last):\n"
    "  File \"/tmp/w/main.py\", line 3, in <module>\n"
    "    f.write(b\"x\"*65536)\n"
    "OSError: [Errno 27] File too large\n";

} // namespace

//==============================================================================
// 语法错误
//==============================================================================

TEST(ClassifierTest, SyntaxErrorWithCaret) {
    ExecutionOutcome o = ResultClassifier().classify(failed_with(SYNTAX_SAMPLE));
    EXPECT_EQ(o.status, OutcomeStatus::SYNTAX_ERROR);
    EXPECT_EQ(o.error_code, ErrorCode::SYNTAX_ERROR);
    ASSERT_TRUE(o.traceback.has_value());
    EXPECT_EQ(o.traceback->exception_type, "SyntaxError");
    EXPECT_EQ(o.traceback->message, "invalid syntax");
    EXPECT_EQ(o.traceback->line, 1);
    EXPECT_EQ(o.traceback->column, 7);
    ASSERT_EQ(o.traceback->frames.size(), 1u);
    EXPECT_EQ(o.traceback->frames[0].source, "def f(:");
    EXPECT_EQ(o.traceback->frames[0].file, "/tmp/pybox_ctx_1_2_abc/main.py");
    EXPECT_TRUE(o.traceback->frames[0].function.empty());
}

TEST(ClassifierTest, IndentationAndTabErrors) {
    ExecutionOutcome indent = ResultClassifier().classify(failed_with(INDENT_SAMPLE));
    EXPECT_EQ(indent.status, OutcomeStatus::SYNTAX_ERROR);
    ASSERT_TRUE(indent.traceback.has_value());
    EXPECT_EQ(indent.traceback->exception_type, "IndentationError");
    EXPECT_EQ(indent.traceback->line, 2);
    EXPECT_EQ(indent.traceback->column, 1);

    ExecutionOutcome tab = ResultClassifier().classify(failed_with(TAB_SAMPLE));
    EXPECT_EQ(tab.status, OutcomeStatus::SYNTAX_ERROR);
    ASSERT_TRUE(tab.traceback.has_value());
    EXPECT_EQ(tab.traceback->line, 3);
    EXPECT_EQ(tab.traceback->column, 0);
    EXPECT_EQ(tab.traceback->frames[0].source, "y = 2");
}

//==============================================================================
// 运行时错误
//==============================================================================

TEST(ClassifierTest, NestedFramesSkipCaretLines) {
    ExecutionOutcome o = ResultClassifier().classify(failed_with(NESTED_SAMPLE));
    EXPECT_EQ(o.status, OutcomeStatus::RUNTIME_ERROR);
    ASSERT_TRUE(o.traceback.has_value());
    EXPECT_EQ(o.traceback->exception_type, "TypeError");
    EXPECT_EQ(o.traceback->message, "unsupported operand type(s) for +: 'NoneType' and 'int'");

    const auto &frames = o.traceback->frames;
    ASSERT_EQ(frames.size(), 3u);
    EXPECT_EQ(frames[0].function, "<module>");
    EXPECT_EQ(frames[1].function, "f");
    EXPECT_EQ(frames[1].source, "return g({\"k\": None})");
    EXPECT_EQ(frames[2].function, "g");
    EXPECT_EQ(frames[2].line, 2);
    EXPECT_EQ(frames[2].source, "return x[\"k\"] + 1");
    EXPECT_EQ(o.traceback->line, 2);
}

TEST(ClassifierTest, ChainedExceptionUsesLastBlock) {
    ExecutionOutcome o = ResultClassifier().classify(failed_with(CHAINED_SAMPLE));
    EXPECT_EQ(o.status, OutcomeStatus::RUNTIME_ERROR);
    ASSERT_TRUE(o.traceback.has_value());
    EXPECT_EQ(o.traceback->exception_type, "ValueError");
    EXPECT_EQ(o.traceback->message, "bad value");
    ASSERT_EQ(o.traceback->frames.size(), 1u);
    EXPECT_EQ(o.traceback->frames[0].line, 4);
    EXPECT_EQ(o.message, "ValueError: bad value");
}

TEST(ClassifierTest, RepeatedFramesMarkerIgnored) {
    ExecutionOutcome o = ResultClassifier().classify(failed_with(RECURSION_SAMPLE));
    EXPECT_EQ(o.status, OutcomeStatus::RUNTIME_ERROR);
    ASSERT_TRUE(o.traceback.has_value());
    EXPECT_EQ(o.traceback->exception_type, "RecursionError");
    EXPECT_EQ(o.traceback->frames.size(), 3u);
    for (const auto &f : o.traceback->frames) {
        EXPECT_EQ(f.source.find("Previous line"), std::string::npos);
    }
}

// exec() 中的语法错误发生在运行期
TEST(ClassifierTest, SyntaxErrorInsideTracebackIsRuntime) {
    ExecutionOutcome o = ResultClassifier().classify(failed_with(EXEC_SYNTAX_SAMPLE));
    EXPECT_EQ(o.status, OutcomeStatus::RUNTIME_ERROR);
    ASSERT_TRUE(o.traceback.has_value());
    EXPECT_EQ(o.traceback->exception_type, "SyntaxError");
    ASSERT_EQ(o.traceback->frames.size(), 2u);
    EXPECT_EQ(o.traceback->frames[1].file, "<string>");
    EXPECT_EQ(o.traceback->frames[1].source, "def f(:");
}

TEST(ClassifierTest, ExceptionWithoutMessage) {
    ExecutionOutcome o = ResultClassifier().classify(failed_with(
        "Traceback (most recent call last):\n"
        "  File \"/tmp/w/main.py\", line 1, in <module>\n"
        "    raise KeyboardInterrupt\n"
        "KeyboardInterrupt\n"));
    EXPECT_EQ(o.status, OutcomeStatus::RUNTIME_ERROR);
    ASSERT_TRUE(o.traceback.has_value());
    EXPECT_EQ(o.traceback->exception_type, "KeyboardInterrupt");
    EXPECT_TRUE(o.traceback->message.empty());
}

//==============================================================================
// 资源耗尽
//==============================================================================

TEST(ClassifierTest, MemoryErrorIsResourceLimit) {
    ExecutionOutcome o = ResultClassifier().classify(failed_with(MEMORY_SAMPLE));
    EXPECT_EQ(o.status, OutcomeStatus::RESOURCE_LIMIT_EXCEEDED);
    EXPECT_EQ(o.error_code, ErrorCode::RESOURCE_LIMIT_EXCEEDED);
    ASSERT_TRUE(o.traceback.has_value());
    EXPECT_EQ(o.traceback->exception_type, "MemoryError");
}

TEST(ClassifierTest, FileTooLargeIsResourceLimit) {
    ExecutionOutcome o = ResultClassifier().classify(failed_with(FILE_SIZE_SAMPLE));
    EXPECT_EQ(o.status, OutcomeStatus::RESOURCE_LIMIT_EXCEEDED);
    EXPECT_EQ(o.traceback->message, "[Errno 27] File too large");
}

// 测试：代码主动抛出的 MemoryError / OSError(ENOMEM) 是普通运行时错误
TEST(ClassifierTest, ExplicitRaiseIsRuntimeError) {
    ExecutionOutcome memory = ResultClassifier().classify(failed_with(
        "Traceback (most recent call last):\n"
        "  File \"/tmp/w/main.py\", line 1, in <module>\n"
        "    raise MemoryError\n"
        "MemoryError\n"));
    EXPECT_EQ(memory.status, OutcomeStatus::RUNTIME_ERROR);
    EXPECT_EQ(memory.error_code, ErrorCode::RUNTIME_ERROR);

    ExecutionOutcome enomem = ResultClassifier().classify(failed_with(
        "Traceback (most recent call last):\n"
        "  File \"/tmp/w/main.py\", line 1, in <module>\n"
        "    raise OSError(12, \"x\")\n"
        "OSError: [Errno 12] x\n"));
    EXPECT_EQ(enomem.status, OutcomeStatus::RUNTIME_ERROR);
}

// 测试：except 中裸 raise 重新抛出的真实 MemoryError 仍算资源耗尽
TEST(ClassifierTest, ReraisedMemoryErrorIsResourceLimit) {
    ExecutionOutcome o = ResultClassifier().classify(failed_with(
        "Traceback (most recent call last):\n"
        "  File \"/tmp/w/main.py\", line 2, in <module>\n"
        "    x = bytearray(10**10)\n"
        "        ^^^^^^^^^^^^^^^^^\n"
        "MemoryError\n"
        "\n"
        "During handling of the above exception, another exception occurred:\n"
        "\n"
        "Traceback (most recent call last):\n"
        "  File \"/tmp/w/main.py\", line 5, in <module>\n"
        "    raise\n"
        "MemoryError\n"));
    EXPECT_EQ(o.status, OutcomeStatus::RESOURCE_LIMIT_EXCEEDED);
}

TEST(ClassifierTest, EnvelopeLimitsAndTimeout) {
    RawExecutionResult raw;
    raw.status = RunStatus::TIME_LIMIT;
    raw.message = "wall clock limit of 100ms exceeded";
    raw.stderr_data = NESTED_SAMPLE;
    ExecutionOutcome timeout = ResultClassifier().classify(raw);
    EXPECT_EQ(timeout.status, OutcomeStatus::TIMEOUT);
    EXPECT_EQ(timeout.error_code, ErrorCode::TIMEOUT);
    EXPECT_FALSE(timeout.traceback.has_value());

    for (RunStatus s : {RunStatus::CPU_LIMIT, RunStatus::MEMORY_LIMIT,
                        RunStatus::OUTPUT_LIMIT, RunStatus::PROCESS_LIMIT}) {
        raw.status = s;
        EXPECT_EQ(ResultClassifier().classify(raw).status,
                  OutcomeStatus::RESOURCE_LIMIT_EXCEEDED) << sandbox::run_status_str(s);
    }
}

//==============================================================================
// 其它
//==============================================================================

TEST(ClassifierTest, CleanExitIsSuccess) {
    RawExecutionResult raw;
    raw.status = RunStatus::OK;
    raw.exit_code = 0;
    raw.stdout_data = "2\n";
    // 用户自己打印的 traceback 不影响正常退出
    raw.stderr_data = NESTED_SAMPLE;
    ExecutionOutcome o = ResultClassifier().classify(raw);
    EXPECT_EQ(o.status, OutcomeStatus::SUCCESS);
    EXPECT_EQ(o.error_code, ErrorCode::OK);
    EXPECT_EQ(o.stdout_data, "2\n");
    EXPECT_FALSE(o.traceback.has_value());
}

TEST(ClassifierTest, NonZeroExitWithoutTraceback) {
    ExecutionOutcome o = ResultClassifier().classify(failed_with("", 3));
    EXPECT_EQ(o.status, OutcomeStatus::RUNTIME_ERROR);
    EXPECT_EQ(o.message, "exit code 3");

    ExecutionOutcome pip = ResultClassifier().classify(failed_with(
        "ERROR: Could not find a version that satisfies the requirement nothing-here\n"
        "ERROR: No matching distribution found for nothing-here\n"));
    EXPECT_EQ(pip.status, OutcomeStatus::RUNTIME_ERROR);
    EXPECT_NE(pip.message.find("No matching distribution"), std::string::npos);
}

TEST(ClassifierTest, FatalSignal) {
    RawExecutionResult raw;
    raw.status = RunStatus::KILLED_BY_SIGNAL;
    raw.signal = SIGSEGV;
    raw.message = "killed by signal 11";
    ExecutionOutcome o = ResultClassifier().classify(raw);
    EXPECT_EQ(o.status, OutcomeStatus::RUNTIME_ERROR);
    EXPECT_NE(o.message.find("signal 11"), std::string::npos);
}

TEST(ClassifierTest, InternalErrorKeepsCode) {
    Error e(ErrorCode::FORK_FAILED, "Resource temporarily unavailable");
    e.with_context("ctx_9_9");
    ExecutionOutcome o = ResultClassifier().internal_error(e);
    EXPECT_EQ(o.status, OutcomeStatus::INTERNAL_ERROR);
    EXPECT_EQ(o.error_code, ErrorCode::FORK_FAILED);
    EXPECT_EQ(o.context_id, "ctx_9_9");
    EXPECT_TRUE(is_internal_code(o.error_code));
}

//==============================================================================
// 执行层结果判定
//==============================================================================

TEST(RunAnalysisTest, StatusFromWaitStatus) {
    ExecutionLimits limits;
    sandbox::CgroupStats none;

    auto analyze = [&](int status, bool timed_out, int64_t cpu_ms, int64_t mem_kb) {
        RawExecutionResult r;
        r.cpu_time_ms = cpu_ms;
        r.memory_kb = mem_kb;
        sandbox::Sandbox::analyze(r, status, timed_out, none, limits);
        return r.status;
    };
    auto exited = [](int code) { return code << 8; };

    EXPECT_EQ(analyze(exited(0), false, 10, 1000), RunStatus::OK);
    EXPECT_EQ(analyze(exited(1), false, 10, 1000), RunStatus::RUNTIME_ERROR);
    EXPECT_EQ(analyze(SIGKILL, true, 10, 1000), RunStatus::TIME_LIMIT);
    EXPECT_EQ(analyze(SIGXCPU, false, 10, 1000), RunStatus::CPU_LIMIT);
    EXPECT_EQ(analyze(SIGKILL, false, limits.cpu_time_limit_ms, 1000), RunStatus::CPU_LIMIT);
    EXPECT_EQ(analyze(SIGKILL, false, 10, limits.memory_limit_kb), RunStatus::MEMORY_LIMIT);
    EXPECT_EQ(analyze(SIGKILL, false, 10, 1000), RunStatus::KILLED_BY_SIGNAL);
    EXPECT_EQ(analyze(SIGXFSZ, false, 10, 1000), RunStatus::OUTPUT_LIMIT);
    EXPECT_EQ(analyze(SIGSYS, false, 10, 1000), RunStatus::SECCOMP_VIOLATION);
    EXPECT_EQ(analyze(SIGSEGV, false, 10, 1000), RunStatus::KILLED_BY_SIGNAL);
}

TEST(RunAnalysisTest, CgroupEvents) {
    ExecutionLimits limits;
    sandbox::CgroupStats oom;
    oom.oom_killed = true;
    RawExecutionResult r;
    sandbox::Sandbox::analyze(r, SIGKILL, false, oom, limits);
    EXPECT_EQ(r.status, RunStatus::MEMORY_LIMIT);

    sandbox::CgroupStats pids;
    pids.pids_limited = true;
    RawExecutionResult p;
    sandbox::Sandbox::analyze(p, 1 << 8, false, pids, limits);
    EXPECT_EQ(p.status, RunStatus::PROCESS_LIMIT);
}

//==============================================================================
// 输出缓冲
//==============================================================================

TEST(BoundedBufferTest, KeepsEverythingUnderLimit) {
    sandbox::BoundedBuffer buf(16);
    buf.append("hello ", 6);
    buf.append("world", 5);
    EXPECT_FALSE(buf.truncated());
    EXPECT_EQ(buf.str(), "hello world");
}

TEST(BoundedBufferTest, KeepsHeadAndTail) {
    sandbox::BoundedBuffer buf(8);
    std::string data = "ABCD";
    for (int i = 0; i < 100; ++i) data += "-";
    data += "WXYZ";
    // 分多次写入，模拟管道分段读取
    for (size_t i = 0; i < data.size(); i += 7) {
        std::string chunk = data.substr(i, 7);
        buf.append(chunk.data(), chunk.size());
    }
    EXPECT_TRUE(buf.truncated());
    EXPECT_EQ(buf.total(), data.size());
    std::string s = buf.str();
    EXPECT_EQ(s.substr(0, 4), "ABCD");
    EXPECT_EQ(s.substr(s.size() - 4), "WXYZ");
    EXPECT_NE(s.find("[100 bytes truncated]"), std::string::npos);
}
