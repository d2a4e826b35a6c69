/**
 * @file report_test.cpp
 * @brief 结果报告格式测试
 */

#include <gtest/gtest.h>

#include <fstream>
#include <sstream>

#include "pybox.h"
#include "test_helpers.h"

using namespace pybox;

namespace {

ExecutionOutcome runtime_outcome() {
    ExecutionOutcome o;
    o.status = OutcomeStatus::RUNTIME_ERROR;
    o.error_code = ErrorCode::RUNTIME_ERROR;
    o.message = "ValueError: x";
    o.stdout_data = "<b>partial</b>\n";
    o.stderr_data = "Traceback (most recent call last):\n";
    o.stderr_truncated = true;
    o.duration_ms = 42;
    o.context_id = "ctx_7_3";
    o.final_state = RequestState::CLASSIFIED;

    Traceback tb;
    tb.exception_type = "ValueError";
    tb.message = "x";
    tb.line = 1;
    tb.frames.push_back({"/tmp/w/main.py", 1, "<module>", "raise ValueError(\"x\")"});
    o.traceback = tb;
    return o;
}

} // namespace

TEST(ReportTest, HeaderLines) {
    std::string text = format_outcome(runtime_outcome());
    std::istringstream in(text);
    std::string line;

    std::getline(in, line);
    EXPECT_EQ(line, "status RUNTIME_ERROR");
    std::getline(in, line);
    EXPECT_EQ(line, "error RUNTIME_ERROR");
    std::getline(in, line);
    EXPECT_EQ(line, "time 42");
    std::getline(in, line);
    EXPECT_EQ(line, "context ctx_7_3");
    std::getline(in, line);
    EXPECT_EQ(line, "details");
    std::getline(in, line);
    EXPECT_EQ(line, "<outcome status=\"RUNTIME_ERROR\" error=\"RUNTIME_ERROR\" time=\"42\" state=\"CLASSIFIED\">");
}

// 测试：用户输出被转义，不能破坏报告结构
TEST(ReportTest, UserOutputIsEscaped) {
    ExecutionOutcome o = runtime_outcome();
    o.stdout_data = "</stdout><outcome>\x1b[31m\"&";
    std::string text = format_outcome(o);

    EXPECT_NE(text.find("&lt;/stdout&gt;&lt;outcome&gt;\\x1b[31m&quot;&amp;"), std::string::npos);
    EXPECT_EQ(text.find("\x1b"), std::string::npos);
    EXPECT_NE(text.find("<stderr truncated=\"1\">"), std::string::npos);
    EXPECT_NE(text.find("<stdout truncated=\"0\">"), std::string::npos);
}

TEST(ReportTest, TracebackElement) {
    std::string text = format_outcome(runtime_outcome());
    EXPECT_NE(text.find("<traceback type=\"ValueError\" message=\"x\" line=\"1\" column=\"0\">"),
              std::string::npos);
    EXPECT_NE(text.find("<frame file=\"/tmp/w/main.py\" line=\"1\" function=\"&lt;module&gt;\">"
                        "raise ValueError(&quot;x&quot;)</frame>"),
              std::string::npos);
}

TEST(ReportTest, RejectedOutcomeHasNoTraceback) {
    ExecutionOutcome o;
    o.status = OutcomeStatus::POLICY_VIOLATION;
    o.error_code = ErrorCode::POLICY_DENIED;
    o.message = "package 'snake' is on the deny list";
    std::string text = format_outcome(o);
    EXPECT_NE(text.find("status POLICY_VIOLATION\nerror POLICY_DENIED\n"), std::string::npos);
    EXPECT_NE(text.find("context \n"), std::string::npos);
    EXPECT_NE(text.find("state=\"REJECTED\""), std::string::npos);
    EXPECT_EQ(text.find("<traceback"), std::string::npos);
}

TEST(ReportTest, WriteToFile) {
    test::TempDir dir;
    ASSERT_FALSE(dir.path().empty());
    std::string path = dir.path() + "/result.txt";

    ASSERT_TRUE(write_outcome_file(path, runtime_outcome()).ok());
    auto content = read_file(path);
    ASSERT_TRUE(content.ok());
    EXPECT_EQ(content.value(), format_outcome(runtime_outcome()));

    auto bad = write_outcome_file(dir.path() + "/missing/result.txt", runtime_outcome());
    ASSERT_FALSE(bad.ok());
    EXPECT_EQ(bad.error().code(), ErrorCode::FILE_WRITE_ERROR);
}
