#include <string>

#include <gtest/gtest.h>

#include "tally_reports/core/structured_log.h"

namespace tally_reports {

TEST(StructuredLogTest, ParsesLevelNamesCaseInsensitively) {
    EXPECT_EQ(ParseLogLevel("DEBUG"), LogLevel::kDebug);
    EXPECT_EQ(ParseLogLevel("Warning"), LogLevel::kWarn);
    EXPECT_EQ(ParseLogLevel("error"), LogLevel::kError);
    EXPECT_EQ(ParseLogLevel("verbose"), LogLevel::kInfo);
    EXPECT_STREQ(LogLevelName(ParseLogLevel("warning")), "warn");
}

TEST(StructuredLogTest, FiltersBelowConfiguredLevelAndEscapesValues) {
    ReportRuntimeConfig runtime;
    runtime.log_level = "warn";
    runtime.log_sink = "stderr";

    testing::internal::CaptureStderr();
    EmitStructuredLog(&runtime, "ledger_report_cli", "info", "skipped");
    EmitStructuredLog(&runtime, "ledger_report_cli", "error", "report_failed",
                      {{"ledger", "Acme \"North\""}, {"detail", "line1\nline2"}});
    const std::string output = testing::internal::GetCapturedStderr();

    EXPECT_EQ(output.find("skipped"), std::string::npos);
    EXPECT_NE(output.find(" level=error app=ledger_report_cli event=report_failed"),
              std::string::npos);
    EXPECT_NE(output.find(" ledger=\"Acme \\\"North\\\"\""), std::string::npos);
    EXPECT_NE(output.find(" detail=\"line1\\nline2\"\n"), std::string::npos);
}

TEST(StructuredLogTest, RoutesToStdoutWhenConfigured) {
    ReportRuntimeConfig runtime;
    runtime.log_level = "debug";
    runtime.log_sink = "stdout";

    testing::internal::CaptureStdout();
    EmitStructuredLog(&runtime, "ledger_list_cli", "debug", "ledgers_listed");
    const std::string output = testing::internal::GetCapturedStdout();
    EXPECT_EQ(output.rfind("ts_ns=", 0), 0U);
    EXPECT_NE(output.find("event=ledgers_listed"), std::string::npos);
}

}  // namespace tally_reports
