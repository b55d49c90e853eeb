#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "tally_reports/apps/report_cli_support.h"

namespace tally_reports::apps {

namespace {

std::filesystem::path WriteFile(const std::string& name, const std::string& content) {
    const auto path = std::filesystem::temp_directory_path() / name;
    std::ofstream out(path);
    out << content;
    return path;
}

std::string ReadFile(const std::filesystem::path& path) {
    std::ifstream in(path);
    std::stringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

const char* kFixture = R"({
  "companies": [{"guid": "g1", "alterid": "7", "name": "Acme Books"}],
  "vouchers": [
    {"company_guid": "g1", "company_alterid": "7", "vch_mst_id": "V1", "vch_no": "1",
     "vch_date": "2024-04-10", "led_name": "Cash", "vch_dr_amt": "10"},
    {"company_guid": "g1", "company_alterid": "7", "vch_mst_id": "V1", "vch_no": "1",
     "vch_date": "2024-04-10", "led_name": "Sales", "vch_cr_amt": "10"}
  ]
})";

}  // namespace

TEST(ReportCliSupportTest, BootstrapsFromFixtureAndConfig) {
    const auto fixture = WriteFile("tally_reports_cli_fixture.json", kFixture);
    const auto config = WriteFile("tally_reports_cli_config.yaml",
                                  "report:\n  inconsistency_policy: report\n"
                                  "storage:\n  ledgers_table:\n");
    ReportCliContext context;
    std::string error;
    ASSERT_TRUE(BootstrapReportCli(config.string(), fixture.string(), &context, &error)) << error;
    ASSERT_NE(context.store, nullptr);
    EXPECT_EQ(context.config.engine.inconsistency_policy, InconsistencyPolicy::kReport);

    CompanyRecord company;
    bool found = false;
    ASSERT_TRUE(context.store->GetCompany(CompanyRef{"g1", "7"}, &company, &found, &error));
    EXPECT_TRUE(found);
    std::vector<LegRecord> legs;
    std::vector<MalformedRow> malformed;
    ASSERT_TRUE(context.store->LoadCompanyLegs(CompanyRef{"g1", "7"}, &legs, &malformed, &error));
    EXPECT_EQ(legs.size(), 2U);

    std::filesystem::remove(fixture);
    std::filesystem::remove(config);
}

TEST(ReportCliSupportTest, BootstrapUsesEnvironmentStoreWithoutFixture) {
    setenv("TALLY_REPORTS_STORE_MODE", "in_memory", 1);
    setenv("TALLY_REPORTS_SCHEMA", "tally", 1);
    ReportCliContext context;
    std::string error;
    ASSERT_TRUE(BootstrapReportCli("", "", &context, &error)) << error;
    EXPECT_EQ(context.config.tables.schema, "tally");
    EXPECT_TRUE(context.storage_warning.empty());
    ASSERT_NE(context.sql_client, nullptr);
    unsetenv("TALLY_REPORTS_STORE_MODE");
    unsetenv("TALLY_REPORTS_SCHEMA");
}

TEST(ReportCliSupportTest, BootstrapFailsOnMissingFiles) {
    ReportCliContext context;
    std::string error;
    EXPECT_FALSE(BootstrapReportCli("/nonexistent/tally.yaml", "", &context, &error));
    EXPECT_NE(error.find("unable to open config"), std::string::npos);
    EXPECT_FALSE(BootstrapReportCli("", "/nonexistent/fixture.json", &context, &error));
    EXPECT_NE(error.find("unable to open fixture"), std::string::npos);
    EXPECT_FALSE(BootstrapReportCli("", "", nullptr, &error));
}

TEST(ReportCliSupportTest, ParsesCompanyAndDateArguments) {
    ArgMap args{{"company-guid", "g1"}, {"company-alterid", "7"}, {"from", "01-04-2024"},
                {"to", "2024-13-01"}};
    CompanyRef company;
    std::string error;
    ASSERT_TRUE(ParseCompanyArgs(args, &company, &error));
    EXPECT_EQ(company.guid, "g1");
    EXPECT_EQ(company.alterid, "7");

    CalendarDate date;
    ASSERT_TRUE(ParseDateArg(args, "from", &date, &error));
    EXPECT_EQ(date.ToIso(), "2024-04-01");
    EXPECT_FALSE(ParseDateArg(args, "to", &date, &error));
    EXPECT_EQ(error, "invalid date for --to: 2024-13-01");
    EXPECT_FALSE(ParseDateArg(args, "as-on", &date, &error));
    EXPECT_EQ(error, "--as-on is required");

    args.erase("company-alterid");
    EXPECT_FALSE(ParseCompanyArgs(args, &company, &error));
    EXPECT_NE(error.find("--company-alterid"), std::string::npos);
}

TEST(ReportCliSupportTest, EmitsPayloadAndMetricsToFiles) {
    const auto root = std::filesystem::temp_directory_path() / "tally_reports_emit_test";
    std::filesystem::remove_all(root);
    ArgMap args{{"output", (root / "report.json").string()},
                {"metrics-output", (root / "metrics.prom").string()}};
    std::string error;
    ASSERT_TRUE(EmitCliOutput(args, "{\"ok\": true}\n", &error)) << error;
    EXPECT_EQ(ReadFile(root / "report.json"), "{\"ok\": true}\n");
    EXPECT_TRUE(std::filesystem::exists(root / "metrics.prom"));
    std::filesystem::remove_all(root);
}

}  // namespace tally_reports::apps
