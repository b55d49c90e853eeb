#include <string>

#include <gtest/gtest.h>

#include "tally_reports/core/sql_client.h"

namespace tally_reports {

TEST(InMemorySqlClientTest, QueriesRowsByColumnValue) {
    InMemorySqlClient client;
    std::string error;
    ASSERT_TRUE(client.InsertRow("vouchers", SqlRow{{"company_guid", "g1"}, {"vch_no", "1"}},
                                 &error));
    ASSERT_TRUE(client.InsertRow("vouchers", SqlRow{{"company_guid", "g2"}, {"vch_no", "2"}},
                                 &error));
    ASSERT_TRUE(client.InsertRow("vouchers", SqlRow{{"company_guid", "g1"}, {"vch_no", "3"}},
                                 &error));

    const auto rows = client.QueryRows("vouchers", "company_guid", "g1", &error);
    ASSERT_EQ(rows.size(), 2U);
    EXPECT_EQ(rows[0].at("vch_no"), "1");
    EXPECT_EQ(rows[1].at("vch_no"), "3");
    EXPECT_EQ(client.QueryAllRows("vouchers", &error).size(), 3U);
    EXPECT_TRUE(client.QueryRows("missing", "company_guid", "g1", &error).empty());
    EXPECT_TRUE(error.empty());
}

TEST(InMemorySqlClientTest, RejectsEmptyTableOrRow) {
    InMemorySqlClient client;
    std::string error;
    EXPECT_FALSE(client.InsertRow("", SqlRow{{"k", "v"}}, &error));
    EXPECT_EQ(error, "empty table");
    EXPECT_FALSE(client.InsertRow("vouchers", SqlRow{}, &error));
    EXPECT_EQ(error, "empty row");
    EXPECT_TRUE(client.Ping(&error));
}

}  // namespace tally_reports
