// File: tests/ingest/transaction_table_test.cpp
#include "ingest/transaction_table.hpp"
#include "ingest/context_enricher.hpp"
#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace profitlift {
namespace {

std::vector<TransactionRecord> ReadText(const std::string& text) {
    std::istringstream in(text);
    return TransactionTable::Read(in);
}

// ============================================================================
// Line splitting
// ============================================================================

TEST(TransactionTableTest, SplitLineHandlesQuotes) {
    auto fields = TransactionTable::SplitLine(R"(T1,"Bread, white","say ""hi""",3.5)");
    ASSERT_EQ(4u, fields.size());
    EXPECT_EQ("T1", fields[0]);
    EXPECT_EQ("Bread, white", fields[1]);
    EXPECT_EQ("say \"hi\"", fields[2]);
    EXPECT_EQ("3.5", fields[3]);
}

TEST(TransactionTableTest, SplitLineFlagsUnterminatedQuote) {
    bool malformed = false;
    TransactionTable::SplitLine("T1,\"open", ',', &malformed);
    EXPECT_TRUE(malformed);
}

TEST(TransactionTableTest, SplitLineCustomDelimiter) {
    auto fields = TransactionTable::SplitLine("a;b;;c", ';');
    ASSERT_EQ(4u, fields.size());
    EXPECT_EQ("", fields[2]);
}

// ============================================================================
// Reading
// ============================================================================

TEST(TransactionTableTest, GroupsRowsByTransaction) {
    auto records = ReadText(
        "transaction_id,timestamp,store_id,item_id,price,quantity,margin_pct,category\n"
        "T1,2024-11-12 09:30:00,S1,bread,3.0,2,0.2,bakery\n"
        "T2,2024-11-12 19:00:00,S2,milk,2.0,,,\n"
        "T1,2024-11-12 09:30:00,S1,butter,4.5,1,,dairy\n");

    ASSERT_EQ(2u, records.size());

    const auto& t1 = records[0];
    EXPECT_EQ("T1", t1.transaction_id);
    EXPECT_EQ("S1", t1.store_id);
    ASSERT_EQ(2u, t1.items.size());
    EXPECT_EQ("bread", t1.items[0].item_id);
    EXPECT_EQ(2u, t1.items[0].quantity);
    ASSERT_TRUE(t1.items[0].margin_pct.has_value());
    EXPECT_DOUBLE_EQ(0.2, *t1.items[0].margin_pct);
    EXPECT_EQ("bakery", t1.items[0].category.value_or(""));
    EXPECT_FALSE(t1.items[1].margin_pct.has_value());
    EXPECT_DOUBLE_EQ(4.5, t1.items[1].price);

    const auto& t2 = records[1];
    EXPECT_EQ("T2", t2.transaction_id);
    EXPECT_EQ(1u, t2.items[0].quantity);
    EXPECT_FALSE(t2.items[0].category.has_value());
}

TEST(TransactionTableTest, EnrichesMissingContextFields) {
    auto records = ReadText(
        "transaction_id,timestamp,store_id,item_id,price\n"
        "T1,2024-11-16 19:00:00,S1,sweets,5\n");

    ASSERT_EQ(1u, records.size());
    EXPECT_EQ("evening", records[0].time_bin);
    EXPECT_EQ("weekend", records[0].weekday_weekend);
    EXPECT_EQ(4, records[0].quarter);
    EXPECT_EQ("diwali", records[0].festival.value_or(""));
}

TEST(TransactionTableTest, KeepsSuppliedContextFields) {
    auto records = ReadText(
        "Transaction_ID,Timestamp,Store_ID,Item_ID,Price,Time_Bin,Weekday_Weekend,Quarter\n"
        "T1,1700000000,S1,tea,1.5,Morning,Weekday,2\n");

    ASSERT_EQ(1u, records.size());
    EXPECT_EQ(1700000000, records[0].timestamp);
    EXPECT_EQ("morning", records[0].time_bin);
    EXPECT_EQ("weekday", records[0].weekday_weekend);
    EXPECT_EQ(2, records[0].quarter);
}

TEST(TransactionTableTest, SkipsBlankLinesAndByteOrderMark) {
    auto records = ReadText(
        "\xEF\xBB\xBFtransaction_id,timestamp,store_id,item_id,price\n"
        "\n"
        "T1,1700000000,S1,tea,1.5\n"
        "   \n");
    EXPECT_EQ(1u, records.size());
}

TEST(TransactionTableTest, MissingRequiredColumnThrows) {
    EXPECT_THROW(ReadText("transaction_id,timestamp,store_id,item_id\nT1,0,S1,a\n"),
                 std::runtime_error);
}

TEST(TransactionTableTest, EmptyInputThrows) {
    EXPECT_THROW(ReadText(""), std::runtime_error);
}

TEST(TransactionTableTest, HeaderOnlyYieldsNoRecords) {
    EXPECT_TRUE(ReadText("transaction_id,timestamp,store_id,item_id,price\n").empty());
}

TEST(TransactionTableTest, BadValuesNameTheRow) {
    try {
        ReadText("transaction_id,timestamp,store_id,item_id,price\n"
                 "T1,1700000000,S1,tea,1.5\n"
                 "T2,1700000000,S1,tea,cheap\n");
        FAIL() << "Expected std::runtime_error";
    } catch (const std::runtime_error& e) {
        EXPECT_NE(std::string::npos, std::string(e.what()).find("row 3"));
    }

    EXPECT_THROW(ReadText("transaction_id,timestamp,store_id,item_id,price\n"
                          "T1,not-a-time,S1,tea,1.5\n"),
                 std::runtime_error);
    EXPECT_THROW(ReadText("transaction_id,timestamp,store_id,item_id,price,quarter\n"
                          "T1,1700000000,S1,tea,1.5,5\n"),
                 std::runtime_error);
    EXPECT_THROW(ReadText("transaction_id,timestamp,store_id,item_id,price\n"
                          "T1,1700000000,S1,\"tea,1.5\n"),
                 std::runtime_error);
}

TEST(TransactionTableTest, ReadFileMissingPathThrows) {
    EXPECT_THROW(TransactionTable::ReadFile("/nonexistent/profitlift/input.csv"),
                 std::runtime_error);
}

TEST(TransactionTableTest, ReadFileParsesCsv) {
    std::string path = "/tmp/profitlift_table_test.csv";
    {
        std::ofstream out(path);
        out << "transaction_id,timestamp,store_id,item_id,price,discount_flag\n"
            << "T1,2024-01-08 09:00:00,S1,bread,3.0,1\n"
            << "T1,2024-01-08 09:00:00,S1,butter,4.0,0\n";
    }

    auto records = TransactionTable::ReadFile(path);
    ASSERT_EQ(1u, records.size());
    EXPECT_EQ(2u, records[0].items.size());
    EXPECT_TRUE(records[0].discount_flag);

    std::filesystem::remove(path);
}

} // namespace
} // namespace profitlift
