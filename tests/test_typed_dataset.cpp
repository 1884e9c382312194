#include <gtest/gtest.h>

#include "CSVUtils.h"
#include "DataManager.h"
#include "TabulaExceptions.h"
#include "TestHelpers.h"
#include "TypedDataset.h"

#include <cmath>
#include <sstream>

using namespace Tabula;

namespace {
DataFrame loadText(const std::string& text, char delimiter = ',') {
    std::istringstream in(text);
    TypedDataset ds("<memory>", delimiter);
    ds.load(in);
    return ds.release();
}

const char* kSalesCsv =
    "order_date,region,amount,units,priority\n"
    "2024-01-05,North,120.5,3,true\n"
    "2024-01-06,\"South, Coastal\",80,NA,false\n"
    "2024-02-11,North,,5,true\n"
    "2024-02-12,East,42.25,2,false\n";
} // namespace

TEST(CSVUtilsTest, ReadRecordHandlesQuotesAndLineBreaks) {
    std::istringstream in("a, \"b,1\" ,\"say \"\"hi\"\"\"\n\"multi\nline\",x\n");
    CSVUtils::Record first = CSVUtils::readRecord(in, ',');
    ASSERT_EQ(first.status, CSVUtils::RecordStatus::OK);
    ASSERT_EQ(first.fields.size(), 3u);
    EXPECT_EQ(first.fields[0], "a");
    EXPECT_EQ(first.fields[1], "b,1");
    EXPECT_EQ(first.fields[2], "say \"hi\"");
    EXPECT_EQ(first.quoted[1], 1);

    CSVUtils::Record second = CSVUtils::readRecord(in, ',');
    ASSERT_EQ(second.status, CSVUtils::RecordStatus::OK);
    EXPECT_EQ(second.fields[0], "multi\nline");
    EXPECT_EQ(second.physicalLines, 2u);

    EXPECT_EQ(CSVUtils::readRecord(in, ',').status, CSVUtils::RecordStatus::END);
}

TEST(CSVUtilsTest, UnterminatedQuoteIsMalformed) {
    std::istringstream in("x,\"never closed\n");
    EXPECT_EQ(CSVUtils::readRecord(in, ',').status, CSVUtils::RecordStatus::MALFORMED);
}

TEST(CSVUtilsTest, FieldLimitIsEnforced) {
    CSVUtils::ParseLimits limits;
    limits.maxFieldBytes = 4;
    std::istringstream in("abcdefgh,1\n");
    EXPECT_EQ(CSVUtils::readRecord(in, ',', limits).status, CSVUtils::RecordStatus::LIMIT_EXCEEDED);
}

TEST(CSVUtilsTest, NormalizeHeaderNamesBlanksAndDuplicates) {
    const auto names = CSVUtils::normalizeHeader({"id", "", "id", "id"});
    ASSERT_EQ(names.size(), 4u);
    EXPECT_EQ(names[1], "Unnamed: 1");
    EXPECT_EQ(names[2], "id.1");
    EXPECT_EQ(names[3], "id.2");
}

TEST(CSVUtilsTest, MissingTokens) {
    for (const char* token : {"", "NA", "N/A", "NaN", "null", "None", "#N/A"}) {
        EXPECT_TRUE(CSVUtils::isMissingToken(token)) << token;
    }
    EXPECT_FALSE(CSVUtils::isMissingToken("0"));
    EXPECT_FALSE(CSVUtils::isMissingToken("none"));
}

TEST(TypedDatasetTest, InfersColumnTypes) {
    const DataFrame df = loadText(kSalesCsv);
    ASSERT_EQ(df.rows(), 4u);
    ASSERT_EQ(df.cols(), 5u);
    EXPECT_EQ(df.column("order_date").type, ColumnType::DATETIME);
    EXPECT_EQ(df.column("region").type, ColumnType::CATEGORICAL);
    EXPECT_EQ(df.column("amount").type, ColumnType::NUMERIC);
    // A gap forces the integer column to float, as pandas does.
    EXPECT_EQ(df.column("units").type, ColumnType::NUMERIC);
    EXPECT_EQ(df.column("priority").type, ColumnType::BOOLEAN);

    EXPECT_EQ(std::get<std::string>(df.column("region").at(1)), "South, Coastal");
    EXPECT_TRUE(df.column("amount").isMissing(2));
    EXPECT_TRUE(std::isnan(df.column("amount").numberAt(2)));
    EXPECT_TRUE(df.column("units").isMissing(1));
    EXPECT_DOUBLE_EQ(df.column("units").numberAt(2), 5.0);
    EXPECT_EQ(std::get<Timestamp>(df.column("order_date").at(0)), *parseTimestamp("2024-01-05"));
}

TEST(TypedDatasetTest, WholeNumberColumnStaysInteger) {
    const DataFrame df = loadText("id;label\n1;a\n2;b\n-3;c\n", ';');
    EXPECT_EQ(df.column("id").type, ColumnType::INTEGER);
    EXPECT_EQ(std::get<int64_t>(df.column("id").at(2)), -3);
}

TEST(TypedDatasetTest, SkipsMalformedAndOverWideRows) {
    std::istringstream in("a,b\n1,2\n3,4,5\n6\n7,8\n");
    TypedDataset ds("<memory>");
    ds.load(in);
    EXPECT_EQ(ds.rowCount(), 3u);
    EXPECT_EQ(ds.skippedRecords(), 1u);
    // Short rows are padded with missing cells.
    EXPECT_TRUE(ds.frame().column("b").isMissing(1));
}

TEST(TypedDatasetTest, HonoursBomAndBlankLines) {
    const DataFrame df = loadText("\xEF\xBB\xBFname,value\n\nx,1\n\ny,2\n");
    ASSERT_EQ(df.rows(), 2u);
    EXPECT_EQ(df.columns.front().name, "name");
}

TEST(TypedDatasetTest, SeparatorPoliciesAndOverrides) {
    std::istringstream in("code,price\n007,\"1.234,5\"\n010,\"2,0\"\n");
    TypedDataset ds("<memory>");
    ds.setNumericSeparatorPolicy(TypedDataset::NumericSeparatorPolicy::EUROPEAN);
    ds.setColumnTypeOverride("code", ColumnType::CATEGORICAL);
    ds.load(in);
    EXPECT_EQ(std::get<std::string>(ds.frame().column("code").at(0)), "007");
    EXPECT_DOUBLE_EQ(ds.frame().column("price").numberAt(0), 1234.5);

    double value = 0.0;
    EXPECT_TRUE(TypedDataset::parseNumber("1,234.5", TypedDataset::NumericSeparatorPolicy::US_THOUSANDS, value));
    EXPECT_DOUBLE_EQ(value, 1234.5);
    EXPECT_FALSE(TypedDataset::parseNumber("12abc", TypedDataset::NumericSeparatorPolicy::PLAIN, value));
}

TEST(TypedDatasetTest, EmptyInputIsADatasetError) {
    std::istringstream in("");
    TypedDataset ds("<memory>");
    EXPECT_THROW(ds.load(in), DatasetException);
}

TEST(DataManagerTest, LoadsOnceAndDescribesSchema) {
    TabulaTest::TempFile csv(".csv", kSalesCsv);
    DataManager manager(csv.path());
    EXPECT_FALSE(manager.isLoaded());

    const auto first = manager.frame();
    EXPECT_TRUE(manager.isLoaded());
    EXPECT_EQ(first.get(), manager.frame().get());
    EXPECT_NE(first.get(), manager.frame(true).get());

    const std::string schema = manager.schema();
    EXPECT_EQ(schema.rfind("Shape: 4 rows \xC3\x97 5 columns\n", 0), 0u);
    EXPECT_NE(schema.find("  - region: object (4 non-null, 3 unique) | Examples: ['North', 'South, Coastal', 'East']"),
              std::string::npos);
    EXPECT_NE(schema.find("  - amount: float64 (3 non-null, 3 unique)"), std::string::npos);
}

TEST(DataManagerTest, WideNumericColumnsShowARange) {
    const std::string schema = DataManager::describeSchema(TabulaTest::sequenceFrame(12));
    EXPECT_NE(schema.find("  - id: int64 (12 non-null, 12 unique) | Range: [0, 11]"), std::string::npos);
    EXPECT_NE(schema.find("  - value: float64 (12 non-null, 12 unique) | Range: [0.0, 16.5]"), std::string::npos);
}

TEST(DataManagerTest, MissingFileIsDataLoadError) {
    DataManager manager("/nonexistent/tabula/data.csv");
    try {
        manager.frame();
        FAIL() << "expected DataLoadError";
    } catch (const DataLoadError& e) {
        EXPECT_EQ(e.code(), ErrorCode::DATA_LOAD_ERROR);
        EXPECT_EQ(std::string(e.what()), "Data file not found");
        EXPECT_EQ(e.details(), "File: /nonexistent/tabula/data.csv");
    }
    EXPECT_FALSE(manager.isLoaded());
}
