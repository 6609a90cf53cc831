// ╔══════════════════════════════════════════════════════════════════════════════╗
// ║  Tabula - Result Set Unit Tests                                              ║
// ╚══════════════════════════════════════════════════════════════════════════════╝

#include <gtest/gtest.h>

#include "tabula/result_set.hpp"

#include <stdexcept>
#include <string>
#include <vector>

using namespace tabula;

class ResultSetTest : public ::testing::Test {
protected:
    std::vector<ColumnDescriptor> columns_{
        {"id", TypeCode::Varchar},
        {"name", TypeCode::Varchar},
        {"age", TypeCode::Int},
    };
};

// ==============================================================================
// Column Descriptors
// ==============================================================================

TEST_F(ResultSetTest, DescriptorKindFromType) {
    EXPECT_FALSE(columns_[0].is_numeric());
    EXPECT_TRUE(columns_[2].is_numeric());
    EXPECT_EQ(columns_[2].type, TypeCode::Int);

    ColumnDescriptor explicit_kind("total", ValueKind::Numeric);
    EXPECT_TRUE(explicit_kind.is_numeric());
    EXPECT_EQ(explicit_kind.type, TypeCode::Custom);
}

// ==============================================================================
// Row
// ==============================================================================

TEST_F(ResultSetTest, RowAccess) {
    Row row(columns_, {std::string("123"), std::string("jon"), 32});

    EXPECT_EQ(row.size(), 3u);
    EXPECT_EQ(std::get<std::string>(row.at(1)), "jon");
    EXPECT_THROW((void)row.at(3), std::out_of_range);

    auto age = row.find("age");
    ASSERT_TRUE(age.has_value());
    EXPECT_EQ(std::get<std::int32_t>(**age), 32);
}

TEST_F(ResultSetTest, RowSizeMismatchThrows) {
    EXPECT_THROW((void)Row(columns_, {std::string("123")}), std::invalid_argument);
}

TEST_F(ResultSetTest, FluentRow) {
    Row row;
    row.with({"id", TypeCode::Varchar}, std::string("1"))
       .with({"score", TypeCode::Double}, 2.5);

    ASSERT_EQ(row.columns().size(), 2u);
    EXPECT_EQ(row.columns()[1].name, "score");
    EXPECT_TRUE(row.columns()[1].is_numeric());
}

TEST_F(ResultSetTest, TypedGetters) {
    Row row(columns_, {std::string("123"), Value{}, 32});

    auto id = row.get_string("id");
    ASSERT_TRUE(id.has_value());
    EXPECT_EQ(*id, "123");

    auto age = row.get_int("age");
    ASSERT_TRUE(age.has_value());
    EXPECT_EQ(*age, 32);

    auto widened = row.get_bigint("age");
    ASSERT_TRUE(widened.has_value());
    EXPECT_EQ(*widened, 32);

    EXPECT_EQ(row.get_int("id").error().code(), ErrorCode::TypeMismatch);
    EXPECT_EQ(row.get_string("name").error().code(), ErrorCode::NullValue);
    EXPECT_EQ(row.get_string("email").error().code(), ErrorCode::ColumnNotFound);
}

// ==============================================================================
// ResultSet
// ==============================================================================

TEST_F(ResultSetTest, FromValues) {
    auto result = ResultSet::from_values(columns_, {
        {std::string("123"), std::string("jon"), 32},
        {std::string("456"), std::string("mary"), 25},
    });
    ASSERT_TRUE(result.has_value()) << result.error().to_string();

    EXPECT_EQ(result->row_count(), 2u);
    EXPECT_EQ(result->columns(), columns_);
    for (const auto& row : *result) {
        EXPECT_EQ(row.columns(), columns_);
    }
}

TEST_F(ResultSetTest, FromValuesRejectsShortRow) {
    auto result = ResultSet::from_values(columns_, {
        {std::string("123"), std::string("jon"), 32},
        {std::string("456")},
    });
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code(), ErrorCode::ColumnCountMismatch);
}

TEST_F(ResultSetTest, Filter) {
    auto result = ResultSet::from_values(columns_, {
        {std::string("123"), std::string("jon"), 32},
        {std::string("456"), std::string("mary"), 25},
        {std::string("9"), std::string("Anastasios"), 39},
    });
    ASSERT_TRUE(result.has_value());

    auto older = result->filter([](const Row& row) {
        auto age = row.get_int("age");
        return age && *age > 30;
    });
    EXPECT_EQ(older.row_count(), 2u);
    EXPECT_EQ(older.columns(), columns_);

    auto none = result->filter([](const Row&) { return false; });
    EXPECT_TRUE(none.empty());
}
