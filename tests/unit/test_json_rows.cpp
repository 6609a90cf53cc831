// ╔══════════════════════════════════════════════════════════════════════════════╗
// ║  Tabula - JSON Adapter Unit Tests                                            ║
// ╚══════════════════════════════════════════════════════════════════════════════╝

#include <gtest/gtest.h>

#include "tabula/json_rows.hpp"
#include "tabula/table_renderer.hpp"

#include <filesystem>
#include <fstream>
#include <string>
#include <variant>

using namespace tabula;

class JsonRowsTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir_ = std::filesystem::temp_directory_path() / "tabula_json_test";
        std::filesystem::remove_all(test_dir_);
        std::filesystem::create_directories(test_dir_);
    }

    void TearDown() override {
        std::filesystem::remove_all(test_dir_);
    }

    std::filesystem::path test_dir_;
    TableRenderer renderer_;
};

// ==============================================================================
// Documents
// ==============================================================================

TEST_F(JsonRowsTest, ArrayRows) {
    auto result = json::parse_result_set(R"({
        "columns": [{"name": "id", "type": "text"},
                    {"name": "name", "type": "text"},
                    {"name": "age", "type": "int"}],
        "rows": [["123", "jon", 32], ["456", "mary", 25]]
    })");
    ASSERT_TRUE(result.has_value()) << result.error().to_string();

    ASSERT_EQ(result->row_count(), 2u);
    EXPECT_TRUE(result->columns()[2].is_numeric());
    EXPECT_EQ(*result->rows()[0].get_int("age"), 32);

    auto text = renderer_.render(*result);
    ASSERT_TRUE(text.has_value());
    EXPECT_EQ(*text,
        "+---+----+---+\n"
        "|id |name|age|\n"
        "+---+----+---+\n"
        "|123|jon | 32|\n"
        "|456|mary| 25|\n"
        "+---+----+---+");
}

TEST_F(JsonRowsTest, ObjectRowsRenderTheSame) {
    auto arrays = json::parse_result_set(R"({
        "columns": [{"name": "id", "type": "text"}, {"name": "age", "type": "int"}],
        "rows": [["123", 32], ["456", 25]]
    })");
    auto objects = json::parse_result_set(R"({
        "columns": [{"name": "id", "type": "text"}, {"name": "age", "type": "int"}],
        "rows": [{"age": 32, "id": "123"}, {"id": "456", "age": 25}]
    })");
    ASSERT_TRUE(arrays.has_value());
    ASSERT_TRUE(objects.has_value());

    auto from_arrays = renderer_.render(*arrays);
    auto from_objects = renderer_.render(*objects);
    ASSERT_TRUE(from_arrays.has_value());
    ASSERT_TRUE(from_objects.has_value());
    EXPECT_EQ(*from_arrays, *from_objects);
}

TEST_F(JsonRowsTest, MissingObjectKeyIsNull) {
    auto result = json::parse_result_set(R"({
        "columns": ["id", {"name": "age", "type": "int"}],
        "rows": [{"id": "1"}]
    })");
    ASSERT_TRUE(result.has_value());
    EXPECT_TRUE(is_null(*result->rows()[0].find("age").value()));
}

TEST_F(JsonRowsTest, DecimalKeepsDigits) {
    auto result = json::parse_result_set(R"({
        "columns": [{"name": "price", "type": "decimal"}],
        "rows": [[12.5], ["0.10"]]
    })");
    ASSERT_TRUE(result.has_value());
    EXPECT_TRUE(result->columns()[0].is_numeric());
    EXPECT_EQ(*result->rows()[1].get_string("price"), "0.10");
}

TEST_F(JsonRowsTest, EmptyRows) {
    auto result = json::parse_result_set(R"({"columns": ["id"], "rows": []})");
    ASSERT_TRUE(result.has_value());

    auto text = renderer_.render(*result);
    ASSERT_TRUE(text.has_value());
    EXPECT_EQ(*text, "Nothing");
}

// ==============================================================================
// Errors
// ==============================================================================

TEST_F(JsonRowsTest, InvalidJson) {
    auto result = json::parse_result_set("{not json");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code(), ErrorCode::ParseError);
}

TEST_F(JsonRowsTest, MissingColumns) {
    auto result = json::parse_result_set(R"({"rows": []})");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code(), ErrorCode::ParseError);
}

TEST_F(JsonRowsTest, UnknownType) {
    auto result = json::parse_result_set(R"({"columns": [{"name": "x", "type": "money"}]})");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code(), ErrorCode::UnknownType);
}

TEST_F(JsonRowsTest, WrongRowWidth) {
    auto result = json::parse_result_set(R"({"columns": ["a", "b"], "rows": [["1"]]})");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code(), ErrorCode::ColumnCountMismatch);
}

TEST_F(JsonRowsTest, FractionInIntegerColumn) {
    auto result = json::parse_result_set(R"({
        "columns": [{"name": "age", "type": "int"}],
        "rows": [[3.5]]
    })");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code(), ErrorCode::TypeMismatch);
}

TEST_F(JsonRowsTest, FloatOutOfRange) {
    auto result = json::parse_result_set(R"({
        "columns": [{"name": "x", "type": "float"}],
        "rows": [[1e300]]
    })");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code(), ErrorCode::TypeMismatch);
}

TEST_F(JsonRowsTest, FloatInRange) {
    auto result = json::parse_result_set(R"({
        "columns": [{"name": "x", "type": "float"}],
        "rows": [[1.5], [-3e38]]
    })");
    ASSERT_TRUE(result.has_value()) << result.error().to_string();
    EXPECT_FLOAT_EQ(std::get<float>(*result->rows()[0].find("x").value()), 1.5f);
}

TEST_F(JsonRowsTest, CustomColumnKeepsHugeUnsigned) {
    auto result = json::parse_result_set(R"({
        "columns": [{"name": "x", "type": "custom"}],
        "rows": [[18446744073709551615], [-1]]
    })");
    ASSERT_TRUE(result.has_value()) << result.error().to_string();
    EXPECT_EQ(*result->rows()[0].get_string("x"), "18446744073709551615");
    EXPECT_EQ(*result->rows()[1].get_bigint("x"), -1);

    auto text = renderer_.render(*result);
    ASSERT_TRUE(text.has_value());
    EXPECT_NE(text->find("|18446744073709551615|"), std::string::npos) << *text;
}

TEST_F(JsonRowsTest, IntegerColumnRejectsHugeUnsigned) {
    auto result = json::parse_result_set(R"({
        "columns": [{"name": "n", "type": "bigint"}],
        "rows": [[18446744073709551615]]
    })");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code(), ErrorCode::TypeMismatch);
}

TEST_F(JsonRowsTest, DecimalNumbersAreNormalized) {
    auto result = json::parse_result_set(R"({
        "columns": [{"name": "price", "type": "decimal"}],
        "rows": [[12.50], [0.10], ["12.50"]]
    })");
    ASSERT_TRUE(result.has_value());

    auto text = renderer_.render(*result);
    ASSERT_TRUE(text.has_value());
    EXPECT_EQ(*text,
        "+-----+\n"
        "|price|\n"
        "+-----+\n"
        "| 12.5|\n"
        "|  0.1|\n"
        "|12.50|\n"
        "+-----+");
}

// ==============================================================================
// Files
// ==============================================================================

TEST_F(JsonRowsTest, LoadFromFile) {
    auto path = test_dir_ / "users.json";
    {
        std::ofstream file(path);
        file << R"({"columns": ["id"], "rows": [["123"], ["456"]]})";
    }

    auto result = json::load_result_set(path);
    ASSERT_TRUE(result.has_value()) << result.error().to_string();
    EXPECT_EQ(result->row_count(), 2u);
}

TEST_F(JsonRowsTest, LoadMissingFile) {
    auto result = json::load_result_set(test_dir_ / "missing.json");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code(), ErrorCode::IoError);
}

// ==============================================================================
// JSON View
// ==============================================================================

TEST_F(JsonRowsTest, RowToJsonKeepsColumnOrder) {
    std::vector<ColumnDescriptor> columns{
        {"id", TypeCode::Varchar}, {"name", TypeCode::Varchar}, {"age", TypeCode::Int}};
    Row row(columns, {std::string("123"), std::string("jon"), 32});

    EXPECT_EQ(json::row_to_json(row).dump(), R"({"id":"123","name":"jon","age":32})");
}

TEST_F(JsonRowsTest, JsonView) {
    std::vector<ColumnDescriptor> columns{{"id", TypeCode::Varchar}, {"age", TypeCode::Int}};
    auto result = ResultSet::from_values(columns, {
        {std::string("1"), 5},
        {std::string("22"), Value{}},
    });
    ASSERT_TRUE(result.has_value());

    auto view = json::json_view(*result);
    ASSERT_EQ(view.columns().size(), 1u);
    EXPECT_EQ(view.columns()[0].name, json::JSON_COLUMN);
    EXPECT_FALSE(view.columns()[0].is_numeric());

    auto text = renderer_.render(view);
    ASSERT_TRUE(text.has_value());
    EXPECT_EQ(*text,
        "+----------------------+\n"
        "|[json]                |\n"
        "+----------------------+\n"
        "|{\"id\":\"1\",\"age\":5}    |\n"
        "|{\"id\":\"22\",\"age\":null}|\n"
        "+----------------------+");
}
