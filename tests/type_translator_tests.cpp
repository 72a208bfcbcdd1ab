#include "fibermeta/catalog/type_translator.hpp"

#include <catch2/catch_test_macros.hpp>

#include <string>

using fibermeta::catalog::DataType;
using fibermeta::catalog::TypeKind;
using fibermeta::catalog::format_data_type;
using fibermeta::catalog::parse_data_type;

TEST_CASE("Type translator recognises unparameterized types")
{
    CHECK(parse_data_type("boolean") == DataType::of(TypeKind::Boolean));
    CHECK(parse_data_type("tinyint") == DataType::of(TypeKind::TinyInt));
    CHECK(parse_data_type("smallint") == DataType::of(TypeKind::SmallInt));
    CHECK(parse_data_type("integer") == DataType::of(TypeKind::Integer));
    CHECK(parse_data_type("bigint") == DataType::of(TypeKind::BigInt));
    CHECK(parse_data_type("real") == DataType::of(TypeKind::Real));
    CHECK(parse_data_type("double") == DataType::of(TypeKind::Double));
    CHECK(parse_data_type("date") == DataType::of(TypeKind::Date));
    CHECK(parse_data_type("time") == DataType::of(TypeKind::Time));
    CHECK(parse_data_type("timestamp") == DataType::of(TypeKind::Timestamp));
}

TEST_CASE("Type translator ignores case and surrounding whitespace")
{
    CHECK(parse_data_type("  BigInt ") == DataType::of(TypeKind::BigInt));
    CHECK(parse_data_type("TIMESTAMP") == DataType::of(TypeKind::Timestamp));
    CHECK(parse_data_type("\tVarChar( 32 )\n") == DataType::varchar(32U));
}

TEST_CASE("Type translator parses parameterized types")
{
    SECTION("varchar and char carry a length")
    {
        CHECK(parse_data_type("varchar(255)") == DataType::varchar(255U));
        CHECK(parse_data_type("char(1)") == DataType::fixed_char(1U));
        CHECK(parse_data_type("varchar (10)") == DataType::varchar(10U));
    }

    SECTION("decimal scale defaults to zero")
    {
        CHECK(parse_data_type("decimal(10)") == DataType::decimal(10U, 0U));
        CHECK(parse_data_type("decimal(10,2)") == DataType::decimal(10U, 2U));
        CHECK(parse_data_type("decimal( 38 , 38 )") == DataType::decimal(38U, 38U));
    }
}

TEST_CASE("Type translator rejects malformed or out of range parameters")
{
    CHECK_FALSE(parse_data_type("varchar()").is_known());
    CHECK_FALSE(parse_data_type("varchar(0)").is_known());
    CHECK_FALSE(parse_data_type("varchar(-1)").is_known());
    CHECK_FALSE(parse_data_type("varchar(99999999999999999999)").is_known());
    CHECK_FALSE(parse_data_type("varchar(10").is_known());
    CHECK_FALSE(parse_data_type("varchar").is_known());
    CHECK_FALSE(parse_data_type("char(x)").is_known());
    CHECK_FALSE(parse_data_type("decimal(0)").is_known());
    CHECK_FALSE(parse_data_type("decimal(39)").is_known());
    CHECK_FALSE(parse_data_type("decimal(5,6)").is_known());
    CHECK_FALSE(parse_data_type("decimal(10,)").is_known());
    CHECK_FALSE(parse_data_type("decimal(,2)").is_known());
}

TEST_CASE("Type translator maps unknown names to Unknown")
{
    CHECK(parse_data_type("").kind == TypeKind::Unknown);
    CHECK(parse_data_type("   ").kind == TypeKind::Unknown);
    CHECK(parse_data_type("string").kind == TypeKind::Unknown);
    CHECK(parse_data_type("int").kind == TypeKind::Unknown);
    CHECK(parse_data_type("timestamptz").kind == TypeKind::Unknown);
    CHECK(parse_data_type("bigint bigint").kind == TypeKind::Unknown);
    CHECK(parse_data_type("integer(4)").kind == TypeKind::Unknown);
}

TEST_CASE("Formatted types parse back to the same type")
{
    const DataType samples[] = {DataType::of(TypeKind::Boolean),
                                DataType::of(TypeKind::Timestamp),
                                DataType::varchar(64U),
                                DataType::fixed_char(3U),
                                DataType::decimal(12U, 4U)};
    for (const auto& sample : samples) {
        const auto text = format_data_type(sample);
        CAPTURE(text);
        CHECK(parse_data_type(text) == sample);
    }

    CHECK(format_data_type(DataType::decimal(9U)) == "decimal(9,0)");
    CHECK(format_data_type(DataType::varchar(20U)) == "varchar(20)");
    CHECK(format_data_type(DataType{}) == "unknown");
}
