#define BOOST_TEST_MODULE xpq

#include "test_schema.hh"

#include <xpq/exception.hh>
#include <xpq/schema_printer.hh>

#include <boost/test/included/unit_test.hpp>

using namespace xpq;
using namespace xpq::testing;

BOOST_AUTO_TEST_CASE(raw_schema_levels_and_paths) {
    test_schema s{users_schema()};
    BOOST_REQUIRE_EQUAL(s.raw.leaves.size(), 3);
    const schema::raw_node& array = *s.raw.leaves[2];
    BOOST_CHECK_EQUAL(schema::path_to_string(array.path), "favorite_numbers.array");
    BOOST_CHECK_EQUAL(array.column_index, 2);
    BOOST_CHECK_EQUAL(array.def_level, 1);
    BOOST_CHECK_EQUAL(array.rep_level, 1);
    BOOST_CHECK_EQUAL(s.raw.leaves[1]->def_level, 1);
    BOOST_CHECK_EQUAL(s.raw.leaves[1]->rep_level, 0);
}

BOOST_AUTO_TEST_CASE(logical_schema_of_users) {
    test_schema s{users_schema()};
    BOOST_REQUIRE_EQUAL(s.logical.fields.size(), 3);
    BOOST_REQUIRE_EQUAL(s.logical.leaves.size(), 3);

    BOOST_CHECK(std::holds_alternative<schema::primitive_node>(s.logical.fields[0]));

    const auto& color = std::get<schema::optional_node>(s.logical.fields[1]);
    BOOST_CHECK_EQUAL(color.def_level, 0);
    const auto& color_leaf = std::get<schema::primitive_node>(*color.child);
    BOOST_CHECK_EQUAL(color_leaf.def_level, 1);
    BOOST_CHECK(std::holds_alternative<schema::logical_type::BYTE_ARRAY>(color_leaf.logical_type));

    // Legacy two-level list: the repeated leaf is the element.
    const auto& numbers = std::get<schema::list_node>(s.logical.fields[2]);
    BOOST_CHECK_EQUAL(numbers.def_level, 0);
    BOOST_CHECK_EQUAL(numbers.rep_level, 0);
    const auto& element = std::get<schema::primitive_node>(*numbers.element);
    BOOST_CHECK_EQUAL(element.column_index, 2);
    BOOST_CHECK_EQUAL(element.def_level, 1);
    BOOST_CHECK_EQUAL(element.rep_level, 1);
    BOOST_CHECK_EQUAL(s.logical.leaves[2], &element);
}

BOOST_AUTO_TEST_CASE(three_level_list_and_map) {
    test_schema s{{
        root_element(2),
        with_converted_type(group_element("tags", 1, FieldRepetitionType::OPTIONAL), format::ConvertedType::LIST),
        group_element("list", 1, FieldRepetitionType::REPEATED),
        leaf_element("element", format::Type::INT64, FieldRepetitionType::REQUIRED),
        with_converted_type(group_element("m", 1, FieldRepetitionType::REQUIRED), format::ConvertedType::MAP),
        group_element("key_value", 2, FieldRepetitionType::REPEATED),
        leaf_element("key", format::Type::INT32, FieldRepetitionType::REQUIRED),
        leaf_element("value", format::Type::INT32, FieldRepetitionType::OPTIONAL),
    }};
    const auto& tags = std::get<schema::optional_node>(s.logical.fields[0]);
    const auto& list = std::get<schema::list_node>(*tags.child);
    BOOST_CHECK_EQUAL(list.def_level, 1);
    BOOST_CHECK_EQUAL(list.rep_level, 0);
    BOOST_CHECK(std::holds_alternative<schema::primitive_node>(*list.element));

    const auto& m = std::get<schema::map_node>(s.logical.fields[1]);
    BOOST_CHECK_EQUAL(m.def_level, 0);
    BOOST_CHECK(std::holds_alternative<schema::primitive_node>(*m.key));
    BOOST_CHECK(std::holds_alternative<schema::optional_node>(*m.value));
    BOOST_CHECK_EQUAL(s.logical.leaves.size(), 3);
}

BOOST_AUTO_TEST_CASE(list_of_tuples_keeps_the_repeated_group) {
    test_schema s{{
        root_element(1),
        with_converted_type(group_element("points", 1, FieldRepetitionType::REQUIRED), format::ConvertedType::LIST),
        group_element("points_tuple", 1, FieldRepetitionType::REPEATED),
        leaf_element("x", format::Type::INT32, FieldRepetitionType::REQUIRED),
    }};
    const auto& points = std::get<schema::list_node>(s.logical.fields[0]);
    const auto& tuple = std::get<schema::struct_node>(*points.element);
    BOOST_CHECK_EQUAL(tuple.fields.size(), 1);
}

BOOST_AUTO_TEST_CASE(annotations_resolve_to_logical_types) {
    namespace lt = schema::logical_type;
    auto utf8 = with_converted_type(
            leaf_element("s", format::Type::BYTE_ARRAY, FieldRepetitionType::REQUIRED), format::ConvertedType::UTF8);
    BOOST_CHECK(std::holds_alternative<lt::STRING>(schema::determine_logical_type(utf8)));

    auto decimal = with_converted_type(
            leaf_element("d", format::Type::INT64, FieldRepetitionType::REQUIRED), format::ConvertedType::DECIMAL);
    decimal.__set_precision(10);
    decimal.__set_scale(2);
    auto decimal_type = std::get<lt::DECIMAL_INT64>(schema::determine_logical_type(decimal));
    BOOST_CHECK_EQUAL(decimal_type.scale, 2);
    BOOST_CHECK_EQUAL(decimal_type.precision, 10);

    auto timestamp = leaf_element("t", format::Type::INT64, FieldRepetitionType::REQUIRED);
    format::TimestampType ts;
    ts.isAdjustedToUTC = false;
    ts.unit.__set_NANOS(format::NanoSeconds());
    format::LogicalType logical;
    logical.__set_TIMESTAMP(ts);
    timestamp.__set_logicalType(logical);
    auto timestamp_type = std::get<lt::TIMESTAMP>(schema::determine_logical_type(timestamp));
    BOOST_CHECK(timestamp_type.unit == lt::TIMESTAMP::NANOS);
    BOOST_CHECK(!timestamp_type.utc_adjustment);

    auto plain = leaf_element("i", format::Type::INT96, FieldRepetitionType::REQUIRED);
    BOOST_CHECK(std::holds_alternative<lt::INT96>(schema::determine_logical_type(plain)));
}

BOOST_AUTO_TEST_CASE(annotation_must_fit_physical_type) {
    auto utf8_int = with_converted_type(
            leaf_element("s", format::Type::INT32, FieldRepetitionType::REQUIRED), format::ConvertedType::UTF8);
    BOOST_CHECK_THROW(schema::determine_logical_type(utf8_int), metadata_error);

    auto decimal = with_converted_type(
            leaf_element("d", format::Type::INT32, FieldRepetitionType::REQUIRED), format::ConvertedType::DECIMAL);
    BOOST_CHECK_THROW(schema::determine_logical_type(decimal), metadata_error);
    decimal.__set_precision(12);
    decimal.__set_scale(2);
    BOOST_CHECK_THROW(schema::determine_logical_type(decimal), metadata_error);
}

BOOST_AUTO_TEST_CASE(malformed_lists_and_maps) {
    std::vector<format::SchemaElement> list_with_two_children = {
        root_element(1),
        with_converted_type(group_element("l", 2, FieldRepetitionType::REQUIRED), format::ConvertedType::LIST),
        leaf_element("a", format::Type::INT32, FieldRepetitionType::REPEATED),
        leaf_element("b", format::Type::INT32, FieldRepetitionType::REPEATED),
    };
    BOOST_CHECK_THROW(test_schema{list_with_two_children}, metadata_error);

    std::vector<format::SchemaElement> list_without_repetition = {
        root_element(1),
        with_converted_type(group_element("l", 1, FieldRepetitionType::REQUIRED), format::ConvertedType::LIST),
        leaf_element("a", format::Type::INT32, FieldRepetitionType::REQUIRED),
    };
    BOOST_CHECK_THROW(test_schema{list_without_repetition}, metadata_error);

    std::vector<format::SchemaElement> map_without_value = {
        root_element(1),
        with_converted_type(group_element("m", 1, FieldRepetitionType::REQUIRED), format::ConvertedType::MAP),
        group_element("key_value", 1, FieldRepetitionType::REPEATED),
        leaf_element("key", format::Type::INT32, FieldRepetitionType::REQUIRED),
    };
    BOOST_CHECK_THROW(test_schema{map_without_value}, metadata_error);
}

BOOST_AUTO_TEST_CASE(malformed_flat_schemas) {
    BOOST_CHECK_THROW(schema::flat_schema_to_raw_schema({}), metadata_error);

    std::vector<format::SchemaElement> too_few = {root_element(2), leaf_element("a", format::Type::INT32,
            FieldRepetitionType::REQUIRED)};
    BOOST_CHECK_THROW(schema::flat_schema_to_raw_schema(too_few), metadata_error);

    std::vector<format::SchemaElement> too_many = {
        root_element(1),
        leaf_element("a", format::Type::INT32, FieldRepetitionType::REQUIRED),
        leaf_element("b", format::Type::INT32, FieldRepetitionType::REQUIRED),
    };
    BOOST_CHECK_THROW(schema::flat_schema_to_raw_schema(too_many), metadata_error);

    format::SchemaElement untyped;
    untyped.__set_name("x");
    std::vector<format::SchemaElement> untyped_leaf = {root_element(1), untyped};
    BOOST_CHECK_THROW(schema::flat_schema_to_raw_schema(untyped_leaf), metadata_error);
}

BOOST_AUTO_TEST_CASE(empty_root_has_no_leaves) {
    test_schema s{{root_element(0)}};
    BOOST_CHECK(s.raw.leaves.empty());
    BOOST_CHECK(s.logical.fields.empty());
    BOOST_CHECK_EQUAL(schema::schema_to_string(s.raw), "message schema {\n}\n");
}

BOOST_AUTO_TEST_CASE(print_users_schema) {
    test_schema s{users_schema()};
    std::string expected =
        "message schema {\n"
        "  REQUIRED BYTE_ARRAY name;\n"
        "  OPTIONAL BYTE_ARRAY favorite_color;\n"
        "  REQUIRED group favorite_numbers (LIST) {\n"
        "    REPEATED INT32 array;\n"
        "  }\n"
        "}\n";
    BOOST_CHECK_EQUAL(schema::schema_to_string(s.raw), expected);
}

BOOST_AUTO_TEST_CASE(print_annotations) {
    auto uuid = leaf_element("id", format::Type::FIXED_LEN_BYTE_ARRAY, FieldRepetitionType::REQUIRED);
    uuid.__set_type_length(16);
    format::LogicalType uuid_type;
    uuid_type.__set_UUID(format::UUIDType());
    uuid.__set_logicalType(uuid_type);

    auto price = with_converted_type(
            leaf_element("price", format::Type::INT32, FieldRepetitionType::OPTIONAL), format::ConvertedType::DECIMAL);
    price.__set_precision(9);
    price.__set_scale(2);

    auto small = leaf_element("small", format::Type::INT32, FieldRepetitionType::REQUIRED);
    format::IntType int_type;
    int_type.bitWidth = 8;
    int_type.isSigned = true;
    format::LogicalType small_type;
    small_type.__set_INTEGER(int_type);
    small.__set_logicalType(small_type);

    test_schema s{{root_element(3), uuid, price, small}};
    std::string expected =
        "message schema {\n"
        "  REQUIRED FIXED_LEN_BYTE_ARRAY (16) id (UUID);\n"
        "  OPTIONAL INT32 price (DECIMAL(9,2));\n"
        "  REQUIRED INT32 small (INTEGER(8,true));\n"
        "}\n";
    BOOST_CHECK_EQUAL(schema::schema_to_string(s.raw), expected);
}
