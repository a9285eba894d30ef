#define BOOST_TEST_MODULE xpq

#include "test_schema.hh"

#include <xpq/exception.hh>
#include <xpq/record_reader.hh>
#include <xpq/value.hh>

#include <boost/test/included/unit_test.hpp>

using namespace xpq;
using namespace xpq::testing;

namespace {

std::vector<std::vector<std::string>> format_all(const std::vector<record::row>& rows) {
    std::vector<std::vector<std::string>> out;
    for (const record::row& r : rows) {
        out.push_back(record::format_row(r));
    }
    return out;
}

} // namespace

BOOST_AUTO_TEST_CASE(users_file_rows) {
    test_schema s{users_schema()};
    auto reader = record::record_reader::make(s.logical, 0, 2, vector_sources(users_columns()), all_fields(s.logical));
    auto rows = read_all(reader);
    BOOST_REQUIRE_EQUAL(rows.size(), 2);

    std::vector<std::string> alyssa = {"\"Alyssa\"", "null", "[3, 9, 15, 20]"};
    std::vector<std::string> ben = {"\"Ben\"", "\"red\"", "[]"};
    auto formatted = format_all(rows);
    BOOST_CHECK_EQUAL_COLLECTIONS(formatted[0].begin(), formatted[0].end(), alyssa.begin(), alyssa.end());
    BOOST_CHECK_EQUAL_COLLECTIONS(formatted[1].begin(), formatted[1].end(), ben.begin(), ben.end());

    BOOST_CHECK_EQUAL(rows[0].fields[0].name, "name");
    BOOST_CHECK(rows[0].get("favorite_color")->is_null());
    const auto& numbers = std::get<record::list_value>(rows[0].get("favorite_numbers")->v);
    BOOST_CHECK_EQUAL(numbers.elements.size(), 4);
}

BOOST_AUTO_TEST_CASE(projection_opens_only_selected_columns) {
    test_schema s{users_schema()};
    std::vector<int> opened;
    auto sources = vector_sources(users_columns());
    record::column_source_factory recording = [&] (const schema::primitive_node& leaf) {
        opened.push_back(leaf.column_index);
        return sources(leaf);
    };
    auto reader = record::record_reader::make(s.logical, 0, 2, recording, {2});
    auto rows = read_all(reader);
    BOOST_REQUIRE_EQUAL(rows.size(), 2);
    BOOST_REQUIRE_EQUAL(rows[0].fields.size(), 1);
    BOOST_CHECK_EQUAL(rows[0].fields[0].name, "favorite_numbers");
    BOOST_CHECK_EQUAL(record::format_value(rows[1].fields[0].data), "[]");
    BOOST_REQUIRE_EQUAL(opened.size(), 1);
    BOOST_CHECK_EQUAL(opened[0], 2);
}

BOOST_AUTO_TEST_CASE(no_columns_yields_empty_rows) {
    test_schema s{users_schema()};
    auto reader = record::record_reader::make(s.logical, 0, 3, vector_sources({}), {});
    auto rows = read_all(reader);
    BOOST_REQUIRE_EQUAL(rows.size(), 3);
    BOOST_CHECK(rows[2].fields.empty());
}

// message schema {
//   OPTIONAL group a {
//     REPEATED group b {
//       OPTIONAL INT32 c;
//       REQUIRED INT64 d;
//     }
//   }
// }
BOOST_AUTO_TEST_CASE(repeated_group_inside_optional_group) {
    test_schema s{{
        root_element(1),
        group_element("a", 1, FieldRepetitionType::OPTIONAL),
        group_element("b", 2, FieldRepetitionType::REPEATED),
        leaf_element("c", format::Type::INT32, FieldRepetitionType::OPTIONAL),
        leaf_element("d", format::Type::INT64, FieldRepetitionType::REQUIRED),
    }};
    // Rows: {a: {b: [{c: 1, d: 10}, {c: null, d: 20}]}}, {a: null}, {a: {b: []}}
    auto sources = vector_sources({
        {0, {value_at(3, 0, int32_t(1)), null_at(2, 1), null_at(0, 0), null_at(1, 0)}},
        {1, {value_at(2, 0, int64_t(10)), value_at(2, 1, int64_t(20)), null_at(0, 0), null_at(1, 0)}},
    });
    auto reader = record::record_reader::make(s.logical, 0, 3, sources, all_fields(s.logical));
    auto rows = read_all(reader);
    BOOST_REQUIRE_EQUAL(rows.size(), 3);
    BOOST_CHECK_EQUAL(record::format_value(rows[0].fields[0].data), "{b: [{c: 1, d: 10}, {c: null, d: 20}]}");
    BOOST_CHECK_EQUAL(record::format_value(rows[1].fields[0].data), "null");
    BOOST_CHECK_EQUAL(record::format_value(rows[2].fields[0].data), "{b: []}");
}

BOOST_AUTO_TEST_CASE(sibling_columns_must_agree_on_record_boundaries) {
    test_schema s{{
        root_element(1),
        group_element("a", 1, FieldRepetitionType::OPTIONAL),
        group_element("b", 2, FieldRepetitionType::REPEATED),
        leaf_element("c", format::Type::INT32, FieldRepetitionType::OPTIONAL),
        leaf_element("d", format::Type::INT64, FieldRepetitionType::REQUIRED),
    }};
    // c holds [{1}, {2}] and [{3}], d holds [{10}] and [{20}, {30}].
    auto sources = vector_sources({
        {0, {value_at(3, 0, int32_t(1)), value_at(3, 1, int32_t(2)), value_at(3, 0, int32_t(3))}},
        {1, {value_at(2, 0, int64_t(10)), value_at(2, 0, int64_t(20)), value_at(2, 1, int64_t(30))}},
    });
    auto reader = record::record_reader::make(s.logical, 4, 2, sources, all_fields(s.logical));
    try {
        reader.read_one();
        BOOST_FAIL("expected an assembly error");
    } catch (const assembly_error& e) {
        BOOST_CHECK_EQUAL(e.row_group(), 4);
    }
}

BOOST_AUTO_TEST_CASE(map_keys_and_values_must_agree_on_entries) {
    test_schema s{{
        root_element(1),
        with_converted_type(group_element("m", 1, FieldRepetitionType::OPTIONAL), format::ConvertedType::MAP),
        group_element("key_value", 2, FieldRepetitionType::REPEATED),
        with_converted_type(leaf_element("key", format::Type::BYTE_ARRAY, FieldRepetitionType::REQUIRED),
                format::ConvertedType::UTF8),
        leaf_element("value", format::Type::INT32, FieldRepetitionType::OPTIONAL),
    }};
    // Two keys in the first map, but the values end the map after one entry.
    auto sources = vector_sources({
        {0, {value_at(2, 0, std::string("a")), value_at(2, 1, std::string("b")), null_at(1, 0)}},
        {1, {value_at(3, 0, int32_t(1)), value_at(3, 0, int32_t(2)), null_at(1, 0)}},
    });
    auto reader = record::record_reader::make(s.logical, 0, 2, sources, all_fields(s.logical));
    BOOST_CHECK_THROW(read_all(reader), assembly_error);
}

// message schema {
//   OPTIONAL group tags (LIST) {
//     REPEATED group list {
//       OPTIONAL BYTE_ARRAY element (UTF8);
//     }
//   }
// }
BOOST_AUTO_TEST_CASE(three_level_list) {
    test_schema s{{
        root_element(1),
        with_converted_type(group_element("tags", 1, FieldRepetitionType::OPTIONAL), format::ConvertedType::LIST),
        group_element("list", 1, FieldRepetitionType::REPEATED),
        with_converted_type(leaf_element("element", format::Type::BYTE_ARRAY, FieldRepetitionType::OPTIONAL),
                format::ConvertedType::UTF8),
    }};
    // Rows: ["x", null], null, []
    auto sources = vector_sources({
        {0, {value_at(3, 0, std::string("x")), null_at(2, 1), null_at(0, 0), null_at(1, 0)}},
    });
    auto reader = record::record_reader::make(s.logical, 0, 3, sources, all_fields(s.logical));
    auto rows = read_all(reader);
    BOOST_REQUIRE_EQUAL(rows.size(), 3);
    BOOST_CHECK_EQUAL(record::format_value(rows[0].fields[0].data), "[\"x\", null]");
    BOOST_CHECK_EQUAL(record::format_value(rows[1].fields[0].data), "null");
    BOOST_CHECK_EQUAL(record::format_value(rows[2].fields[0].data), "[]");
}

// message schema {
//   OPTIONAL group m (MAP) {
//     REPEATED group key_value {
//       REQUIRED BYTE_ARRAY key (UTF8);
//       OPTIONAL INT32 value;
//     }
//   }
// }
BOOST_AUTO_TEST_CASE(map_field) {
    test_schema s{{
        root_element(1),
        with_converted_type(group_element("m", 1, FieldRepetitionType::OPTIONAL), format::ConvertedType::MAP),
        group_element("key_value", 2, FieldRepetitionType::REPEATED),
        with_converted_type(leaf_element("key", format::Type::BYTE_ARRAY, FieldRepetitionType::REQUIRED),
                format::ConvertedType::UTF8),
        leaf_element("value", format::Type::INT32, FieldRepetitionType::OPTIONAL),
    }};
    // Rows: {"a" -> 1, "b" -> null}, {}
    auto sources = vector_sources({
        {0, {value_at(2, 0, std::string("a")), value_at(2, 1, std::string("b")), null_at(1, 0)}},
        {1, {value_at(3, 0, int32_t(1)), null_at(2, 1), null_at(1, 0)}},
    });
    auto reader = record::record_reader::make(s.logical, 0, 2, sources, all_fields(s.logical));
    auto rows = read_all(reader);
    BOOST_REQUIRE_EQUAL(rows.size(), 2);
    BOOST_CHECK_EQUAL(record::format_value(rows[0].fields[0].data), "{\"a\" -> 1, \"b\" -> null}");
    BOOST_CHECK_EQUAL(record::format_value(rows[1].fields[0].data), "{}");
}

// message schema {
//   REPEATED group matrix {
//     REPEATED INT32 row;
//   }
// }
BOOST_AUTO_TEST_CASE(nested_repetition) {
    test_schema s{{
        root_element(1),
        group_element("matrix", 1, FieldRepetitionType::REPEATED),
        leaf_element("row", format::Type::INT32, FieldRepetitionType::REPEATED),
    }};
    // Rows: [{row: [1, 2]}, {row: []}, {row: [3]}], []
    auto sources = vector_sources({
        {0, {value_at(2, 0, int32_t(1)), value_at(2, 2, int32_t(2)), null_at(1, 1), value_at(2, 1, int32_t(3)),
             null_at(0, 0)}},
    });
    auto reader = record::record_reader::make(s.logical, 0, 2, sources, all_fields(s.logical));
    auto rows = read_all(reader);
    BOOST_REQUIRE_EQUAL(rows.size(), 2);
    BOOST_CHECK_EQUAL(record::format_value(rows[0].fields[0].data), "[{row: [1, 2]}, {row: []}, {row: [3]}]");
    BOOST_CHECK_EQUAL(record::format_value(rows[1].fields[0].data), "[]");
}

BOOST_AUTO_TEST_CASE(definition_level_above_maximum) {
    test_schema s{users_schema()};
    auto columns = users_columns();
    columns[1][1] = value_at(2, 0, std::string("red"));
    auto reader = record::record_reader::make(s.logical, 7, 2, vector_sources(columns), all_fields(s.logical));
    try {
        read_all(reader);
        BOOST_FAIL("expected an assembly error");
    } catch (const assembly_error& e) {
        BOOST_CHECK_EQUAL(e.row_group(), 7);
        BOOST_CHECK(std::string(e.what()).find("Row group 7") == 0);
    }
}

BOOST_AUTO_TEST_CASE(repetition_level_above_maximum) {
    test_schema s{users_schema()};
    auto columns = users_columns();
    columns[2][1] = value_at(1, 2, int32_t(9));
    BOOST_CHECK_THROW(
        {
            auto reader = record::record_reader::make(s.logical, 0, 2, vector_sources(columns), all_fields(s.logical));
            read_all(reader);
        },
        assembly_error);
}

BOOST_AUTO_TEST_CASE(value_presence_must_match_definition_level) {
    test_schema s{users_schema()};
    auto missing = users_columns();
    missing[1][1] = null_at(1, 0);
    BOOST_CHECK_THROW(
        {
            auto reader = record::record_reader::make(s.logical, 0, 2, vector_sources(missing), all_fields(s.logical));
            read_all(reader);
        },
        assembly_error);

    auto unexpected = users_columns();
    unexpected[1][0] = value_at(0, 0, std::string("blue"));
    BOOST_CHECK_THROW(
        {
            auto reader = record::record_reader::make(s.logical, 0, 2, vector_sources(unexpected), all_fields(s.logical));
            read_all(reader);
        },
        assembly_error);
}

BOOST_AUTO_TEST_CASE(record_must_start_at_repetition_level_zero) {
    test_schema s{users_schema()};
    auto columns = users_columns();
    // Ben's list continues Alyssa's, leaving his record without a start.
    columns[2][4] = value_at(1, 1, int32_t(21));
    auto reader = record::record_reader::make(s.logical, 0, 2, vector_sources(columns), all_fields(s.logical));
    BOOST_CHECK_THROW(read_all(reader), assembly_error);
}

BOOST_AUTO_TEST_CASE(row_count_must_match_columns) {
    test_schema s{users_schema()};
    {
        auto reader = record::record_reader::make(s.logical, 0, 3, vector_sources(users_columns()), all_fields(s.logical));
        BOOST_CHECK_THROW(read_all(reader), assembly_error);
    }
    {
        auto reader = record::record_reader::make(s.logical, 0, 1, vector_sources(users_columns()), all_fields(s.logical));
        BOOST_REQUIRE(reader.read_one());
        BOOST_CHECK_THROW(reader.read_one(), assembly_error);
    }
}
