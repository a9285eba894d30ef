#define BOOST_TEST_MODULE xpq

#include "test_schema.hh"

#include <xpq/exception.hh>
#include <xpq/frequency.hh>

#include <boost/test/included/unit_test.hpp>

using namespace xpq;
using namespace xpq::testing;

namespace {

using counts = std::vector<std::pair<std::string, uint64_t>>;

// Serves rows assembled from in-memory columns.
class reader_source {
    record::record_reader _reader;
public:
    explicit reader_source(record::record_reader reader) : _reader{std::move(reader)} {}
    std::optional<record::row> read_one() { return _reader.read_one(); }
};

reader_source users_rows(const test_schema& s, const frequency_counter& counter) {
    return reader_source{record::record_reader::make(
            s.logical, 0, 2, vector_sources(users_columns()), counter.required_fields(s.logical))};
}

void check_counts(const counts& actual, const counts& expected) {
    BOOST_REQUIRE_EQUAL(actual.size(), expected.size());
    for (size_t i = 0; i < actual.size(); ++i) {
        BOOST_CHECK_EQUAL(actual[i].first, expected[i].first);
        BOOST_CHECK_EQUAL(actual[i].second, expected[i].second);
    }
}

} // namespace

BOOST_AUTO_TEST_CASE(favorite_color_of_users) {
    test_schema s{users_schema()};
    frequency_counter counter{s.logical, {"favorite_color"}};
    std::vector<size_t> expected_fields = {1};
    auto fields = counter.required_fields(s.logical);
    BOOST_CHECK_EQUAL_COLLECTIONS(fields.begin(), fields.end(), expected_fields.begin(), expected_fields.end());

    auto rows = users_rows(s, counter);
    auto results = count_frequencies(rows, counter);
    BOOST_REQUIRE_EQUAL(results.size(), 1);
    BOOST_CHECK_EQUAL(results[0].column, "favorite_color");
    check_counts(results[0].counts, {{"null", 1}, {"\"red\"", 1}});
}

BOOST_AUTO_TEST_CASE(paths_are_case_insensitive_and_deduplicated) {
    test_schema s{users_schema()};
    frequency_counter counter{s.logical, {"FAVORITE_NUMBERS.Array", "favorite_numbers.array"}};
    auto rows = users_rows(s, counter);
    auto results = count_frequencies(rows, counter);
    BOOST_REQUIRE_EQUAL(results.size(), 1);
    BOOST_CHECK_EQUAL(results[0].column, "favorite_numbers.array");
    check_counts(results[0].counts, {{"[3, 9, 15, 20]", 1}, {"[]", 1}});
}

BOOST_AUTO_TEST_CASE(no_paths_selects_every_leaf) {
    test_schema s{users_schema()};
    frequency_counter counter{s.logical, {}};
    auto rows = users_rows(s, counter);
    auto results = count_frequencies(rows, counter);
    BOOST_REQUIRE_EQUAL(results.size(), 3);
    BOOST_CHECK_EQUAL(results[0].column, "name");
    BOOST_CHECK_EQUAL(results[1].column, "favorite_color");
    BOOST_CHECK_EQUAL(results[2].column, "favorite_numbers.array");
    check_counts(results[0].counts, {{"\"Alyssa\"", 1}, {"\"Ben\"", 1}});
}

BOOST_AUTO_TEST_CASE(limit_caps_rows_scanned) {
    test_schema s{users_schema()};
    frequency_counter counter{s.logical, {"name"}};
    auto rows = users_rows(s, counter);
    auto results = count_frequencies(rows, counter, 1);
    check_counts(results[0].counts, {{"\"Alyssa\"", 1}});
}

BOOST_AUTO_TEST_CASE(unknown_and_group_paths_are_rejected) {
    test_schema s{users_schema()};
    BOOST_CHECK_THROW((frequency_counter{s.logical, {"favourite_colour"}}), invalid_column);
    try {
        frequency_counter counter{s.logical, {"favorite_numbers"}};
        BOOST_FAIL("expected invalid_column");
    } catch (const invalid_column& e) {
        BOOST_CHECK(std::string(e.what()).find("not a leaf") != std::string::npos);
    }
}

// message schema {
//   OPTIONAL group m (MAP) {
//     REPEATED group key_value {
//       REQUIRED BYTE_ARRAY key (UTF8);
//       OPTIONAL INT32 value;
//     }
//   }
// }
BOOST_AUTO_TEST_CASE(paths_through_maps) {
    test_schema s{{
        root_element(1),
        with_converted_type(group_element("m", 1, FieldRepetitionType::OPTIONAL), format::ConvertedType::MAP),
        group_element("key_value", 2, FieldRepetitionType::REPEATED),
        with_converted_type(leaf_element("key", format::Type::BYTE_ARRAY, FieldRepetitionType::REQUIRED),
                format::ConvertedType::UTF8),
        leaf_element("value", format::Type::INT32, FieldRepetitionType::OPTIONAL),
    }};
    // Rows: {"a" -> 1, "b" -> null}, null, {"a" -> 1, "b" -> null}
    auto sources = vector_sources({
        {0, {value_at(2, 0, std::string("a")), value_at(2, 1, std::string("b")), null_at(0, 0),
             value_at(2, 0, std::string("a")), value_at(2, 1, std::string("b"))}},
        {1, {value_at(3, 0, int32_t(1)), null_at(2, 1), null_at(0, 0), value_at(3, 0, int32_t(1)), null_at(2, 1)}},
    });
    frequency_counter counter{s.logical, {"m.key_value.key", "m.key_value.value"}};
    reader_source rows{record::record_reader::make(s.logical, 0, 3, sources, counter.required_fields(s.logical))};
    auto results = count_frequencies(rows, counter);
    BOOST_REQUIRE_EQUAL(results.size(), 2);
    check_counts(results[0].counts, {{"[\"a\", \"b\"]", 2}, {"null", 1}});
    check_counts(results[1].counts, {{"[1, null]", 2}, {"null", 1}});
}

BOOST_AUTO_TEST_CASE(ties_ignore_quotes) {
    counts c = {{"\"zeta\"", 1}, {"\"red\"", 3}, {"null", 1}, {"\"alpha\"", 1}, {"7", 3}};
    sort_frequencies(c);
    check_counts(c, {{"7", 3}, {"\"red\"", 3}, {"\"alpha\"", 1}, {"null", 1}, {"\"zeta\"", 1}});
}
