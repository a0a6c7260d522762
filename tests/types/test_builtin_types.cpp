// tests/types/test_builtin_types.cpp
#define BOOST_TEST_MODULE BuiltinTypesTests
#include <boost/test/unit_test.hpp>

#include <cstdint>
#include <limits>
#include <stdexcept>

#include "stasis/serialization/type_catalog.hpp"
#include "stasis/types/duration.hpp"
#include "stasis/types/ordered_map.hpp"
#include "stasis/types/temporal.hpp"
#include "stasis/types/time_breakdown.hpp"
#include "stasis/types/timezone.hpp"

using namespace stasis::types;
using stasis::serialization::TypeCatalog;
using stasis::serialization::Value;

BOOST_AUTO_TEST_SUITE(DurationTestSuite)

BOOST_AUTO_TEST_CASE(test_normalization) {
    Duration carry(0, 90000, 1500000);
    BOOST_CHECK_EQUAL(carry.days(), 1);
    BOOST_CHECK_EQUAL(carry.seconds(), 3601);
    BOOST_CHECK_EQUAL(carry.microseconds(), 500000);

    Duration negative(0, -1);
    BOOST_CHECK_EQUAL(negative.days(), -1);
    BOOST_CHECK_EQUAL(negative.seconds(), 86399);
    BOOST_CHECK(negative.is_negative());
    BOOST_CHECK_EQUAL(negative.total_seconds(), -1.0);
}

BOOST_AUTO_TEST_CASE(test_string_form) {
    BOOST_CHECK_EQUAL(Duration().str(), "0:00:00");
    BOOST_CHECK_EQUAL(Duration(0, -1).str(), "-1 day, 23:59:59");
    BOOST_CHECK_EQUAL(Duration(1, 1, 500).str(), "1 day, 0:00:01.000500");
    BOOST_CHECK_EQUAL(Duration(2, 7200).str(), "2 days, 2:00:00");
}

BOOST_AUTO_TEST_CASE(test_range) {
    BOOST_CHECK_NO_THROW(Duration{Duration::MAX_DAYS});
    BOOST_CHECK_THROW(Duration(Duration::MAX_DAYS + 1), std::invalid_argument);
    BOOST_CHECK_THROW(Duration(-Duration::MAX_DAYS, -1), std::invalid_argument);
}

BOOST_AUTO_TEST_CASE(test_factory_rejects_extreme_components) {
    const auto max = std::numeric_limits<std::int64_t>::max();
    const auto min = std::numeric_limits<std::int64_t>::min();
    const auto& factory = *Duration::factory();

    BOOST_CHECK_THROW(factory({Value(0), Value(max), Value(1000000)}),
                      std::invalid_argument);
    BOOST_CHECK_THROW(factory({Value(0), Value(min), Value(-1)}),
                      std::invalid_argument);
    BOOST_CHECK_THROW(factory({Value(max), Value(86400)}), std::invalid_argument);
    BOOST_CHECK_THROW(factory({Value(min), Value(-86400)}), std::invalid_argument);
    BOOST_CHECK_THROW(factory({Value(min)}), std::invalid_argument);

    // Large but offsetting components still normalize
    Value offset = factory({Value(-1000), Value(1000 * 86400), Value(0)});
    BOOST_CHECK(offset.as<Duration>()->equals(Duration()));
}

BOOST_AUTO_TEST_CASE(test_reduce_and_rebuild) {
    Duration duration(3, 4, 5);
    auto reduction = duration.reduce();
    BOOST_CHECK_EQUAL(reduction.factory->name(), "stasis.Duration");
    BOOST_REQUIRE_EQUAL(reduction.arguments.size(), 3u);
    BOOST_CHECK_EQUAL(reduction.arguments[2].as_int(), 5);

    Value rebuilt = (*reduction.factory)(reduction.arguments);
    BOOST_CHECK(rebuilt.as<Duration>()->equals(duration));
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(TemporalTestSuite)

BOOST_AUTO_TEST_CASE(test_date_validation) {
    BOOST_CHECK_NO_THROW(Date(2024, 2, 29));
    BOOST_CHECK_THROW(Date(2023, 2, 29), std::invalid_argument);
    BOOST_CHECK_THROW(Date(1900, 2, 29), std::invalid_argument);
    BOOST_CHECK_NO_THROW(Date(2000, 2, 29));
    BOOST_CHECK_THROW(Date(0, 1, 1), std::invalid_argument);
    BOOST_CHECK_THROW(Date(2023, 13, 1), std::invalid_argument);
    BOOST_CHECK_THROW(Date(2023, 4, 31), std::invalid_argument);
}

BOOST_AUTO_TEST_CASE(test_time_validation) {
    BOOST_CHECK_NO_THROW(Time(23, 59, 59, 999999));
    BOOST_CHECK_THROW(Time(24), std::invalid_argument);
    BOOST_CHECK_THROW(Time(0, 60), std::invalid_argument);
    BOOST_CHECK_THROW(Time(0, 0, 0, 1000000), std::invalid_argument);
    BOOST_CHECK_THROW(DateTime(2023, 1, 1, 0, 0, -1), std::invalid_argument);
}

BOOST_AUTO_TEST_CASE(test_state_layout) {
    DateTime datetime(2023, 1, 1, 12, 30, 45, 123456);
    const Value::Bytes expected = {0x07, 0xe7, 0x01, 0x01, 0x0c,
                                   0x1e, 0x2d, 0x01, 0xe2, 0x40};
    BOOST_CHECK(datetime.state() == expected);
    BOOST_CHECK_EQUAL(datetime.state().size(), DateTime::STATE_SIZE);

    Time time(1, 2, 3, 4);
    BOOST_CHECK(time.state() == Value::Bytes({1, 2, 3, 0, 0, 4}));

    BOOST_CHECK(Date(2024, 12, 31).state() == Value::Bytes({0x07, 0xe8, 12, 31}));
}

BOOST_AUTO_TEST_CASE(test_raw_state_is_not_validated) {
    // Month 0 would be rejected by the public constructor
    Date date = Date::from_state({0x07, 0xe7, 0x00, 0x01});
    BOOST_CHECK_EQUAL(date.month(), 0);

    // A short payload reads as zeros past its end
    DateTime datetime = DateTime::from_state({0x07, 0xe7, 0x00, 0x01, 0x01});
    BOOST_CHECK_EQUAL(datetime.hour(), 1);
    BOOST_CHECK_EQUAL(datetime.microsecond(), 0);
}

BOOST_AUTO_TEST_CASE(test_string_forms) {
    BOOST_CHECK_EQUAL(Date(2023, 7, 4).str(), "2023-07-04");
    BOOST_CHECK_EQUAL(DateTime(2023, 7, 4, 9, 5).str(), "2023-07-04 09:05:00");
    BOOST_CHECK_EQUAL(Time(9, 5, 0, 250).str(), "09:05:00.000250");

    auto pst = std::make_shared<const TimeZone>(Duration(0, -8 * 3600));
    BOOST_CHECK_EQUAL(Time(12, 0, 0, 0, pst).str(), "12:00:00-08:00");
    BOOST_CHECK_EQUAL(DateTime(2023, 1, 1, 0, 0, 0, 0, TimeZone::utc()).str(),
                      "2023-01-01 00:00:00+00:00");
}

BOOST_AUTO_TEST_CASE(test_equality_includes_zone) {
    auto utc = TimeZone::utc();
    auto plus_one = std::make_shared<const TimeZone>(Duration(0, 3600));

    BOOST_CHECK(Time(1, 0, 0, 0, utc).equals(Time(1, 0, 0, 0, utc)));
    BOOST_CHECK(!Time(1, 0, 0, 0, utc).equals(Time(1, 0, 0, 0, plus_one)));
    BOOST_CHECK(!Time(1).equals(Time(1, 0, 0, 0, utc)));
    BOOST_CHECK(!Time(1).equals(Date(2023, 1, 1)));
}

BOOST_AUTO_TEST_CASE(test_factories) {
    Value datetime = (*DateTime::factory())({2023, 5, 6, 7, 8, 9});
    BOOST_CHECK_EQUAL(datetime.str(), "2023-05-06 07:08:09");
    BOOST_CHECK_THROW((*DateTime::factory())({2023, 5}), std::invalid_argument);
    BOOST_CHECK_THROW((*Date::factory())({2023, 2, 30}), std::invalid_argument);

    Value time = Time::factory()->from_state({1, 2, 3, 0, 0, 0},
                                             {Value(TimeZone::utc())});
    BOOST_CHECK_EQUAL(time.str(), "01:02:03+00:00");
    BOOST_CHECK_THROW(Date::factory()->from_state({0, 1, 1, 1}, {Value(1)}),
                      std::invalid_argument);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(TimeZoneTestSuite)

BOOST_AUTO_TEST_CASE(test_offset_bounds) {
    BOOST_CHECK_NO_THROW(TimeZone(Duration(0, 86399)));
    BOOST_CHECK_NO_THROW(TimeZone(Duration(0, -86399)));
    BOOST_CHECK_THROW(TimeZone(Duration(1)), std::invalid_argument);
    BOOST_CHECK_THROW(TimeZone(Duration(-1)), std::invalid_argument);
}

BOOST_AUTO_TEST_CASE(test_string_forms) {
    BOOST_CHECK_EQUAL(TimeZone::utc()->str(), "UTC");
    BOOST_CHECK_EQUAL(TimeZone(Duration(0, 19800)).str(), "UTC+05:30");
    BOOST_CHECK_EQUAL(TimeZone(Duration(0, -3600), "CET-ish").str(), "CET-ish");
    BOOST_CHECK_EQUAL(TimeZone(Duration(0, 3661, 5)).utc_offset_string(),
                      "+01:01:01.000005");
}

BOOST_AUTO_TEST_CASE(test_reduce) {
    TimeZone named(Duration(0, 3600), "CET");
    auto reduction = named.reduce();
    BOOST_REQUIRE_EQUAL(reduction.arguments.size(), 2u);
    BOOST_CHECK(reduction.arguments[0].as<Duration>()->seconds() == 3600);
    BOOST_CHECK_EQUAL(reduction.arguments[1].as_string(), "CET");

    BOOST_CHECK_EQUAL(TimeZone::utc()->reduce().arguments.size(), 1u);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(TimeBreakdownTestSuite)

BOOST_AUTO_TEST_CASE(test_tm_conversion) {
    std::tm tm{};
    tm.tm_year = 123;
    tm.tm_mon = 0;
    tm.tm_mday = 1;
    tm.tm_wday = 0;  // Sunday
    tm.tm_yday = 0;

    TimeBreakdown breakdown(tm);
    BOOST_CHECK_EQUAL(breakdown.year(), 2023);
    BOOST_CHECK_EQUAL(breakdown.month(), 1);
    BOOST_CHECK_EQUAL(breakdown.wday(), 6);
    BOOST_CHECK_EQUAL(breakdown.yday(), 1);

    std::tm back = breakdown.to_tm();
    BOOST_CHECK_EQUAL(back.tm_year, 123);
    BOOST_CHECK_EQUAL(back.tm_wday, 0);
    BOOST_CHECK_EQUAL(back.tm_yday, 0);
}

BOOST_AUTO_TEST_CASE(test_string_form) {
    TimeBreakdown breakdown(
        TimeBreakdown::Fields{2023, 1, 2, 3, 4, 5, 0, 2, -1});
    BOOST_CHECK_EQUAL(breakdown.str(),
                      "TimeBreakdown(tm_year=2023, tm_mon=1, tm_mday=2, "
                      "tm_hour=3, tm_min=4, tm_sec=5, tm_wday=0, tm_yday=2, "
                      "tm_isdst=-1)");
}

BOOST_AUTO_TEST_CASE(test_factory_requires_nine_fields) {
    auto factory = TimeBreakdown::factory();
    BOOST_CHECK_THROW((*factory)({Value(Value::List{1, 2, 3})}),
                      std::invalid_argument);
    BOOST_CHECK_THROW((*factory)({}), std::invalid_argument);

    Value built =
        (*factory)({Value(Value::List{2023, 1, 2, 3, 4, 5, 0, 2, -1})});
    BOOST_CHECK_EQUAL(built.as<TimeBreakdown>()->isdst(), -1);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(OrderedMapTestSuite)

BOOST_AUTO_TEST_CASE(test_insertion_order) {
    OrderedMap map;
    map.set("b", 1);
    map.set("a", 2);
    map.set("b", 3);

    BOOST_REQUIRE_EQUAL(map.size(), 2u);
    BOOST_CHECK_EQUAL(map.items()[0].first.as_string(), "b");
    BOOST_CHECK_EQUAL(map.items()[0].second.as_int(), 3);
    BOOST_CHECK_EQUAL(map.str(), "OrderedMap([('b', 3), ('a', 2)])");

    BOOST_CHECK(map.erase("b"));
    BOOST_CHECK(!map.erase("b"));
    BOOST_CHECK(!map.contains("b"));
    BOOST_CHECK(map.contains("a"));
}

BOOST_AUTO_TEST_CASE(test_equality_is_order_sensitive) {
    OrderedMap first{{"x", 1}, {"y", 2}};
    OrderedMap second{{"y", 2}, {"x", 1}};
    OrderedMap same{{"x", 1}, {"y", 2}};

    BOOST_CHECK(first.equals(same));
    BOOST_CHECK(!first.equals(second));
}

BOOST_AUTO_TEST_CASE(test_reduce_shape) {
    BOOST_CHECK(OrderedMap().reduce().arguments.empty());

    OrderedMap map{{1, "one"}};
    auto reduction = map.reduce();
    BOOST_REQUIRE_EQUAL(reduction.arguments.size(), 1u);
    const auto& pairs = reduction.arguments[0].as_list();
    BOOST_REQUIRE_EQUAL(pairs.size(), 1u);
    BOOST_CHECK(pairs[0] == Value(Value::List{1, "one"}));
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(CatalogTestSuite)

BOOST_AUTO_TEST_CASE(test_builtin_names) {
    auto& catalog = TypeCatalog::instance();
    BOOST_CHECK(catalog.name_of(typeid(DateTime)) == std::string("stasis.DateTime"));
    BOOST_CHECK(catalog.name_of(typeid(OrderedMap)) ==
                std::string("stasis.OrderedMap"));
    BOOST_CHECK(catalog.type_of("stasis.TimeZone") ==
                std::type_index(typeid(TimeZone)));
    BOOST_CHECK(catalog.factory("stasis.Duration") == Duration::factory());
    BOOST_CHECK(catalog.factory("missing") == nullptr);
    BOOST_CHECK(!catalog.type_of("missing"));
}

BOOST_AUTO_TEST_SUITE_END()
