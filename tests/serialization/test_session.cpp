// tests/serialization/test_session.cpp
#define BOOST_TEST_MODULE SessionTests
#include <boost/test/unit_test.hpp>

#include <memory>
#include <vector>

#include "stasis/serialization/session.hpp"
#include "stasis/types/duration.hpp"
#include "stasis/types/ordered_map.hpp"
#include "stasis/types/temporal.hpp"
#include "stasis/types/time_breakdown.hpp"
#include "stasis/types/timezone.hpp"

using namespace stasis::serialization;
using stasis::types::DateTime;
using stasis::types::Duration;
using stasis::types::OrderedMap;
using stasis::types::Time;
using stasis::types::TimeBreakdown;
using stasis::types::TimeZone;

namespace {

class Unregistered : public Object {
public:
    std::string str() const override { return "<unregistered>"; }
    bool equals(const Object&) const override { return false; }
};

Value nested_lists(int depth) {
    Value value = 0;
    for (int i = 0; i < depth; ++i) {
        value = Value(Value::List{value});
    }
    return value;
}

}  // namespace

BOOST_AUTO_TEST_SUITE(SessionTestSuite)

BOOST_AUTO_TEST_CASE(test_primitives) {
    Session session;
    Value original(Value::List{Value(), true, 12, 0.25, "text"});

    nlohmann::json document = session.flatten(original);
    BOOST_CHECK_EQUAL(document.dump(), R"([null,true,12,0.25,"text"])");
    BOOST_CHECK(session.restore(document) == original);
}

BOOST_AUTO_TEST_CASE(test_bytes_and_factories_are_tagged) {
    Session session;

    nlohmann::json bytes = session.flatten(Value::Bytes{'h', 'i'});
    BOOST_CHECK_EQUAL(bytes.dump(), R"({"__bytes__":"aGk="})");
    BOOST_CHECK(session.restore(bytes) == Value(Value::Bytes{'h', 'i'}));

    nlohmann::json factory = session.flatten(Duration::factory());
    BOOST_CHECK_EQUAL(factory.dump(), R"({"__type__":"stasis.Duration"})");
    Value restored = session.restore(factory);
    BOOST_REQUIRE(restored.is_factory());
    BOOST_CHECK_EQUAL(restored.as_factory()->name(), "stasis.Duration");
}

BOOST_AUTO_TEST_CASE(test_encode_decode) {
    Session session;
    Value original(std::make_shared<const OrderedMap>(OrderedMap{
        {"span", std::make_shared<const Duration>(-1, 86399)},
        {"when", std::make_shared<const TimeBreakdown>(
                     TimeBreakdown::Fields{2023, 1, 1, 0, 0, 0, 6, 1, 0})}}));

    const std::string text = session.encode(original);
    BOOST_CHECK(text.find("\"__object__\":\"stasis.OrderedMap\"") !=
                std::string::npos);

    Value restored = session.decode(text);
    BOOST_CHECK(restored == original);
    BOOST_CHECK_EQUAL(
        restored.as<OrderedMap>()->find("span")->str(), "-1 day, 23:59:59");
}

BOOST_AUTO_TEST_CASE(test_free_functions) {
    Value original(std::make_shared<const Duration>(3, 4, 5));
    BOOST_CHECK(decode(encode(original)) == original);
    BOOST_CHECK_EQUAL(encode(original, false), R"("3 days, 0:00:04.000005")");
}

BOOST_AUTO_TEST_CASE(test_lossy_mode_writes_string_forms) {
    SessionConfig config;
    config.unpicklable = false;
    Session lossy(config);

    const std::vector<Value> values = {
        Value(std::make_shared<const DateTime>(2023, 1, 1, 12, 0, 0, 0,
                                               TimeZone::utc())),
        Value(std::make_shared<const Time>(8, 15)),
        Value(std::make_shared<const TimeZone>(Duration(0, 3600), "CET")),
        Value(std::make_shared<const TimeBreakdown>(
            TimeBreakdown::Fields{2023, 1, 1, 0, 0, 0, 6, 1, 0})),
        Value(std::make_shared<const OrderedMap>(
            OrderedMap{{"span", std::make_shared<const Duration>(1)}}))};

    for (const auto& value : values) {
        BOOST_TEST_CONTEXT(value.str()) {
            nlohmann::json document = lossy.flatten(value);
            BOOST_REQUIRE(document.is_string());
            BOOST_CHECK_EQUAL(document.get<std::string>(), value.str());
            BOOST_CHECK(document.dump().find("__reduce__") == std::string::npos);
            BOOST_CHECK(document.dump().find("__object__") == std::string::npos);
        }
    }
}

BOOST_AUTO_TEST_CASE(test_indent) {
    SessionConfig config;
    config.indent = 2;
    Session session(config);

    BOOST_CHECK_EQUAL(session.encode(Value::List{1}), "[\n  1\n]");
}

BOOST_AUTO_TEST_CASE(test_unregistered_type) {
    Session strict;
    BOOST_CHECK_THROW(strict.flatten(std::make_shared<const Unregistered>()),
                      SerializationException);

    SessionConfig config;
    config.unpicklable = false;
    Session lossy(config);
    BOOST_CHECK_EQUAL(lossy.flatten(std::make_shared<const Unregistered>()),
                      "<unregistered>");
}

BOOST_AUTO_TEST_CASE(test_restore_rejects_unknown_input) {
    Session session;

    BOOST_CHECK_THROW(session.restore({{"plain", 1}}), SerializationException);
    BOOST_CHECK_THROW(session.restore({{"__object__", "no.such.Type"}}),
                      SerializationException);
    BOOST_CHECK_THROW(session.restore({{"__type__", "no.such.factory"}}),
                      SerializationException);
    BOOST_CHECK_THROW(session.restore({{"__object__", 7}}),
                      SerializationException);
    BOOST_CHECK_THROW(session.restore(nlohmann::json(18446744073709551615ULL)),
                      SerializationException);
    BOOST_CHECK_THROW(session.decode("{not json"), SerializationException);
}

BOOST_AUTO_TEST_CASE(test_depth_bound) {
    SessionConfig config;
    config.max_depth = 8;
    Session session(config);

    BOOST_CHECK_NO_THROW(session.flatten(nested_lists(7)));
    BOOST_CHECK_THROW(session.flatten(nested_lists(8)), SerializationException);

    nlohmann::json deep = 0;
    for (int i = 0; i < 8; ++i) {
        deep = nlohmann::json::array({deep});
    }
    BOOST_CHECK_THROW(session.restore(deep), SerializationException);

    // A failed call leaves the session usable
    BOOST_CHECK_NO_THROW(session.flatten(nested_lists(3)));
}

BOOST_AUTO_TEST_CASE(test_invalid_config_rejected) {
    SessionConfig config;
    config.max_depth = 0;
    BOOST_CHECK_THROW(Session session(config), std::invalid_argument);
}

BOOST_AUTO_TEST_SUITE_END()
