#include <gtest/gtest.h>

#include <cmath>
#include <limits>
#include <string>

#include "toon_errors.hpp"
#include "toon_host.hpp"
#include "toon_normalize.hpp"
#include "test_helpers.hpp"

using namespace toonenc;
using namespace toonenc::test_util;

namespace {

ValuePtr strict(const HostValuePtr& v) {
    return normalize(*v, NormalizeMode::STRICT);
}

ValuePtr sanitize(const HostValuePtr& v) {
    return normalize(*v, NormalizeMode::SANITIZE);
}

} // namespace

TEST(NormalizeStrict, PrimitivesPassThrough) {
    EXPECT_EQ(strict(null_())->kind, ValueKind::V_NULL);

    auto b = strict(boolean(true));
    ASSERT_EQ(b->kind, ValueKind::V_BOOL);
    EXPECT_TRUE(b->bool_val);

    auto s = strict(str("text"));
    ASSERT_EQ(s->kind, ValueKind::V_STRING);
    EXPECT_EQ(s->string_val, "text");

    auto n = strict(num(2.75));
    ASSERT_EQ(n->kind, ValueKind::V_NUMBER);
    EXPECT_EQ(n->number_val, 2.75);
}

TEST(NormalizeStrict, NegativeZeroBecomesZero) {
    auto n = strict(num(-0.0));
    ASSERT_EQ(n->kind, ValueKind::V_NUMBER);
    EXPECT_EQ(n->number_val, 0.0);
    EXPECT_FALSE(std::signbit(n->number_val));
}

TEST(NormalizeStrict, RejectsNonFiniteNumbers) {
    EXPECT_THROW(strict(num(std::numeric_limits<double>::infinity())), InvalidValueError);
    EXPECT_THROW(strict(num(-std::numeric_limits<double>::infinity())), InvalidValueError);

    try {
        strict(num(std::nan("")));
        FAIL() << "expected InvalidValueError";
    } catch (const InvalidValueError& e) {
        EXPECT_STREQ(e.what(), "Non-finite number in strict mode");
        EXPECT_EQ(e.type(), ErrorType::INVALID_VALUE);
    }
}

TEST(NormalizeStrict, RejectsNonJsonTypesByName) {
    struct Case {
        HostValuePtr value;
        std::string type;
    };
    const Case cases[] = {
        {HostValue::make_bigint("123"), "bigint"},
        {undefined(), "undefined"},
        {HostValue::make_date(0), "Date"},
        {HostValue::make_function("f"), "function"},
        {HostValue::make_symbol("s"), "symbol"},
        {HostValue::make_instance("Widget", "[object Widget]"), "Widget"},
    };

    for (const auto& c : cases) {
        try {
            strict(c.value);
            FAIL() << "expected InvalidValueError for " << c.type;
        } catch (const InvalidValueError& e) {
            EXPECT_EQ(std::string(e.what()), "Non-JSON type in strict mode: " + c.type);
            EXPECT_EQ(e.type_name(), c.type);
        }
    }
}

TEST(NormalizeStrict, ReportsPathOfOffendingValue) {
    auto v = obj({{"a", arr({num(1), obj({{"b", HostValue::make_function()}})})}});

    try {
        strict(v);
        FAIL() << "expected InvalidValueError";
    } catch (const InvalidValueError& e) {
        EXPECT_EQ(e.path(), "$.a[1].b");
        EXPECT_NE(e.formatted_message().find("Path: $.a[1].b"), std::string::npos);
    }
}

TEST(NormalizeStrict, DuplicateKeysCollapseToLastValue) {
    auto v = HostValue::make_object();
    v->object_items.emplace_back("a", num(1));
    v->object_items.emplace_back("b", num(2));
    v->object_items.emplace_back("a", num(3));

    auto out = strict(v);
    ASSERT_EQ(out->object_items.size(), 2u);
    EXPECT_EQ(out->object_items[0].first, "a");
    EXPECT_EQ(out->object_items[0].second->number_val, 3);
    EXPECT_EQ(out->object_items[1].first, "b");
}

TEST(NormalizeSanitize, DuplicateKeyEndingMissingIsDropped) {
    auto v = HostValue::make_object();
    v->object_items.emplace_back("a", num(1));
    v->object_items.emplace_back("b", num(2));
    v->object_items.emplace_back("a", undefined());

    auto out = sanitize(v);
    ASSERT_EQ(out->object_items.size(), 1u);
    EXPECT_EQ(out->object_items[0].first, "b");
}

TEST(NormalizeStrict, UndefinedFieldIsRejected) {
    EXPECT_THROW(strict(obj({{"a", undefined()}})), InvalidValueError);
}

TEST(NormalizeStrict, PreservesKeyOrder) {
    auto v = strict(obj({{"zeta", num(1)}, {"alpha", num(2)}, {"mid", num(3)}}));
    ASSERT_EQ(v->object_items.size(), 3u);
    EXPECT_EQ(v->object_items[0].first, "zeta");
    EXPECT_EQ(v->object_items[1].first, "alpha");
    EXPECT_EQ(v->object_items[2].first, "mid");
}

TEST(NormalizeSanitize, NonFiniteBecomesNull) {
    EXPECT_EQ(sanitize(num(std::nan("")))->kind, ValueKind::V_NULL);
    EXPECT_EQ(sanitize(num(std::numeric_limits<double>::infinity()))->kind, ValueKind::V_NULL);
}

TEST(NormalizeSanitize, BigIntBecomesDecimalString) {
    auto v = sanitize(HostValue::make_bigint("12345678901234567890"));
    ASSERT_EQ(v->kind, ValueKind::V_STRING);
    EXPECT_EQ(v->string_val, "12345678901234567890");
}

TEST(NormalizeSanitize, DatesBecomeIsoStrings) {
    EXPECT_EQ(sanitize(HostValue::make_date(0))->string_val, "1970-01-01T00:00:00.000Z");
    EXPECT_EQ(sanitize(HostValue::make_date(-1))->string_val, "1969-12-31T23:59:59.999Z");
    EXPECT_EQ(sanitize(HostValue::make_date(1700000000000.0))->string_val, "2023-11-14T22:13:20.000Z");
    EXPECT_EQ(sanitize(HostValue::make_date(951782400000.0))->string_val, "2000-02-29T00:00:00.000Z");
    EXPECT_EQ(sanitize(HostValue::make_date(253402300800000.0))->string_val, "+010000-01-01T00:00:00.000Z");
    EXPECT_EQ(sanitize(HostValue::make_date(-62198755200000.0))->string_val, "-000001-01-01T00:00:00.000Z");
}

TEST(NormalizeSanitize, InvalidDateBecomesNull) {
    EXPECT_EQ(sanitize(HostValue::make_date(std::nan("")))->kind, ValueKind::V_NULL);
    EXPECT_EQ(sanitize(HostValue::make_date(8.64e15 + 1))->kind, ValueKind::V_NULL);
}

TEST(NormalizeSanitize, UnrepresentableBecomesNull) {
    EXPECT_EQ(sanitize(HostValue::make_function("f"))->kind, ValueKind::V_NULL);
    EXPECT_EQ(sanitize(HostValue::make_symbol("s"))->kind, ValueKind::V_NULL);
    EXPECT_EQ(sanitize(undefined())->kind, ValueKind::V_NULL);
}

TEST(NormalizeSanitize, InstancesUseTheirStringForm) {
    auto v = sanitize(HostValue::make_instance("Widget", "[object Widget]"));
    ASSERT_EQ(v->kind, ValueKind::V_STRING);
    EXPECT_EQ(v->string_val, "[object Widget]");
}

TEST(NormalizeSanitize, MissingArrayElementsKeepTheirSlot) {
    auto v = sanitize(arr({num(1), undefined(), num(3)}));
    ASSERT_EQ(v->array_items.size(), 3u);
    EXPECT_EQ(v->array_items[1]->kind, ValueKind::V_NULL);
}

TEST(NormalizeSanitize, MissingFieldsAreDropped) {
    auto v = sanitize(obj({{"a", undefined()}, {"b", num(2)}, {"c", null_()}}));
    ASSERT_EQ(v->object_items.size(), 2u);
    EXPECT_EQ(v->object_items[0].first, "b");
    EXPECT_EQ(v->object_items[1].first, "c");
    EXPECT_EQ(v->find("a"), nullptr);
}

TEST(NormalizeSanitize, IsIdempotent) {
    auto input = obj({
        {"n", num(-0.0)},
        {"inf", num(std::numeric_limits<double>::infinity())},
        {"big", HostValue::make_bigint("99")},
        {"when", HostValue::make_date(86400000.0)},
        {"gone", undefined()},
        {"list", arr({undefined(), HostValue::make_function(), str("x")})},
        {"w", HostValue::make_instance("Widget", "W")},
    });

    auto once = sanitize(input);
    auto twice = sanitize(once->to_host());
    EXPECT_TRUE(once->equals(*twice));
}

TEST(NormalizeSanitize, AggregatesWarnings) {
    NormalizeOptions opts;
    opts.mode = NormalizeMode::SANITIZE;
    Normalizer normalizer(opts);

    normalizer.normalize(*obj({
        {"a", num(std::nan(""))},
        {"b", num(std::numeric_limits<double>::infinity())},
        {"c", undefined()},
    }));

    auto warnings = normalizer.warnings();
    ASSERT_EQ(warnings.size(), 2u);
    EXPECT_EQ(warnings[0].type, "non_finite");
    EXPECT_EQ(warnings[0].message, "2 non-finite number(s) coerced to null");
    EXPECT_EQ(warnings[1].type, "dropped_field");
}

TEST(NormalizeSanitize, WarningsCanBeDisabled) {
    NormalizeOptions opts;
    opts.mode = NormalizeMode::SANITIZE;
    opts.warn = false;
    Normalizer normalizer(opts);

    normalizer.normalize(*arr({num(std::nan(""))}));
    EXPECT_TRUE(normalizer.warnings().empty());
}

TEST(NormalizeDepth, RejectsDeepNesting) {
    NormalizeOptions opts;
    opts.max_depth = 3;
    Normalizer normalizer(opts);

    EXPECT_NO_THROW(normalizer.normalize(*arr({arr({arr({num(1)})})})));
    EXPECT_THROW(normalizer.normalize(*arr({arr({arr({arr({num(1)})})})})), DepthExceededError);
}

TEST(NormalizeDepth, CyclicInputFailsInBothModes) {
    auto self = HostValue::make_object();
    self->set("self", self);

    EXPECT_THROW(strict(self), DepthExceededError);
    EXPECT_THROW(sanitize(self), DepthExceededError);

    // Break the cycle so the nodes are released
    self->object_items.clear();
}

TEST(HostValue, SetReplacesInPlace) {
    auto v = obj({{"a", num(1)}, {"b", num(2)}});
    v->set("a", num(3));
    ASSERT_EQ(v->object_items.size(), 2u);
    EXPECT_EQ(v->object_items[0].first, "a");
    EXPECT_EQ(v->object_items[0].second->number_val, 3);
}

TEST(Value, EqualityIsOrderSensitive) {
    auto a = strict(obj({{"x", num(1)}, {"y", num(2)}}));
    auto b = strict(obj({{"y", num(2)}, {"x", num(1)}}));
    auto c = strict(obj({{"x", num(1)}, {"y", num(2)}}));
    EXPECT_FALSE(a->equals(*b));
    EXPECT_TRUE(a->equals(*c));
}
