#include <gtest/gtest.h>

#include "query/logql.h"
#include "server/api_error.h"
#include "server/request_builder.h"

using namespace logq;
using namespace logq::server;

namespace {

QueryValues values(const std::string& query) {
    return QueryValues::parse("/x?" + query);
}

} // namespace

TEST(LookbackTest, Defaults) {
    auto now = query::fromUnixNanos(1554375800000000000LL);
    auto lb = buildLookback(values(""), now);
    EXPECT_EQ(lb.limit, 100u);
    EXPECT_EQ(lb.end, now);
    EXPECT_EQ(lb.start, now - std::chrono::hours(1));
}

TEST(LookbackTest, NegativeLimitRejected) {
    EXPECT_THROW(buildLookback(values("limit=-1"), query::now()), ApiError);
    EXPECT_EQ(buildLookback(values("limit=0"), query::now()).limit, 0u);
}

TEST(RangeQueryRequestTest, ExplicitParameters) {
    auto req = buildRangeQueryRequest(values(
        "query=%7Bapp%3D%22x%22%7D&start=1554375800&end=1554376800&step=60&limit=5&direction=forward"));
    EXPECT_EQ(req.query, "{app=\"x\"}");
    EXPECT_EQ(query::toUnixNanos(req.start), 1554375800000000000LL);
    EXPECT_EQ(query::toUnixNanos(req.end), 1554376800000000000LL);
    EXPECT_EQ(req.step, std::chrono::seconds(60));
    EXPECT_EQ(req.limit, 5u);
    EXPECT_EQ(req.direction, query::Direction::FORWARD);
}

TEST(RangeQueryRequestTest, DefaultStepFromRange) {
    auto req = buildRangeQueryRequest(values("start=1554375800&end=1554376800"));
    EXPECT_EQ(req.step, std::chrono::seconds(4));
    EXPECT_EQ(req.direction, query::Direction::BACKWARD);
}

TEST(RangeQueryRequestTest, NonPositiveStepRejected) {
    EXPECT_THROW(buildRangeQueryRequest(values("step=0")), ApiError);
    EXPECT_THROW(buildRangeQueryRequest(values("step=-5")), ApiError);
}

TEST(InstantQueryRequestTest, TimeParameter) {
    auto req = buildInstantQueryRequest(values("query=%7Ba%3D%22b%22%7D&time=1.5"));
    EXPECT_EQ(query::toUnixNanos(req.ts), 1500000000LL);
    EXPECT_EQ(req.limit, 100u);
    EXPECT_EQ(req.direction, query::Direction::BACKWARD);
}

TEST(InstantQueryRequestTest, BadDirectionRejected) {
    try {
        buildInstantQueryRequest(values("direction=up"));
        FAIL() << "expected failure";
    } catch (const ApiError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::InvalidParameter);
    }
}

TEST(TailRequestTest, DelayForAtMaximumAccepted) {
    auto req = buildTailRequest(values("query=%7Bapp%3D%22x%22%7D&delay_for=5"));
    EXPECT_EQ(req.delay_for, 5u);
    EXPECT_EQ(req.limit, 100u);
}

TEST(TailRequestTest, DelayForAboveMaximumRejected) {
    try {
        buildTailRequest(values("query=%7Bapp%3D%22x%22%7D&delay_for=6"));
        FAIL() << "expected failure";
    } catch (const ApiError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::DelayTooLarge);
        EXPECT_EQ(e.statusCode(), 400u);
        EXPECT_EQ(std::string(e.what()), "delay_for can't be greater than 5");
    }
}

TEST(TailRequestTest, ConfigurableMaximum) {
    EXPECT_EQ(buildTailRequest(values("delay_for=10"), 10).delay_for, 10u);
    EXPECT_THROW(buildTailRequest(values("delay_for=1"), 0), ApiError);
    EXPECT_THROW(buildTailRequest(values("delay_for=-1")), ApiError);
}

TEST(TailRequestTest, RegexpFoldedIntoQuery) {
    auto req = buildTailRequest(values("query=%7Bapp%3D%22x%22%7D&regexp=err.*&start=1554375800"));
    EXPECT_EQ(req.query, "{app=\"x\"} |~ \"err.*\"");
    EXPECT_EQ(query::toUnixNanos(req.start), 1554375800000000000LL);
}

TEST(LabelRequestTest, NamesAndValues) {
    auto names = buildLabelRequest(values("end=1554375800"), "");
    EXPECT_FALSE(names.values);
    EXPECT_EQ(names.end - names.start, std::chrono::hours(6));

    auto vals = buildLabelRequest(values("start=1554300000&end=1554375800"), "app");
    EXPECT_TRUE(vals.values);
    EXPECT_EQ(vals.name, "app");
    EXPECT_EQ(query::toUnixNanos(vals.start), 1554300000000000000LL);
}

TEST(CombineRegexpTest, AppendsRegexFilter) {
    EXPECT_EQ(combineRegexp("{app=\"x\"}", "err.*"), "{app=\"x\"} |~ \"err.*\"");
}

TEST(CombineRegexpTest, KeepsExistingFiltersAndCanonicalises) {
    EXPECT_EQ(combineRegexp("{app=\"x\",env=~\"prod|dev\"} |= \"GET\"", "5\\d\\d"),
              "{app=\"x\", env=~\"prod|dev\"} |= \"GET\" |~ \"5\\\\d\\\\d\"");
}

TEST(CombineRegexpTest, EmptyRegexpLeavesQueryUntouched) {
    EXPECT_EQ(combineRegexp("anything at all", ""), "anything at all");
}

TEST(CombineRegexpTest, InvalidInputRejected) {
    EXPECT_THROW(combineRegexp("{app=\"x\"", "err"), ApiError);
    EXPECT_THROW(combineRegexp("count_over_time({app=\"x\"}[5m])", "err"), ApiError);
    EXPECT_THROW(combineRegexp("{app=\"x\"}", "(unclosed"), ApiError);
}

TEST(CombineRegexpTest, CombinedQueryParsesBack) {
    auto combined = combineRegexp("{app=\"x\"}", "a\"b");
    query::LogQLParser parser;
    auto parsed = parser.parseLogSelector(combined);
    ASSERT_TRUE(parsed.success) << parsed.error.toString();
    EXPECT_EQ(parsed.expr->toString(), combined);
}

TEST(RangeQueryRequestTest, ExtremeNanosecondBoundsKeepLargeDefaultStep) {
    auto req = buildRangeQueryRequest(values("start=-9223372036854775807&end=9223372036854775807"));
    EXPECT_EQ(query::toUnixNanos(req.start), -9223372036854775807LL);
    EXPECT_EQ(query::toUnixNanos(req.end), 9223372036854775807LL);
    EXPECT_EQ(req.step, std::chrono::seconds(36893488));
}

TEST(LabelRequestTest, DefaultStartClampsAtEarliestTimestamp) {
    auto req = buildLabelRequest(values("end=-9223372036854775807"), "");
    EXPECT_EQ(req.start, query::Timestamp::min());
}
