/// @file test_cursor.cpp
/// Unit tests for cursor.hpp — page-number and opaque cursors.

#include "cursor.hpp"
#include "errors.hpp"

#include <gtest/gtest.h>

using namespace osu_rankings;

namespace {

std::string missingFieldOf(const Json& value) {
    try {
        parsePageCursor(value);
    } catch (const MissingFieldError& e) {
        return e.field();
    }
    return "";
}

} // namespace

// ============================================================================
// parsePageCursor — the three wire shapes
// ============================================================================

TEST(ParsePageCursor, NullIsNone) {
    auto cursor = parsePageCursor(Json(nullptr));
    EXPECT_FALSE(cursor.hasMore());
    EXPECT_EQ(cursor, PageCursor::none());
}

TEST(ParsePageCursor, BareInteger) {
    EXPECT_EQ(parsePageCursor(Json(7)), PageCursor::page(7));
    EXPECT_EQ(parsePageCursor(Json::parse("7")), PageCursor::page(7));
}

TEST(ParsePageCursor, ObjectWithPage) {
    EXPECT_EQ(parsePageCursor(Json{{"page", 3}}), PageCursor::page(3));
}

TEST(ParsePageCursor, ObjectWithPageAndExtraKeys) {
    auto cursor = parsePageCursor(Json::parse(R"({"page": 3, "extra": "x"})"));
    ASSERT_TRUE(cursor.nextPage().has_value());
    EXPECT_EQ(*cursor.nextPage(), 3u);
}

TEST(ParsePageCursor, EmptyObjectIsMissingPage) {
    EXPECT_THROW(parsePageCursor(Json::object()), MissingFieldError);
    EXPECT_EQ(missingFieldOf(Json::object()), "page");
}

TEST(ParsePageCursor, ObjectWithoutPageIsMissingPage) {
    EXPECT_EQ(missingFieldOf(Json{{"extra", 1}}), "page");
}

TEST(ParsePageCursor, ShapeIsNotObservable) {
    // Integer and object forms decode to indistinguishable values.
    EXPECT_EQ(parsePageCursor(Json(4)), parsePageCursor(Json{{"page", 4}}));
}

TEST(ParsePageCursor, UnsupportedKindsAreTypeMismatches) {
    EXPECT_THROW(parsePageCursor(Json("3")), TypeMismatchError);
    EXPECT_THROW(parsePageCursor(Json(true)), TypeMismatchError);
    EXPECT_THROW(parsePageCursor(Json::array({3})), TypeMismatchError);
    EXPECT_THROW(parsePageCursor(Json(2.5)), TypeMismatchError);
    EXPECT_THROW(parsePageCursor(Json{{"page", "3"}}), TypeMismatchError);
}

TEST(ParsePageCursor, NegativeOrHugeNumbersAreRejected) {
    EXPECT_THROW(parsePageCursor(Json(-1)), TypeMismatchError);
    EXPECT_THROW(parsePageCursor(Json(uint64_t{1} << 40)), TypeMismatchError);
}

// ============================================================================
// parsePageCursorField
// ============================================================================

TEST(ParsePageCursorField, AbsentKeyIsNone) {
    auto envelope = Json{{"total", 50}};
    EXPECT_EQ(parsePageCursorField(envelope, "cursor"), PageCursor::none());
}

TEST(ParsePageCursorField, PresentKeyIsDecoded) {
    auto envelope = Json::parse(R"({"cursor": {"page": 2}, "total": 50})");
    EXPECT_EQ(parsePageCursorField(envelope, "cursor"), PageCursor::page(2));
}

TEST(PageCursorToJson, EncodesObjectFormOrNull) {
    EXPECT_EQ(pageCursorToJson(PageCursor::page(5)), Json::parse(R"({"page": 5})"));
    EXPECT_TRUE(pageCursorToJson(PageCursor::none()).is_null());
}

// ============================================================================
// Opaque cursors
// ============================================================================

TEST(ParseOpaqueCursorField, AbsentOrNullIsEmpty) {
    EXPECT_FALSE(parseOpaqueCursorField(Json::object(), "cursor").has_value());
    EXPECT_FALSE(parseOpaqueCursorField(Json{{"cursor", nullptr}}, "cursor").has_value());
}

TEST(ParseOpaqueCursorField, TokenIsKeptVerbatim) {
    auto envelope = Json::parse(
        R"({"cursor": {"published_at": "2024-03-01T00:00:00+00:00", "id": 1234}})");

    auto cursor = parseOpaqueCursorField(envelope, "cursor");
    ASSERT_TRUE(cursor.has_value());
    EXPECT_EQ(cursor->token(), envelope["cursor"]);
    EXPECT_EQ(cursor->token().dump(), envelope["cursor"].dump());
}

TEST(ParseOpaqueCursorField, PageShapedTokenIsNotInterpreted) {
    // A token that happens to look like a page cursor stays a token.
    auto cursor = parseOpaqueCursorField(Json{{"cursor", {{"page", 2}}}}, "cursor");
    ASSERT_TRUE(cursor.has_value());
    EXPECT_EQ(cursor->token(), (Json{{"page", 2}}));
}
