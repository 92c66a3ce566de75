#pragma once

#include "json_types.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <utility>

namespace osu_rankings {

/// Page-number cursor of ranking resources.
///
/// On the wire it is null/absent, a bare integer, or an object carrying
/// `page`. Once decoded the producing shape is forgotten: a cursor is either
/// "no more pages" or the number of the next page.
class PageCursor {
public:
    /// No further pages exist.
    PageCursor() = default;

    static PageCursor none() { return PageCursor(); }
    static PageCursor page(uint32_t number) { return PageCursor(number); }

    bool hasMore() const { return mPage.has_value(); }

    /// Number of the next page; std::nullopt when exhausted.
    std::optional<uint32_t> nextPage() const { return mPage; }

    bool operator==(const PageCursor& other) const { return mPage == other.mPage; }
    bool operator!=(const PageCursor& other) const { return !(*this == other); }

private:
    explicit PageCursor(uint32_t number) : mPage(number) {}

    std::optional<uint32_t> mPage;
};

/// Forward-only token of list/search resources. Stored and replayed
/// verbatim; its contents are never interpreted.
class OpaqueCursor {
public:
    explicit OpaqueCursor(Json token) : mToken(std::move(token)) {}

    const Json& token() const { return mToken; }

    bool operator==(const OpaqueCursor& other) const { return mToken == other.mToken; }
    bool operator!=(const OpaqueCursor& other) const { return !(*this == other); }

private:
    Json mToken;
};

/// Decode one page-number cursor value.
///
///   null                 -> PageCursor::none()
///   n (integer >= 0)     -> PageCursor::page(n)
///   {"page": n, ...}     -> PageCursor::page(n), other keys ignored
///   {...} without page   -> MissingFieldError("page")
///
/// Any other JSON kind, a negative number or a number beyond 32 bits throws
/// TypeMismatchError.
PageCursor parsePageCursor(const Json& value);

/// Decode the page-number cursor stored under @p key; an absent key is the
/// same as null.
PageCursor parsePageCursorField(const Json& envelope, const char* key);

/// Encode as {"page": n}; exhausted cursors encode as null.
Json pageCursorToJson(const PageCursor& cursor);

/// Read the opaque token stored under @p key. Absent and null mean no
/// further results.
std::optional<OpaqueCursor> parseOpaqueCursorField(const Json& envelope,
                                                   const char* key);

} // namespace osu_rankings
