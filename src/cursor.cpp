#include "cursor.hpp"
#include "errors.hpp"
#include "mapping.hpp"

namespace osu_rankings {

namespace {

uint32_t toPageNumber(const Json& value) {
    if (!value.is_number_integer()) {
        throw TypeMismatchError(
            std::string("expected a page number, got ") + value.type_name());
    }
    return checkedInteger<uint32_t>(value);
}

} // namespace

PageCursor parsePageCursor(const Json& value) {
    switch (value.type()) {
        case Json::value_t::null:
            return PageCursor::none();

        case Json::value_t::number_integer:
        case Json::value_t::number_unsigned:
            return PageCursor::page(toPageNumber(value));

        case Json::value_t::object:
            return PageCursor::page(toPageNumber(requireField(value, "page")));

        default:
            throw TypeMismatchError(
                std::string("expected a page number, an object holding `page`"
                            " or null, got ") + value.type_name());
    }
}

PageCursor parsePageCursorField(const Json& envelope, const char* key) {
    const auto it = envelope.find(key);
    if (it == envelope.end()) {
        return PageCursor::none();
    }
    return parsePageCursor(*it);
}

Json pageCursorToJson(const PageCursor& cursor) {
    const auto page = cursor.nextPage();
    if (!page) {
        return nullptr;
    }
    return Json{{"page", *page}};
}

std::optional<OpaqueCursor> parseOpaqueCursorField(const Json& envelope,
                                                   const char* key) {
    const auto it = envelope.find(key);
    if (it == envelope.end() || it->is_null()) {
        return std::nullopt;
    }
    return OpaqueCursor(*it);
}

} // namespace osu_rankings
