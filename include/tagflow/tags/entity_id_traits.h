#pragma once

#include <charconv>
#include <cstdint>
#include <string>
#include <string_view>
#include <system_error>
#include <tagflow/core/types.h>
#include <tagflow/metadata/database.h>

namespace tagflow::tags {

/**
 * @brief How an entity id type is bound, read back and parsed.
 *
 * Specialised for every id type a TagEngine can be instantiated with.
 */
template <typename Id> struct EntityIdTraits;

template <> struct EntityIdTraits<std::string> {
    static Result<void> bind(metadata::Statement& stmt, int index, const std::string& id) {
        return stmt.bind(index, id);
    }

    static std::string read(const metadata::Statement& stmt, int column) {
        return stmt.getString(column);
    }

    static Result<std::string> parse(std::string_view text) {
        if (text.empty()) {
            return Error{ErrorCode::InvalidArgument, "Entity id must not be empty"};
        }
        return std::string(text);
    }
};

template <> struct EntityIdTraits<std::int64_t> {
    static Result<void> bind(metadata::Statement& stmt, int index, std::int64_t id) {
        return stmt.bind(index, id);
    }

    static std::int64_t read(const metadata::Statement& stmt, int column) {
        return stmt.getInt64(column);
    }

    static Result<std::int64_t> parse(std::string_view text) {
        std::int64_t value = 0;
        auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
        if (text.empty() || ec != std::errc{} || end != text.data() + text.size()) {
            return Error{ErrorCode::InvalidArgument,
                         "Invalid entity id: '" + std::string(text) + "'"};
        }
        return value;
    }
};

} // namespace tagflow::tags
