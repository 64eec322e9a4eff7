#pragma once

#include <cstdint>
#include <type_traits>

/**
 * One column of a table. The derived types give it a name, and optionally
 * the SQL options appended to its definition:
 *
 *   struct Jid: Column<std::string> { static constexpr auto name = "jid";
 *     static constexpr auto options = "NOT NULL"; };
 */
template <typename T>
struct Column
{
    Column(T default_value):
        value{default_value} {}
    Column():
        value{} {}
    using real_type = T;
    T value{};
};

/**
 * Base of the integer primary keys assigned by the database itself.  Their
 * value is never part of an INSERT, and it is set from the last inserted
 * rowid once the row is saved.
 */
struct IdColumn: Column<std::int64_t> {
    static constexpr std::int64_t unset_value = -1;

    IdColumn(): Column<std::int64_t>(unset_value) {}
};

template <typename ColumnType>
constexpr bool is_id_column = std::is_base_of<IdColumn, ColumnType>::value;
