#pragma once

#include <database/statement.hpp>
#include <database/column.hpp>
#include <database/errors.hpp>
#include <database/query.hpp>
#include <database/table.hpp>

#include <type_traits>
#include <string>
#include <tuple>

/**
 * INSERT all the columns of a row, except its IdColumn, whose value is
 * chosen by the database.
 */
struct InsertQuery: public Query
{
  template <typename... T>
  InsertQuery(const std::string& name, const std::tuple<T...>& columns,
              const std::string& verb="INSERT"):
      Query(verb + " INTO ")
  {
    this->body += name;
    this->insert_col_names(columns);
    this->insert_values(columns);
  }

  template <int N=0, typename... T>
  typename std::enable_if<N < sizeof...(T), void>::type
  add_params(const std::tuple<T...>& columns)
  {
    auto&& column = std::get<N>(columns);
    using ColumnType = std::decay_t<decltype(column)>;

    if (!is_id_column<ColumnType>)
      actual_add_param(*this, column.value);

    this->add_params<N+1>(columns);
  }

  template <int N=0, typename... T>
  typename std::enable_if<N == sizeof...(T), void>::type
  add_params(const std::tuple<T...>&)
  {}

  template <typename... T>
  void insert_values(const std::tuple<T...>& columns)
  {
    this->body += " VALUES (";
    this->insert_value(columns);
    this->body += ")";
    this->add_params(columns);
  }

  template <int N=0, typename... T>
  typename std::enable_if<N < sizeof...(T), void>::type
  insert_value(const std::tuple<T...>& columns, bool first=true)
  {
    using ColumnType = std::decay_t<decltype(std::get<N>(columns))>;

    if (!is_id_column<ColumnType>)
      {
        if (!first)
          this->body += ", ";
        this->add_placeholder();
        first = false;
      }
    this->insert_value<N+1>(columns, first);
  }
  template <int N=0, typename... T>
  typename std::enable_if<N == sizeof...(T), void>::type
  insert_value(const std::tuple<T...>&, const bool)
  { }

  template <typename... T>
  void insert_col_names(const std::tuple<T...>& columns)
  {
    this->body += " (";
    this->insert_col_name(columns);
    this->body += ")";
  }

  template <int N=0, typename... T>
  typename std::enable_if<N < sizeof...(T), void>::type
  insert_col_name(const std::tuple<T...>& columns, bool first=true)
  {
    using ColumnType = std::decay_t<decltype(std::get<N>(columns))>;

    if (!is_id_column<ColumnType>)
      {
        if (!first)
          this->body += ", ";
        this->body += ColumnType::name;
        first = false;
      }

    this->insert_col_name<N+1>(columns, first);
  }

  template <int N=0, typename... T>
  typename std::enable_if<N == sizeof...(T), void>::type
  insert_col_name(const std::tuple<T...>&, const bool)
  {}
};

template <std::size_t N=0, typename... T>
typename std::enable_if<N < sizeof...(T), void>::type
update_autoincrement_id(std::tuple<T...>& columns, const std::int64_t rowid)
{
  auto&& column = std::get<N>(columns);
  using ColumnType = std::decay_t<decltype(column)>;
  if constexpr (is_id_column<ColumnType>)
    column.value = rowid;
  update_autoincrement_id<N+1>(columns, rowid);
}

template <std::size_t N=0, typename... T>
typename std::enable_if<N == sizeof...(T), void>::type
update_autoincrement_id(std::tuple<T...>&, const std::int64_t)
{}

/**
 * Insert the row. If it has an IdColumn, it receives the value assigned by
 * the database.  Returns Constraint, instead of throwing, when a UNIQUE or
 * PRIMARY KEY constraint rejected the row, for the callers that know what
 * to do in that case.
 */
template <typename... T>
StepResult insert(Row<T...>& row, DatabaseEngine& db)
{
  InsertQuery query(row.table_name, row.columns);
  const auto res = query.execute(db);
  if (res == StepResult::Done)
    update_autoincrement_id(row.columns, db.last_inserted_rowid);
  return res;
}

/**
 * Same as insert(), but a row that already exists is silently kept as is.
 * Returns whether a new row has been inserted.
 */
template <typename... T>
bool insert_or_ignore(Row<T...>& row, DatabaseEngine& db)
{
  InsertQuery query(row.table_name, row.columns, "INSERT OR IGNORE");
  if (query.execute(db) != StepResult::Done)
    throw StorageFailure("Failed to insert a row in " + row.table_name);
  return db.affected_rows() > 0;
}
