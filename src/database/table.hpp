#pragma once

#include <database/engine.hpp>
#include <database/column.hpp>
#include <database/errors.hpp>

#include <logger/logger.hpp>

#include <optional>
#include <string>
#include <tuple>
#include <set>
#include <type_traits>

using namespace std::string_literals;

/**
 * The values of one row of a table (or of a view), one member per column.
 */
template <typename... T>
struct Row
{
  Row(std::string name):
      table_name(std::move(name))
  {}

  template <typename Type>
  typename Type::real_type& col()
  {
    return std::get<Type>(this->columns).value;
  }

  template <typename Type>
  const auto& col() const
  {
    return std::get<Type>(this->columns).value;
  }

  std::tuple<T...> columns{};
  std::string table_name;
};

template <typename T>
std::string ToSQLType(DatabaseEngine& db)
{
  if (is_id_column<T>)
    return db.id_column_type();
  else if (std::is_same<typename T::real_type, std::string>::value ||
           std::is_same<typename T::real_type, std::optional<std::string>>::value)
    return "TEXT";
  else
    return "INTEGER";
}

template <typename ColumnType>
void add_column_to_table(DatabaseEngine& db, const std::string& table_name)
{
  const std::string name = ColumnType::name;
  std::string query{"ALTER TABLE " + table_name + " ADD " + ColumnType::name + " " + ToSQLType<ColumnType>(db)};
  auto res = db.raw_exec(query);
  if (std::get<0>(res) == false)
    {
      log_error("Error adding column ", name, " to table ", table_name, ": ",  std::get<1>(res));
      throw StorageFailure("Failed to add column " + name + " to table " + table_name + ": " + std::get<1>(res));
    }
  log_info("Added missing column ", name, " to table ", table_name);
}

template <typename ColumnType, decltype(ColumnType::options) = nullptr>
void append_option(std::string& s)
{
  s += " "s + ColumnType::options;
}

template <typename, typename... Args>
void append_option(Args&& ...)
{ }

/**
 * A table made of the given columns. Table-wide constraints (a composite
 * primary key, a UNIQUE clause, etc) are given to the constructor and
 * appended after the column definitions.
 */
template <typename... T>
class Table
{
  static_assert(sizeof...(T) > 0, "Table cannot be empty");
  using ColumnTypes = std::tuple<T...>;

 public:
  using RowType = Row<T...>;

  Table(std::string name, std::string constraints={}):
      name(std::move(name)),
      constraints(std::move(constraints))
  {}

  /**
   * Add the columns that an older version of the schema did not have.
   */
  void upgrade(DatabaseEngine& db) const
  {
    const auto existing_columns = db.get_all_columns_from_table(this->name);
    add_column_if_not_exists(db, existing_columns);
  }

  void create(DatabaseEngine& db) const
  {
    std::string query{"CREATE TABLE IF NOT EXISTS "};
    query += this->name;
    query += " (";
    this->add_column_create(db, query);
    if (!this->constraints.empty())
      query += ", " + this->constraints;
    query += ")";

    auto result = db.raw_exec(query);
    if (std::get<0>(result) == false)
      {
        log_error("Error executing query: ", std::get<1>(result));
        throw StorageFailure("Failed to create table " + this->name + ": " + std::get<1>(result));
      }
  }

  RowType row() const
  {
    return {this->name};
  }

  const std::string& get_name() const
  {
    return this->name;
  }

 private:

  template <std::size_t N=0>
  typename std::enable_if<N < sizeof...(T), void>::type
  add_column_if_not_exists(DatabaseEngine& db, const std::set<std::string>& existing_columns) const
  {
    using ColumnType = typename std::remove_reference<decltype(std::get<N>(std::declval<ColumnTypes>()))>::type;
    if (existing_columns.count(ColumnType::name) == 0)
      add_column_to_table<ColumnType>(db, this->name);
    add_column_if_not_exists<N+1>(db, existing_columns);
  }
  template <std::size_t N=0>
  typename std::enable_if<N == sizeof...(T), void>::type
  add_column_if_not_exists(DatabaseEngine&, const std::set<std::string>&) const
  {}

  template <std::size_t N=0>
  typename std::enable_if<N < sizeof...(T), void>::type
  add_column_create(DatabaseEngine& db, std::string& str) const
  {
    using ColumnType = typename std::remove_reference<decltype(std::get<N>(std::declval<ColumnTypes>()))>::type;
    str += ColumnType::name;
    str += " ";
    str += ToSQLType<ColumnType>(db);
    append_option<ColumnType>(str);
    if (N != sizeof...(T) - 1)
      str += ", ";

    add_column_create<N+1>(db, str);
  }
  template <std::size_t N=0>
  typename std::enable_if<N == sizeof...(T), void>::type
  add_column_create(DatabaseEngine&, std::string&) const
  { }

  const std::string name;
  const std::string constraints;
};
