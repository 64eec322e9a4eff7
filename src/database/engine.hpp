#pragma once

/**
 * Interface to provide non-portable behaviour, specific to each
 * database engine we want to support.
 *
 * Everything else (all portable stuf) should go outside of this class.
 */

#include <database/statement.hpp>

#include <cstdint>
#include <memory>
#include <string>
#include <tuple>
#include <set>

class DatabaseEngine
{
 public:

  DatabaseEngine() = default;
  virtual ~DatabaseEngine() = default;

  DatabaseEngine(const DatabaseEngine&) = delete;
  DatabaseEngine& operator=(const DatabaseEngine&) = delete;
  DatabaseEngine(DatabaseEngine&&) = delete;
  DatabaseEngine& operator=(DatabaseEngine&&) = delete;

  virtual std::set<std::string> get_all_columns_from_table(const std::string& table_name) = 0;
  /**
   * Whether a table (or a view, or a trigger, etc, depending on kind)
   * with that name exists.
   */
  virtual bool has_relation(const std::string& name, const std::string& kind) = 0;
  virtual std::tuple<bool, std::string> raw_exec(const std::string& query) = 0;
  /**
   * Compile the query. Throws a StorageFailure if the engine rejects it.
   */
  virtual std::unique_ptr<Statement> prepare(const std::string& query) = 0;
  virtual void extract_last_insert_rowid(Statement& statement) = 0;
  /**
   * Number of rows inserted, modified or deleted by the last statement.
   */
  virtual std::int64_t affected_rows() const = 0;
  virtual std::string id_column_type() const = 0;

  std::int64_t last_inserted_rowid{-1};
};
