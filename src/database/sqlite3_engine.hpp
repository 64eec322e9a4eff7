#pragma once

#include <database/engine.hpp>

#include <database/statement.hpp>

#include <memory>
#include <string>
#include <tuple>
#include <set>

#include <sqlite3.h>

class Sqlite3Engine: public DatabaseEngine
{
 public:
  Sqlite3Engine(sqlite3* db);

  ~Sqlite3Engine();

  /**
   * Open (and create, if needed) the database file. ":memory:" opens a
   * private in-memory database. Throws a StorageFailure on error.
   */
  static std::unique_ptr<DatabaseEngine> open(const std::string& filename, const int busy_timeout_ms);

  std::set<std::string> get_all_columns_from_table(const std::string& table_name) override final;
  bool has_relation(const std::string& name, const std::string& kind) override final;
  std::tuple<bool, std::string> raw_exec(const std::string& query) override final;
  std::unique_ptr<Statement> prepare(const std::string& query) override;
  void extract_last_insert_rowid(Statement& statement) override;
  std::int64_t affected_rows() const override;
  std::string id_column_type() const override;
private:
  sqlite3* const db;
};
