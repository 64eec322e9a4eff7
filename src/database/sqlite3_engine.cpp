#include <database/sqlite3_engine.hpp>

#include <database/sqlite3_statement.hpp>
#include <database/errors.hpp>
#include <database/query.hpp>

#include <utils/tolower.hpp>
#include <logger/logger.hpp>

Sqlite3Engine::Sqlite3Engine(sqlite3* db):
    db(db)
{
}

Sqlite3Engine::~Sqlite3Engine()
{
  sqlite3_close(this->db);
}

std::set<std::string> Sqlite3Engine::get_all_columns_from_table(const std::string& table_name)
{
  std::set<std::string> result;
  char* errmsg;
  std::string query{"PRAGMA table_info(" + table_name + ")"};
  int res = sqlite3_exec(this->db, query.data(), [](void* param, int columns_nb, char** columns, char**) -> int {
    constexpr int name_column = 1;
    auto* result = static_cast<std::set<std::string>*>(param);
    if (name_column < columns_nb)
      result->insert(utils::tolower(columns[name_column]));
    return 0;
  }, &result, &errmsg);

  if (res != SQLITE_OK)
    {
      const std::string error = errmsg ? errmsg : sqlite3_errstr(res);
      sqlite3_free(errmsg);
      log_error("Error executing ", query, ": ", error);
      throw StorageFailure("Failed to list the columns of table " + table_name + ": " + error);
    }

  return result;
}

bool Sqlite3Engine::has_relation(const std::string& name, const std::string& kind)
{
  Query query{"SELECT count(*) FROM sqlite_master WHERE type="};
  query << kind << " AND name=" << name;
  auto statement = this->prepare(query.body);
  statement->bind(query.params);
  if (statement->step() != StepResult::Row)
    throw StorageFailure("Failed to look for " + kind + " " + name + ": " + statement->get_error_message());
  return statement->get_column_int64(0) > 0;
}

std::unique_ptr<DatabaseEngine> Sqlite3Engine::open(const std::string& filename, const int busy_timeout_ms)
{
  sqlite3* new_db;
  auto res = sqlite3_open_v2(filename.data(), &new_db,
                             SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX, nullptr);
  if (res != SQLITE_OK)
    {
      const std::string error = new_db ? sqlite3_errmsg(new_db) : sqlite3_errstr(res);
      log_error("Failed to open database file ", filename, ": ", error);
      sqlite3_close(new_db);
      throw StorageFailure("Failed to open database file " + filename + ": " + error);
    }
  sqlite3_extended_result_codes(new_db, 1);
  sqlite3_busy_timeout(new_db, busy_timeout_ms);
  return std::make_unique<Sqlite3Engine>(new_db);
}

std::tuple<bool, std::string> Sqlite3Engine::raw_exec(const std::string& query)
{
#ifdef DEBUG_SQL_QUERIES
  log_debug("SQL QUERY: ", query);
  const auto timer = make_sql_timer();
#endif

  char* error;
  const auto result = sqlite3_exec(db, query.data(), nullptr, nullptr, &error);
  if (result != SQLITE_OK)
    {
      std::string err_msg(error ? error : sqlite3_errstr(result));
      sqlite3_free(error);
      return std::make_tuple(false, err_msg);
    }
  return std::make_tuple(true, std::string{});
}

std::unique_ptr<Statement> Sqlite3Engine::prepare(const std::string& query)
{
  sqlite3_stmt* stmt;
  auto res = sqlite3_prepare_v2(db, query.data(), static_cast<int>(query.size()) + 1,
                                &stmt, nullptr);
  if (res != SQLITE_OK)
    {
      const std::string error = sqlite3_errmsg(db);
      log_error("Error preparing statement: ", error);
      throw StorageFailure("Failed to prepare query \"" + query + "\": " + error);
    }
  return std::make_unique<Sqlite3Statement>(stmt);
}

void Sqlite3Engine::extract_last_insert_rowid(Statement&)
{
  this->last_inserted_rowid = sqlite3_last_insert_rowid(this->db);
}

std::int64_t Sqlite3Engine::affected_rows() const
{
  return sqlite3_changes(this->db);
}

std::string Sqlite3Engine::id_column_type() const
{
  return "INTEGER PRIMARY KEY AUTOINCREMENT";
}
