#pragma once

#include <database/statement.hpp>

#include <logger/logger.hpp>

#include <sqlite3.h>

class Sqlite3Statement: public Statement
{
 public:
  Sqlite3Statement(sqlite3_stmt* stmt):
      stmt(stmt) {}
  ~Sqlite3Statement()
  {
    sqlite3_finalize(this->stmt);
  }

  StepResult step() override final
  {
    const auto res = sqlite3_step(this->get());
    if (res == SQLITE_ROW)
      return StepResult::Row;
    else if (res == SQLITE_DONE)
      return StepResult::Done;
    else if ((res & 0xff) == SQLITE_CONSTRAINT)
      return StepResult::Constraint;
    else
      return StepResult::Error;
  }

  void bind(const std::vector<QueryParam>& params) override
  {
    int i = 1;
    for (const QueryParam& param: params)
      {
        bool res;
        if (const auto* text = std::get_if<std::string>(&param))
          res = this->bind_text(i, *text);
        else if (const auto* integer = std::get_if<std::int64_t>(&param))
          res = this->bind_int64(i, *integer);
        else
          res = this->bind_null(i);
        if (!res)
          log_error("Failed to bind param ", i, ": ", this->get_error_message());
        i++;
      }
  }

  std::int64_t get_column_int64(const int col) override
  {
    return sqlite3_column_int64(this->get(), col);
  }

  std::string get_column_text(const int col) override
  {
    const unsigned char* str = sqlite3_column_text(this->get(), col);
    if (str == nullptr)
      return {};
    const auto size = sqlite3_column_bytes(this->get(), col);
    return {reinterpret_cast<const char*>(str), static_cast<std::size_t>(size)};
  }

  bool is_column_null(const int col) override
  {
    return sqlite3_column_type(this->get(), col) == SQLITE_NULL;
  }

  bool bind_text(const int pos, const std::string& data) override
  {
    return sqlite3_bind_text(this->get(), pos, data.data(), static_cast<int>(data.size()), SQLITE_TRANSIENT) == SQLITE_OK;
  }
  bool bind_int64(const int pos, const std::int64_t value) override
  {
    return sqlite3_bind_int64(this->get(), pos, static_cast<sqlite3_int64>(value)) == SQLITE_OK;
  }
  bool bind_null(const int pos) override
  {
    return sqlite3_bind_null(this->get(), pos) == SQLITE_OK;
  }

  std::string get_error_message() override
  {
    return sqlite3_errmsg(sqlite3_db_handle(this->get()));
  }

  Sqlite3Statement(const Sqlite3Statement&) = delete;
  Sqlite3Statement& operator=(const Sqlite3Statement&) = delete;
  Sqlite3Statement(Sqlite3Statement&&) = delete;
  Sqlite3Statement& operator=(Sqlite3Statement&&) = delete;

  sqlite3_stmt* get()
  {
    return this->stmt;
  }

 private:
  sqlite3_stmt* stmt;
};
