#pragma once

#include <database/query.hpp>
#include <database/statement.hpp>
#include <database/errors.hpp>

#include <optional>
#include <string>

/**
 * A query returning a single integer (a count(*), a max(), etc) from the
 * first row. The value is absent when there is no row, or when it is NULL.
 */
struct ScalarQuery: public Query
{
    using Query::Query;

    std::optional<std::int64_t> execute(DatabaseEngine& db)
    {
#ifdef DEBUG_SQL_QUERIES
      const auto timer = this->log_and_time();
#endif
      auto statement = db.prepare(this->body);
      statement->bind(this->params);
      const auto res = statement->step();
      if (res == StepResult::Done)
        return std::nullopt;
      if (res != StepResult::Row)
        throw StorageFailure("Failed to execute query \"" + this->body + "\": " + statement->get_error_message());
      if (statement->is_column_null(0))
        return std::nullopt;
      return statement->get_column_int64(0);
    }
};

struct CountQuery: public ScalarQuery
{
    CountQuery(std::string name):
        ScalarQuery("SELECT count(*) FROM ")
    {
      this->body += std::move(name);
    }

    CountQuery& where()
    {
      this->body += " WHERE ";
      return *this;
    }

    std::int64_t execute(DatabaseEngine& db)
    {
      return ScalarQuery::execute(db).value_or(0);
    }
};
