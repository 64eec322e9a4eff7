#include <database/query.hpp>
#include <database/errors.hpp>

StepResult Query::execute(DatabaseEngine& db)
{
#ifdef DEBUG_SQL_QUERIES
  const auto timer = this->log_and_time();
#endif

  auto statement = db.prepare(this->body);
  statement->bind(this->params);

  StepResult res;
  while ((res = statement->step()) == StepResult::Row)
    ;
  if (res == StepResult::Error)
    throw StorageFailure("Failed to execute query \"" + this->body + "\": " + statement->get_error_message());
  if (res == StepResult::Done)
    db.extract_last_insert_rowid(*statement);
  return res;
}

void actual_add_param(Query& query, const std::string& val)
{
  query.params.emplace_back(val);
}

void actual_add_param(Query& query, const std::optional<std::string>& val)
{
  if (val)
    query.params.emplace_back(*val);
  else
    query.params.emplace_back(nullptr);
}

Query& operator<<(Query& query, const char* str)
{
  query.body += str;
  return query;
}

Query& operator<<(Query& query, const std::string& str)
{
  query.add_placeholder();
  actual_add_param(query, str);
  return query;
}

Query& operator<<(Query& query, const std::optional<std::string>& str)
{
  query.add_placeholder();
  actual_add_param(query, str);
  return query;
}
