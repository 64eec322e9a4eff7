#pragma once

#include <database/query.hpp>
#include <database/engine.hpp>
#include <database/errors.hpp>

class DeleteQuery: public Query
{
public:
  DeleteQuery(const std::string& name):
      Query("DELETE")
  {
    this->body += " FROM " + name;
  }

  DeleteQuery& where()
  {
    this->body += " WHERE ";
    return *this;
  };

  /**
   * Returns the number of deleted rows
   */
  std::int64_t execute(DatabaseEngine& db)
  {
    if (Query::execute(db) != StepResult::Done)
      throw StorageFailure("Failed to execute query \"" + this->body + "\"");
    return db.affected_rows();
  }
};
