#pragma once

#include "rosterstore.h"

#include <database/statement.hpp>
#include <database/engine.hpp>
#include <database/column.hpp>

#include <logger/logger.hpp>

#include <type_traits>
#include <optional>
#include <vector>
#include <string>

#ifdef DEBUG_SQL_QUERIES
#include <utils/scopeguard.hpp>
#include <chrono>
#include <sstream>

/**
 * Logs the time elapsed between its creation and its destruction.
 */
inline auto make_sql_timer()
{
  const auto start_time = std::chrono::steady_clock::now();
  return utils::make_scope_guard([start_time]()
                                 {
                                   const auto elapsed = std::chrono::steady_clock::now() - start_time;
                                   const auto micros = std::chrono::duration_cast<std::chrono::microseconds>(elapsed);
                                   log_debug("Query executed in ", micros.count(), "us.");
                                 });
}
#endif

/**
 * The text of a query, and the values of its numbered parameters.
 *
 * Column types are written as their name, strings, integers and optional
 * strings become parameters, and C strings are copied verbatim:
 *
 *   Query query{"SELECT count(*) FROM jidmap WHERE "};
 *   query << Database::Jid{} << "=" << address;
 */
struct Query
{
    std::string body;
    std::vector<QueryParam> params;
    int current_param{1};

    Query(std::string str):
        body(std::move(str))
    {}

    /**
     * Execute the statement, ignoring the rows it may return.  Returns
     * either Done or Constraint (when a UNIQUE or PRIMARY KEY constraint
     * rejected the write). Any other error throws a StorageFailure.
     */
    StepResult execute(DatabaseEngine& db);

    /**
     * Add the placeholder for the next parameter in the body
     */
    void add_placeholder()
    {
      this->body += "$" + std::to_string(this->current_param++);
    }

#ifdef DEBUG_SQL_QUERIES
    auto log_and_time()
    {
       std::ostringstream os;
       os << this->body << "; ";
       for (const auto& param: this->params)
         {
           if (const auto* text = std::get_if<std::string>(&param))
             os << "'" << *text << "' ";
           else if (const auto* integer = std::get_if<std::int64_t>(&param))
             os << *integer << " ";
           else
             os << "NULL ";
         }
       log_debug("SQL QUERY: ", os.str());
       return make_sql_timer();
    }
#endif
};

void actual_add_param(Query& query, const std::string& val);
void actual_add_param(Query& query, const std::optional<std::string>& val);
template <typename T>
typename std::enable_if<std::is_integral<T>::value, void>::type
actual_add_param(Query& query, const T& val)
{
  query.params.emplace_back(static_cast<std::int64_t>(val));
}

template <typename T>
typename std::enable_if<!std::is_integral<T>::value, decltype((void)T::name, std::declval<Query&>())>::type
operator<<(Query& query, const T&)
{
  query.body += T::name;
  return query;
}

Query& operator<<(Query& query, const char* str);
Query& operator<<(Query& query, const std::string& str);
Query& operator<<(Query& query, const std::optional<std::string>& str);
template <typename Integer>
typename std::enable_if<std::is_integral<Integer>::value, Query&>::type
operator<<(Query& query, const Integer& i)
{
  query.add_placeholder();
  actual_add_param(query, i);
  return query;
}
