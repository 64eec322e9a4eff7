#pragma once

#include <cstdint>
#include <cstddef>
#include <string>
#include <variant>
#include <vector>

enum class StepResult
{
  Row,
  Done,
  Constraint,
  Error,
};

/**
 * A value bound to a numbered parameter of a query.
 */
using QueryParam = std::variant<std::nullptr_t, std::int64_t, std::string>;

class Statement
{
 public:
  virtual ~Statement() = default;
  virtual StepResult step() = 0;

  virtual void bind(const std::vector<QueryParam>& params) = 0;

  virtual std::int64_t get_column_int64(const int col) = 0;
  virtual std::string get_column_text(const int col) = 0;
  virtual bool is_column_null(const int col) = 0;

  virtual bool bind_text(const int pos, const std::string& data) = 0;
  virtual bool bind_int64(const int pos, const std::int64_t value) = 0;
  virtual bool bind_null(const int pos) = 0;

  /**
   * The message describing the last error that occured with this
   * statement.
   */
  virtual std::string get_error_message() = 0;
};
