#include "internal/db/sql/sql_filters.hpp"

#include <vector>

#include "internal/model/job_status.hpp"

namespace usbforge::db::sql {

namespace {

class WhereBuilder {
 public:
  void Add(const std::string& condition, Param value) {
    conditions_.push_back(condition);
    params_.push_back(std::move(value));
  }

  void AddRange(const char* column, uint64_t from_ms, uint64_t to_ms) {
    if (from_ms != 0) Add(std::string(column) + " >= ?", from_ms);
    if (to_ms != 0) Add(std::string(column) + " <= ?", to_ms);
  }

  void AddIn(const char* column, std::vector<std::string> values) {
    if (values.empty()) return;
    std::string condition = std::string(column) + " IN (";
    for (std::size_t i = 0; i < values.size(); ++i) {
      condition += i == 0 ? "?" : ",?";
      params_.push_back(std::move(values[i]));
    }
    conditions_.push_back(condition + ")");
  }

  Clause Finish(const std::string& tail) {
    Clause clause;
    for (std::size_t i = 0; i < conditions_.size(); ++i) {
      clause.sql += i == 0 ? " WHERE " : " AND ";
      clause.sql += conditions_[i];
    }
    clause.sql += tail;
    clause.params = std::move(params_);
    return clause;
  }

 private:
  std::vector<std::string> conditions_;
  Params                   params_;
};

} // namespace

Clause JobListClause(const JobFilter& filter, std::size_t limit) {
  WhereBuilder where;

  std::vector<std::string> statuses;
  statuses.reserve(filter.statuses.size());
  for (auto status : filter.statuses) {
    statuses.emplace_back(model::ToString(status));
  }
  where.AddIn("job_status", std::move(statuses));

  if (filter.order_ref) where.Add("order_ref = ?", *filter.order_ref);
  if (filter.assigned_device_id) where.Add("assigned_device_id = ?", *filter.assigned_device_id);
  where.AddRange("created_at_ms", filter.created_from_ms, filter.created_to_ms);

  return where.Finish(" ORDER BY created_at_ms DESC, id DESC LIMIT " + std::to_string(limit) + ";");
}

Clause LogListClause(const LogFilter& filter, std::size_t limit) {
  WhereBuilder where;

  if (filter.job_id) where.Add("job_id = ?", *filter.job_id);
  if (filter.level) where.Add("level = ?", std::string(model::ToString(*filter.level)));
  if (filter.category) where.Add("category = ?", *filter.category);
  if (filter.error_code) where.Add("error_code = ?", *filter.error_code);
  if (filter.correlation_id) where.Add("correlation_id = ?", *filter.correlation_id);
  where.AddRange("created_at_ms", filter.created_from_ms, filter.created_to_ms);

  const char* dir = filter.oldest_first ? "ASC" : "DESC";
  return where.Finish(std::string(" ORDER BY created_at_ms ") + dir + ", id " + dir + " LIMIT " + std::to_string(limit) + ";");
}

std::string ToPostgres(std::string_view sql) {
  std::string out;
  out.reserve(sql.size() + 16);

  bool in_literal = false;
  int  index      = 0;
  for (char c : sql) {
    if (c == '\'') in_literal = !in_literal;
    if (c == '?' && !in_literal) {
      out += '$';
      out += std::to_string(++index);
      continue;
    }
    out += c;
  }
  return out;
}

} // namespace usbforge::db::sql
