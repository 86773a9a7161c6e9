#pragma once

#include <string>
#include <vector>

namespace settlement::db::sql {

/*
  Backend-agnostic migration execution.

  Each backend implements ExecuteSQL().
*/

class MigrationExecutor {
 public:
  virtual ~MigrationExecutor() = default;

  virtual void ExecuteSQL(const std::string& sql) = 0;
};

/*
  Schema shared by the SQLite and Postgres backends.

  Written in the common subset of both dialects: BIGINT for u64 values
  (stored as signed 64-bit), INTEGER for enums and booleans.
*/
const std::vector<std::string>& SchemaStatements();

// Applies SchemaStatements() in order. Every statement is idempotent.
void RunMigrations(MigrationExecutor& executor);

} // namespace settlement::db::sql
