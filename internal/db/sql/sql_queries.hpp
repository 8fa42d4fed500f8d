#pragma once

namespace taskgate::db::sql {

/*
  Canonical SQL used by all backends.

  IMPORTANT:
  These are written in the SQLite-compatible subset with `?` placeholders
  so they work in both engines.
*/

static constexpr const char* CREATE_TASKS_SQLITE =
    "CREATE TABLE IF NOT EXISTS tasks ("
    " id BLOB PRIMARY KEY,"
    " title TEXT NOT NULL,"
    " description TEXT NOT NULL,"
    " completed INTEGER NOT NULL,"
    " project_id BLOB,"
    " priority INTEGER NOT NULL,"
    " status INTEGER NOT NULL,"
    " due_date INTEGER,"
    " created_at INTEGER NOT NULL,"
    " updated_at INTEGER NOT NULL);"
    "CREATE INDEX IF NOT EXISTS tasks_created_at ON tasks(created_at, id);";

static constexpr const char* CREATE_TASKS_POSTGRES =
    "CREATE TABLE IF NOT EXISTS tasks ("
    " id BYTEA PRIMARY KEY,"
    " title TEXT NOT NULL,"
    " description TEXT NOT NULL,"
    " completed BIGINT NOT NULL,"
    " project_id BYTEA,"
    " priority BIGINT NOT NULL,"
    " status BIGINT NOT NULL,"
    " due_date BIGINT,"
    " created_at BIGINT NOT NULL,"
    " updated_at BIGINT NOT NULL);"
    "CREATE INDEX IF NOT EXISTS tasks_created_at ON tasks(created_at, id);";

static constexpr const char* TASK_COLUMNS =
    "id,title,description,completed,project_id,priority,status,due_date,created_at,updated_at";

static constexpr const char* INSERT_TASK =
    "INSERT INTO tasks(id,title,description,completed,project_id,priority,status,due_date,created_at,updated_at)"
    " VALUES(?,?,?,?,?,?,?,?,?,?);";

static constexpr const char* SELECT_TASK =
    "SELECT id,title,description,completed,project_id,priority,status,due_date,created_at,updated_at"
    " FROM tasks WHERE id=?;";

static constexpr const char* UPDATE_TASK =
    "UPDATE tasks SET title=?,description=?,completed=?,project_id=?,priority=?,status=?,due_date=?,updated_at=?"
    " WHERE id=?;";

static constexpr const char* DELETE_TASK =
    "DELETE FROM tasks WHERE id=?;";

}
