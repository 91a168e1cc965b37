/*
 * db.cc -- principal attribute database for xrealmauthz
 *
 * Copyright (C) 2024 The xrealmauthz authors
 *
 * This file is part of xrealmauthz. Please see README
 * for terms of use.
 */

#include <map>
#include <memory>
#include <mutex>
#include <string>

#include <sqlite3.h>

#include "xrealmauthz/xrealmauthz.h"
#include "db.hh"

namespace kdc {
using ::std::string;
using ::std::map;

class Database::Implementation {
public:
  virtual ~Implementation(void) = default;

  virtual operator bool(void) const = 0;
  virtual const char *errmsg(void) const = 0;
  virtual void setTimeout(int ms) { (void)ms; }

  virtual xra_result_t addPrincipal(const string &name) = 0;
  virtual xra_result_t deletePrincipal(const string &name) = 0;
  virtual xra_result_t listPrincipals(std::vector<string> &out) const = 0;
  virtual xra_result_t getStrings(const string &name, Attributes &out) const = 0;
  virtual xra_result_t setString(const string &name, const string &key,
                                 const string &value) = 0;
  virtual xra_result_t deleteString(const string &name, const string &key) = 0;
};

/* In-memory layout: principal name -> string attributes. */
class Database::Memory : public Database::Implementation {
public:
  operator bool(void) const { return true; }
  const char *errmsg(void) const { return nullptr; }

  xra_result_t addPrincipal(const string &name) {
    std::lock_guard<std::mutex> guard(lock);
    records.emplace(name, Attributes{});
    return XRA_OK;
  }

  xra_result_t deletePrincipal(const string &name) {
    std::lock_guard<std::mutex> guard(lock);
    return records.erase(name) ? XRA_OK : XRA_ERROR_NO_SUCH_PRINCIPAL;
  }

  xra_result_t listPrincipals(std::vector<string> &out) const {
    std::lock_guard<std::mutex> guard(lock);
    for (const auto &r : records) {
      out.push_back(r.first);
    }
    return XRA_OK;
  }

  xra_result_t getStrings(const string &name, Attributes &out) const {
    std::lock_guard<std::mutex> guard(lock);
    const auto r = records.find(name);
    if (r == records.end()) {
      return XRA_ERROR_NO_SUCH_PRINCIPAL;
    }
    out = r->second;
    return XRA_OK;
  }

  xra_result_t setString(const string &name, const string &key,
                         const string &value) {
    std::lock_guard<std::mutex> guard(lock);
    const auto r = records.find(name);
    if (r == records.end()) {
      return XRA_ERROR_NO_SUCH_PRINCIPAL;
    }
    r->second[key] = value;
    return XRA_OK;
  }

  xra_result_t deleteString(const string &name, const string &key) {
    std::lock_guard<std::mutex> guard(lock);
    const auto r = records.find(name);
    if (r == records.end()) {
      return XRA_ERROR_NO_SUCH_PRINCIPAL;
    }
    return r->second.erase(key) ? XRA_OK : XRA_ERROR_NO_SUCH_ATTRIBUTE;
  }

private:
  mutable std::mutex lock;
  map<string, Attributes> records;
};

namespace {
/* Releases prepared statements. */
struct Deleter {
  void operator()(sqlite3_stmt *p) { sqlite3_finalize(p); }
};
} /* anonymous namespace */

using Statement = std::unique_ptr<sqlite3_stmt, Deleter>;

class Database::SQLite : public Database::Implementation {
public:
  SQLite(const std::string &dbname);

  ~SQLite(void) { if (db) { sqlite3_close_v2(db); db = nullptr; } }

  operator bool(void) const;
  const char *errmsg(void) const;
  void setTimeout(int ms) { if (db) { sqlite3_busy_timeout(db, ms); } }

  xra_result_t addPrincipal(const string &name);
  xra_result_t deletePrincipal(const string &name);
  xra_result_t listPrincipals(std::vector<string> &out) const;
  xra_result_t getStrings(const string &name, Attributes &out) const;
  xra_result_t setString(const string &name, const string &key,
                         const string &value);
  xra_result_t deleteString(const string &name, const string &key);

private:
  int status;
  sqlite3 *db;
  string open_error;

  bool exec(const char *sql);
  Statement prepare(const char *sql, xra_result_t &res) const;
  xra_result_t fail(int code, const char *what) const;
  xra_result_t exists(const string &name, bool &found) const;
};

static const char *schema[] = {
  "PRAGMA foreign_keys = ON",
  "create table if not exists Principals (name TEXT PRIMARY KEY)",
  "create table if not exists Strings ("
  "principal TEXT NOT NULL REFERENCES Principals(name) ON DELETE CASCADE, "
  "key TEXT NOT NULL, value TEXT, PRIMARY KEY(principal, key))"
};

Database::SQLite::SQLite(const std::string &dbname) : db(nullptr) {
  status = sqlite3_open_v2(dbname.c_str(),
                           &db,
                           SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE
                           | SQLITE_OPEN_FULLMUTEX,
                           nullptr);
  if (status != SQLITE_OK) {
    open_error = db ? sqlite3_errmsg(db) : sqlite3_errstr(status);
    xra_log(XRA_LOG_ERR, "cannot open %s: %s\n", dbname.c_str(), open_error.c_str());
    sqlite3_close_v2(db);
    db = nullptr;
    return;
  }

  for (const char *sql : schema) {
    if (!exec(sql)) {
      break;
    }
  }
}

Database::SQLite::operator bool(void) const {
  return db && ((status == SQLITE_OK)
                || (status == SQLITE_DONE)
                || (status == SQLITE_ROW));
}

const char *Database::SQLite::errmsg(void) const {
  return db ? sqlite3_errmsg(db) : open_error.c_str();
}

bool Database::SQLite::exec(const char *sql) {
  char *err = nullptr;
  status = sqlite3_exec(db, sql, nullptr, nullptr, &err);
  if (status != SQLITE_OK) {
    xra_log(XRA_LOG_ERR, "%s: %s\n", sql, err ? err : sqlite3_errstr(status));
  }
  sqlite3_free(err);
  return status == SQLITE_OK;
}

xra_result_t Database::SQLite::fail(int code, const char *what) const {
  xra_log(XRA_LOG_WARNING, "%s: %s\n", what, sqlite3_errstr(code));
  return (code & 0xff) == SQLITE_NOMEM
    ? XRA_ERROR_OUT_OF_MEMORY : XRA_ERROR_STORAGE_UNAVAILABLE;
}

Statement Database::SQLite::prepare(const char *sql, xra_result_t &res) const {
  sqlite3_stmt *stmt = nullptr;

  if (!db) {
    res = XRA_ERROR_STORAGE_UNAVAILABLE;
    return Statement{};
  }
  int code = sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr);
  if (code != SQLITE_OK) {
    sqlite3_finalize(stmt);
    res = fail(code, "prepare");
    return Statement{};
  }
  res = XRA_OK;
  return Statement{stmt};
}

static inline int
bind(sqlite3_stmt *stmt, int idx, const string &s) {
  return sqlite3_bind_text(stmt, idx, s.c_str(), static_cast<int>(s.size()),
                           SQLITE_TRANSIENT);
}

xra_result_t Database::SQLite::exists(const string &name, bool &found) const {
  xra_result_t res;
  Statement stmt = prepare("select 1 from Principals where name = ?1", res);
  if (!stmt) {
    return res;
  }

  bind(stmt.get(), 1, name);
  int code = sqlite3_step(stmt.get());
  if ((code != SQLITE_ROW) && (code != SQLITE_DONE)) {
    return fail(code, "lookup principal");
  }
  found = code == SQLITE_ROW;
  return XRA_OK;
}

xra_result_t Database::SQLite::addPrincipal(const string &name) {
  xra_result_t res;
  Statement stmt = prepare("insert or ignore into Principals (name) values (?1)", res);
  if (!stmt) {
    return res;
  }

  bind(stmt.get(), 1, name);
  int code = sqlite3_step(stmt.get());
  return code == SQLITE_DONE ? XRA_OK : fail(code, "add principal");
}

xra_result_t Database::SQLite::deletePrincipal(const string &name) {
  xra_result_t res;
  Statement stmt = prepare("delete from Principals where name = ?1", res);
  if (!stmt) {
    return res;
  }

  bind(stmt.get(), 1, name);
  int code = sqlite3_step(stmt.get());
  if (code != SQLITE_DONE) {
    return fail(code, "delete principal");
  }
  return sqlite3_changes(db) ? XRA_OK : XRA_ERROR_NO_SUCH_PRINCIPAL;
}

xra_result_t Database::SQLite::listPrincipals(std::vector<string> &out) const {
  xra_result_t res;
  Statement stmt = prepare("select name from Principals order by name", res);
  if (!stmt) {
    return res;
  }

  int code;
  while ((code = sqlite3_step(stmt.get())) == SQLITE_ROW) {
    const unsigned char *s = sqlite3_column_text(stmt.get(), 0);
    out.emplace_back(s ? reinterpret_cast<const char *>(s) : "");
  }
  return code == SQLITE_DONE ? XRA_OK : fail(code, "list principals");
}

xra_result_t Database::SQLite::getStrings(const string &name, Attributes &out) const {
  xra_result_t res;
  /* one row per string, or a single row with NULL key if the
   * principal has none */
  Statement stmt = prepare("select s.key, s.value from Principals p "
                           "left join Strings s on s.principal = p.name "
                           "where p.name = ?1", res);
  if (!stmt) {
    return res;
  }

  bind(stmt.get(), 1, name);
  bool found = false;
  int code;
  while ((code = sqlite3_step(stmt.get())) == SQLITE_ROW) {
    found = true;
    const unsigned char *key = sqlite3_column_text(stmt.get(), 0);
    const unsigned char *value = sqlite3_column_text(stmt.get(), 1);
    if (key) {
      out[reinterpret_cast<const char *>(key)] =
        value ? reinterpret_cast<const char *>(value) : "";
    }
  }
  if (code != SQLITE_DONE) {
    out.clear();
    return fail(code, "read strings");
  }
  return found ? XRA_OK : XRA_ERROR_NO_SUCH_PRINCIPAL;
}

xra_result_t Database::SQLite::setString(const string &name, const string &key,
                                         const string &value) {
  xra_result_t res;
  Statement stmt = prepare("insert or replace into Strings (principal, key, value) "
                           "select ?1, ?2, ?3 where exists "
                           "(select 1 from Principals where name = ?1)", res);
  if (!stmt) {
    return res;
  }

  bind(stmt.get(), 1, name);
  bind(stmt.get(), 2, key);
  bind(stmt.get(), 3, value);
  int code = sqlite3_step(stmt.get());
  if (code != SQLITE_DONE) {
    return fail(code, "set string");
  }
  return sqlite3_changes(db) ? XRA_OK : XRA_ERROR_NO_SUCH_PRINCIPAL;
}

xra_result_t Database::SQLite::deleteString(const string &name, const string &key) {
  xra_result_t res;
  Statement stmt = prepare("delete from Strings where principal = ?1 and key = ?2", res);
  if (!stmt) {
    return res;
  }

  bind(stmt.get(), 1, name);
  bind(stmt.get(), 2, key);
  int code = sqlite3_step(stmt.get());
  if (code != SQLITE_DONE) {
    return fail(code, "delete string");
  }
  if (sqlite3_changes(db)) {
    return XRA_OK;
  }

  bool found = false;
  res = exists(name, found);
  if (res != XRA_OK) {
    return res;
  }
  return found ? XRA_ERROR_NO_SUCH_ATTRIBUTE : XRA_ERROR_NO_SUCH_PRINCIPAL;
}

Database::Database(const string &dbname, bool memonly)
  : mem(memonly) {
  if (mem) {
    db = new Memory;
  } else {
    db = new SQLite{dbname};
  }
}

Database::~Database(void) {
  delete db;
}

Database::operator bool(void) const {
  return db && *db;
}

const char *Database::errmsg(void) const {
  return db ? db->errmsg() : nullptr;
}

void Database::setTimeout(int ms) {
  db->setTimeout(ms);
}

xra_result_t Database::addPrincipal(const Principal &princ) {
  xra_log(XRA_LOG_DEBUG, "add principal %s\n", princ.unparse().c_str());
  return db->addPrincipal(princ.unparse());
}

xra_result_t Database::deletePrincipal(const Principal &princ) {
  xra_log(XRA_LOG_DEBUG, "delete principal %s\n", princ.unparse().c_str());
  return db->deletePrincipal(princ.unparse());
}

xra_result_t Database::listPrincipals(std::vector<Principal> &out) const {
  std::vector<string> names;
  xra_result_t res = db->listPrincipals(names);

  for (const auto &name : names) {
    if (auto princ = Principal::parse(name)) {
      out.push_back(*princ);
    }
  }
  return res;
}

xra_result_t Database::getAttributes(const Principal &princ,
                                     Attributes &out) const {
  return db->getStrings(princ.unparse(), out);
}

xra_result_t Database::setAttribute(const Principal &princ,
                                    const string &key,
                                    const string &value) {
  xra_log(XRA_LOG_DEBUG, "set string %s on %s\n", key.c_str(),
          princ.unparse().c_str());
  return db->setString(princ.unparse(), key, value);
}

xra_result_t Database::deleteAttribute(const Principal &princ,
                                       const string &key) {
  xra_log(XRA_LOG_DEBUG, "delete string %s from %s\n", key.c_str(),
          princ.unparse().c_str());
  return db->deleteString(princ.unparse(), key);
}

} /* namespace kdc */
