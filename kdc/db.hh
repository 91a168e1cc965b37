/*
 * db.hh -- principal attribute database for xrealmauthz
 *
 * Copyright (C) 2024 The xrealmauthz authors
 *
 * This file is part of xrealmauthz. Please see README
 * for terms of use.
 */

#ifndef _DB_HH
#define _DB_HH 1

#include <string>
#include <vector>

#include "xrealmauthz/attributes.hh"
#include "xrealmauthz/principal.hh"

namespace kdc {

using xrealmauthz::Attributes;
using xrealmauthz::Principal;

/**
 * Principal records and their string attributes. The records are
 * kept either in an SQLite database file or in memory.
 */
class Database : public xrealmauthz::AttributeAccessor {
public:
  Database(const std::string &dbname, bool memonly = false);
  Database(const Database &) = delete;
  Database(const Database &&) = delete;
  ~Database(void);

  Database &operator=(const Database &) = delete;
  Database &operator=(const Database &&) = delete;

  operator bool(void) const;
  const char *errmsg(void) const;

  /**
   * Sets the time in milliseconds to wait for a locked database
   * before a read fails with XRA_ERROR_STORAGE_UNAVAILABLE.
   */
  void setTimeout(int ms);

  /**
   * Adds the principal @p princ without any attributes.
   *
   * @return XRA_OK if @p princ has been created or already existed.
   */
  xra_result_t addPrincipal(const Principal &princ);

  /** Removes @p princ together with all its attributes. */
  xra_result_t deletePrincipal(const Principal &princ);

  /** Retrieves the names of all principals in @p out. */
  xra_result_t listPrincipals(std::vector<Principal> &out) const;

  xra_result_t getAttributes(const Principal &princ,
                             Attributes &out) const override;
  xra_result_t setAttribute(const Principal &princ,
                            const std::string &key,
                            const std::string &value) override;
  xra_result_t deleteAttribute(const Principal &princ,
                               const std::string &key) override;

private:
  const bool mem;               //< true if always in memory
  class Implementation;
  class Memory;
  class SQLite;
  /**
   * The database object is either an in-memory structure or an sqlite
   * handle, depending on the memonly flag passed at construction.
   */
  Implementation *db;
};

} /* namespace kdc */

#endif /* _DB_HH */
