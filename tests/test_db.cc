/*
 * test_db.cc -- principal attribute database
 *
 * Copyright (C) 2024 The xrealmauthz authors
 *
 * This file is part of xrealmauthz. Please see README
 * for terms of use.
 */

#include <filesystem>
#include <memory>

#include <sqlite3.h>

#include <catch2/catch.hpp>
#include "test.hh"
#include "db.hh"

using xrealmauthz::Attributes;
using xrealmauthz::Principal;

/* Runs the administrative operations used by the test scenarios
 * against @p db. */
static void
check_attribute_store(kdc::Database &db) {
  const Principal edge = Principal::tgs("REALM1.COM", "REALM2.COM");
  const Principal other = Principal::tgs("REALM1.COM", "REALM3.COM");
  Attributes attrs;

  REQUIRE(db);
  REQUIRE(db.getAttributes(edge, attrs) == XRA_ERROR_NO_SUCH_PRINCIPAL);
  REQUIRE(db.setAttribute(edge, "xr:@REALM2.COM", "") == XRA_ERROR_NO_SUCH_PRINCIPAL);

  REQUIRE(db.addPrincipal(edge) == XRA_OK);
  REQUIRE(db.addPrincipal(edge) == XRA_OK);
  REQUIRE(db.addPrincipal(other) == XRA_OK);

  REQUIRE(db.getAttributes(edge, attrs) == XRA_OK);
  REQUIRE(attrs.empty());

  REQUIRE(db.setAttribute(edge, "xr:@REALM2.COM", "") == XRA_OK);
  REQUIRE(db.setAttribute(edge, "xr:authz_test", "") == XRA_OK);
  REQUIRE(db.setAttribute(edge, "xr:authz_test", "x") == XRA_OK);

  attrs.clear();
  REQUIRE(db.getAttributes(edge, attrs) == XRA_OK);
  REQUIRE(attrs.size() == 2);
  REQUIRE(attrs["xr:@REALM2.COM"] == "");
  REQUIRE(attrs["xr:authz_test"] == "x");

  attrs.clear();
  REQUIRE(db.getAttributes(other, attrs) == XRA_OK);
  REQUIRE(attrs.empty());

  REQUIRE(db.deleteAttribute(edge, "xr:authz_test") == XRA_OK);
  REQUIRE(db.deleteAttribute(edge, "xr:authz_test") == XRA_ERROR_NO_SUCH_ATTRIBUTE);
  REQUIRE(db.deleteAttribute(Principal("nobody", "REALM1.COM"), "xr:authz_test")
          == XRA_ERROR_NO_SUCH_PRINCIPAL);

  std::vector<Principal> princs;
  REQUIRE(db.listPrincipals(princs) == XRA_OK);
  REQUIRE(princs.size() == 2);

  REQUIRE(db.deletePrincipal(edge) == XRA_OK);
  REQUIRE(db.deletePrincipal(edge) == XRA_ERROR_NO_SUCH_PRINCIPAL);

  /* a re-created principal starts without strings */
  REQUIRE(db.addPrincipal(edge) == XRA_OK);
  attrs.clear();
  REQUIRE(db.getAttributes(edge, attrs) == XRA_OK);
  REQUIRE(attrs.empty());
}

SCENARIO( "Store string attributes in memory", "[db]" ) {
  GIVEN("An in-memory database") {
    kdc::Database db{"", true};

    THEN("principals and strings can be administered") {
      check_attribute_store(db);
    }
  }
}

SCENARIO( "Store string attributes with SQLite", "[db]" ) {
  GIVEN("An SQLite in-memory database") {
    kdc::Database db{":memory:"};

    THEN("principals and strings can be administered") {
      check_attribute_store(db);
    }
  }

  GIVEN("A database file that cannot be created") {
    test_log_off();
    kdc::Database db{"/nonexistent/directory/xrealmauthz.db"};

    THEN("all accesses report storage unavailable") {
      Attributes attrs;
      REQUIRE_FALSE(db);
      REQUIRE(db.errmsg() != nullptr);
      REQUIRE(db.getAttributes(Principal("krbtgt/R1", "R2"), attrs)
              == XRA_ERROR_STORAGE_UNAVAILABLE);
      REQUIRE(db.addPrincipal(Principal("krbtgt/R1", "R2"))
              == XRA_ERROR_STORAGE_UNAVAILABLE);
    }
  }
}

struct SqliteCloser {
  void operator()(sqlite3 *p) { sqlite3_close_v2(p); }
};

SCENARIO( "Locked databases time out", "[db]" ) {
  GIVEN("A database file locked by another connection") {
    const auto path = std::filesystem::temp_directory_path() / "xra_test_locked.db";
    std::filesystem::remove(path);

    const Principal edge = Principal::tgs("REALM1.COM", "REALM2.COM");
    kdc::Database db{path.string()};
    REQUIRE(db);
    REQUIRE(db.addPrincipal(edge) == XRA_OK);
    REQUIRE(db.setAttribute(edge, "xr:@REALM2.COM", "") == XRA_OK);

    sqlite3 *handle = nullptr;
    REQUIRE(sqlite3_open(path.string().c_str(), &handle) == SQLITE_OK);
    std::unique_ptr<sqlite3, SqliteCloser> other(handle);
    REQUIRE(sqlite3_exec(other.get(), "begin exclusive", nullptr, nullptr, nullptr)
            == SQLITE_OK);

    WHEN("the attributes are read with a short timeout") {
      Attributes attrs;
      db.setTimeout(10);

      test_log_off();
      xra_result_t res = db.getAttributes(edge, attrs);

      THEN("the read fails with storage unavailable") {
        REQUIRE(res == XRA_ERROR_STORAGE_UNAVAILABLE);
        REQUIRE(attrs.empty());
      }
    }

    sqlite3_exec(other.get(), "rollback", nullptr, nullptr, nullptr);
    other.reset();
    std::filesystem::remove(path);
  }
}
