/*
 * test_configuration.cc -- loading of the policy configuration
 *
 * Copyright (C) 2024 The xrealmauthz authors
 *
 * This file is part of xrealmauthz. Please see README
 * for terms of use.
 */

#include <sstream>

#include <catch2/catch.hpp>
#include "test.hh"
#include "config_parser.hh"

using xrealmauthz::Enforcing;

SCENARIO( "Read policy configuration files", "[configuration]" ) {
  GIVEN("A configuration for monitoring mode") {
    xra_config::parser parser;

    WHEN("the file is parsed") {
      bool ok = parser.parseFile("./testconfig/monitoring.yaml");

      THEN("enforcing is disabled and both realms are pre-approved") {
        REQUIRE(ok);
        REQUIRE(parser.have_config());
        REQUIRE(parser.policy.enforcing == Enforcing::Disabled);
        REQUIRE_FALSE(parser.policy.isEnforcing());
        REQUIRE(parser.policy.allowed_realms.size() == 2);
        REQUIRE(parser.policy.isPreApproved("REALM2.COM"));
        REQUIRE(parser.policy.isPreApproved("REALM3.COM"));
        REQUIRE_FALSE(parser.policy.isPreApproved("REALM1.COM"));
        REQUIRE(parser.database == "/var/lib/krb5kdc/xrealmauthz.db");
        REQUIRE(parser.db_timeout == 500);
      }
    }
  }

  GIVEN("A configuration with explicit enforcing mode") {
    xra_config::parser parser;

    WHEN("the file is parsed") {
      bool ok = parser.parseFile("./testconfig/enforcing.yaml");

      THEN("enforcing is enabled and the single realm is pre-approved") {
        REQUIRE(ok);
        REQUIRE(parser.policy.enforcing == Enforcing::Enabled);
        REQUIRE(parser.policy.isEnforcing());
        REQUIRE(parser.policy.allowed_realms.size() == 1);
        REQUIRE(parser.policy.isPreApproved("REALM2.COM"));
      }
    }
  }

  GIVEN("A configuration without kdcdefaults") {
    xra_config::parser parser;

    WHEN("the file is parsed") {
      bool ok = parser.parseFile("./testconfig/default.yaml");

      THEN("enforcing is unset, which means enforcing") {
        REQUIRE(ok);
        REQUIRE(parser.policy.enforcing == Enforcing::Unset);
        REQUIRE(parser.policy.isEnforcing());
        REQUIRE(parser.policy.allowed_realms.empty());
        REQUIRE(parser.database.empty());
      }
    }
  }

  GIVEN("Invalid configuration files") {
    xra_config::parser parser;

    THEN("parsing fails") {
      test_log_off();
      REQUIRE_FALSE(parser.parseFile("./testconfig/bad_enforcing.yaml"));
      REQUIRE_FALSE(parser.parseFile("./testconfig/bad_realms.yaml"));
      REQUIRE_FALSE(parser.parseFile("./testconfig/does_not_exist.yaml"));
    }
  }
}

SCENARIO( "Read policy configuration from a stream", "[configuration]" ) {
  GIVEN("Realms as a comma separated list") {
    std::istringstream in{"kdcdefaults:\n"
                          "  xrealmauthz_enforcing: Off\n"
                          "  xrealmauthz_allowed_realms: \"R2, R3 R4\"\n"};
    xra_config::parser parser;

    REQUIRE(parser.parse(in));
    THEN("every realm is pre-approved") {
      REQUIRE(parser.policy.enforcing == Enforcing::Disabled);
      REQUIRE(parser.policy.allowed_realms
              == std::set<xrealmauthz::Realm>{ "R2", "R3", "R4" });
    }
  }

  GIVEN("An empty document") {
    std::istringstream in{""};
    xra_config::parser parser;

    THEN("the defaults are used") {
      REQUIRE(parser.parse(in));
      REQUIRE(parser.policy.enforcing == Enforcing::Unset);
    }
  }

  GIVEN("Malformed documents") {
    THEN("parsing fails") {
      const char *docs[] = {
        "kdcdefaults: [a, b]\n",
        "kdcdefaults:\n  xrealmauthz_enforcing: [true]\n",
        "kdcdefaults:\n  xrealmauthz_enforcing:\n",
        "kdcdefaults:\n  xrealmauthz_allowed_realms: \"\"\n",
        "kdcdefaults:\n  xrealmauthz_allowed_realms: [R2, [R3]]\n",
        "kdcdefaults:\n  xrealmauthz_db_timeout: soon\n",
        "kdcdefaults: {\n",
        "- just\n- a list\n",
      };

      for (const char *doc : docs) {
        std::istringstream in{doc};
        xra_config::parser parser;
        INFO(doc);
        REQUIRE_FALSE(parser.parse(in));
      }
    }
  }
}

SCENARIO( "Kerberos profile booleans", "[configuration]" ) {
  bool value = false;

  THEN("all true spellings are accepted") {
    for (const char *s : { "y", "yes", "TRUE", "t", "1", "On" }) {
      value = false;
      REQUIRE(xra_config::parseBoolean(s, value));
      REQUIRE(value);
    }
  }
  THEN("all false spellings are accepted") {
    for (const char *s : { "n", "No", "false", "nil", "0", "OFF" }) {
      value = true;
      REQUIRE(xra_config::parseBoolean(s, value));
      REQUIRE_FALSE(value);
    }
  }
  THEN("other values are rejected") {
    REQUIRE_FALSE(xra_config::parseBoolean("2", value));
    REQUIRE_FALSE(xra_config::parseBoolean("", value));
    REQUIRE_FALSE(xra_config::parseBoolean("enabled", value));
  }
}
