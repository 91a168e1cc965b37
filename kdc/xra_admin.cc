/*
 * xra_admin.cc -- administration and test tool for xrealmauthz
 *
 * Copyright (C) 2024 The xrealmauthz authors
 *
 * This file is part of xrealmauthz. Please see README
 * for terms of use.
 */

#include <iomanip>
#include <iostream>
#include <string>
#include <vector>

#include <cstring>
#include <cstdlib>
#include <cstdio>
#include <unistd.h>

#include "xrealmauthz/xrealmauthz.h"
#include "xrealmauthz/decision_log.hh"
#include "xrealmauthz/engine.hh"
#include "config_parser.hh"
#include "db.hh"

#define XRA_DEFAULT_DATABASE "xrealmauthz.db"

static void
usage( const char *program, const char *version) {
  const char *p;

  p = strrchr(program, '/');
  if (p)
    program = ++p;

  fprintf( stderr, "%s v%s -- cross-realm authorization for Kerberos KDCs\n\n"
           "usage: %s [-C file] [-d database] [-v num] command [args]\n\n"
           "\t-C file\t\tload configuration file\n"
           "\t-d database\tprincipal database (default: %s)\n"
           "\t-v num\t\tverbosity level (default: 5)\n\n"
           "commands:\n"
           "\taddprinc PRINCIPAL\n"
           "\tdelprinc PRINCIPAL\n"
           "\tsetstr PRINCIPAL KEY VALUE\n"
           "\tdelstr PRINCIPAL KEY\n"
           "\tgetstrs PRINCIPAL\n"
           "\tlistprincs\n"
           "\tcheck CLIENT SERVER [TRANSIT-REALM...]\n",
           program, version, program, XRA_DEFAULT_DATABASE );
}

using xrealmauthz::Principal;

static bool
parse_principal(const char *s, Principal &princ) {
  auto p = Principal::parse(s);
  if (!p || p->realm.empty()) {
    std::cerr << "Invalid principal name '" << s << "'" << std::endl;
    return false;
  }
  princ = *p;
  return true;
}

static int
report(xra_result_t res, const std::string &what) {
  if (res != XRA_OK) {
    std::cerr << what << ": " << xra_strerror(res) << std::endl;
    return 1;
  }
  return 0;
}

/* Runs a single TGS policy check and prints the verdict. Returns 0 if
 * a ticket would be issued. */
static int
check(const xrealmauthz::Policy &policy, const kdc::Database &db,
      const Principal &client, const Principal &server,
      const std::vector<xrealmauthz::Realm> &path) {
  xrealmauthz::Engine engine{policy, db};
  std::string status;

  xrealmauthz::logStartup(policy);

  const auto req = xrealmauthz::TgsRequest::fromTransitPath(client, server, path);
  xra_result_t res = engine.checkTgs(req, status);
  if (res != XRA_OK) {
    std::cerr << xra_strerror(res) << std::endl;
    return 1;
  }
  std::cout << "ticket issued for " << client << " to " << server
            << " via " << req.trust_edge << std::endl;
  return 0;
}

int
main(int argc, char **argv) {
  std::string config_file = xra_config::getDefaultConfigFile();
  std::string dbname;
  int opt;
  xra_log_t log_level = XRA_LOG_NOTICE;
  xra_config::parser parser;

  while ((opt = getopt(argc, argv, "C:d:v:")) != -1) {
    switch (opt) {
    case 'C' :
      config_file = optarg;
      break;
    case 'd' :
      dbname = optarg;
      break;
    case 'v' :
      log_level = static_cast<xra_log_t>(strtol(optarg, nullptr, 10));
      break;
    default:
      usage(argv[0], XRA_PACKAGE_VERSION);
      exit(1);
    }
  }

  xra_set_log_level(log_level);

  if (optind >= argc) {
    usage(argv[0], XRA_PACKAGE_VERSION);
    exit(1);
  }

  /* refuse to run with an ambiguous policy */
  if (!config_file.empty() && !parser.parseFile(config_file)) {
    std::cerr << "Invalid configuration!" << std::endl;
    exit(3);
  }

  if (dbname.empty()) {
    dbname = parser.database.empty() ? XRA_DEFAULT_DATABASE : parser.database;
  }

  kdc::Database db{dbname};
  if (!db) {
    std::cerr << "Cannot open database '" << dbname << "': "
              << db.errmsg() << std::endl;
    exit(2);
  }
  if (parser.db_timeout > 0) {
    db.setTimeout(parser.db_timeout);
  }

  const std::string cmd{argv[optind]};
  const std::vector<std::string> args(argv + optind + 1, argv + argc);
  Principal princ;

  if (cmd == "listprincs" && args.empty()) {
    std::vector<Principal> princs;
    int result = report(db.listPrincipals(princs), cmd);
    for (const auto &p : princs) {
      std::cout << p << std::endl;
    }
    return result;
  }

  if (args.empty() || !parse_principal(args[0].c_str(), princ)) {
    usage(argv[0], XRA_PACKAGE_VERSION);
    exit(1);
  }

  if (cmd == "addprinc" && args.size() == 1) {
    return report(db.addPrincipal(princ), cmd);
  } else if (cmd == "delprinc" && args.size() == 1) {
    return report(db.deletePrincipal(princ), cmd);
  } else if (cmd == "setstr" && args.size() == 3) {
    return report(db.setAttribute(princ, args[1], args[2]), cmd);
  } else if (cmd == "delstr" && args.size() == 2) {
    return report(db.deleteAttribute(princ, args[1]), cmd);
  } else if (cmd == "getstrs" && args.size() == 1) {
    xrealmauthz::Attributes attrs;
    int result = report(db.getAttributes(princ, attrs), cmd);
    for (const auto &a : attrs) {
      std::cout << std::quoted(a.first) << ": " << std::quoted(a.second) << std::endl;
    }
    return result;
  } else if (cmd == "check" && args.size() >= 2) {
    Principal server;
    if (!parse_principal(args[1].c_str(), server)) {
      exit(1);
    }
    std::vector<xrealmauthz::Realm> path(args.begin() + 2, args.end());
    return check(parser.policy, db, princ, server, path);
  }

  usage(argv[0], XRA_PACKAGE_VERSION);
  return 1;
}
