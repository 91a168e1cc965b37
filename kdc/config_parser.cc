/*
 * config_parser.cc -- policy configuration for the xrealmauthz KDC module
 *
 * Copyright (C) 2024 The xrealmauthz authors
 *
 * This file is part of xrealmauthz. Please see README
 * for terms of use.
 */

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <sstream>

#include "xrealmauthz/xrealmauthz.h"
#include "config_parser.hh"

namespace xra_config {

std::string
getDefaultConfigFile(void) {
  const char *env = getenv("XREALMAUTHZ_CONFIG");
  const char *home = getenv("HOME");
  std::error_code err;

  if (env && *env) {
    return env;
  }

  if (home) { /* check if $HOME/.xrealmauthzrc exists */
    std::filesystem::path path{std::filesystem::path(home)/".xrealmauthzrc"};
    if (std::filesystem::exists(path, err)) {
      return path;
    }
  }
  if (std::filesystem::exists("/etc/xrealmauthz.conf", err)) {
    return "/etc/xrealmauthz.conf";
  }
  return "";
}

bool
parseBoolean(const std::string &s, bool &result) {
  static const char *yes[] = { "y", "yes", "true", "t", "1", "on" };
  static const char *no[] = { "n", "no", "false", "nil", "0", "off" };
  std::string value{s};

  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char c) { return std::tolower(c); });

  for (const char *v : yes) {
    if (value == v) {
      result = true;
      return true;
    }
  }
  for (const char *v : no) {
    if (value == v) {
      result = false;
      return true;
    }
  }
  return false;
}

/* explicitly define destructor to avoid inlining warning */
parser::~parser(void) {
}

bool
parser::readEnforcing(const YAML::Node &section) {
  auto node = section[XRA_CONFIG_ENFORCING];
  bool enforcing;

  if (!node.IsDefined()) {
    return true;
  }
  if (!node.IsScalar() || !parseBoolean(node.as<std::string>(), enforcing)) {
    xra_log(XRA_LOG_ERR, "invalid value for %s\n", XRA_CONFIG_ENFORCING);
    return false;
  }
  policy.enforcing = enforcing
    ? xrealmauthz::Enforcing::Enabled : xrealmauthz::Enforcing::Disabled;
  return true;
}

/* Splits @p value at whitespace and commas and adds each realm to
 * @p realms. */
static bool
add_realms(const std::string &value, std::set<xrealmauthz::Realm> &realms) {
  std::string list{value};
  std::replace(list.begin(), list.end(), ',', ' ');
  std::istringstream in{list};
  std::string realm;
  bool found = false;

  while (in >> realm) {
    realms.insert(realm);
    found = true;
  }
  return found;
}

bool
parser::readAllowedRealms(const YAML::Node &section) {
  auto node = section[XRA_CONFIG_ALLOWED_REALMS];

  if (!node.IsDefined() || node.IsNull()) {
    return true;
  }

  if (node.IsScalar()) {
    if (!add_realms(node.as<std::string>(), policy.allowed_realms)) {
      xra_log(XRA_LOG_ERR, "empty realm list in %s\n", XRA_CONFIG_ALLOWED_REALMS);
      return false;
    }
  } else if (node.IsSequence()) {
    for (const auto &entry : node) {
      if (!entry.IsScalar() || !add_realms(entry.as<std::string>(),
                                           policy.allowed_realms)) {
        xra_log(XRA_LOG_ERR, "invalid realm in %s\n", XRA_CONFIG_ALLOWED_REALMS);
        return false;
      }
    }
  } else {
    xra_log(XRA_LOG_ERR, "%s must be a realm list\n", XRA_CONFIG_ALLOWED_REALMS);
    return false;
  }
  return true;
}

bool
parser::readDatabase(const YAML::Node &section) {
  if (auto db = section[XRA_CONFIG_DATABASE]) {
    if (!db.IsScalar()) {
      xra_log(XRA_LOG_ERR, "invalid value for %s\n", XRA_CONFIG_DATABASE);
      return false;
    }
    database = db.as<std::string>();
  }

  if (auto timeout = section[XRA_CONFIG_DB_TIMEOUT]) {
    if (!timeout.IsScalar() || (timeout.as<int>() < 0)) {
      xra_log(XRA_LOG_ERR, "invalid value for %s\n", XRA_CONFIG_DB_TIMEOUT);
      return false;
    }
    db_timeout = timeout.as<int>();
  }
  return true;
}

bool
parser::load(void) {
  policy = xrealmauthz::Policy{};
  database.clear();
  db_timeout = 0;

  if (config_root->IsNull()) {
    return true;                /* empty file, use defaults */
  }
  if (!config_root->IsMap()) {
    xra_log(XRA_LOG_ERR, "configuration must be a map\n");
    return false;
  }

  auto section = (*config_root)[XRA_CONFIG_SECTION];
  if (!section.IsDefined() || section.IsNull()) {
    return true;
  }
  if (!section.IsMap()) {
    xra_log(XRA_LOG_ERR, "%s must be a map\n", XRA_CONFIG_SECTION);
    return false;
  }

  bool ok = true;
  ok = readEnforcing(section) && ok;
  ok = readAllowedRealms(section) && ok;
  ok = readDatabase(section) && ok;
  return ok;
}

bool parser::parse(std::istream& input) {
  try {
    config_root = std::make_unique<YAML::Node>(YAML::Load(input));
    return load();
  }
  catch (const YAML::Exception& ex) {
    xra_log(XRA_LOG_ERR, "%s\n", ex.what());
  }
  return false;
}

bool parser::parseFile(const std::string &filename) {
  try {
    config_root = std::make_unique<YAML::Node>(YAML::LoadFile(filename));
    return load();
  }
  catch (const YAML::BadFile& ex) {
    xra_log(XRA_LOG_ERR, "cannot read %s: %s\n", filename.c_str(), ex.what());
  }
  catch (const YAML::Exception& ex) {
    xra_log(XRA_LOG_ERR, "%s: %s\n", filename.c_str(), ex.what());
  }
  return false;
}

} /* namespace xra_config */
