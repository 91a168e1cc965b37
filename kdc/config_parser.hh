/*
 * config_parser.hh -- policy configuration for the xrealmauthz KDC module
 *
 * Copyright (C) 2024 The xrealmauthz authors
 *
 * This file is part of xrealmauthz. Please see README
 * for terms of use.
 */

#ifndef _CONFIG_PARSER_HH
#define _CONFIG_PARSER_HH 1

#include <iostream>
#include <memory>
#include <string>

#include <yaml-cpp/yaml.h>

#include "xrealmauthz/policy.hh"

namespace xra_config {

std::string getDefaultConfigFile(void);

/**
 * Reads a boolean the way Kerberos profiles do: y, yes, true, t, 1,
 * on and n, no, false, nil, 0, off, ignoring case.
 *
 * @return @c false if @p s is none of these.
 */
bool parseBoolean(const std::string &s, bool &result);

class parser {
public:
  ~parser(void);

  /**
   * Parses the YAML document from @p input. Returns @c false if the
   * document cannot be parsed or contains an invalid policy.
   */
  bool parse(std::istream& input);
  bool parseFile(const std::string &filename);

  bool have_config(void) const { return (bool)config_root; }

  xrealmauthz::Policy policy;
  std::string database;         /* path of the principal database */
  int db_timeout = 0;           /* busy timeout in ms, 0 for default */
protected:
  std::unique_ptr<YAML::Node> config_root;

  bool load(void);
  bool readEnforcing(const YAML::Node &section);
  bool readAllowedRealms(const YAML::Node &section);
  bool readDatabase(const YAML::Node &section);
};

} /* namespace xra_config */

#endif /* _CONFIG_PARSER_HH */
