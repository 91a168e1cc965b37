/*
 * principal.cc -- Kerberos principal names for xrealmauthz
 *
 * Copyright (C) 2024 The xrealmauthz authors
 *
 * This file is part of xrealmauthz. Please see README
 * for terms of use.
 */

#include "xrealmauthz/xrealmauthz.h"
#include "xrealmauthz/principal.hh"

namespace xrealmauthz {

/* Returns the position of the last '@' that is not escaped by a
 * backslash, or std::string::npos. */
static std::string::size_type
find_realm_separator(const std::string &s) {
  std::string::size_type sep = std::string::npos;

  for (std::string::size_type idx = 0; idx < s.size(); idx++) {
    if (s[idx] == '\\') {
      idx++;                    /* skip escaped character */
    } else if (s[idx] == '@') {
      sep = idx;
    }
  }
  return sep;
}

std::optional<Principal>
Principal::parse(const std::string &s, const Realm &default_realm) {
  const auto sep = find_realm_separator(s);

  if (sep == std::string::npos) {
    if (s.empty())
      return std::nullopt;
    return Principal{s, default_realm};
  }

  /* Realm names cannot contain '@', so the name part must not
   * contain another separator. */
  if ((sep == 0) || (sep + 1 == s.size())
      || (find_realm_separator(s.substr(0, sep)) != std::string::npos)) {
    return std::nullopt;
  }
  return Principal{s.substr(0, sep), s.substr(sep + 1)};
}

Principal
Principal::tgs(const Realm &dest, const Realm &realm) {
  return Principal{std::string(XRA_TGS_NAME "/") + dest, realm};
}

std::string
Principal::unparse(void) const {
  return realm.empty() ? name : name + '@' + realm;
}

bool
Principal::isTgs(void) const {
  static const std::string prefix{XRA_TGS_NAME "/"};
  return name.compare(0, prefix.size(), prefix) == 0;
}

std::ostream &
operator<<(std::ostream &os, const Principal &p) {
  return os << p.unparse();
}

} /* namespace xrealmauthz */
