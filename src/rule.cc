/*
 * rule.cc -- Cross-realm authorization rule parsing and matching
 *
 * Copyright (C) 2024 The xrealmauthz authors
 *
 * This file is part of xrealmauthz. Please see README
 * for terms of use.
 */

#include <algorithm>

#include "xrealmauthz/xrealmauthz.h"
#include "xrealmauthz/rule.hh"

namespace xrealmauthz {

static constexpr size_t prefix_len = sizeof(XRA_ATTR_PREFIX) - 1;

static inline bool
has_prefix(const std::string &key) {
  return key.compare(0, prefix_len, XRA_ATTR_PREFIX) == 0;
}

std::optional<Rule>
parseRule(const std::string &key) {
  if (!has_prefix(key))
    return std::nullopt;

  const std::string rest{key.substr(prefix_len)};
  if (rest.empty())
    return std::nullopt;

  if (rest[0] == '@') {
    const Realm realm{rest.substr(1)};
    if (realm.empty() || (realm.find('@') != std::string::npos))
      return std::nullopt;
    return Rule{RealmRule{realm}};
  }

  const auto princ = Principal::parse(rest);
  if (!princ)
    return std::nullopt;
  return Rule{PrincipalRule{princ->name, princ->realm}};
}

Rules
parseRules(const Attributes &attrs) {
  Rules rules;

  for (const auto &attr : attrs) {
    if (auto rule = parseRule(attr.first)) {
      rules.push_back(*rule);
    } else if (has_prefix(attr.first)) {
      xra_log(XRA_LOG_DEBUG, "ignoring malformed rule '%s'\n",
              attr.first.c_str());
    }
  }
  return rules;
}

namespace {
struct KeyBuilder {
  std::string operator()(const RealmRule &r) const {
    return XRA_ATTR_PREFIX "@" + r.realm;
  }
  std::string operator()(const PrincipalRule &r) const {
    return XRA_ATTR_PREFIX + Principal{r.name, r.realm}.unparse();
  }
};

struct Matcher {
  const Realm &origin_realm;
  const Principal &client;
  const Realm &default_realm;

  bool operator()(const RealmRule &r) const {
    return r.realm == origin_realm;
  }
  bool operator()(const PrincipalRule &r) const {
    const Realm &realm = r.realm.empty() ? default_realm : r.realm;
    return !realm.empty() && (r.name == client.name) && (realm == client.realm);
  }
};
} /* anonymous namespace */

std::string
ruleToKey(const Rule &rule) {
  return std::visit(KeyBuilder{}, rule);
}

bool
matches(const Rules &rules, const Realm &origin_realm,
        const Principal &client, const Realm &default_realm) {
  const Matcher match{origin_realm, client, default_realm};

  return std::any_of(rules.cbegin(), rules.cend(),
                     [&match](const auto &rule) {
                       return std::visit(match, rule);
                     });
}

} /* namespace xrealmauthz */
