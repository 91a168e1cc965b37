/*
 * rule.hh -- Cross-realm authorization rule representation
 *
 * Copyright (C) 2024 The xrealmauthz authors
 *
 * This file is part of xrealmauthz. Please see README
 * for terms of use.
 */

#ifndef XRA_RULE_HH
#define XRA_RULE_HH 1

#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "xrealmauthz/principal.hh"

namespace xrealmauthz {

/*
 * The string attributes of a principal record, key -> value. Only
 * keys starting with XRA_ATTR_PREFIX are of interest here, their
 * values are ignored.
 */
using Attributes = std::map<std::string, std::string>;

/* Authorizes every client whose origin realm is realm. */
struct RealmRule {
  Realm realm;
};

/*
 * Authorizes a single client. An empty realm denotes a bare name
 * that is resolved against the realm of the trust edge.
 */
struct PrincipalRule {
  std::string name;
  Realm realm;
};

using Rule = std::variant<RealmRule, PrincipalRule>;
using Rules = std::vector<Rule>;

/**
 * Parses the attribute key @p key. Keys without XRA_ATTR_PREFIX and
 * malformed keys (nothing after the prefix, a lone '@', an empty
 * name or realm) yield std::nullopt.
 */
std::optional<Rule> parseRule(const std::string &key);

/** Parses all keys of @p attrs, skipping everything that is no rule. */
Rules parseRules(const Attributes &attrs);

/** Returns the attribute key that represents @p rule. */
std::string ruleToKey(const Rule &rule);

/**
 * Checks if any of @p rules authorizes @p client. Realm rules are
 * compared with @p origin_realm, the first realm of the transit path.
 * Bare principal rules only apply to clients from @p default_realm.
 *
 * @param rules         The rules found on the trust edge.
 * @param origin_realm  The client's home realm.
 * @param client        The requesting client principal.
 * @param default_realm Realm against which bare names are read.
 * @return              @c true if at least one rule matches.
 */
bool matches(const Rules &rules, const Realm &origin_realm,
             const Principal &client, const Realm &default_realm);

} /* namespace xrealmauthz */

#endif /* XRA_RULE_HH */
