/*
 * principal.hh -- Kerberos principal names for xrealmauthz
 *
 * Copyright (C) 2024 The xrealmauthz authors
 *
 * This file is part of xrealmauthz. Please see README
 * for terms of use.
 */

#ifndef XRA_PRINCIPAL_HH
#define XRA_PRINCIPAL_HH 1

#include <optional>
#include <ostream>
#include <string>

namespace xrealmauthz {

/* A realm is an opaque, case-sensitive token. */
using Realm = std::string;

/**
 * A principal is identified by its name (all components joined by
 * '/', with '@' inside a component escaped as "\@") and its realm.
 * Two principals are equal if both strings are equal.
 */
struct Principal {
  std::string name;
  Realm realm;

  Principal() = default;
  Principal(const std::string &n, const Realm &r) : name(n), realm(r) {}

  /**
   * Parses the textual representation @p s of a principal. The realm
   * is everything after the last unescaped '@'. If @p s has no realm
   * part, @p default_realm is used.
   *
   * @return The principal, or std::nullopt if @p s has an empty name
   *         or an empty realm after '@'.
   */
  static std::optional<Principal> parse(const std::string &s,
                                        const Realm &default_realm = Realm());

  /** Returns the ticket-granting principal krbtgt/@p dest@@p realm. */
  static Principal tgs(const Realm &dest, const Realm &realm);

  /** Returns "name@realm", or just the name if realm is empty. */
  std::string unparse(void) const;

  /** Returns the name without the realm. */
  const std::string &unparseNoRealm(void) const { return name; }

  /** true if this is a krbtgt/... principal. */
  bool isTgs(void) const;

  bool operator==(const Principal &other) const {
    return name == other.name && realm == other.realm;
  }
  bool operator!=(const Principal &other) const { return !(*this == other); }
  bool operator<(const Principal &other) const {
    return realm < other.realm || (realm == other.realm && name < other.name);
  }
};

std::ostream &operator<<(std::ostream &os, const Principal &p);

} /* namespace xrealmauthz */

#endif /* XRA_PRINCIPAL_HH */
