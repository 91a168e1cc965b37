/*
 * policy.hh -- process-wide cross-realm authorization policy
 *
 * Copyright (C) 2024 The xrealmauthz authors
 *
 * This file is part of xrealmauthz. Please see README
 * for terms of use.
 */

#ifndef XRA_POLICY_HH
#define XRA_POLICY_HH 1

#include <set>
#include <string>

#include "xrealmauthz/principal.hh"

namespace xrealmauthz {

/* Enforcing mode as read from the configuration. */
enum class Enforcing : unsigned char { Unset, Enabled, Disabled };

/**
 * The policy is loaded once at startup and not modified afterwards.
 */
struct Policy {
  Enforcing enforcing = Enforcing::Unset;
  std::set<Realm> allowed_realms;

  /* Unset means enforcing. */
  bool isEnforcing(void) const { return enforcing != Enforcing::Disabled; }

  bool isPreApproved(const Realm &realm) const {
    return allowed_realms.find(realm) != allowed_realms.end();
  }
};

} /* namespace xrealmauthz */

#endif /* XRA_POLICY_HH */
