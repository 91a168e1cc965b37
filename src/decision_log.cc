/*
 * decision_log.cc -- log output for authorization decisions
 *
 * Copyright (C) 2024 The xrealmauthz authors
 *
 * This file is part of xrealmauthz. Please see README
 * for terms of use.
 */

#include "xrealmauthz/xrealmauthz.h"
#include "xrealmauthz/decision_log.hh"

namespace xrealmauthz {

void
logStartup(const Policy &policy) {
  xra_log(XRA_LOG_NOTICE, XRA_MODULE_NAME " cross-realm authorization plugin loaded "
          "(enforcing mode: %s, pre-approved realms: %d)\n",
          policy.isEnforcing() ? "enabled" : "disabled",
          static_cast<int>(policy.allowed_realms.size()));

  for (const auto &realm : policy.allowed_realms) {
    xra_log(XRA_LOG_INFO, "pre-approved realm %s\n", realm.c_str());
  }
}

void
logDecision(const TgsRequest &req, const Decision &decision) {
  const std::string client{req.client.unparse()};
  const std::string server{req.server.unparse()};

  switch (decision.verdict) {
  case Verdict::Allow:
    xra_log(decision.reason == Reason::NotCrossRealm ? XRA_LOG_DEBUG : XRA_LOG_INFO,
            "allow %s for %s via %s (%s)\n", client.c_str(), server.c_str(),
            req.trust_edge.unparse().c_str(), reasonName(decision.reason));
    break;
  case Verdict::Deny:
    xra_log(XRA_LOG_NOTICE, "%s: %s for %s\n", decision.status.c_str(),
            client.c_str(), server.c_str());
    break;
  case Verdict::AllowLogged:
    xra_log(XRA_LOG_WARNING, "%s\n", decision.status.c_str());
    break;
  }
}

} /* namespace xrealmauthz */
