/*
 * engine.cc -- cross-realm authorization decision engine
 *
 * Copyright (C) 2024 The xrealmauthz authors
 *
 * This file is part of xrealmauthz. Please see README
 * for terms of use.
 */

#include <exception>
#include <string>

#include "xrealmauthz/xrealmauthz.h"
#include "xrealmauthz/decision_log.hh"
#include "xrealmauthz/engine.hh"
#include "xrealmauthz/rule.hh"

namespace xrealmauthz {

TgsRequest
TgsRequest::fromTransitPath(const Principal &client,
                            const Principal &server,
                            const std::vector<Realm> &path) {
  TgsRequest req;
  req.client = client;
  req.server = server;
  if (path.empty()) {
    req.origin_realm = client.realm;
    req.trust_edge = Principal::tgs(server.realm, client.realm);
  } else {
    req.origin_realm = path.front();
    req.trust_edge = Principal::tgs(server.realm, path.back());
  }
  return req;
}

const char *
verdictName(Verdict v) {
  switch (v) {
  case Verdict::Allow: return "allow";
  case Verdict::Deny: return "deny";
  case Verdict::AllowLogged: return "allow (logged)";
  }
  return "unknown";
}

const char *
reasonName(Reason r) {
  switch (r) {
  case Reason::NotCrossRealm: return "not cross-realm";
  case Reason::PreApproved: return "pre-approved realm";
  case Reason::RuleMatch: return "rule match";
  case Reason::NoRule: return "no rule";
  case Reason::WouldDeny: return "would deny";
  }
  return "unknown";
}

static inline std::string
limit_status(std::string s) {
  if (s.size() >= XRA_MAX_STATUS_LEN)
    s.resize(XRA_MAX_STATUS_LEN - 1);
  return s;
}

Engine::Engine(const Policy &policy, const AttributeAccessor &store_)
  : config(policy), store(store_) {
}

Rules
Engine::lookupRules(const Principal &edge, bool &storage_error) const {
  Attributes attrs;
  xra_result_t res;

  storage_error = false;
  try {
    res = store.getAttributes(edge, attrs);
  } catch (const std::exception &ex) {
    xra_log(XRA_LOG_ERR, "reading %s: %s\n", edge.unparse().c_str(), ex.what());
    res = XRA_ERROR_STORAGE_UNAVAILABLE;
  }

  switch (res) {
  case XRA_OK:
    return parseRules(attrs);
  case XRA_ERROR_NO_SUCH_PRINCIPAL:
  case XRA_ERROR_NO_SUCH_ATTRIBUTE:
    xra_log(XRA_LOG_DEBUG, "no authorization entries on %s\n",
            edge.unparse().c_str());
    break;
  default:
    /* fail closed */
    xra_log(XRA_LOG_ERR, XRA_MODULE_NAME " plugin failed to retrieve "
            "cross-realm TGT %s from database: %s\n",
            edge.unparse().c_str(), xra_strerror(res));
    storage_error = true;
    break;
  }
  return Rules{};
}

Decision
Engine::decide(const TgsRequest &req) const {
  if (req.destinationRealm() == req.client.realm) {
    return Decision{Verdict::Allow, Reason::NotCrossRealm};
  }

  const Realm &origin = req.origin_realm.empty()
    ? req.client.realm : req.origin_realm;

  if (config.isPreApproved(origin)) {
    return Decision{Verdict::Allow, Reason::PreApproved};
  }

  bool storage_error;
  const Rules rules = lookupRules(req.trust_edge, storage_error);

  if (matches(rules, origin, req.client, req.trust_edge.realm)) {
    return Decision{Verdict::Allow, Reason::RuleMatch, storage_error};
  }

  if (config.isEnforcing()) {
    /* the KDC adds client and server to its own log line */
    return Decision{Verdict::Deny, Reason::NoRule, storage_error,
        limit_status(XRA_MODULE_NAME " plugin denied from "
                     + req.trust_edge.realm)};
  }

  return Decision{Verdict::AllowLogged, Reason::WouldDeny, storage_error,
      limit_status(XRA_MODULE_NAME " plugin would deny "
                   + req.client.unparse() + " for " + req.server.unparse()
                   + " from " + req.trust_edge.realm)};
}

xra_result_t
Engine::checkTgs(const TgsRequest &req, std::string &status) const {
  const Decision decision = decide(req);

  logDecision(req, decision);
  status = decision.status;
  return decision.allowed() ? XRA_OK : XRA_ERROR_POLICY;
}

} /* namespace xrealmauthz */
