/*
 * engine.hh -- cross-realm authorization decision engine
 *
 * Copyright (C) 2024 The xrealmauthz authors
 *
 * This file is part of xrealmauthz. Please see README
 * for terms of use.
 */

#ifndef XRA_ENGINE_HH
#define XRA_ENGINE_HH 1

#include <string>
#include <vector>

#include "xrealmauthz/xrealmauthz.h"
#include "xrealmauthz/attributes.hh"
#include "xrealmauthz/policy.hh"
#include "xrealmauthz/principal.hh"

namespace xrealmauthz {

/**
 * A single TGS request as seen by the policy check. The trust edge
 * is the krbtgt principal of the ticket the client presented, i.e.
 * krbtgt/DEST@PREV where PREV is the last realm of the transit path.
 */
struct TgsRequest {
  Principal client;
  Realm origin_realm;           /**< first realm of the transit path */
  Principal server;             /**< requested service principal */
  Principal trust_edge;

  /**
   * Creates a request for @p client asking for @p server where the
   * ticket traversed the realms in @p path, starting with the
   * client's realm. An empty @p path denotes direct trust from the
   * client's realm.
   */
  static TgsRequest fromTransitPath(const Principal &client,
                                    const Principal &server,
                                    const std::vector<Realm> &path);

  /* The realm of the destination KDC. */
  const Realm &destinationRealm(void) const { return server.realm; }
};

enum class Verdict : unsigned char { Allow, Deny, AllowLogged };

enum class Reason : unsigned char {
  NotCrossRealm,
  PreApproved,
  RuleMatch,
  NoRule,
  WouldDeny
};

struct Decision {
  Verdict verdict;
  Reason reason;
  bool storage_error = false; /**< edge lookup failed, treated as empty */
  std::string status;         /**< message for the KDC log, may be empty */

  bool allowed(void) const { return verdict != Verdict::Deny; }
};

const char *verdictName(Verdict v);
const char *reasonName(Reason r);

/**
 * The decision engine holds the policy and a reference to the
 * principal database. It has no other state, so decide() can be
 * called from several threads at the same time as long as the
 * AttributeAccessor allows concurrent reads.
 */
class Engine {
public:
  Engine(const Policy &policy, const AttributeAccessor &store);

  /**
   * Decides whether @p req may pass its trust edge. The attributes of
   * the trust edge are read for each call. A database error is
   * handled as if the edge carried no rules.
   */
  Decision decide(const TgsRequest &req) const;

  /**
   * Entry point for the KDC: runs decide(), logs the result and
   * translates it into a result code.
   *
   * @param req     The request to check.
   * @param status  Receives a message for the KDC log.
   * @return XRA_OK if a ticket may be issued, XRA_ERROR_POLICY if the
   *         request must be rejected.
   */
  xra_result_t checkTgs(const TgsRequest &req, std::string &status) const;

  const Policy &policy(void) const { return config; }

private:
  const Policy config;
  const AttributeAccessor &store;

  Rules lookupRules(const Principal &edge, bool &storage_error) const;
};

} /* namespace xrealmauthz */

#endif /* XRA_ENGINE_HH */
