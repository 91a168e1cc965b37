/*
 * decision_log.hh -- log output for authorization decisions
 *
 * Copyright (C) 2024 The xrealmauthz authors
 *
 * This file is part of xrealmauthz. Please see README
 * for terms of use.
 */

#ifndef XRA_DECISION_LOG_HH
#define XRA_DECISION_LOG_HH 1

#include "xrealmauthz/engine.hh"
#include "xrealmauthz/policy.hh"

namespace xrealmauthz {

/**
 * Announces the loaded policy. External tools look for the text
 * "enforcing mode: enabled" or "enforcing mode: disabled".
 */
void logStartup(const Policy &policy);

/**
 * Writes exactly one line for @p decision. AllowLogged decisions are
 * logged as warnings containing "would deny".
 */
void logDecision(const TgsRequest &req, const Decision &decision);

} /* namespace xrealmauthz */

#endif /* XRA_DECISION_LOG_HH */
