/*
 * xrealmauthz.h -- main header file for libxrealmauthz
 *
 * Copyright (C) 2024 The xrealmauthz authors
 *
 * This file is part of xrealmauthz. Please see README
 * for terms of use.
 */

#ifndef _XREALMAUTHZ_H_
#define _XREALMAUTHZ_H_ 1

#ifdef __cplusplus
extern "C" {
#ifdef EMACS_NEEDS_A_CLOSING_BRACKET
}
#endif
#endif

#ifndef XRA_PACKAGE_VERSION
#define XRA_PACKAGE_VERSION "0.1.0"
#endif /* XRA_PACKAGE_VERSION */

/** Name under which the policy module announces itself. */
#define XRA_MODULE_NAME             "xrealmauthz"

/**
 * Prefix of string attributes on a cross-realm krbtgt principal that
 * carry authorization rules. "xr:@REALM" authorizes a realm,
 * "xr:name" or "xr:name@REALM" a single principal.
 */
#define XRA_ATTR_PREFIX             "xr:"

/** Primary name component of ticket-granting service principals. */
#define XRA_TGS_NAME                "krbtgt"

/** Configuration section holding the policy relations. */
#define XRA_CONFIG_SECTION          "kdcdefaults"
#define XRA_CONFIG_ENFORCING        "xrealmauthz_enforcing"
#define XRA_CONFIG_ALLOWED_REALMS   "xrealmauthz_allowed_realms"
#define XRA_CONFIG_DATABASE         "xrealmauthz_database"
#define XRA_CONFIG_DB_TIMEOUT       "xrealmauthz_db_timeout"

/** Upper bound for status messages handed back to the KDC. */
#define XRA_MAX_STATUS_LEN          256

typedef enum {
  XRA_OK,
  XRA_ERROR_OUT_OF_MEMORY,
  XRA_ERROR_INTERNAL_ERROR,
  XRA_ERROR_BAD_CONFIG            = 0x10,
  XRA_ERROR_NO_SUCH_PRINCIPAL     = 0x11,
  XRA_ERROR_NO_SUCH_ATTRIBUTE     = 0x12,
  XRA_ERROR_STORAGE_UNAVAILABLE   = 0x13,
  XRA_ERROR_POLICY                = 0x20 /**< KDC policy rejects request */
} xra_result_t;

/**
 * Returns a static, human-readable description of @p result. The
 * text for XRA_ERROR_POLICY is the generic rejection message that is
 * shown to a denied client.
 */
const char *xra_strerror(xra_result_t result);

#include "xrealmauthz/xra_debug.h"

#ifdef __cplusplus
}
#endif

#endif /* _XREALMAUTHZ_H_ */
