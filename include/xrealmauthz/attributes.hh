/*
 * attributes.hh -- access to string attributes of principal records
 *
 * Copyright (C) 2024 The xrealmauthz authors
 *
 * This file is part of xrealmauthz. Please see README
 * for terms of use.
 */

#ifndef XRA_ATTRIBUTES_HH
#define XRA_ATTRIBUTES_HH 1

#include <string>

#include "xrealmauthz/xrealmauthz.h"
#include "xrealmauthz/principal.hh"
#include "xrealmauthz/rule.hh"

namespace xrealmauthz {

/**
 * Interface to the principal database. Implementations must be safe
 * to read from several request handlers at once.
 */
class AttributeAccessor {
public:
  virtual ~AttributeAccessor(void) = default;

  /**
   * Retrieves all string attributes of @p princ into @p out.
   *
   * @return XRA_OK on success, XRA_ERROR_NO_SUCH_PRINCIPAL if
   *         @p princ does not exist, XRA_ERROR_STORAGE_UNAVAILABLE
   *         if the storage could not be read.
   */
  virtual xra_result_t getAttributes(const Principal &princ,
                                     Attributes &out) const = 0;

  /** Sets attribute @p key of @p princ to @p value. */
  virtual xra_result_t setAttribute(const Principal &princ,
                                    const std::string &key,
                                    const std::string &value) = 0;

  /**
   * Removes attribute @p key from @p princ. Returns
   * XRA_ERROR_NO_SUCH_ATTRIBUTE if it was not set.
   */
  virtual xra_result_t deleteAttribute(const Principal &princ,
                                       const std::string &key) = 0;
};

} /* namespace xrealmauthz */

#endif /* XRA_ATTRIBUTES_HH */
