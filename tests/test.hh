/*
 * test.hh -- common declarations for xrealmauthz unit tests
 *
 * Copyright (C) 2024 The xrealmauthz authors
 *
 * This file is part of xrealmauthz. Please see README
 * for terms of use.
 */

#ifndef TEST_HH_
#define TEST_HH_

#include <string>
#include <vector>

#include "xrealmauthz/xrealmauthz.h"
#include "xrealmauthz/attributes.hh"
#include "xrealmauthz/principal.hh"

void test_log_off(void);
void test_log_on(void);

/*
 * Collects all log lines written while an object of this class
 * exists. Only one LogCapture may be active at a time.
 */
class LogCapture {
public:
  LogCapture(xra_log_t level = XRA_LOG_DEBUG);
  ~LogCapture(void);

  /* true if any captured line contains text */
  bool contains(const std::string &text) const;
  const std::vector<std::string> &lines(void) const;
  void clear(void);

private:
  xra_log_t saved_level;
};

/* Attribute store that cannot be reached. */
class UnavailableStore : public xrealmauthz::AttributeAccessor {
public:
  mutable unsigned int reads = 0;

  xra_result_t getAttributes(const xrealmauthz::Principal &,
                             xrealmauthz::Attributes &) const override {
    ++reads;
    return XRA_ERROR_STORAGE_UNAVAILABLE;
  }
  xra_result_t setAttribute(const xrealmauthz::Principal &,
                            const std::string &,
                            const std::string &) override {
    return XRA_ERROR_STORAGE_UNAVAILABLE;
  }
  xra_result_t deleteAttribute(const xrealmauthz::Principal &,
                               const std::string &) override {
    return XRA_ERROR_STORAGE_UNAVAILABLE;
  }
};

#endif /* TEST_HH_ */
