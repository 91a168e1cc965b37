/*
 * testdriver.cc -- xrealmauthz unit tests
 *
 * Copyright (C) 2024 The xrealmauthz authors
 *
 * This file is part of xrealmauthz. Please see README
 * for terms of use.
 */

#define CATCH_CONFIG_RUNNER
#include <catch2/catch.hpp>
#include "test.hh"

static std::vector<std::string> captured;

static void
capture(xra_log_t level, const char *message) {
  (void)level;
  captured.emplace_back(message);
}

LogCapture::LogCapture(xra_log_t level) : saved_level(xra_get_log_level()) {
  captured.clear();
  xra_set_log_level(level);
  xra_set_log_handler(capture);
}

LogCapture::~LogCapture(void) {
  xra_set_log_handler(nullptr);
  xra_set_log_level(saved_level);
}

bool LogCapture::contains(const std::string &text) const {
  for (const auto &line : captured) {
    if (line.find(text) != std::string::npos) {
      return true;
    }
  }
  return false;
}

const std::vector<std::string> &LogCapture::lines(void) const {
  return captured;
}

void LogCapture::clear(void) {
  captured.clear();
}

void test_log_off(void) {
  xra_set_log_level(XRA_LOG_CRIT);
}

void test_log_on(void) {
  xra_set_log_level(XRA_LOG_NOTICE);
}

int main(int argc, char* argv[]) {
  test_log_off();
  int result = Catch::Session().run( argc, argv );

  return result;
}
