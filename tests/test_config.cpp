#include <doctest/doctest.h>
#include "zetta/config.hpp"

#include <cstdio>
#include <fstream>
#include <string>

using namespace zetta;

TEST_CASE("Defaults match a USB CDC board") {
  LinkConfig cfg;
  CHECK(cfg.dev == "/dev/ttyACM0");
  CHECK(cfg.baud == 115200);
  CHECK(cfg.timeout_ms == 100);
  CHECK(cfg.boot_delay_ms == 400);
}

TEST_CASE("Keys present in the file override, absent keys keep their value") {
  LinkConfig cfg;
  std::string err;
  REQUIRE(parse_config(R"({"dev": "/dev/ttyUSB1", "baud": 57600})", cfg, err));
  CHECK(cfg.dev == "/dev/ttyUSB1");
  CHECK(cfg.baud == 57600);
  CHECK(cfg.timeout_ms == 100);
  CHECK(cfg.boot_delay_ms == 400);
}

TEST_CASE("Invalid config leaves the previous values untouched") {
  LinkConfig cfg;
  std::string err;

  CHECK_FALSE(parse_config("{not json", cfg, err));
  CHECK(err.find("not valid JSON") != std::string::npos);

  CHECK_FALSE(parse_config("[1, 2]", cfg, err));

  CHECK_FALSE(parse_config(R"({"dev": "/dev/x", "baud": "fast"})", cfg, err));
  CHECK(err.find("baud") != std::string::npos);
  CHECK(cfg.dev == "/dev/ttyACM0");                  // all-or-nothing

  CHECK_FALSE(parse_config(R"({"baud": 0})", cfg, err));
  CHECK_FALSE(parse_config(R"({"timeout_ms": -1})", cfg, err));
  CHECK_FALSE(parse_config(R"({"dev": 5})", cfg, err));
  CHECK(cfg.baud == 115200);
}

TEST_CASE("load_config reads a file and reports a missing one") {
  const std::string path = "zetta_test_config.json";
  {
    std::ofstream out(path);
    out << R"({"dev": "/dev/ttyS3", "timeout_ms": 250, "boot_delay_ms": 0})";
  }
  LinkConfig cfg;
  std::string err;
  REQUIRE(load_config(path, cfg, err));
  CHECK(cfg.dev == "/dev/ttyS3");
  CHECK(cfg.timeout_ms == 250);
  CHECK(cfg.boot_delay_ms == 0);
  std::remove(path.c_str());

  CHECK_FALSE(load_config("does/not/exist.json", cfg, err));
  CHECK(err.find("cannot open") != std::string::npos);
}

TEST_CASE("to_transport_config copies every field") {
  LinkConfig cfg;
  cfg.dev = "/dev/ttyUSB0";
  cfg.baud = 9600;
  cfg.timeout_ms = 20;
  cfg.boot_delay_ms = 5;
  const transport::Config tc = to_transport_config(cfg);
  CHECK(tc.path == "/dev/ttyUSB0");
  CHECK(tc.baud == 9600);
  CHECK(tc.timeout_ms == 20);
  CHECK(tc.boot_delay_ms == 5);
}
