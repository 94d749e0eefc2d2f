#include "tagcache/memory_store.hpp"

#include <catch2/catch_test_macros.hpp>

#include <thread>

using namespace tagcache;
using namespace std::chrono_literals;

TEST_CASE("memory store round trip and delete", "[memory_store]") {
  MemoryStore s;
  std::optional<Bytes> out;
  REQUIRE(s.raw_set("k", to_bytes("hello"), 10s, 1s));
  REQUIRE(s.raw_get("k", out, 1s));
  REQUIRE(out.has_value());
  CHECK(to_string(*out) == "hello");
  CHECK(s.bytes_used() == 5);

  REQUIRE(s.raw_set("k", to_bytes("hi"), 10s, 1s));
  CHECK(s.bytes_used() == 2);

  REQUIRE(s.raw_del("k", 1s));
  REQUIRE(s.raw_del("k", 1s));
  REQUIRE(s.raw_get("k", out, 1s));
  CHECK_FALSE(out.has_value());
  CHECK(s.size() == 0);
  CHECK(s.bytes_used() == 0);
}

TEST_CASE("memory store rejects bad writes", "[memory_store]") {
  MemoryStore s;
  Error err;
  CHECK_FALSE(s.raw_set("", to_bytes("v"), 1s, 1s, &err));
  CHECK(err.code == ErrorCode::InvalidArgument);
  CHECK_FALSE(s.raw_set("k", to_bytes("v"), 0s, 1s, &err));
  CHECK(err.code == ErrorCode::InvalidArgument);
  CHECK(s.size() == 0);
}

TEST_CASE("memory store expires entries by ttl", "[memory_store][ttl]") {
  MemoryStore s({2});
  for (int i = 0; i < 5; ++i)
    REQUIRE(s.raw_set("short_" + std::to_string(i), to_bytes("x"), 20ms, 1s));
  REQUIRE(s.raw_set("long", to_bytes("y"), 10s, 1s));
  std::this_thread::sleep_for(60ms);

  std::optional<Bytes> out;
  REQUIRE(s.raw_get("short_4", out, 1s));
  CHECK_FALSE(out.has_value());

  // Each tick is bounded by ttl_cleanup_per_tick.
  s.tick();
  s.tick();
  s.tick();
  CHECK(s.size() == 1);
  CHECK(s.stats().expirations == 5);
}

TEST_CASE("re-setting a key re-arms its expiry", "[memory_store][ttl]") {
  MemoryStore s;
  REQUIRE(s.raw_set("k", to_bytes("a"), 20ms, 1s));
  REQUIRE(s.raw_set("k", to_bytes("b"), 10s, 1s));
  std::this_thread::sleep_for(50ms);
  s.tick();
  std::optional<Bytes> out;
  REQUIRE(s.raw_get("k", out, 1s));
  REQUIRE(out.has_value());
  CHECK(to_string(*out) == "b");
}

TEST_CASE("memory store scans live keys by prefix", "[memory_store]") {
  MemoryStore s;
  REQUIRE(s.raw_set("user_2", to_bytes("2"), 10s, 1s));
  REQUIRE(s.raw_set("user_1", to_bytes("1"), 10s, 1s));
  REQUIRE(s.raw_set("rider_1", to_bytes("r"), 10s, 1s));
  REQUIRE(s.raw_set("user_old", to_bytes("o"), 10ms, 1s));
  std::this_thread::sleep_for(30ms);

  std::vector<std::string> keys;
  REQUIRE(s.raw_scan_prefix("user_", keys, 1s));
  CHECK(keys == std::vector<std::string>{"user_1", "user_2"});
  REQUIRE(s.raw_scan_prefix("", keys, 1s));
  CHECK(keys.size() == 3);
}

TEST_CASE("memory store info reports counters", "[memory_store]") {
  MemoryStore s;
  REQUIRE(s.raw_set("k", to_bytes("abc"), 10s, 1s));
  std::optional<Bytes> out;
  REQUIRE(s.raw_get("k", out, 1s));
  REQUIRE(s.raw_del("k", 1s));
  const auto info = s.info();
  CHECK(info.find("store:memory\n") != std::string::npos);
  CHECK(info.find("store_sets:1\n") != std::string::npos);
  CHECK(info.find("store_gets:1\n") != std::string::npos);
  CHECK(info.find("store_dels:1\n") != std::string::npos);
  CHECK(info.find("store_keys:0\n") != std::string::npos);
}
