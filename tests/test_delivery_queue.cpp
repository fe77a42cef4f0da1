#include <doctest/doctest.h>
#include "zetta/delivery_queue.hpp"

#include <chrono>
#include <thread>

using namespace zetta;
using std::chrono::milliseconds;

TEST_CASE("Items come out in push order") {
  DeliveryQueue<int, 8> q;
  for (int i = 0; i < 5; ++i) CHECK(q.push(i));
  CHECK(q.size() == 5);
  for (int i = 0; i < 5; ++i) {
    auto v = q.pop(milliseconds(0));
    REQUIRE(v.has_value());
    CHECK(*v == i);
  }
  CHECK(q.empty());
}

TEST_CASE("Zero timeout on an empty queue returns immediately") {
  DeliveryQueue<int, 4> q;
  CHECK_FALSE(q.pop(milliseconds(0)).has_value());
}

TEST_CASE("Timed pop gives up after the timeout") {
  DeliveryQueue<int, 4> q;
  const auto t0 = std::chrono::steady_clock::now();
  CHECK_FALSE(q.pop(milliseconds(30)).has_value());
  CHECK(std::chrono::steady_clock::now() - t0 >= milliseconds(25));
}

TEST_CASE("Full queue evicts the oldest item") {
  DeliveryQueue<int, 3> q;
  CHECK(q.push(1));
  CHECK(q.push(2));
  CHECK(q.push(3));
  CHECK_FALSE(q.push(4));                 // 1 evicted
  CHECK_FALSE(q.push(5));                 // 2 evicted
  CHECK(q.size() == 3);
  CHECK(*q.pop(milliseconds(0)) == 3);
  CHECK(*q.pop(milliseconds(0)) == 4);
  CHECK(*q.pop(milliseconds(0)) == 5);
}

TEST_CASE("flush() empties the queue and reports the count") {
  DeliveryQueue<int, 4> q;
  q.push(1);
  q.push(2);
  CHECK(q.flush() == 2);
  CHECK(q.empty());
  CHECK(q.flush() == 0);
}

TEST_CASE("Blocking pop wakes when another thread pushes") {
  DeliveryQueue<int, 4> q;
  std::thread producer([&q] {
    std::this_thread::sleep_for(milliseconds(20));
    q.push(99);
  });
  auto v = q.pop();
  producer.join();
  REQUIRE(v.has_value());
  CHECK(*v == 99);
}
