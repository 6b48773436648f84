#include "backoff.hpp"
#include <cassert>

using ms = std::chrono::milliseconds;

static void test_doubles_until_cap() {
  Backoff b(ms(500), ms(30000));
  assert(b.next() == ms(500));
  assert(b.next() == ms(1000));
  assert(b.next() == ms(2000));
  assert(b.next() == ms(4000));
  assert(b.next() == ms(8000));
  assert(b.next() == ms(16000));
  assert(b.next() == ms(30000));
  assert(b.next() == ms(30000));
  assert(b.attempts() == 8);
}

static void test_strictly_increasing_below_cap() {
  Backoff b(ms(3), ms(1000));
  ms prev = b.next();
  while (b.peek() < ms(1000)) {
    ms d = b.next();
    assert(d > prev);
    prev = d;
  }
  assert(b.next() == ms(1000));
}

static void test_reset() {
  Backoff b(ms(20), ms(80));
  b.next();
  b.next();
  assert(b.peek() == ms(80));
  b.reset();
  assert(b.attempts() == 0);
  assert(b.next() == ms(20));
}

static void test_degenerate_bounds() {
  Backoff z(ms(0), ms(0));
  assert(z.next() == ms(1));
  Backoff inv(ms(100), ms(10));
  assert(inv.next() == ms(100));
  assert(inv.next() == ms(100));
}

int main() {
  test_doubles_until_cap();
  test_strictly_increasing_below_cap();
  test_reset();
  test_degenerate_bounds();
  return 0;
}
