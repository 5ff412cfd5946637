/*

    Copyright the Gapkey contributors, 2026

    This file is part of Gapkey.

    Gapkey is free software: you can redistribute it and/or modify
    it under the terms of the GNU Affero General Public License as
    published by the Free Software Foundation, either version 3 of the
    License, or (at your option) any later version.

    Gapkey is distributed in the hope that it will be useful,
    but WITHOUT ANY WARRANTY; without even the implied warranty of
    MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
    GNU Affero General Public License for more details.

    You should have received a copy of the GNU Affero General Public License
    along with Gapkey.  If not, see <http://www.gnu.org/licenses/>.

*/

#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <iomanip>
#include <iostream>
#include <locale>
#include <sstream>

#ifndef BOOST_CHRONO_HEADER_ONLY
#define BOOST_CHRONO_HEADER_ONLY
#endif
#include <boost/chrono.hpp>
#include <boost/chrono/process_cpu_clocks.hpp>

#include "../config.hpp"
#include "../data_structures/key_generator.hpp"
#include "../data_structures/reorderable_container.hpp"

using namespace gapkey;

namespace {

typedef int64_t microseconds_t;

namespace chrono = boost::chrono;
microseconds_t get_this_process_microseconds() {
  return chrono::duration_cast<chrono::microseconds>(chrono::process_real_cpu_clock::now().time_since_epoch()).count();
}

// show_decimal(1234567, 1000, 1) --> "1234.5"
template<typename Integral, typename Integral2>
std::string show_decimal(Integral us, Integral2 divisor, int places, std::locale const& locale = std::locale()) {
  Integral divisordivisor = 1;
  for(int i = 0; i < places; ++i) { divisordivisor *= 10; }

  std::stringstream result;
  result << (us / divisor)
         << std::use_facet< std::numpunct<char> >(locale).decimal_point()
         << std::setfill('0') << std::setw(places) << std::abs(us / (divisor / divisordivisor) % divisordivisor);
  return result.str();
}

std::string show_microseconds(microseconds_t us) {
  return show_decimal(us, 1000, 1);
}

struct benchmark_timer {
  explicit benchmark_timer(const char* name):name_(name),start_(get_this_process_microseconds()){}
  ~benchmark_timer() {
    std::cout << std::setw(32) << std::left << name_
              << show_microseconds(get_this_process_microseconds() - start_) << " ms\n";
  }
private:
  const char* name_;
  microseconds_t start_;
};

template<typename Container>
size_t longest_key(Container const& c) {
  size_t result = 0;
  for (auto i = c.begin(); i != c.end(); ++i) {
    result = std::max(result, i.key().size());
  }
  return result;
}

void do_benchmark(size_t count, size_t insertions) {
  {
    benchmark_timer t("generate (unbounded)");
    const std::vector<order_key> keys = initial_keys(count);
    LOG << count << " keys, the last is " << keys.back() << '\n';
  }
  {
    benchmark_timer t("generate (between neighbors)");
    const std::vector<order_key> keys = keys_between(order_key::from_hex("80"), order_key::from_hex("81"), count);
    LOG << count << " keys, the last is " << keys.back() << '\n';
  }

  reorderable_container<size_t> c;
  {
    benchmark_timer t("put_at_end");
    for (size_t i = 0; i < count; ++i) {
      c.put_at_end({i});
    }
  }
  LOG << "after appending one at a time, the longest key has " << longest_key(c) << " digits\n";

  // Always inserting right after the same element is the worst case
  // for key length.
  const size_t anchor = c.front();
  {
    benchmark_timer t("put_next_to (same spot)");
    for (size_t i = 0; i < insertions; ++i) {
      c.put_next_to(anchor, {count + i});
    }
  }
  LOG << "after " << insertions << " insertions at one spot, the longest key has "
      << longest_key(c) << " digits\n";

  {
    benchmark_timer t("recompute");
    c.recompute();
  }
  LOG << "after recompute, the longest key has " << longest_key(c) << " digits\n";

  {
    benchmark_timer t("sort");
    c.sort();
  }
  {
    benchmark_timer t("pop_items");
    const std::vector<size_t> popped = c.pop_items(c.size() / 2);
    LOG << "popped " << popped.size() << ", " << c.size() << " left\n";
  }
}

// Larger runs would only measure the allocator.
const unsigned long long max_count = 1ULL << 26;

// Accepts a plain decimal number no larger than max_count.
bool parse_count(const char* text, size_t& result) {
  if (!isdigit(static_cast<unsigned char>(text[0]))) return false;
  errno = 0;
  char* end = nullptr;
  const unsigned long long value = strtoull(text, &end, 10);
  if (errno == ERANGE || *end != '\0' || value > max_count) return false;
  result = size_t(value);
  return true;
}

void usage(const char* program) {
  std::cerr << "usage: " << program << " [-n <count>] [-i <insertions>]\n";
}

} // end anonymous namespace

int main(int argc, char **argv)
{
  size_t count = 10000;
  size_t insertions = 1000;
  for (int i = 1; i < argc; ++i) {
    bool ok = false;
    if (i + 1 < argc && strcmp(argv[i], "-n") == 0) {
      ok = parse_count(argv[++i], count);
    }
    else if (i + 1 < argc && strcmp(argv[i], "-i") == 0) {
      ok = parse_count(argv[++i], insertions);
    }
    if (!ok) {
      usage(argv[0]);
      return 1;
    }
  }
  if (count == 0) {
    usage(argv[0]);
    return 1;
  }
  do_benchmark(count, insertions);
  return 0;
}
