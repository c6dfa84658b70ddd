#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <array>
#include <cmath>
#include <numeric>
#include <random>
#include <set>
#include <vector>

#include "RngUtils.h"
#include "randutils.hpp"

using trialsynth::rng_utils::get_engine;
using trialsynth::rng_utils::get_random_index;
using trialsynth::rng_utils::get_random_normal;
using trialsynth::rng_utils::tag_from_name;
using trialsynth::rng_utils::fresh_master_seed;
using trialsynth::rng_utils::CRNKey;
using trialsynth::rng_utils::CRNEngineProvider;
using trialsynth::rng_utils::splitmix64;
using trialsynth::rng_utils::hash_combine64;

TEST_CASE("RngUtils: get_engine returns the wrapped engine", "[rng][engine]") {
  std::mt19937_64 stdrng(12345u);
  REQUIRE(&get_engine(stdrng) == &stdrng);

  randutils::seed_seq_fe128 seed{1u, 2u, 3u, 4u};
  randutils::mt19937_rng rrng(seed);
  REQUIRE(&get_engine(rrng) == &rrng.engine());
}

TEST_CASE("RngUtils: get_random_index range and coverage", "[rng][index]") {
  std::mt19937_64 rng(7u);
  std::set<std::size_t> seen;

  for (int i = 0; i < 2000; ++i) {
    const std::size_t idx = get_random_index(rng, 8);
    REQUIRE(idx < 8);
    seen.insert(idx);
  }
  REQUIRE(seen.size() == 8);
  REQUIRE(get_random_index(rng, 0) == 0);
}

TEST_CASE("RngUtils: get_random_normal moments and degenerate sd", "[rng][normal]") {
  std::mt19937_64 rng(99u);
  std::vector<double> draws(20000);
  for (auto& d : draws)
    d = get_random_normal(rng, 130.0, 10.0);

  const double mean = std::accumulate(draws.begin(), draws.end(), 0.0) / draws.size();
  double ss = 0.0;
  for (double d : draws)
    ss += (d - mean) * (d - mean);
  const double sd = std::sqrt(ss / (draws.size() - 1));

  REQUIRE(mean == Catch::Approx(130.0).margin(0.3));
  REQUIRE(sd == Catch::Approx(10.0).margin(0.3));

  // No engine output is consumed for a zero sd
  std::mt19937_64 a(5u), b(5u);
  REQUIRE(get_random_normal(a, 80.0, 0.0) == 80.0);
  REQUIRE(a() == b());
}

TEST_CASE("RngUtils: tag_from_name is stable and distinguishes names", "[rng][tag]") {
  REQUIRE(tag_from_name("mvn") == tag_from_name("mvn"));
  REQUIRE(tag_from_name("mvn") != tag_from_name("bootstrap"));
  REQUIRE(tag_from_name("") == 0xcbf29ce484222325ull);
}

TEST_CASE("RngUtils: fresh_master_seed varies between calls", "[rng][seed]") {
  std::set<uint64_t> seeds;
  for (int i = 0; i < 8; ++i)
    seeds.insert(fresh_master_seed());
  REQUIRE(seeds.size() > 1);
}

TEST_CASE("CRNKey: seed determinism and tag-order sensitivity", "[rng][crn][CRNKey]") {
  const uint64_t MASTER = 0xD00DCAFEF00DCAFEull;

  CRNKey k1(MASTER, {1, 2, 3});
  CRNKey k2(MASTER, {1, 2, 3});
  REQUIRE(k1.make_seed_for(0) == k2.make_seed_for(0));
  REQUIRE(k1.make_seed_for(42) == k2.make_seed_for(42));

  CRNKey k3(MASTER, {1, 3, 2});
  REQUIRE(k1.make_seed_for(0) != k3.make_seed_for(0));

  CRNKey k4(MASTER ^ 0xFFFF, {1, 2, 3});
  REQUIRE(k1.make_seed_for(7) != k4.make_seed_for(7));
}

TEST_CASE("CRNKey: with_tag composes identically to explicit construction", "[rng][crn][CRNKey]") {
  const uint64_t MASTER = 0xABCDEF0102030405ull;

  auto stepwise = CRNKey(MASTER).with_tag(11).with_tag(22).with_tag(33);
  auto grouped = CRNKey(MASTER).with_tags({11, 22, 33});
  CRNKey full(MASTER, {11, 22, 33});

  for (std::size_t r : {0u, 1u, 7u, 123u}) {
    REQUIRE(stepwise.make_seed_for(r) == full.make_seed_for(r));
    REQUIRE(grouped.make_seed_for(r) == full.make_seed_for(r));
  }
}

TEST_CASE("CRNEngineProvider: per-stream engines are reproducible", "[rng][crn][CRNEngineProvider]") {
  CRNEngineProvider<std::mt19937_64> prov(CRNKey(0x1111222233334444ull, {tag_from_name("mvn")}));

  std::vector<std::array<uint64_t, 3>> ref(10);
  for (std::size_t r = 0; r < ref.size(); ++r) {
    auto eng = prov.make_engine(r);
    for (int i = 0; i < 3; ++i) ref[r][i] = eng();
  }

  // Rebuilding in reverse order gives the same streams
  for (std::size_t r = ref.size(); r-- > 0;) {
    auto eng = prov.make_engine(r);
    std::array<uint64_t, 3> got{eng(), eng(), eng()};
    REQUIRE(got == ref[r]);
  }

  auto e0 = prov.make_engine(0);
  auto e1 = prov.make_engine(1);
  REQUIRE(e0() != e1());
}

TEST_CASE("CRNEngineProvider: works with randutils engines", "[rng][crn][randutils]") {
  CRNEngineProvider<randutils::mt19937_rng> prov(CRNKey(0xFACEFACEFACEFACEull, {7, 8, 9}));

  auto a = prov.make_engine(3);
  auto b = prov.make_engine(3);
  REQUIRE(a.engine()() == b.engine()());
}

TEST_CASE("CRNEngineProvider: extending tags changes streams", "[rng][crn][tags]") {
  CRNEngineProvider<std::mt19937_64> p1(CRNKey(0xCAFEBABECAFED00Dull, {11, 22}));
  auto p2 = p1.with_tag(33);

  auto e1 = p1.make_engine(5);
  auto e2 = p2.make_engine(5);
  REQUIRE(e1() != e2());
}

TEST_CASE("splitmix64 and hash_combine64: determinism", "[rng][hash]") {
  REQUIRE(splitmix64(0) == splitmix64(0));
  REQUIRE(splitmix64(1) != splitmix64(2));
  REQUIRE(hash_combine64({1, 2}) != hash_combine64({2, 1}));
}
