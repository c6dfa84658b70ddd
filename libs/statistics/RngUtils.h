#pragma once

#include <array>
#include <cstdint>
#include <cstddef>
#include <initializer_list>
#include <random>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>
#include "randutils.hpp"

namespace trialsynth
{
  namespace rng_utils
  {

    // --- Detection: does Rng have .engine()? (e.g., randutils::mt19937_rng) ---
    template <typename T, typename = void>
    struct has_engine_method : std::false_type {};

    template <typename T>
    struct has_engine_method<T, std::void_t<decltype(std::declval<T&>().engine())>> : std::true_type {};

    // Return a reference to the underlying engine, whether wrapped or direct.
    template <typename Rng>
    inline auto& get_engine(Rng& rng)
    {
      if constexpr (has_engine_method<Rng>::value)
	return rng.engine();
      else
	return rng;
    }

    /**
     * @brief Get a random index in [0, hiExclusive). Returns 0 when hiExclusive is 0.
     */
    template <typename Rng>
    inline std::size_t get_random_index(Rng& rng, std::size_t hiExclusive)
    {
      if (hiExclusive == 0)
	return 0;

      std::uniform_int_distribution<std::size_t> dist(0, hiExclusive - 1);
      return dist(get_engine(rng));
    }

    /**
     * @brief Draw from N(mean, stddev). A non-positive stddev returns the mean
     * without consuming engine output.
     */
    template <typename Rng>
    inline double get_random_normal(Rng& rng, double mean, double stddev)
    {
      if (!(stddev > 0.0))
	return mean;

      std::normal_distribution<double> dist(mean, stddev);
      return dist(get_engine(rng));
    }

    // Simple 64-bit splitmix hash (deterministic, good avalanche)
    inline uint64_t splitmix64(uint64_t x) {
      x += 0x9e3779b97f4a7c15ull;
      x = (x ^ (x >> 30)) * 0xbf58476d1ce4e5b9ull;
      x = (x ^ (x >> 27)) * 0x94d049bb133111ebull;
      return x ^ (x >> 31);
    }

    // Combine several 64-bit values into one seed
    inline uint64_t hash_combine64(std::initializer_list<uint64_t> parts) {
      uint64_t h = 0x6a09e667f3bcc909ull;
      for (auto v : parts) h = splitmix64(h ^ v);
      return h;
    }

    // FNV-1a over the bytes of a name, so that stream tags can be spelled
    // ("mvn", "knn-mask") instead of numbered.
    inline uint64_t tag_from_name(const std::string& name)
    {
      uint64_t h = 0xcbf29ce484222325ull;
      for (unsigned char c : name)
	{
	  h ^= c;
	  h *= 0x100000001b3ull;
	}
      return h;
    }

    /**
     * @brief Draw a fresh 64-bit master seed from randutils' entropy-mixing
     * auto seeder. Used when the caller supplies no seed; the value is reported
     * back so the run can be replayed.
     */
    inline uint64_t fresh_master_seed()
    {
      randutils::auto_seed_128 seeder;
      std::array<uint32_t, 2> words{};
      seeder.generate(words.begin(), words.end());
      return (static_cast<uint64_t>(words[0]) << 32) | static_cast<uint64_t>(words[1]);
    }

    // A master seed plus an immutable sequence of 64-bit tags naming one random stream.
    class CRNKey
    {
    public:
      CRNKey(uint64_t masterSeed, std::vector<uint64_t> tags = {})
	: m_masterSeed(masterSeed), m_tags(std::move(tags))
      {}

      CRNKey with_tag(uint64_t tag) const
      {
	auto t = m_tags; t.push_back(tag);
	return CRNKey(m_masterSeed, std::move(t));
      }

      CRNKey with_tags(std::initializer_list<uint64_t> tags) const
      {
	auto t = m_tags; t.insert(t.end(), tags.begin(), tags.end());
	return CRNKey(m_masterSeed, std::move(t));
      }

      uint64_t masterSeed() const noexcept
      {
	return m_masterSeed;
      }

      const std::vector<uint64_t>& tags() const noexcept
      {
	return m_tags;
      }

      // Derive a 64-bit seed for one substream (a subject, a masked row, ...)
      uint64_t make_seed_for(std::size_t stream) const
      {
	uint64_t h = m_masterSeed;
	for (auto v : m_tags) h = hash_combine64({h, v});
	h = hash_combine64({h, static_cast<uint64_t>(stream)});
	return h;
      }

    private:
      uint64_t m_masterSeed;
      std::vector<uint64_t> m_tags;
    };

    inline std::seed_seq make_seed_seq(uint64_t seed64)
    {
      // Expand a 64-bit seed into eight 32-bit words using diversified SplitMix64
      const uint64_t s0 = seed64;
      const uint64_t s1 = splitmix64(s0);
      const uint64_t s2 = splitmix64(s0 ^ 0x9e3779b97f4a7c15ull);
      const uint64_t s3 = splitmix64(s0 + 0xd1342543de82ef95ull);
      const uint64_t s4 = splitmix64(s1 ^ 0x94d049bb133111ebull);
      const uint64_t s5 = splitmix64(s2 + 0xbf58476d1ce4e5b9ull);
      const uint64_t s6 = splitmix64(s3 ^ 0x6a09e667f3bcc909ull);
      const uint64_t s7 = splitmix64(s4 + 0x243f6a8885a308d3ull);

      const uint64_t mix = (s3 ^ s5 ^ s6 ^ s7);

      std::array<uint32_t, 8> words = {
	static_cast<uint32_t>(s0), static_cast<uint32_t>(s0 >> 32),
	static_cast<uint32_t>(s1), static_cast<uint32_t>(s1 >> 32),
	static_cast<uint32_t>(s2), static_cast<uint32_t>(s2 >> 32),
	static_cast<uint32_t>(mix), static_cast<uint32_t>(mix >> 32)
      };

      return std::seed_seq(words.begin(), words.end());
    }

    // Construct a seeded engine regardless of API style
    template<class Eng>
    inline Eng construct_seeded_engine(std::seed_seq& sseq)
    {
      if constexpr (std::is_constructible_v<Eng, std::seed_seq&>)
	{
	  return Eng(sseq);
	}
      else
	{
	  Eng e;
	  e.seed(sseq);
	  return e;
	}
    }

    /**
     * @brief Builds independent, reproducible engines from a CRNKey.
     *
     * Every call to make_engine returns a freshly seeded engine, so callers
     * never share engine state between subjects or between threads.
     */
    template<class Eng = std::mt19937_64>
    class CRNEngineProvider
    {
    public:
      using Engine = Eng;

      explicit CRNEngineProvider(CRNKey key)
	:  m_key(std::move(key))
      {}

      CRNEngineProvider with_tag(uint64_t tag) const
      {
	return CRNEngineProvider(m_key.with_tag(tag));
      }

      Engine make_engine(std::size_t stream) const
      {
	auto seed64 = m_key.make_seed_for(stream);
	auto sseq   = make_seed_seq(seed64);
	return construct_seeded_engine<Engine>(sseq);
      }

      const CRNKey& key() const noexcept
      {
	return m_key;
      }

    private:
      CRNKey m_key;
    };
  } // namespace rng_utils
} // namespace trialsynth
