/*
 * -----------------------------------------------------------------------------
 * Filename:      KmerIter.hpp
 *
 * Author:        MalabZ
 *
 * Created Date:  2026-09-02
 *
 * Last Modified: 2026-10-11
 *
 * Description:
 *  Canonical k-mer extraction with open syncmer subsampling.
 *	K-mers are packed 2 bits per base (A=0, C=1, G=2, T=3) into a uint32_t,
 *	so only k <= 16 is supported.
 *
 * Version:
 *  1.1
 * -----------------------------------------------------------------------------
 */
#pragma once
#ifndef KMERITER_HPP
#define KMERITER_HPP

#include <kmerConfig.hpp>
#include <seqan3/alphabet/nucleotide/dna5.hpp>
#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <iterator>
#include <span>
#include <string_view>
#include <vector>

namespace bramble {
	inline constexpr uint8_t INVALID_BASE = 4;

	/**
	 * Map a character to its 2-bit code, INVALID_BASE for anything that is not ACGT.
	 */
	inline uint8_t baseCode(char base) noexcept {
		switch (base) {
		case 'A': case 'a': return 0;
		case 'C': case 'c': return 1;
		case 'G': case 'g': return 2;
		case 'T': case 't': return 3;
		default: return INVALID_BASE;
		}
	}

	/**
	 * Map a dna5 symbol to its 2-bit code. The dna5 ranks are A=0, C=1, G=2, N=3, T=4.
	 */
	inline uint8_t baseCode(seqan3::dna5 base) noexcept {
		switch (seqan3::to_rank(base)) {
		case 0: return 0;
		case 1: return 1;
		case 2: return 2;
		case 4: return 3;
		default: return INVALID_BASE;
		}
	}

	inline constexpr uint32_t kmerMask(uint8_t bits) noexcept {
		return static_cast<uint32_t>((uint64_t{ 1 } << (2u * bits)) - 1u);
	}

	uint32_t reverseComplement(uint32_t kmer, uint8_t kmerSize) noexcept;

	/**
	 * Open syncmer test: the first minimal s-mer of the k-mer (scanning left to right)
	 * must start at the configured offset.
	 */
	bool isSyncmer(uint32_t kmer, const KmerConfig& config) noexcept;

	/**
	 * Number of canonical k-mers that pass the syncmer test, counted by enumerating all 4^k k-mers.
	 * Without syncmers the closed form is used. Counts are cached per configuration.
	 * This is the universe used by the classifier's null model.
	 */
	uint64_t possibleKmers(const KmerConfig& config);

	/**
	 * A restartable view over the canonical k-mers of a sequence.
	 *
	 * Every call to begin() starts a fresh scan, so the view can be iterated many times and always
	 * yields the same values. Windows containing a non-ACGT symbol are skipped, and a k-mer equal to
	 * the previously emitted one is not repeated.
	 */
	template <typename Alphabet>
	class CanonicalKmers {
	public:
		class iterator {
		public:
			using value_type = uint32_t;
			using difference_type = std::ptrdiff_t;
			using iterator_category = std::input_iterator_tag;

			iterator() = default;
			iterator(const Alphabet* first, const Alphabet* last, const KmerConfig& config)
				: cur(first), end(last), config(config),
				mask(kmerMask(config.kmerSize)),
				firstLetterShift(2u * (config.kmerSize - 1u))
			{
				advance();
			}

			uint32_t operator*() const { return value; }

			iterator& operator++() {
				advance();
				return *this;
			}

			void operator++(int) { advance(); }

			friend bool operator==(const iterator& it, std::default_sentinel_t) { return it.done; }

		private:
			const Alphabet* cur{ nullptr };
			const Alphabet* end{ nullptr };
			KmerConfig config{};
			uint32_t mask{ 0 };
			uint32_t firstLetterShift{ 0 };
			uint32_t forward{ 0 };
			uint32_t reverse{ 0 };
			uint32_t filled{ 0 };
			uint32_t value{ 0 };
			uint32_t lastReturned{ 0 };
			bool hasLast{ false };
			bool done{ true };

			void advance() {
				while (cur != end) {
					uint8_t code = baseCode(*cur++);
					if (code == INVALID_BASE) {
						filled = 0;
						continue;
					}
					forward = ((forward << 2) | code) & mask;
					reverse = (reverse >> 2) | (static_cast<uint32_t>(3u - code) << firstLetterShift);
					if (filled < config.kmerSize) {
						++filled;
					}
					if (filled < config.kmerSize) {
						continue;
					}
					uint32_t canonical = std::min(forward, reverse);
					if (!isSyncmer(canonical, config)) {
						continue;
					}
					if (hasLast && canonical == lastReturned) {
						continue;
					}
					lastReturned = canonical;
					hasLast = true;
					value = canonical;
					done = false;
					return;
				}
				done = true;
			}
		};

		CanonicalKmers(std::span<const Alphabet> sequence, const KmerConfig& config)
			: sequence(sequence), config(config) {}

		iterator begin() const {
			return iterator(sequence.data(), sequence.data() + sequence.size(), config);
		}

		std::default_sentinel_t end() const { return {}; }

	private:
		std::span<const Alphabet> sequence;
		KmerConfig config;
	};

	inline CanonicalKmers<seqan3::dna5> canonicalKmers(const std::vector<seqan3::dna5>& sequence, const KmerConfig& config) {
		return CanonicalKmers<seqan3::dna5>(std::span<const seqan3::dna5>(sequence.data(), sequence.size()), config);
	}

	inline CanonicalKmers<char> canonicalKmers(std::string_view sequence, const KmerConfig& config) {
		return CanonicalKmers<char>(std::span<const char>(sequence.data(), sequence.size()), config);
	}

	/**
	 * Materialise the k-mers of a sequence in emission order.
	 */
	template <typename Sequence>
	std::vector<uint32_t> collectKmers(const Sequence& sequence, const KmerConfig& config) {
		std::vector<uint32_t> kmers;
		for (uint32_t kmer : canonicalKmers(sequence, config)) {
			kmers.push_back(kmer);
		}
		return kmers;
	}
}

#endif // KMERITER_HPP
