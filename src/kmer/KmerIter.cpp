/*
 * -----------------------------------------------------------------------------
 * Filename:      KmerIter.cpp
 *
 * Author:        MalabZ
 *
 * Created Date:  2026-09-02
 *
 * Last Modified: 2026-10-02
 *
 * Description:
 *  Non-template helpers of the canonical k-mer extractor
 *
 * Version:
 *  1.1
 * -----------------------------------------------------------------------------
 */
#include <KmerIter.hpp>
#include <map>
#include <mutex>
#include <tuple>
#include <omp.h>

namespace bramble {
	/**
	 * Reverse complement a packed k-mer.
	 *
	 * @param kmer The packed k-mer.
	 * @param kmerSize The number of bases in the k-mer.
	 * @return The packed reverse complement.
	 */
	uint32_t reverseComplement(uint32_t kmer, uint8_t kmerSize) noexcept {
		uint32_t complement = (~kmer) & kmerMask(kmerSize);
		uint32_t buffer = 0;
		for (uint8_t i = 0; i < kmerSize; ++i) {
			// Pop the right-most letter and append it to the buffer
			buffer = (buffer << 2) | (complement & 3u);
			complement >>= 2;
		}
		return buffer;
	}

	bool isSyncmer(uint32_t kmer, const KmerConfig& config) noexcept {
		const uint32_t diff = config.kmerSize - config.smerSize;
		if (diff == 0) {
			return true;
		}
		const uint32_t smerMask = kmerMask(config.smerSize);
		uint32_t minimumIndex = 0;
		uint32_t minimum = (kmer >> (diff << 1)) & smerMask;
		for (uint32_t i = 1; i <= diff; ++i) {
			uint32_t smer = (kmer >> ((diff - i) << 1)) & smerMask;
			if (smer < minimum) {
				minimum = smer;
				minimumIndex = i;
			}
		}
		return minimumIndex == config.syncmerOffset;
	}

	static uint64_t countCanonicalSyncmers(const KmerConfig& config) {
		const int64_t all = int64_t{ 1 } << (2 * config.kmerSize);
		uint64_t count = 0;
#pragma omp parallel for schedule(static) reduction(+:count)
		for (int64_t x = 0; x < all; ++x)
		{
			uint32_t kmer = static_cast<uint32_t>(x);
			if (kmer <= reverseComplement(kmer, config.kmerSize) && isSyncmer(kmer, config)) {
				++count;
			}
		}
		return count;
	}

	uint64_t possibleKmers(const KmerConfig& config) {
		const uint64_t all = uint64_t{ 1 } << (2 * config.kmerSize);
		if (!config.syncmersEnabled()) {
			// Palindromes only exist for even k and are their own reverse complement
			return (config.kmerSize % 2 == 0)
				? (all + (uint64_t{ 1 } << config.kmerSize)) / 2
				: all / 2;
		}

		static std::mutex cacheMutex;
		static std::map<std::tuple<uint8_t, uint8_t, uint8_t>, uint64_t> cache;
		const auto key = std::make_tuple(config.kmerSize, config.smerSize, config.syncmerOffset);
		{
			std::lock_guard<std::mutex> lock(cacheMutex);
			auto it = cache.find(key);
			if (it != cache.end()) {
				return it->second;
			}
		}
		uint64_t count = countCanonicalSyncmers(config);
		std::lock_guard<std::mutex> lock(cacheMutex);
		cache.emplace(key, count);
		return count;
	}
}
