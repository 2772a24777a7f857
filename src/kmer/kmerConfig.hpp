/*
 * -----------------------------------------------------------------------------
 * Filename:      kmerConfig.hpp
 *
 * Author:        MalabZ
 *
 * Created Date:  2026-09-02
 *
 * Last Modified: 2026-10-11
 *
 * Description:
 *  K-mer extraction parameters shared by every Bramble stage
 *
 * Version:
 *  1.1
 * -----------------------------------------------------------------------------
 */
#pragma once
#ifndef KMERCONFIG_HPP
#define KMERCONFIG_HPP
#include <cstdint>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>

namespace bramble {
	inline constexpr uint8_t DEFAULT_KMER_SIZE = 15;
	inline constexpr uint8_t DEFAULT_SMER_SIZE = 9;
	inline constexpr uint8_t DEFAULT_SYNCMER_OFFSET = 3;
	inline constexpr uint8_t MAX_KMER_SIZE = 16;

	struct KmerConfig {
		uint8_t kmerSize{ DEFAULT_KMER_SIZE };
		uint8_t smerSize{ DEFAULT_SMER_SIZE };
		uint8_t syncmerOffset{ DEFAULT_SYNCMER_OFFSET };

		bool syncmersEnabled() const {
			return smerSize < kmerSize;
		}

		/**
		 * Check the parameters and throw std::invalid_argument if they cannot be used.
		 */
		void validate() const {
			if (kmerSize == 0 || kmerSize > MAX_KMER_SIZE) {
				throw std::invalid_argument("Kmer size must be in [1, 16], got " + std::to_string(kmerSize));
			}
			if (smerSize == 0 || smerSize > kmerSize) {
				throw std::invalid_argument("Smer size must be in [1, kmer size], got " + std::to_string(smerSize));
			}
			if (syncmerOffset > kmerSize - smerSize) {
				throw std::invalid_argument("Syncmer offset must be at most kmer size - smer size, got "
					+ std::to_string(syncmerOffset));
			}
		}

		std::string toString() const {
			std::ostringstream oss;
			oss << "k=" << static_cast<int>(kmerSize)
				<< " s=" << static_cast<int>(smerSize)
				<< " t=" << static_cast<int>(syncmerOffset);
			return oss.str();
		}

		bool operator==(const KmerConfig& other) const = default;

		template <class Archive>
		void serialize(Archive& archive) {
			archive(kmerSize, smerSize, syncmerOffset);
		}
	};

	inline std::ostream& operator<<(std::ostream& os, const KmerConfig& config) {
		return os << config.toString();
	}
}

#endif // KMERCONFIG_HPP
