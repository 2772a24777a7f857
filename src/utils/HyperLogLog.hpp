/*
 * -----------------------------------------------------------------------------
 * Filename:      HyperLogLog.hpp
 *
 * Author:        MalabZ
 *
 * Created Date:  2026-09-06
 *
 * Last Modified: 2026-10-02
 *
 * Description:
 *  HyperLogLog sketch of a reference k-mer set, used by the distance
 *  estimator when exact k-mer sets do not fit in memory
 *
 * Version:
 *  1.1
 * -----------------------------------------------------------------------------
 */
#pragma once
#ifndef HYPERLOGLOG_HPP
#define HYPERLOGLOG_HPP
#include <algorithm>
#include <bit>
#include <cmath>
#include <cstdint>
#include <stdexcept>
#include <vector>
#include <cereal/types/vector.hpp>
#include <cereal/archives/binary.hpp>
#include <simde/x86/avx2.h>
#include <xxhash.h>

namespace bramble {
	class HyperLogLog
	{
	public:
		explicit HyperLogLog(uint8_t bits = 12)
			: bits(bits), size(1ULL << bits), registers(size, 0)
		{
			if (bits < 5 || bits > 24)
				throw std::invalid_argument("HyperLogLog bit width must be in the range [5,24].");

			switch (size)
			{
			case 16:
				alpha = 0.673;
				break;
			case 32:
				alpha = 0.697;
				break;
			case 64:
				alpha = 0.709;
				break;
			default:
				alpha = 0.7213 / (1 + 1.079 / size);
				break;
			}
			correction_factor = alpha * size * size;
		}

		void add(uint32_t kmer)
		{
			uint64_t hash = XXH64(&kmer, sizeof(kmer), 0);
			uint64_t index = hash >> (64 - bits);
			uint8_t rank = static_cast<uint8_t>(std::countl_zero((hash << bits) | ((1ULL << bits) - 1)) + 1);
			registers[index] = std::max(registers[index], rank);
		}

		bool empty() const
		{
			return std::all_of(registers.begin(), registers.end(), [](uint8_t r) { return r == 0; });
		}

		double estimate() const
		{
			double sum = 0.0;
			size_t zero_count = 0;
			const double* lookup = getLookupTable();

			// registers are summed 4 at a time, size is a multiple of 32 for bits >= 5
			size_t vec_size = registers.size() / 32 * 32;
			simde__m256d vec_sum = simde_mm256_setzero_pd();
			size_t i = 0;
			for (; i < vec_size; i += 32)
			{
				for (int k = 0; k < 32; k += 4)
				{
					simde__m256d v = simde_mm256_set_pd(
						lookup[registers[i + k + 0]],
						lookup[registers[i + k + 1]],
						lookup[registers[i + k + 2]],
						lookup[registers[i + k + 3]]);
					vec_sum = simde_mm256_add_pd(vec_sum, v);
				}

				for (size_t j = i; j < i + 32; ++j)
					if (registers[j] == 0)
						++zero_count;
			}

			for (; i < size; ++i)
			{
				sum += lookup[registers[i]];
				if (registers[i] == 0)
					++zero_count;
			}

			alignas(32) double temp[4];
			simde_mm256_store_pd(temp, vec_sum);
			sum += temp[0] + temp[1] + temp[2] + temp[3];

			double estimate = correction_factor / sum;

			// small cardinality correction
			if (estimate <= 2.5 * size && zero_count != 0)
			{
				estimate = size * std::log(static_cast<double>(size) / zero_count);
			}

			return estimate;
		}

		void merge(const HyperLogLog& other)
		{
			if (bits != other.bits)
				throw std::invalid_argument("Cannot merge HyperLogLog sketches of different widths.");
			for (size_t i = 0; i < size; ++i)
			{
				registers[i] = std::max(registers[i], other.registers[i]);
			}
		}

		/**
		 * Estimated size of the union of both sketched sets.
		 */
		double unionEstimate(const HyperLogLog& other) const
		{
			HyperLogLog merged(*this);
			merged.merge(other);
			return merged.estimate();
		}

		uint8_t width() const { return bits; }

		template<class Archive>
		void serialize(Archive& ar)
		{
			ar(bits, size, alpha, correction_factor, registers);
		}

	private:
		uint8_t bits;
		uint64_t size;
		double alpha;
		double correction_factor;
		std::vector<uint8_t> registers;

		static const double* getLookupTable()
		{
			static const std::vector<double> lookup = [] {
				std::vector<double> table(65);
				for (int i = 0; i <= 64; ++i)
					table[i] = std::pow(2.0, -static_cast<double>(i));
				return table;
				}();
			return lookup.data();
		}
	};

	/**
	 * Jaccard distance estimated by inclusion-exclusion over two sketches, clamped to [0, 1].
	 * An empty sketch is at distance 1 from everything.
	 */
	inline double sketchDistance(const HyperLogLog& a, const HyperLogLog& b)
	{
		if (a.empty() || b.empty())
			return 1.0;
		double unionSize = a.unionEstimate(b);
		if (unionSize <= 0.0)
			return 1.0;
		double intersection = a.estimate() + b.estimate() - unionSize;
		double similarity = std::clamp(intersection / unionSize, 0.0, 1.0);
		return 1.0 - similarity;
	}
}

#endif // HYPERLOGLOG_HPP
