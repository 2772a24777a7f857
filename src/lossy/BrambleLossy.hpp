/*
 * -----------------------------------------------------------------------------
 * Filename:      BrambleLossy.hpp
 *
 * Author:        MalabZ
 *
 * Created Date:  2026-09-20
 *
 * Last Modified: 2026-09-30
 *
 * Description:
 *  Lossy recompression of a database. Member ranges separated by at most
 *  2^L - 1 non-member positions are merged, so membership sets only grow.
 *
 * Version:
 *  1.0
 * -----------------------------------------------------------------------------
 */
#pragma once
#ifndef BRAMBLELOSSY_HPP
#define BRAMBLELOSSY_HPP
#include <lossyConfig.hpp>
#include <Database.hpp>
#include <RunLengthEncoding.hpp>
#include <cstdint>
#include <vector>

namespace BrambleLossy {
	/**
	 * Largest gap closed at a level.
	 */
	inline uint64_t maxGap(uint32_t level) {
		return (uint64_t{ 1 } << level) - 1;
	}

	/**
	 * Merge consecutive ranges whose gap is at most maxGap(level).
	 */
	std::vector<bramble::PositionRange> widenRanges(const std::vector<bramble::PositionRange>& ranges, uint32_t level);

	/**
	 * Lossy copy of an exact database. The key set and key order are kept.
	 * Throws std::invalid_argument for an already lossy input or a level outside [1, 31].
	 */
	bramble::Database recompress(const bramble::Database& exact, uint32_t level);

	void run(LossyConfig config);
}

#endif // BRAMBLELOSSY_HPP
