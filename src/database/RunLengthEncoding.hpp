/*
 * -----------------------------------------------------------------------------
 * Filename:      RunLengthEncoding.hpp
 *
 * Author:        MalabZ
 *
 * Created Date:  2026-09-13
 *
 * Last Modified: 2026-10-08
 *
 * Description:
 *  Run-length encoding of membership sets.
 *
 *  A membership set (sorted reference positions) is stored as 16-bit blocks
 *  read from position 0 onwards:
 *    1xxxxxxxxxxxxxxx  literal, bit b marks position cursor + b, 15 positions
 *    01nnnnnnnnnnnnnn  n member positions
 *    00nnnnnnnnnnnnnn  n non-member positions
 *  Non-member positions after the last member are not stored.
 *
 * Version:
 *  1.1
 * -----------------------------------------------------------------------------
 */
#pragma once
#ifndef RUNLENGTHENCODING_HPP
#define RUNLENGTHENCODING_HPP
#include <bit>
#include <cstdint>
#include <span>
#include <vector>

namespace bramble {
	inline constexpr uint16_t LITERAL_FLAG = 0x8000;
	inline constexpr uint16_t ONES_FLAG = 0x4000;
	inline constexpr uint16_t RUN_MASK = 0x3FFF;
	inline constexpr uint32_t LITERAL_WIDTH = 15;
	inline constexpr uint32_t MAX_RUN = RUN_MASK;

	struct PositionRange {
		uint32_t start;
		uint32_t length;

		uint32_t end() const { return start + length; }
		bool operator==(const PositionRange& other) const = default;
	};

	/**
	 * Collects the ranges of one membership set from positions added in ascending order.
	 */
	class RangeBuilder {
		std::vector<PositionRange> ranges;

	public:
		/**
		 * Add a position. Adding a position twice in a row is a no-op; going backwards throws InvariantError.
		 */
		void add(uint32_t position);

		const std::vector<PositionRange>& get() const { return ranges; }
		bool empty() const { return ranges.empty(); }
	};

	/**
	 * Sorted, duplicate free positions to maximal ranges.
	 */
	std::vector<PositionRange> toRanges(const std::vector<uint32_t>& positions);

	/**
	 * Append the blocks of the membership set given as sorted, disjoint, non-adjacent ranges.
	 *
	 * @param ranges The member ranges in ascending order.
	 * @param blocks The block vector appended to.
	 * @return The number of blocks appended.
	 */
	size_t encodeRanges(const std::vector<PositionRange>& ranges, std::vector<uint16_t>& blocks);

	size_t encodePositions(const std::vector<uint32_t>& positions, std::vector<uint16_t>& blocks);

	/**
	 * Call fn(start, length) for every maximal range of member positions.
	 */
	template <typename Fn>
	void forEachRange(std::span<const uint16_t> blocks, Fn&& fn) {
		uint64_t cursor = 0;
		uint64_t openStart = 0;
		uint64_t openLength = 0;
		auto extend = [&](uint64_t start, uint64_t length) {
			if (openLength > 0 && openStart + openLength == start) {
				openLength += length;
				return;
			}
			if (openLength > 0)
				fn(static_cast<uint32_t>(openStart), static_cast<uint32_t>(openLength));
			openStart = start;
			openLength = length;
		};

		for (uint16_t block : blocks) {
			if (block & LITERAL_FLAG) {
				for (uint32_t bit = 0; bit < LITERAL_WIDTH; ++bit) {
					if (block & (1u << bit))
						extend(cursor + bit, 1);
				}
				cursor += LITERAL_WIDTH;
			}
			else if (block & ONES_FLAG) {
				uint64_t length = block & RUN_MASK;
				if (length > 0)
					extend(cursor, length);
				cursor += length;
			}
			else {
				cursor += block & RUN_MASK;
			}
		}
		if (openLength > 0)
			fn(static_cast<uint32_t>(openStart), static_cast<uint32_t>(openLength));
	}

	/**
	 * Call fn(position) for every member position in ascending order.
	 */
	template <typename Fn>
	void forEachMember(std::span<const uint16_t> blocks, Fn&& fn) {
		uint32_t cursor = 0;
		for (uint16_t block : blocks) {
			if (block & LITERAL_FLAG) {
				uint16_t bits = static_cast<uint16_t>(block & ~LITERAL_FLAG);
				while (bits) {
					int bit = std::countr_zero(bits);
					fn(cursor + static_cast<uint32_t>(bit));
					bits &= bits - 1;
				}
				cursor += LITERAL_WIDTH;
			}
			else if (block & ONES_FLAG) {
				uint32_t length = block & RUN_MASK;
				for (uint32_t pos = cursor; pos < cursor + length; ++pos)
					fn(pos);
				cursor += length;
			}
			else {
				cursor += block & RUN_MASK;
			}
		}
	}

	std::vector<PositionRange> decodeRanges(std::span<const uint16_t> blocks);
	std::vector<uint32_t> decodePositions(std::span<const uint16_t> blocks);
	uint64_t memberCount(std::span<const uint16_t> blocks);
}

#endif // RUNLENGTHENCODING_HPP
