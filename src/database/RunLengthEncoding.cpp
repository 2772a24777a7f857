/*
 * -----------------------------------------------------------------------------
 * Filename:      RunLengthEncoding.cpp
 *
 * Author:        MalabZ
 *
 * Created Date:  2026-09-13
 *
 * Last Modified: 2026-10-08
 *
 * Description:
 *  Run-length encoding of membership sets
 *
 * Version:
 *  1.1
 * -----------------------------------------------------------------------------
 */
#include <RunLengthEncoding.hpp>
#include <errors.hpp>
#include <algorithm>
#include <string>

namespace bramble {
	void RangeBuilder::add(uint32_t position) {
		if (!ranges.empty()) {
			PositionRange& last = ranges.back();
			if (position < last.end() - 1) {
				throw InvariantError("Positions must be added in ascending order, got " + std::to_string(position)
					+ " after " + std::to_string(last.end() - 1));
			}
			if (position == last.end() - 1) {
				return;
			}
			if (position == last.end()) {
				last.length++;
				return;
			}
		}
		ranges.push_back({ position, 1 });
	}

	std::vector<PositionRange> toRanges(const std::vector<uint32_t>& positions) {
		RangeBuilder builder;
		for (uint32_t position : positions) {
			builder.add(position);
		}
		return builder.get();
	}

	size_t encodeRanges(const std::vector<PositionRange>& ranges, std::vector<uint16_t>& blocks) {
		const size_t before = blocks.size();
		uint64_t cursor = 0;
		size_t r = 0;
		// members of ranges[r] before this offset are already encoded
		uint64_t consumed = 0;

		while (r < ranges.size()) {
			uint64_t next = static_cast<uint64_t>(ranges[r].start) + consumed;
			if (next < cursor) {
				throw InvariantError("Membership ranges overlap or are out of order at position " + std::to_string(next));
			}
			uint64_t gap = next - cursor;
			if (gap >= LITERAL_WIDTH) {
				uint64_t length = std::min<uint64_t>(gap, MAX_RUN);
				blocks.push_back(static_cast<uint16_t>(length));
				cursor += length;
				continue;
			}

			uint64_t run = gap == 0 ? ranges[r].length - consumed : 0;
			if (run >= LITERAL_WIDTH) {
				uint64_t length = std::min<uint64_t>(run, MAX_RUN);
				blocks.push_back(static_cast<uint16_t>(ONES_FLAG | length));
				cursor += length;
				consumed += length;
				if (consumed == ranges[r].length) {
					++r;
					consumed = 0;
				}
				continue;
			}

			// literal window [cursor, cursor + 15)
			uint16_t block = LITERAL_FLAG;
			const uint64_t windowEnd = cursor + LITERAL_WIDTH;
			while (r < ranges.size()) {
				uint64_t position = static_cast<uint64_t>(ranges[r].start) + consumed;
				if (position >= windowEnd)
					break;
				uint64_t stop = std::min<uint64_t>(ranges[r].end(), windowEnd);
				for (uint64_t p = position; p < stop; ++p) {
					block |= static_cast<uint16_t>(1u << (p - cursor));
				}
				consumed += stop - position;
				if (consumed == ranges[r].length) {
					++r;
					consumed = 0;
				}
			}
			blocks.push_back(block);
			cursor = windowEnd;
		}
		return blocks.size() - before;
	}

	size_t encodePositions(const std::vector<uint32_t>& positions, std::vector<uint16_t>& blocks) {
		return encodeRanges(toRanges(positions), blocks);
	}

	std::vector<PositionRange> decodeRanges(std::span<const uint16_t> blocks) {
		std::vector<PositionRange> ranges;
		forEachRange(blocks, [&ranges](uint32_t start, uint32_t length) {
			ranges.push_back({ start, length });
			});
		return ranges;
	}

	std::vector<uint32_t> decodePositions(std::span<const uint16_t> blocks) {
		std::vector<uint32_t> positions;
		forEachMember(blocks, [&positions](uint32_t position) {
			positions.push_back(position);
			});
		return positions;
	}

	uint64_t memberCount(std::span<const uint16_t> blocks) {
		uint64_t count = 0;
		forEachRange(blocks, [&count](uint32_t, uint32_t length) {
			count += length;
			});
		return count;
	}
}
