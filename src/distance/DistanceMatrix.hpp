/*
 * -----------------------------------------------------------------------------
 * Filename:      DistanceMatrix.hpp
 *
 * Author:        MalabZ
 *
 * Created Date:  2026-09-06
 *
 * Last Modified: 2026-10-03
 *
 * Description:
 *  Symmetric pairwise distance matrix stored as its strict lower triangle.
 *	Row i holds the cells (i, 0) .. (i, i - 1), so appending references
 *	appends rows and never moves existing cells.
 *
 * Version:
 *  1.1
 * -----------------------------------------------------------------------------
 */
#pragma once
#ifndef DISTANCEMATRIX_HPP
#define DISTANCEMATRIX_HPP

#include <errors.hpp>
#include <cereal/types/vector.hpp>
#include <cmath>
#include <cstddef>
#include <string>
#include <utility>
#include <vector>

namespace bramble {
	class DistanceMatrix {
		size_t n{ 0 };
		std::vector<float> lower;

	public:
		DistanceMatrix() = default;
		explicit DistanceMatrix(size_t n) : n(n), lower(cellCount(n), 1.0f) {}

		static size_t cellCount(size_t n) {
			return n < 2 ? 0 : n * (n - 1) / 2;
		}

		static size_t cellIndex(size_t i, size_t j) {
			if (i < j) {
				std::swap(i, j);
			}
			return i * (i - 1) / 2 + j;
		}

		size_t size() const { return n; }

		float at(size_t i, size_t j) const {
			if (i >= n || j >= n) {
				throw std::out_of_range("Distance matrix index out of range");
			}
			if (i == j) {
				return 0.0f;
			}
			return lower[cellIndex(i, j)];
		}

		void set(size_t i, size_t j, float distance) {
			if (i == j) {
				return;
			}
			lower[cellIndex(i, j)] = distance;
		}

		/**
		 * Grow to newSize references. New cells start at the maximal distance.
		 */
		void extend(size_t newSize) {
			if (newSize < n) {
				throw std::invalid_argument("Distance matrix cannot shrink");
			}
			n = newSize;
			lower.resize(cellCount(n), 1.0f);
		}

		/**
		 * Every stored distance must be a finite value in [0, 1].
		 */
		void validate() const {
			if (lower.size() != cellCount(n)) {
				throw InvariantError("Distance matrix holds " + std::to_string(lower.size())
					+ " cells, expected " + std::to_string(cellCount(n)));
			}
			for (size_t idx = 0; idx < lower.size(); ++idx) {
				float d = lower[idx];
				if (!std::isfinite(d) || d < 0.0f || d > 1.0f) {
					throw InvariantError("Distance matrix cell " + std::to_string(idx) + " is outside [0, 1]");
				}
			}
		}

		template <class Archive>
		void serialize(Archive& archive) {
			archive(n, lower);
		}
	};
}

#endif // DISTANCEMATRIX_HPP
