/*
 * -----------------------------------------------------------------------------
 * Filename:      BrambleOrder.hpp
 *
 * Author:        MalabZ
 *
 * Created Date:  2026-09-10
 *
 * Last Modified: 2026-09-28
 *
 * Description:
 *  Ordering of the references so that similar references are adjacent.
 *
 *  The order is built greedily from a seed reference by always appending the
 *  closest unplaced reference, then refined by pairwise swaps that lower the
 *  sum of distances between neighbours.
 *
 * Version:
 *  1.0
 * -----------------------------------------------------------------------------
 */
#pragma once
#ifndef BRAMBLEORDER_HPP
#define BRAMBLEORDER_HPP
#include <orderConfig.hpp>
#include <DistanceMatrix.hpp>
#include <cstdint>
#include <vector>

namespace BrambleOrder {
	/**
	 * Greedy nearest neighbour order starting at seed. Ties go to the lowest reference index.
	 *
	 * @param matrix The pairwise distances.
	 * @param seed The reference placed first.
	 * @return order[position] = reference index.
	 */
	std::vector<uint32_t> greedyOrder(const bramble::DistanceMatrix& matrix, uint32_t seed = 0);

	/**
	 * First improvement pairwise swap passes. Stops after a pass without improvement or after maxPasses passes.
	 *
	 * @return The number of passes run.
	 */
	uint32_t refineOrder(const bramble::DistanceMatrix& matrix, std::vector<uint32_t>& order, uint32_t maxPasses);

	double totalAdjacentDistance(const bramble::DistanceMatrix& matrix, const std::vector<uint32_t>& order);

	/**
	 * Throw InvariantError unless order is a permutation of 0 .. n - 1.
	 */
	void verifyPermutation(const std::vector<uint32_t>& order, size_t n);

	void run(OrderConfig config);
}

#endif // BRAMBLEORDER_HPP
