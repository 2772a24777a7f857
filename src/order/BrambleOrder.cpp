/*
 * -----------------------------------------------------------------------------
 * Filename:      BrambleOrder.cpp
 *
 * Author:        MalabZ
 *
 * Created Date:  2026-09-10
 *
 * Last Modified: 2026-09-28
 *
 * Description:
 *  The main program of BrambleOrder.
 *
 * Version:
 *  1.0
 * -----------------------------------------------------------------------------
 */
#include <BrambleOrder.hpp>
#include <BrambleDistance.hpp>
#include <errors.hpp>
#include <fileToTaxid.hpp>
#include <timeUtil.hpp>
#include <algorithm>
#include <initializer_list>
#include <iomanip>

namespace BrambleOrder {
	// Swaps must gain more than this to count as an improvement
	static constexpr double SWAP_EPSILON = 1e-9;

	std::vector<uint32_t> greedyOrder(const bramble::DistanceMatrix& matrix, uint32_t seed) {
		const size_t n = matrix.size();
		std::vector<uint32_t> order;
		if (n == 0) {
			return order;
		}
		if (seed >= n) {
			throw std::invalid_argument("Seed reference " + std::to_string(seed) + " is out of range for "
				+ std::to_string(n) + " references");
		}
		order.reserve(n);
		std::vector<bool> placed(n, false);
		uint32_t last = seed;
		placed[last] = true;
		order.push_back(last);

		while (order.size() < n) {
			uint32_t best = 0;
			float bestDistance = 2.0f;
			for (uint32_t candidate = 0; candidate < n; ++candidate) {
				if (placed[candidate])
					continue;
				float d = matrix.at(last, candidate);
				if (d < bestDistance) {
					bestDistance = d;
					best = candidate;
				}
			}
			placed[best] = true;
			order.push_back(best);
			last = best;
		}
		return order;
	}

	double totalAdjacentDistance(const bramble::DistanceMatrix& matrix, const std::vector<uint32_t>& order) {
		double total = 0.0;
		for (size_t pos = 1; pos < order.size(); ++pos) {
			total += matrix.at(order[pos - 1], order[pos]);
		}
		return total;
	}

	/**
	 * Sum of the edges touching positions i and j, each edge counted once.
	 * Edge e joins the positions e and e + 1.
	 */
	static double touchedEdgeCost(const bramble::DistanceMatrix& matrix, const std::vector<uint32_t>& order, size_t i, size_t j) {
		size_t edges[4];
		int count = 0;
		for (size_t pos : { i, j }) {
			if (pos > 0)
				edges[count++] = pos - 1;
			if (pos + 1 < order.size())
				edges[count++] = pos;
		}
		double cost = 0.0;
		for (int idx = 0; idx < count; ++idx) {
			if (std::find(edges, edges + idx, edges[idx]) != edges + idx)
				continue;
			cost += matrix.at(order[edges[idx]], order[edges[idx] + 1]);
		}
		return cost;
	}

	uint32_t refineOrder(const bramble::DistanceMatrix& matrix, std::vector<uint32_t>& order, uint32_t maxPasses) {
		uint32_t passes = 0;
		const size_t n = order.size();
		if (n < 3) {
			return passes;
		}
		bool improved = true;
		while (improved && passes < maxPasses) {
			improved = false;
			++passes;
			for (size_t i = 0; i + 1 < n; ++i) {
				for (size_t j = i + 1; j < n; ++j) {
					double before = touchedEdgeCost(matrix, order, i, j);
					std::swap(order[i], order[j]);
					double after = touchedEdgeCost(matrix, order, i, j);
					if (before - after > SWAP_EPSILON) {
						improved = true;
					}
					else {
						std::swap(order[i], order[j]);
					}
				}
			}
		}
		return passes;
	}

	void verifyPermutation(const std::vector<uint32_t>& order, size_t n) {
		if (order.size() != n) {
			throw bramble::InvariantError("Ordering holds " + std::to_string(order.size()) + " positions for "
				+ std::to_string(n) + " references");
		}
		std::vector<bool> seen(n, false);
		for (uint32_t reference : order) {
			if (reference >= n) {
				throw bramble::InvariantError("Ordering names reference " + std::to_string(reference) + " which does not exist");
			}
			if (seen[reference]) {
				throw bramble::InvariantError("Ordering places reference " + std::to_string(reference) + " twice");
			}
			seen[reference] = true;
		}
	}

	void run(OrderConfig config) {
		auto order_start = bramble::timer_clock::now();
		if (config.verbose) {
			std::cout << config << std::endl;
		}

		config.output_file = bramble::resolveOutputPath(config.output_file, "bramble.f2t");
		bramble::ensureWritable(config.output_file);

		std::cout << "Loading distance file..." << std::endl;
		BrambleDistance::DistanceArtifact artifact = BrambleDistance::loadDistances(config.distance_file);
		if (artifact.records.empty()) {
			throw bramble::ResourceError("Distance file " + config.distance_file + " holds no references");
		}

		std::cout << "Ordering " << artifact.records.size() << " references..." << std::endl;
		std::vector<uint32_t> order = greedyOrder(artifact.matrix, config.seed);
		double greedyCost = totalAdjacentDistance(artifact.matrix, order);
		uint32_t passes = refineOrder(artifact.matrix, order, config.max_passes);
		double refinedCost = totalAdjacentDistance(artifact.matrix, order);
		verifyPermutation(order, artifact.records.size());

		std::vector<bramble::ReferenceRecord> ordered;
		ordered.reserve(order.size());
		for (uint32_t reference : order) {
			ordered.push_back(artifact.records[reference]);
		}
		bramble::saveFileToTaxid(config.output_file, ordered, artifact.config);

		if (config.verbose) {
			std::cout << std::fixed << std::setprecision(4);
			std::cout << "Adjacent distance after greedy order: " << greedyCost << std::endl;
			std::cout << "Adjacent distance after " << passes << " swap passes: " << refinedCost << std::endl;
			std::cout << std::defaultfloat;
			std::cout << "Order time: ";
			bramble::printTime(bramble::elapsedMs(order_start));
			std::cout << std::endl;
		}
		std::cout << "Ordered references written to " << config.output_file << std::endl;
	}
}
