/*
 * -----------------------------------------------------------------------------
 * Filename:      BinomialTable.hpp
 *
 * Author:        MalabZ
 *
 * Created Date:  2026-09-23
 *
 * Last Modified: 2026-10-01
 *
 * Description:
 *  Lookup table of binomial tail probabilities
 *
 * Version:
 *  1.0
 * -----------------------------------------------------------------------------
 */
#pragma once
#ifndef BINOMIALTABLE_HPP
#define BINOMIALTABLE_HPP
#include <cstdint>
#include <vector>

namespace BrambleClassify {
	/**
	 * log10 P[X >= x] for X ~ Binomial(trials, p) and x = 0 .. trials.
	 * Impossible outcomes hold -infinity.
	 */
	class BinomialTable {
		uint32_t trials{ 0 };
		std::vector<double> logSurvival;

	public:
		BinomialTable() = default;
		BinomialTable(double p, uint32_t trials);

		double at(uint32_t x) const {
			return x > trials ? logSurvival.back() : logSurvival[x];
		}

		uint32_t size() const { return trials; }
	};
}

#endif // BINOMIALTABLE_HPP
