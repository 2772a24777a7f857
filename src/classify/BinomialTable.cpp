/*
 * -----------------------------------------------------------------------------
 * Filename:      BinomialTable.cpp
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
#include <BinomialTable.hpp>
#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <string>

namespace BrambleClassify {
	BinomialTable::BinomialTable(double p, uint32_t trials)
		: trials(trials), logSurvival(static_cast<size_t>(trials) + 1, 0.0)
	{
		if (trials == 0) {
			throw std::invalid_argument("Number of trials must be at least 1");
		}
		if (!(p >= 0.0 && p <= 1.0)) {
			throw std::invalid_argument("Binomial probability must be in [0, 1], got " + std::to_string(p));
		}
		const double negInf = -std::numeric_limits<double>::infinity();
		if (p == 0.0) {
			std::fill(logSurvival.begin() + 1, logSurvival.end(), negInf);
			return;
		}
		if (p == 1.0) {
			return;
		}

		const double n = static_cast<double>(trials);
		const double logP = std::log(p);
		const double logQ = std::log1p(-p);
		const double logNFact = std::lgamma(n + 1.0);

		// sum the pmf from the far tail down, in natural log space
		double tail = negInf;
		for (int64_t x = trials; x >= 0; --x) {
			double k = static_cast<double>(x);
			double logPmf = logNFact - std::lgamma(k + 1.0) - std::lgamma(n - k + 1.0) + k * logP + (n - k) * logQ;
			double high = std::max(tail, logPmf);
			tail = high + std::log(std::exp(tail - high) + std::exp(logPmf - high));
			logSurvival[x] = std::min(0.0, tail / std::log(10.0));
		}
		logSurvival[0] = 0.0;
	}
}
