/*
 * -----------------------------------------------------------------------------
 * Filename:      orderConfig.hpp
 *
 * Author:        MalabZ
 *
 * Created Date:  2026-09-10
 *
 * Last Modified: 2026-09-28
 *
 * Description:
 *  Configuration of the reference orderer
 *
 * Version:
 *  1.0
 * -----------------------------------------------------------------------------
 */
#pragma once
#ifndef ORDERCONFIG_HPP
#define ORDERCONFIG_HPP
#include <cstdint>
#include <iomanip>
#include <iostream>
#include <string>

namespace BrambleOrder {
	struct OrderConfig {
		std::string distance_file;
		std::string output_file;
		uint32_t seed{ 0 };
		// 0 disables the swap refinement
		uint32_t max_passes{ 16 };
		bool verbose = true;
	};

	inline std::ostream& operator<<(std::ostream& os, const OrderConfig& config) {
		os << std::string(50, '=') << std::endl;
		os << " Order Configuration " << std::endl;
		os << std::string(50, '=') << std::endl;

		os << std::left
			<< std::setw(25) << "Distance file:" << config.distance_file << std::endl
			<< std::setw(25) << "Output file:" << config.output_file << std::endl
			<< std::setw(25) << "Seed reference:" << config.seed << std::endl
			<< std::setw(25) << "Max swap passes:" << config.max_passes << std::endl
			<< std::setw(25) << "Verbose:" << config.verbose << std::endl;

		os << std::string(50, '=') << std::endl;

		return os;
	}
}

#endif // ORDERCONFIG_HPP
