/*
 * -----------------------------------------------------------------------------
 * Filename:      timeUtil.hpp
 *
 * Author:        MalabZ
 *
 * Created Date:  2026-09-03
 *
 * Last Modified: 2026-09-03
 *
 * Description:
 *  Timing helpers shared by the Bramble stages
 *
 * Version:
 *  1.0
 * -----------------------------------------------------------------------------
 */
#pragma once
#ifndef TIMEUTIL_HPP
#define TIMEUTIL_HPP
#include <chrono>
#include <iostream>

namespace bramble {
	using timer_clock = std::chrono::high_resolution_clock;

	inline long long elapsedMs(const timer_clock::time_point& start) {
		return std::chrono::duration_cast<std::chrono::milliseconds>(timer_clock::now() - start).count();
	}

	/**
	* Print a duration in a human-readable format.
	*
	* @param milliseconds The duration in milliseconds.
	*/
	inline void printTime(long long milliseconds) {
		// Calculate seconds, minutes, and hours
		long long total_seconds = milliseconds / 1000;
		long long seconds = total_seconds % 60;
		long long total_minutes = total_seconds / 60;
		long long minutes = total_minutes % 60;
		long long hours = total_minutes / 60;

		// Output different formats based on the length of time
		if (hours > 0) {
			std::cout << hours << "h " << minutes << "min " << seconds << "s " << milliseconds % 1000 << "ms" << std::endl;
		}
		else if (minutes > 0) {
			std::cout << minutes << "min " << seconds << "s " << milliseconds % 1000 << "ms" << std::endl;
		}
		else {
			std::cout << seconds << "s " << milliseconds % 1000 << "ms" << std::endl;
		}
	}
}

#endif // TIMEUTIL_HPP
