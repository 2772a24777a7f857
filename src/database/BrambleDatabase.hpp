/*
 * -----------------------------------------------------------------------------
 * Filename:      BrambleDatabase.hpp
 *
 * Author:        MalabZ
 *
 * Created Date:  2026-10-02
 *
 * Last Modified: 2026-10-09
 *
 * Description:
 *  Maintenance of existing artifacts: rewriting a taxid and printing headers
 *
 * Version:
 *  1.0
 * -----------------------------------------------------------------------------
 */
#pragma once
#ifndef BRAMBLEDATABASE_HPP
#define BRAMBLEDATABASE_HPP
#include <databaseConfig.hpp>
#include <Database.hpp>
#include <iostream>
#include <string>

namespace BrambleDatabase {
	/**
	 * Set the taxid of every position whose file is fileName.
	 *
	 * @return The number of positions changed. Throws std::invalid_argument if no position holds fileName.
	 */
	size_t retaxid(bramble::Database& database, const std::string& fileName, uint64_t taxid);

	void runRetaxid(RetaxidConfig config);

	/**
	 * Print the header of an artifact, or the configuration line of an ordered .f2t file.
	 */
	void printInfo(const std::string& path, std::ostream& os);
}

#endif // BRAMBLEDATABASE_HPP
