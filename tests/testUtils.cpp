/*
 * -----------------------------------------------------------------------------
 * Filename:      testUtils.cpp
 *
 * Author:        MalabZ
 *
 * Created Date:  2026-09-25
 *
 * Last Modified: 2026-10-12
 *
 * Description:
 *  Helpers shared by the unit tests
 *
 * Version:
 *  1.0
 * -----------------------------------------------------------------------------
 */
#include <testUtils.hpp>
#include <fstream>
#include <random>
#include <stdexcept>

namespace testutils {
	TempDir::TempDir() {
		std::random_device rd;
		std::mt19937_64 rng(rd());
		do {
			dir = std::filesystem::temp_directory_path() / ("bramble_test_" + std::to_string(rng()));
		} while (std::filesystem::exists(dir));
		std::filesystem::create_directories(dir);
	}

	TempDir::~TempDir() {
		std::error_code ec;
		std::filesystem::remove_all(dir, ec);
	}

	std::string randomSequence(size_t length, uint32_t seed) {
		static const char bases[4] = { 'A', 'C', 'G', 'T' };
		std::mt19937 rng(seed);
		std::uniform_int_distribution<int> pick(0, 3);
		std::string sequence(length, 'A');
		for (auto& base : sequence) {
			base = bases[pick(rng)];
		}
		return sequence;
	}

	std::string reverseComplement(const std::string& sequence) {
		std::string result(sequence.rbegin(), sequence.rend());
		for (auto& base : result) {
			switch (base) {
			case 'A': base = 'T'; break;
			case 'C': base = 'G'; break;
			case 'G': base = 'C'; break;
			case 'T': base = 'A'; break;
			default: break;
			}
		}
		return result;
	}

	void writeFasta(const std::string& path, const std::vector<std::pair<std::string, std::string>>& records) {
		std::ofstream os(path);
		if (!os.is_open()) {
			throw std::runtime_error("Failed to open file: " + path);
		}
		for (const auto& [id, sequence] : records) {
			os << '>' << id << '\n';
			for (size_t pos = 0; pos < sequence.size(); pos += 80) {
				os << sequence.substr(pos, 80) << '\n';
			}
		}
	}

	std::vector<bramble::ReferenceRecord> writeReferences(const TempDir& dir, const std::vector<std::string>& sequences) {
		std::vector<bramble::ReferenceRecord> records;
		for (size_t i = 0; i < sequences.size(); ++i) {
			std::string path = dir.file("ref" + std::to_string(i) + ".fa");
			writeFasta(path, { { "ref" + std::to_string(i), sequences[i] } });
			records.push_back({ path, static_cast<uint64_t>(i + 1) });
		}
		return records;
	}
}
