/*
 * -----------------------------------------------------------------------------
 * Filename:      Database.cpp
 *
 * Author:        MalabZ
 *
 * Created Date:  2026-09-14
 *
 * Last Modified: 2026-10-08
 *
 * Description:
 *  The k-mer database
 *
 * Version:
 *  1.1
 * -----------------------------------------------------------------------------
 */
#include <Database.hpp>
#include <errors.hpp>
#include <algorithm>
#include <fstream>
#include <iomanip>

namespace bramble {
	std::optional<std::span<const uint16_t>> Database::find(uint32_t kmer) const {
		auto it = std::lower_bound(keys.begin(), keys.end(), kmer);
		if (it == keys.end() || *it != kmer) {
			return std::nullopt;
		}
		return membership(static_cast<size_t>(it - keys.begin()));
	}

	void Database::append(uint32_t kmer, const std::vector<PositionRange>& ranges) {
		if (!keys.empty() && kmer <= keys.back()) {
			throw InvariantError("Keys must be appended in ascending order, got " + std::to_string(kmer)
				+ " after " + std::to_string(keys.back()));
		}
		keys.push_back(kmer);
		encodeRanges(ranges, blocks);
		offsets.push_back(blocks.size());
	}

	void Database::recomputeKmerCounts() {
		kmerCounts.assign(files.size(), 0);
		for (size_t idx = 0; idx < keys.size(); ++idx) {
			forEachRange(membership(idx), [this](uint32_t start, uint32_t length) {
				uint64_t end = std::min<uint64_t>(static_cast<uint64_t>(start) + length, kmerCounts.size());
				for (uint64_t pos = start; pos < end; ++pos) {
					kmerCounts[pos]++;
				}
				});
		}
	}

	void Database::validate() const {
		const size_t n = files.size();
		if (taxids.size() != n || kmerCounts.size() != n) {
			throw InvariantError("Database holds " + std::to_string(n) + " files but " + std::to_string(taxids.size())
				+ " taxids and " + std::to_string(kmerCounts.size()) + " k-mer counts");
		}
		if (possibleKmers == 0 || keys.size() > possibleKmers) {
			throw InvariantError("Database holds " + std::to_string(keys.size()) + " keys out of "
				+ std::to_string(possibleKmers) + " possible k-mers");
		}
		if (offsets.size() != keys.size() + 1 || offsets.front() != 0 || offsets.back() != blocks.size()) {
			throw InvariantError("Database block offsets do not match its keys and blocks");
		}
		for (size_t idx = 0; idx < keys.size(); ++idx) {
			if (idx > 0 && keys[idx] <= keys[idx - 1]) {
				throw InvariantError("Database keys are not strictly increasing at index " + std::to_string(idx));
			}
			if (offsets[idx + 1] <= offsets[idx]) {
				throw InvariantError("Empty membership set for key " + std::to_string(keys[idx]));
			}
			uint64_t lastEnd = 0;
			forEachRange(membership(idx), [&lastEnd](uint32_t start, uint32_t length) {
				lastEnd = static_cast<uint64_t>(start) + length;
				});
			if (lastEnd == 0) {
				throw InvariantError("Empty membership set for key " + std::to_string(keys[idx]));
			}
			if (lastEnd > n) {
				throw InvariantError("Membership set of key " + std::to_string(keys[idx]) + " names position "
					+ std::to_string(lastEnd - 1) + " but the database holds " + std::to_string(n) + " files");
			}
		}
	}

	std::ostream& operator<<(std::ostream& os, const Database& database) {
		os << std::left
			<< std::setw(20) << "Configuration:" << database.config << std::endl
			<< std::setw(20) << "Files:" << database.fileCount() << std::endl
			<< std::setw(20) << "Keys:" << database.keyCount() << std::endl
			<< std::setw(20) << "Possible k-mers:" << database.possibleKmers << std::endl
			<< std::setw(20) << "Blocks:" << database.blocks.size() << std::endl
			<< std::setw(20) << "Lossy level:";
		if (database.lossy()) {
			os << database.lossyLevel << std::endl;
		}
		else {
			os << "exact" << std::endl;
		}
		return os;
	}

	void saveDatabase(const std::string& path, const Database& database) {
		database.validate();
		ArtifactHeader header;
		header.kind = kDatabaseArtifact;
		header.config = database.config;
		header.fileCount = database.fileCount();
		header.lossyLevel = database.lossyLevel;
		writeAtomically(path, [&](std::ostream& os) {
			writeHeader(os, header);
			cereal::BinaryOutputArchive archive(os);
			archive(database);
			});
	}

	Database loadDatabase(const std::string& path) {
		std::ifstream is(path, std::ios::binary);
		if (!is.is_open()) {
			throw ResourceError("Failed to open file: " + path);
		}
		ArtifactHeader header = readHeader(is, path);
		if (header.kind != kDatabaseArtifact) {
			throw std::runtime_error(path + " holds " + artifactKindName(header.kind) + ", expected a database");
		}
		Database database;
		cereal::BinaryInputArchive archive(is);
		archive(database);
		database.config = header.config;
		database.lossyLevel = header.lossyLevel;
		if (database.fileCount() != header.fileCount) {
			throw InvariantError("Database " + path + " declares " + std::to_string(header.fileCount)
				+ " files but holds " + std::to_string(database.fileCount()));
		}
		database.validate();
		return database;
	}
}
