/*
 * -----------------------------------------------------------------------------
 * Filename:      fileToTaxid.hpp
 *
 * Author:        MalabZ
 *
 * Created Date:  2026-09-04
 *
 * Last Modified: 2026-10-09
 *
 * Description:
 *  Reading and writing of file-to-taxid (.f2t) mappings and extraction of
 *  reference k-mer bitmaps.
 *
 *  A .f2t line is "<path>\t<taxid>". A path may list several FASTA files
 *  joined by '$' which then act as one reference. Ordered mappings start
 *  with a "#bramble" comment line holding the k-mer configuration they
 *  were ordered under.
 *
 * Version:
 *  1.1
 * -----------------------------------------------------------------------------
 */
#pragma once
#ifndef FILETOTAXID_HPP
#define FILETOTAXID_HPP

#include <kmerConfig.hpp>
#include <KmerIter.hpp>
#include <dna5_traits.hpp>
#include <roaring/roaring.hh>
#include <seqan3/io/exception.hpp>
#include <cstdint>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace bramble {
	struct ReferenceRecord {
		std::string path;
		uint64_t taxid{ 0 };

		bool operator==(const ReferenceRecord& other) const = default;

		template <class Archive>
		void serialize(Archive& archive) {
			archive(path, taxid);
		}
	};

	struct FileToTaxid {
		std::vector<ReferenceRecord> records;
		std::optional<KmerConfig> config;
		size_t invalidNum{ 0 };
	};

	struct FileInfo {
		size_t fileNum = 0;
		size_t invalidNum = 0;
		size_t sequenceNum = 0;
		size_t skippedNum = 0;
		size_t bpLength = 0;
		size_t kmerNum = 0;

		void operator+=(const FileInfo& other) {
			fileNum += other.fileNum;
			invalidNum += other.invalidNum;
			sequenceNum += other.sequenceNum;
			skippedNum += other.skippedNum;
			bpLength += other.bpLength;
			kmerNum += other.kmerNum;
		}
	};

	std::ostream& operator<<(std::ostream& os, const FileInfo& fileInfo);

	/**
	 * Parse one "path\ttaxid" line. Returns std::nullopt for malformed lines.
	 */
	std::optional<ReferenceRecord> parseFileToTaxidLine(const std::string& line);

	/**
	 * Load a .f2t file. Malformed lines are reported on std::cerr and skipped.
	 * Throws ResourceError if the file cannot be opened.
	 */
	FileToTaxid loadFileToTaxid(const std::string& path);

	/**
	 * Write an ordered .f2t with its configuration comment line.
	 */
	void saveFileToTaxid(const std::string& path, const std::vector<ReferenceRecord>& records, const KmerConfig& config);

	std::string configComment(const KmerConfig& config);
	std::optional<KmerConfig> parseConfigComment(const std::string& line);

	/**
	 * The FASTA files making up a reference, resolved against referenceDir when it is not empty.
	 */
	std::vector<std::string> referencePaths(const ReferenceRecord& record, const std::string& referenceDir);

	/**
	 * Throw ResourceError naming the first reference file that does not exist.
	 */
	void requireReferences(const std::vector<ReferenceRecord>& records, const std::string& referenceDir);

	/**
	 * Stream the canonical k-mers of every sequence of a reference into callback.
	 * Sequences shorter than k are counted as skipped. Files that cannot be opened or fail
	 * to parse are reported, counted in fileInfo.invalidNum and contribute what was read
	 * before the failure. Any other exception, including one thrown by callback, propagates.
	 */
	template <typename Callback>
	void forEachReferenceKmer(const std::vector<std::string>& files,
		const KmerConfig& config,
		FileInfo& fileInfo,
		Callback&& callback)
	{
		for (const auto& file : files) {
			fileInfo.fileNum++;
			try {
				sequence_file_t fin{ file };
				for (auto& record : fin) {
					const auto& seq = record.sequence();
					if (seq.size() < config.kmerSize) {
						fileInfo.skippedNum++;
						continue;
					}
					fileInfo.sequenceNum++;
					fileInfo.bpLength += seq.size();
					for (uint32_t kmer : canonicalKmers(seq, config)) {
						callback(kmer);
					}
				}
			}
			catch (const seqan3::unhandled_extension_error& e) {
				std::cerr << "Unsupported reference file " << file << ": " << e.what() << std::endl;
				fileInfo.invalidNum++;
			}
			catch (const seqan3::file_open_error& e) {
				std::cerr << "Failed to open reference file " << file << ": " << e.what() << std::endl;
				fileInfo.invalidNum++;
			}
			catch (const seqan3::parse_error& e) {
				std::cerr << "Failed to parse reference file " << file << ": " << e.what() << ", skipping the rest of it" << std::endl;
				fileInfo.invalidNum++;
			}
			catch (const seqan3::unexpected_end_of_input& e) {
				std::cerr << "Reference file " << file << " ended unexpectedly: " << e.what() << ", skipping the rest of it" << std::endl;
				fileInfo.invalidNum++;
			}
		}
	}

	/**
	 * Canonical k-mers of a reference as a run-optimized bitmap.
	 */
	roaring::Roaring referenceKmerBitmap(const std::vector<std::string>& files,
		const KmerConfig& config,
		FileInfo& fileInfo);
}

#endif // FILETOTAXID_HPP
