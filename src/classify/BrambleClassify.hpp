/*
 * -----------------------------------------------------------------------------
 * Filename:      BrambleClassify.hpp
 *
 * Author:        MalabZ
 *
 * Created Date:  2026-09-22
 *
 * Last Modified: 2026-10-12
 *
 * Description:
 *  Read classification against a k-mer database.
 *
 *  A read's hits against reference f are compared with Binomial(n, p_f),
 *  p_f being the chance that a random k-mer is one of f's k-mers. The read
 *  goes to the reference with the smallest tail probability when that
 *  probability is below 10^-e.
 *
 * Version:
 *  1.1
 * -----------------------------------------------------------------------------
 */
#pragma once
#include <classifyConfig.hpp>
#include <BinomialTable.hpp>
#include <Database.hpp>
#include <KmerIter.hpp>
#include <interrupt.hpp>
#include <timeUtil.hpp>
#include <concurrentqueue.h>
#include <seqan3/utility/views/chunk.hpp>
#include <omp.h>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace BrambleClassify {
	/**
	 * Read id as written to the output: the header up to its first whitespace.
	 */
	std::string readId(std::string_view header);

	class Classifier {
		const bramble::Database& database;
		double exponent;
		uint32_t trials;
		std::vector<double> probabilities;
		std::vector<BinomialTable> tables;

	public:
		/**
		 * @param database The database, must outlive the classifier.
		 * @param exponent Reads are classified when the best tail probability is below 10^-exponent.
		 * @param trials Number of trials of the null binomial.
		 */
		Classifier(const bramble::Database& database, double exponent, uint32_t trials = DEFAULT_TRIALS);

		/**
		 * Classify a read from its query k-mers.
		 *
		 * @param id The read id.
		 * @param kmers The canonical k-mers of the read.
		 * @param hits Scratch counters, one per reference position, all zero on entry and on return.
		 * @param touched Scratch list of positions with hits.
		 */
		ClassificationRecord classifyKmers(std::string id,
			const std::vector<uint32_t>& kmers,
			std::vector<uint32_t>& hits,
			std::vector<uint32_t>& touched) const;

		template <typename Sequence>
		ClassificationRecord classifyRead(std::string id, const Sequence& sequence) const {
			std::vector<uint32_t> hits(database.fileCount(), 0);
			std::vector<uint32_t> touched;
			return classifyKmers(std::move(id), bramble::collectKmers(sequence, database.config), hits, touched);
		}

		/**
		 * log10 of the tail probability of hits at a reference position given nQuery query k-mers,
		 * 0 when the hits do not exceed the expected count.
		 */
		double score(uint32_t position, uint32_t hitCount, size_t nQuery) const;

		double probability(uint32_t position) const { return probabilities[position]; }
		const bramble::Database& db() const { return database; }
	};

	/**
	 * Classify every read of the input files and write one line per read to os, in input order.
	 */
	void classifyFiles(const Classifier& classifier, const ClassifyConfig& config, std::ostream& os, FileInfo& fileInfo);

	void run(ClassifyConfig config);
}
