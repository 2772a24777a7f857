/*
 * -----------------------------------------------------------------------------
 * Filename:      BrambleClassify.cpp
 *
 * Author:        MalabZ
 *
 * Created Date:  2026-09-22
 *
 * Last Modified: 2026-10-12
 *
 * Description:
 *  The main program of BrambleClassify.
 *
 * Version:
 *  1.1
 * -----------------------------------------------------------------------------
 */
#include <BrambleClassify.hpp>
#include <artifact.hpp>
#include <seqan3/io/exception.hpp>
#include <errors.hpp>
#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>

namespace BrambleClassify {
	std::string readId(std::string_view header) {
		size_t end = header.find_first_of(" \t\r\n");
		return std::string(header.substr(0, end));
	}

	Classifier::Classifier(const bramble::Database& database, double exponent, uint32_t trials)
		: database(database), exponent(exponent), trials(trials)
	{
		if (!(exponent >= 0.0)) {
			throw std::invalid_argument("Significance exponent must be non-negative");
		}
		if (database.possibleKmers == 0) {
			throw std::invalid_argument("Database does not record its number of possible k-mers");
		}
		const double possible = static_cast<double>(database.possibleKmers);
		probabilities.reserve(database.fileCount());
		tables.reserve(database.fileCount());
		for (uint64_t count : database.kmerCounts) {
			double p = std::min(1.0, static_cast<double>(count) / possible);
			probabilities.push_back(p);
			tables.emplace_back(p, trials);
		}
	}

	double Classifier::score(uint32_t position, uint32_t hitCount, size_t nQuery) const {
		if (nQuery == 0) {
			return 0.0;
		}
		double expected = static_cast<double>(nQuery) * probabilities[position];
		if (static_cast<double>(hitCount) <= expected) {
			return 0.0;
		}
		// hits rescaled to the fixed number of trials
		double scaled = std::round(static_cast<double>(hitCount) * trials / static_cast<double>(nQuery));
		uint32_t x = static_cast<uint32_t>(std::min(scaled, static_cast<double>(trials)));
		return tables[position].at(x);
	}

	ClassificationRecord Classifier::classifyKmers(std::string id,
		const std::vector<uint32_t>& kmers,
		std::vector<uint32_t>& hits,
		std::vector<uint32_t>& touched) const
	{
		const uint32_t fileCount = static_cast<uint32_t>(database.fileCount());
		for (uint32_t kmer : kmers) {
			auto membership = database.find(kmer);
			if (!membership)
				continue;
			bramble::forEachMember(*membership, [&](uint32_t position) {
				if (position < fileCount && hits[position]++ == 0)
					touched.push_back(position);
				});
		}

		double bestScore = std::numeric_limits<double>::infinity();
		uint32_t bestPosition = fileCount;
		for (uint32_t position : touched) {
			double s = score(position, hits[position], kmers.size());
			if (s < bestScore || (s == bestScore && position < bestPosition)) {
				bestScore = s;
				bestPosition = position;
			}
			hits[position] = 0;
		}
		touched.clear();

		ClassificationRecord record;
		record.readId = std::move(id);
		if (bestPosition < fileCount && bestScore < -exponent) {
			record.classified = true;
			record.taxid = database.taxids[bestPosition];
			record.file = database.files[bestPosition];
		}
		return record;
	}

	/**
	 * Classify the pending batches in parallel and write their records in batch order.
	 */
	static void processBatches(const Classifier& classifier,
		std::vector<batchReads>& pending,
		std::ostream& os,
		FileInfo& fileInfo)
	{
		if (pending.empty())
			return;
		moodycamel::ConcurrentQueue<batchReads> readQueue;
		const size_t batchCount = pending.size();
		for (auto& batch : pending) {
			readQueue.enqueue(std::move(batch));
		}
		pending.clear();
		std::vector<std::vector<ClassificationRecord>> slots(batchCount);

#pragma omp parallel
		{
			batchReads batch;
			std::vector<uint32_t> hits(classifier.db().fileCount(), 0);
			std::vector<uint32_t> touched;
			while (readQueue.try_dequeue(batch))
			{
				if (bramble::interrupted())
					continue;
				auto& records = slots[batch.index];
				records.reserve(batch.ids.size());
				for (size_t i = 0; i < batch.ids.size(); ++i) {
					std::vector<uint32_t> kmers = bramble::collectKmers(batch.seqs[i], classifier.db().config);
					records.push_back(classifier.classifyKmers(std::move(batch.ids[i]), kmers, hits, touched));
				}
			}
		}
		bramble::throwIfInterrupted("classification");

		for (const auto& records : slots) {
			for (const auto& record : records) {
				os << record << '\n';
				if (record.classified)
					fileInfo.classifiedNum++;
				else
					fileInfo.unclassifiedNum++;
			}
		}
	}

	void classifyFiles(const Classifier& classifier, const ClassifyConfig& config, std::ostream& os, FileInfo& fileInfo) {
		if (config.batchSize == 0) {
			throw std::invalid_argument("Batch size must be at least 1");
		}
		const size_t batchesPerChunk = config.batchesPerChunk > 0
			? config.batchesPerChunk
			: 4 * static_cast<size_t>(std::max<uint16_t>(config.threads, 1));

		for (const auto& file : config.readFiles) {
			fileInfo.fileNum++;
			std::vector<batchReads> pending;
			try {
				bramble::sequence_file_t fin{ file };
				for (auto&& chunk : fin | seqan3::views::chunk(config.batchSize)) {
					batchReads batch;
					batch.index = pending.size();
					for (auto&& record : chunk) {
						fileInfo.bpLength += record.sequence().size();
						batch.ids.emplace_back(readId(record.id()));
						batch.seqs.emplace_back(std::move(record.sequence()));
					}
					fileInfo.sequenceNum += batch.ids.size();
					pending.emplace_back(std::move(batch));
					if (pending.size() == batchesPerChunk) {
						processBatches(classifier, pending, os, fileInfo);
					}
				}
			}
			catch (const seqan3::parse_error& e) {
				std::cerr << "Failed to parse read file " << file << ": " << e.what() << ", skipping the rest of it" << std::endl;
				fileInfo.invalidNum++;
			}
			catch (const seqan3::file_open_error& e) {
				std::cerr << "Failed to open read file " << file << ": " << e.what() << std::endl;
				fileInfo.invalidNum++;
			}
			processBatches(classifier, pending, os, fileInfo);
		}
	}

	void run(ClassifyConfig config) {
		auto TotalclassifyStart = bramble::timer_clock::now();
		if (config.readFiles.empty()) {
			throw std::invalid_argument("No read files given");
		}
		bramble::requireFile(config.dbFile);
		for (const auto& file : config.readFiles) {
			bramble::requireFile(file);
		}
		config.outputFile = bramble::resolveOutputPath(config.outputFile, "bramble.tsv");
		bramble::ensureWritable(config.outputFile);
		if (config.verbose) {
			std::cout << config << std::endl;
		}

		bramble::ArtifactHeader header = bramble::readHeader(config.dbFile);
		if (header.kind != bramble::kDatabaseArtifact) {
			throw std::runtime_error(config.dbFile + " holds " + bramble::artifactKindName(header.kind) + ", expected a database");
		}
		if (config.kmer_given) {
			bramble::checkConfig(header.config, config.kmer, config.dbFile);
		}

		auto readStart = bramble::timer_clock::now();
		std::cout << "Loading database..." << std::endl;
		bramble::Database database = bramble::loadDatabase(config.dbFile);
		Classifier classifier(database, config.exponent, config.trials);
		if (config.verbose) {
			std::cout << "Read time: ";
			bramble::printTime(bramble::elapsedMs(readStart));
			std::cout << database << std::endl;
		}

		omp_set_num_threads(config.threads);
		auto classifyStart = bramble::timer_clock::now();
		std::cout << "Classifying sequences..." << std::endl;
		FileInfo fileInfo;
		bramble::writeAtomically(config.outputFile, [&](std::ostream& os) {
			classifyFiles(classifier, config, os, fileInfo);
			});

		if (config.verbose) {
			std::cout << "Classify time: ";
			bramble::printTime(bramble::elapsedMs(classifyStart));
			double total = fileInfo.sequenceNum > 0 ? static_cast<double>(fileInfo.sequenceNum) : 1.0;
			std::cout << "Read files: " << fileInfo.fileNum << " (" << fileInfo.invalidNum << " invalid)" << std::endl;
			std::cout << "Total sequences: " << fileInfo.sequenceNum << std::endl;
			std::cout << "Total base pairs: " << fileInfo.bpLength << std::endl;
			std::cout << "Classified sequences: " << fileInfo.classifiedNum << " (" << (fileInfo.classifiedNum / total) * 100 << "%)" << std::endl;
			std::cout << "Unclassified sequences: " << fileInfo.unclassifiedNum << " (" << (fileInfo.unclassifiedNum / total) * 100 << "%)" << std::endl;
			std::cout << "\nTotal classify time: ";
			bramble::printTime(bramble::elapsedMs(TotalclassifyStart));
		}
		std::cout << "Classification written to " << config.outputFile << std::endl;
	}
}
