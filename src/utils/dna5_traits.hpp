// -----------------------------------------------------------------------------------------------------
// Copyright (c) 2006-2022, Knut Reinert & Freie Universität Berlin
// Copyright (c) 2016-2022, Knut Reinert & MPI für molekulare Genetik
// This file may be used, modified and/or redistributed under the terms of the 3-clause BSD-License
// shipped with this file and also available at: https://github.com/seqan/raptor/blob/master/LICENSE.md
// -----------------------------------------------------------------------------------------------------

#pragma once

#include <seqan3/alphabet/nucleotide/dna5.hpp>
#include <seqan3/io/sequence_file/input.hpp>

namespace bramble
{
/**
 * \brief Sequence file traits that keep N as its own symbol.
 *
 * The default dna4 reading maps N to A, which would create k-mers that are not in the input.
 * Reading dna5 lets the k-mer extractor restart its window at every N.
 */
struct dna5_traits : seqan3::sequence_file_input_default_traits_dna
{
    using sequence_alphabet = seqan3::dna5;
};

using sequence_file_t = seqan3::sequence_file_input<dna5_traits, seqan3::fields<seqan3::field::id, seqan3::field::seq>>;

} // namespace bramble
