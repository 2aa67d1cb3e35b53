#include "../include/pipeline.hpp"
#include "../include/agp.hpp"
#include "../include/alignments.hpp"
#include "../include/break_classifier.hpp"
#include "../include/chrom_assign.hpp"
#include "../include/contig_support.hpp"
#include "../include/errors.hpp"
#include "../include/fasta_layout.hpp"
#include "../include/layout_annotate.hpp"
#include "../include/logger.hpp"
#include "../include/order_reconciler.hpp"

#include <filesystem>
#include <map>
#include <system_error>

namespace scafbreak {

namespace fs = std::filesystem;

namespace {

// Contig stats after support aggregation and break classification, plus the
// scaffold assignments they were classified against.
struct ContigResult {
    std::vector<ContigStats> contigs;
    ScaffoldChroms chroms;
};

ContigResult classify_from_tables(const AgpLayout& agp, const AlignmentTable& bed, const std::string& tag) {
    ContigSupport support = compute_contig_support(agp, tag);
    log_stream() << "Contigs: " << support.contigs.size()
                 << "; scaffolds: " << support.scaffold_to_contig.size() << "\n";

    ContigResult res;
    res.chroms = alignments_per_scaffold(support.contig_to_scaffold, bed);
    classify_contig_breaks(support.contigs, support.contig_to_scaffold, res.chroms);
    res.contigs = std::move(support.contigs);
    return res;
}

// per-chromosome scaffold counts, debug only
void log_chrom_summary(const ScaffoldChroms& chroms) {
    std::map<std::string, size_t> n;
    for (const auto& kv : chroms) ++n[kv.second.chrom];
    for (const auto& kv : n) debug_stream() << kv.first << ": " << kv.second << " scaffolds\n";
}

} // namespace

void ensure_prefix_dir(const std::string& prefix) {
    const fs::path parent = fs::path(prefix).parent_path();
    if (parent.empty()) return;
    std::error_code ec;
    fs::create_directories(parent, ec);
    if (ec) throw IoError("cannot create output directory " + parent.string() + ": " + ec.message());
}

void run_process(const RunOpts& opt) {
    ensure_prefix_dir(opt.prefix);

    FastaScaffolds fasta = load_fasta_scaffolds(opt.fasta_file, opt.prefix, opt.use_cache);
    AgpLayout agp = parse_agp_layout(opt.agp_file);
    AlignmentTable bed = parse_contig_alignments(opt.bed_file);

    ContigResult res = classify_from_tables(agp, bed, opt.scaffold_tag);
    log_chrom_summary(res.chroms);

    assign_chrom_to_scaffolds(fasta.layout, res.chroms);
    assign_agp_order_numbers(fasta.layout, agp);

    relabel_low_confidence(fasta.layout, opt.min_conf);
    check_fasta_export(fasta.layout, fasta);

    const OutputPaths paths(opt.prefix);
    write_layout_table(fasta.layout, paths.layout);
    write_contig_table(res.contigs, paths.contigs);
    dump_fasta_sequences(fasta.layout, fasta, paths, opt.wrap_width);
}

void run_contigs(const RunOpts& opt) {
    ensure_prefix_dir(opt.prefix);

    AgpLayout agp = parse_agp_layout(opt.agp_file);
    AlignmentTable bed = parse_contig_alignments(opt.bed_file);

    ContigResult res = classify_from_tables(agp, bed, opt.scaffold_tag);
    log_chrom_summary(res.chroms);

    write_contig_table(res.contigs, OutputPaths(opt.prefix).contigs);
}

void run_segment(const RunOpts& opt) {
    if (!opt.out_file.empty() && opt.out_file != "-") ensure_prefix_dir(opt.out_file);

    FastaScaffolds fasta = parse_fasta_scaffolds(opt.fasta_file);
    log_stream() << "Segmented " << fasta.names.size() << " scaffolds into " << fasta.layout.size() << " rows\n";
    write_segment_table(fasta.layout, opt.out_file);
}

} // namespace scafbreak
