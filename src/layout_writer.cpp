#include "../include/layout_writer.hpp"
#include "../include/chrom_assign.hpp"
#include "../include/errors.hpp"
#include "../include/logger.hpp"

#include <cstdio>
#include <map>
#include <set>
#include <unordered_map>

namespace scafbreak {

namespace {

constexpr const char* LAYOUT_HEADER =
    "object\tcomponent\tname\torder\tstart\tend\tlength\torientation\tchrom\tconfidence"
    "\tctg_seq_start\tctg_seq_end\tcut_sites\tA\tC\tG\tT\ta\tc\tg\tt\tN\tn\n";

constexpr const char* SEGMENT_HEADER =
    "object\tcomponent\tname\tindex\tstart\tend\tlength\tcut_sites\tA\tC\tG\tT\ta\tc\tg\tt\tN\tn\n";

constexpr const char* CONTIG_HEADER =
    "contig_name\tsupported\tunsupported\tcontig_breaks"
    "\tlocal_breaks\tglobal_breaks\tchimeric_breaks\tsupport_breaks\n";

std::string fmt_conf(double c) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.3f", c);
    return buf;
}

void append_counts(std::string& line, const Segment& s) {
    line += std::to_string(s.cut_sites);
    for (int64_t c : s.counts.n) { line += '\t'; line += std::to_string(c); }
    line += '\n';
}

} // namespace

std::vector<std::string> expected_chrom_files() {
    std::vector<std::string> v;
    for (int i = 1; i <= 22; ++i) v.push_back("chr" + std::to_string(i));
    v.push_back(SEX_CHROM);
    v.push_back(UNPLACED_CHROM);
    return v;
}

void write_layout_table(const Layout& layout, const std::string& path) {
    SAVE out(path);
    out.save(LAYOUT_HEADER);
    std::string line;
    for (const auto& s : layout) {
        line.clear();
        line += s.object;                                         line += '\t';
        line += kind_name(s.kind);                                line += '\t';
        line += s.name;                                           line += '\t';
        line += s.order.str();                                    line += '\t';
        line += std::to_string(s.start);                          line += '\t';
        line += std::to_string(s.end);                            line += '\t';
        line += std::to_string(s.length);                         line += '\t';
        line += std::to_string(static_cast<int>(s.orientation));  line += '\t';
        line += s.chrom;                                          line += '\t';
        line += fmt_conf(s.confidence);                           line += '\t';
        line += std::to_string(s.ctg_start);                      line += '\t';
        line += std::to_string(s.ctg_end);                        line += '\t';
        append_counts(line, s);
        out.save(line);
    }
    out.close();
    log_stream() << "Wrote " << layout.size() << " layout rows to " << path << "\n";
}

void write_segment_table(const Layout& layout, const std::string& path) {
    SAVE out(path);
    out.save(SEGMENT_HEADER);
    std::string line;
    for (const auto& s : layout) {
        line.clear();
        line += s.object;                     line += '\t';
        line += kind_name(s.kind);            line += '\t';
        line += s.name;                       line += '\t';
        line += std::to_string(s.index);      line += '\t';
        line += std::to_string(s.start);      line += '\t';
        line += std::to_string(s.end);        line += '\t';
        line += std::to_string(s.length);     line += '\t';
        append_counts(line, s);
        out.save(line);
    }
    out.close();
}

void write_contig_table(const std::vector<ContigStats>& contigs, const std::string& path) {
    SAVE out(path);
    out.save(CONTIG_HEADER);
    for (const auto& c : contigs) {
        out.save(c.name + '\t' + std::to_string(c.supported) + '\t' + std::to_string(c.unsupported)
                 + '\t' + std::to_string(c.breaks) + '\t' + std::to_string(c.local_breaks)
                 + '\t' + std::to_string(c.global_breaks) + '\t' + std::to_string(c.chimeric_breaks)
                 + '\t' + std::to_string(c.support_breaks) + '\n');
    }
    out.close();
    log_stream() << "Wrote " << contigs.size() << " contig rows to " << path << "\n";
}

void write_fasta_record(SAVE& out, const std::string& header, const std::string& seq, int wrap) {
    out.save(">" + header + "\n");
    if (wrap <= 0) {
        out.save(seq + "\n");
    } else {
        const size_t w = static_cast<size_t>(wrap);
        for (size_t i = 0; i < seq.size(); i += w) {
            out.save(seq.substr(i, w) + "\n");
        }
    }
    out.save("\n");
}

void check_fasta_export(const Layout& layout, const FastaScaffolds& fasta) {
    for (const auto& s : layout) {
        if (s.is_gap()) continue;
        const std::string& seq = fasta.sequence(s.scaffold());
        const int64_t n = static_cast<int64_t>(seq.size());
        if (s.is_scaffold() && s.length != n) {
            throw MismatchError("scaffold " + s.name + " has " + std::to_string(n) + " stored bases, layout says "
                                + std::to_string(s.length) + " (stale cache?)");
        }
        if (s.start < 0 || s.length < 0 || s.start + s.length > n) {
            throw MismatchError("run " + to_string(s) + " lies outside its " + std::to_string(n) + " bp scaffold");
        }
    }
}

void dump_fasta_sequences(const Layout& layout, const FastaScaffolds& fasta, const OutputPaths& paths, int wrap) {
    // chrom -> scaffold name -> scaffold row (sorted by name within a chromosome)
    std::map<std::string, std::map<std::string, const Segment*>> by_chrom;
    std::unordered_map<std::string, std::vector<const Segment*>> runs_of;
    for (const auto& s : layout) {
        if (s.is_scaffold())      by_chrom[s.chrom][s.name] = &s;
        else if (s.is_sequence()) runs_of[s.object].push_back(&s);
    }

    SAVE wg(paths.scaffolds_fa);
    std::set<std::string> written;
    size_t n_contigs = 0;

    for (const auto& ck : by_chrom) {
        const std::string& chrom = ck.first;
        SAVE out(paths.contigs_fa(chrom));
        written.insert(chrom);

        for (const auto& sk : ck.second) {
            const std::string& scaffold = sk.first;
            const Segment& row = *sk.second;
            const std::string& seq = fasta.sequence(scaffold);

            write_fasta_record(wg, scaffold + "@" + chrom + "@scf:0-" + std::to_string(row.length), seq, wrap);

            for (const Segment* r : runs_of[scaffold]) {
                const std::string header = scaffold + "@" + chrom + "@" + r->order.str()
                    + "@" + (r->orientation == Orientation::forward ? "frw" : "rev")
                    + "@" + r->name
                    + "@ctg:" + std::to_string(r->ctg_start) + "-" + std::to_string(r->ctg_end);
                write_fasta_record(out, header, seq.substr(static_cast<size_t>(r->start), static_cast<size_t>(r->length)), wrap);
                ++n_contigs;
            }
        }
        out.close();
    }
    wg.close();

    const std::string placeholder = [] {
        std::string s;
        for (int i = 0; i < 120; ++i) s += "ACGT";
        return s;
    }();
    for (const auto& chrom : expected_chrom_files()) {
        if (written.count(chrom)) continue;
        SAVE out(paths.contigs_fa(chrom));
        write_fasta_record(out, "empty", placeholder, wrap);
        out.close();
    }

    log_stream() << "Exported " << fasta.names.size() << " scaffolds and " << n_contigs << " contig sequences over "
                 << by_chrom.size() << " chromosome files\n";
}

} // namespace scafbreak
