#include "../include/fasta_layout.hpp"
#include "../include/errors.hpp"
#include "../include/kio.hpp"
#include "../include/logger.hpp"
#include "../include/save.hpp"
#include "../include/segmenter.hpp"

#include <filesystem>
#include <memory>
#include <string_view>
#include <zlib.h>
#include <htslib/kseq.h>

KSEQ_INIT(gzFile, gzread)

namespace scafbreak {

namespace {

constexpr const char* CACHE_HEADER =
    "object\tkind\tname\tindex\tstart\tend\tlength\tcut_sites\tA\tC\tG\tT\ta\tc\tg\tt\tN\tn";

// Iterate records of a FASTA with kseq; fn(name, seq) per record.
template <class Fn>
void for_each_fasta_record(const std::string& path, Fn&& fn) {
    std::unique_ptr<gzFile_s, int(*)(gzFile)> fp(gzopen(path.c_str(), "rb"), gzclose);
    if (!fp) throw IoError(path + ": No such file or directory");

    std::unique_ptr<kseq_t, void(*)(kseq_t*)> ks(kseq_init(fp.get()), kseq_destroy);
    if (!ks) throw IoError("kseq_init failed on " + path);

    int ret = 0;
    while ((ret = kseq_read(ks.get())) >= 0) {
        std::string name(ks->name.s ? ks->name.s : "", ks->name.l);
        std::string seq(ks->seq.s ? ks->seq.s : "", ks->seq.l);
        fn(std::move(name), std::move(seq));
    }
    if (ret < -1) throw IoError(path + ": truncated or malformed FASTA");
}

SegmentKind parse_kind(std::string_view s, const std::string& where) {
    if (s == "scaffold") return SegmentKind::scaffold;
    if (s == "sequence") return SegmentKind::sequence;
    if (s == "gap")      return SegmentKind::gap;
    throw IoError("unknown segment kind '" + std::string(s) + "' at " + where);
}

const char* kind_token(SegmentKind k) {
    switch (k) {
        case SegmentKind::scaffold: return "scaffold";
        case SegmentKind::sequence: return "sequence";
        case SegmentKind::gap:      return "gap";
    }
    return "?";
}

} // namespace

const std::string& FastaScaffolds::sequence(const std::string& scaffold) const {
    auto it = seqs.find(scaffold);
    if (it == seqs.end()) throw LookupError("no sequence stored for scaffold " + scaffold);
    return it->second;
}

FastaScaffolds parse_fasta_scaffolds(const std::string& fasta_path) {
    FastaScaffolds fs;
    int64_t record = 0;

    for_each_fasta_record(fasta_path, [&](std::string name, std::string seq) {
        if (seq.empty()) {
            warning_stream() << "skipping empty FASTA record " << name << "\n";
            return;
        }
        if (fs.seqs.count(name)) throw IoError("duplicate FASTA record: " + name);

        auto rows = segment_scaffold(seq, name, ++record);
        fs.layout.insert(fs.layout.end(), std::make_move_iterator(rows.begin()), std::make_move_iterator(rows.end()));
        fs.names.push_back(name);
        fs.seqs.emplace(std::move(name), std::move(seq));
    });

    fill_gap_coordinates(fs.layout);
    log_stream() << "Parsed " << fs.names.size() << " scaffolds, " << fs.layout.size() << " layout rows from " << fasta_path << "\n";
    return fs;
}

void write_fasta_cache(const FastaScaffolds& fs, const FastaCachePaths& paths) {
    {
        SAVE out(paths.layout);
        out.save(std::string(CACHE_HEADER) + "\n");
        std::string line;
        for (const auto& s : fs.layout) {
            line.clear();
            line += s.object;                       line += '\t';
            line += kind_token(s.kind);             line += '\t';
            line += s.name;                         line += '\t';
            line += std::to_string(s.index);        line += '\t';
            line += std::to_string(s.start);        line += '\t';
            line += std::to_string(s.end);          line += '\t';
            line += std::to_string(s.length);       line += '\t';
            line += std::to_string(s.cut_sites);
            for (int64_t c : s.counts.n) { line += '\t'; line += std::to_string(c); }
            line += '\n';
            out.save(line);
        }
        out.close();
    }
    {
        SAVE out(paths.seqs);
        for (const auto& name : fs.names) {
            out.save(">" + name + "\n");
            out.save(fs.sequence(name));
            out.save("\n");
        }
        out.close();
    }
    log_stream() << "Wrote FASTA cache " << paths.layout << " / " << paths.seqs << "\n";
}

FastaScaffolds read_fasta_cache(const FastaCachePaths& paths) {
    FastaScaffolds fs;

    kio::LineReader lr(paths.layout);
    std::string line;
    while (lr.getline(line)) {
        if (lr.line_no() == 1 || line.empty()) continue;   // header
        const std::string where = lr.path() + ":" + std::to_string(lr.line_no());
        auto f = kio::split_tabs(line);
        if (f.size() != 18) throw IoError("expected 18 columns at " + where);

        Segment s;
        s.object = std::string(f[0]);
        s.kind   = parse_kind(f[1], where);
        s.name   = std::string(f[2]);
        int64_t* ints[] = { &s.index, &s.start, &s.end, &s.length, &s.cut_sites };
        for (size_t i = 0; i < 5; ++i) {
            if (!kio::parse_i64(f[3 + i], *ints[i])) throw IoError("bad integer '" + std::string(f[3 + i]) + "' at " + where);
        }
        for (size_t i = 0; i < 10; ++i) {
            if (!kio::parse_i64(f[8 + i], s.counts.n[i])) throw IoError("bad count '" + std::string(f[8 + i]) + "' at " + where);
        }
        if (s.is_scaffold()) fs.names.push_back(s.name);
        fs.layout.push_back(std::move(s));
    }

    for_each_fasta_record(paths.seqs, [&](std::string name, std::string seq) {
        fs.seqs.emplace(std::move(name), std::move(seq));
    });

    for (const auto& name : fs.names) {
        if (!fs.seqs.count(name)) throw IoError("sequence cache lacks scaffold " + name + ": delete " + paths.seqs);
    }
    log_stream() << "Loaded " << fs.names.size() << " scaffolds from cache " << paths.layout << "\n";
    return fs;
}

FastaScaffolds load_fasta_scaffolds(const std::string& fasta_path, const std::string& prefix, bool use_cache) {
    if (!use_cache) return parse_fasta_scaffolds(fasta_path);

    const FastaCachePaths paths(prefix);
    if (std::filesystem::is_regular_file(paths.layout) && std::filesystem::is_regular_file(paths.seqs)) {
        return read_fasta_cache(paths);
    }

    FastaScaffolds fs = parse_fasta_scaffolds(fasta_path);
    write_fasta_cache(fs, paths);
    return fs;
}

} // namespace scafbreak
