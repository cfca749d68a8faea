#include "core/types.hpp"
#include "core/config.hpp"
#include "core/delta_e.hpp"
#include "core/pipeline.hpp"
#include "mapping/named_colors.hpp"
#include "render/artifact_writer.hpp"
#include "scan/file_scanner.hpp"
#include "scan/file_rewriter.hpp"
#include "cli/args.hpp"

#include <chrono>
#include <iomanip>
#include <iostream>
#include <string>
#include <vector>

namespace {

void print_summary(const hexvar::FileScanner::ScanResult& scan,
                   const hexvar::Pipeline::Output& output,
                   const hexvar::Config& config,
                   double seconds) {
    std::cerr << "\n==== HEXVAR SUMMARY ====\n";
    if (scan.counts.empty()) {
        std::cerr << "No hex codes found in " << scan.files.size() << " files.\n";
    } else {
        std::cerr << "Files scanned:      " << scan.files.size() << "\n";
        std::cerr << "Unique hex codes:   " << scan.counts.size() << "\n";
        std::cerr << "Total occurrences:  " << scan.counts.total() << "\n";
        std::cerr << "Canonical colors:   " << output.clusters.size() << "\n";
    }
    std::cerr << "Threshold:          " << config.cluster.threshold << " (config " << config.compute_hash() << ")\n";
    std::cerr << std::fixed << std::setprecision(3)
              << "Elapsed:            " << seconds << "s\n";
    std::cerr.unsetf(std::ios::floatfield);
    std::cerr << "========================\n\n";
}

void print_clusters(const std::vector<hexvar::NamedCluster>& clusters) {
    for (const auto& nc : clusters) {
        std::cerr << "--" << nc.identifier << ": " << nc.cluster.representative.str()
                  << " (" << nc.cluster.total_count() << " uses";
        if (!nc.color_name.empty()) std::cerr << ", named " << nc.color_name;
        std::cerr << ")\n";
        for (const auto& m : nc.cluster.members) {
            if (m.hex == nc.cluster.representative) continue;
            float d = hexvar::delta_e(hexvar::ColorSpace::to_lab(m.hex), nc.cluster.lab);
            std::cerr << "    " << m.hex.str() << " x" << m.count
                      << std::fixed << std::setprecision(2) << "  dE=" << d << "\n";
            std::cerr.unsetf(std::ios::floatfield);
        }
    }
}

bool write_output(const std::string& path, const std::string& content, const char* what) {
    hexvar::Result r = hexvar::write_text_file(path, content);
    if (r.failure()) {
        std::cerr << "Error: Failed to write " << what << " " << path << ": " << r.message << "\n";
        return false;
    }
    std::cerr << "Wrote " << what << " to " << path << "\n";
    return true;
}

}  // namespace

int main(int argc, char* argv[]) {
    hexvar::Args args = hexvar::parse_args(argc, argv);

    if (args.show_help) {
        hexvar::print_help(argv[0]);
        return 0;
    }
    if (!args.error.empty()) {
        std::cerr << "Error: " << args.error << "\n";
        return 2;
    }

    hexvar::Config config = hexvar::Config::defaults();
    if (!args.config_path.empty()) {
        std::string load_error;
        auto loaded = hexvar::Config::load(args.config_path, load_error);
        if (!loaded) {
            std::cerr << "Error: Failed to load config file: " << load_error << "\n";
            return 1;
        }
        config = hexvar::merge_config(config, *loaded);
    } else {
        std::string load_error;
        auto loaded_default = hexvar::Config::load_default(load_error);
        if (loaded_default) {
            config = hexvar::merge_config(config, *loaded_default);
        } else if (!load_error.empty()) {
            std::cerr << "Error: Failed to load config file " << hexvar::Config::default_config_path()
                      << ": " << load_error << "\n";
            return 1;
        }
    }
    config = hexvar::apply_cli_overrides(config, args);

    if (config.scan.patterns.empty()) {
        std::cerr << "Error: No input patterns specified\n";
        hexvar::print_help(argv[0]);
        return 1;
    }

    std::string config_error;
    if (!config.validate(config_error)) {
        std::cerr << "Error: Invalid config: " << config_error << "\n";
        return 1;
    }

    auto started = std::chrono::steady_clock::now();

    hexvar::FileScanner::Config scan_cfg;
    scan_cfg.patterns = config.scan.patterns;
    scan_cfg.ignore = config.scan.ignore;
    scan_cfg.exclude_dirs = config.scan.exclude_dirs;
    scan_cfg.extensions = config.scan.extensions;
    scan_cfg.parallel = config.scan.parallel;
    scan_cfg.progress = config.scan.progress ? &std::cerr : nullptr;
    hexvar::FileScanner scanner(scan_cfg);

    hexvar::FileScanner::ScanResult scan = scanner.scan();
    for (const auto& path : scan.unreadable) {
        std::cerr << "Warning: Failed to read " << path << "\n";
    }

    hexvar::Pipeline::Config pipeline_cfg;
    pipeline_cfg.threshold = config.cluster.threshold;
    pipeline_cfg.name_threshold = config.naming.name_threshold;
    pipeline_cfg.prefix = config.naming.prefix;
    hexvar::Pipeline pipeline(hexvar::NamedColorTable::css(), pipeline_cfg);

    hexvar::Pipeline::Output output;
    hexvar::Result result = pipeline.process(scan.counts, output);
    if (result.failure()) {
        std::cerr << "Error: " << hexvar::error_code_name(result.error) << ": " << result.message << "\n";
        return 1;
    }

    double seconds = std::chrono::duration<double>(std::chrono::steady_clock::now() - started).count();
    print_summary(scan, output, config, seconds);
    if (config.verbose) {
        print_clusters(output.clusters);
    }

    bool ok = true;
    if (!config.output.css_vars.empty()) {
        ok = write_output(config.output.css_vars, hexvar::render_css_vars(output.artifacts), "CSS variables") && ok;
    }
    if (!config.output.mapping.empty()) {
        ok = write_output(config.output.mapping, hexvar::render_mapping_json(output.artifacts), "refactor mapping") && ok;
    }

    std::string report = hexvar::render_audit_json(output.artifacts.audit);
    if (!config.output.json.empty()) {
        ok = write_output(config.output.json, report, "color report") && ok;
    } else {
        std::cout << report << "\n";
    }

    if (config.output.rewrite) {
        if (!ok) {
            std::cerr << "Error: Skipping rewrite because an output could not be written\n";
            return 1;
        }
        hexvar::FileRewriter rewriter(output.artifacts);
        auto rewrite = rewriter.rewrite_files(scan.files, {config.output.css_vars}, config.output.dry_run);
        for (const auto& path : rewrite.failed) {
            std::cerr << "Warning: Failed to rewrite " << path << "\n";
        }
        for (const auto& path : rewrite.changed) {
            std::cerr << (config.output.dry_run ? "Would rewrite " : "Rewrote ") << path << "\n";
        }
        std::cerr << (config.output.dry_run ? "Dry run: " : "")
                  << rewrite.replacements << " replacements in "
                  << rewrite.files_changed << " of " << rewrite.files_scanned << " files\n";
        if (!rewrite.failed.empty()) ok = false;
    }

    return ok ? 0 : 1;
}
