#include "args.hpp"
#include <cstring>
#include <cstdlib>
#include <cstdio>

namespace hexvar {

static bool parse_float(const char* text, float& out) {
    if (!text || !*text) return false;
    char* end = nullptr;
    double v = std::strtod(text, &end);
    if (end == text || *end != '\0') return false;
    out = static_cast<float>(v);
    return true;
}

Args parse_args(int argc, char* argv[]) {
    Args args;

    auto take_value = [&](int& i, const char* flag) -> const char* {
        if (i + 1 < argc) return argv[++i];
        args.error = std::string("missing value for ") + flag;
        return nullptr;
    };

    auto take_path = [&](int& i, const char* flag, std::string& out) {
        const char* v = take_value(i, flag);
        if (!v) return;
        if (!*v) {
            args.error = std::string("empty path for ") + flag;
            return;
        }
        out = v;
    };

    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];

        if (strcmp(arg, "-h") == 0 || strcmp(arg, "--help") == 0) {
            args.show_help = true;
            return args;
        }

        if (strcmp(arg, "-o") == 0 || strcmp(arg, "--out") == 0) {
            take_path(i, arg, args.out);
        }
        else if (strcmp(arg, "--css-vars") == 0) {
            take_path(i, arg, args.css_vars);
        }
        else if (strcmp(arg, "--mapping") == 0) {
            take_path(i, arg, args.mapping);
        }
        else if (strcmp(arg, "--config") == 0) {
            take_path(i, arg, args.config_path);
        }
        else if (strcmp(arg, "-i") == 0 || strcmp(arg, "--ignore") == 0) {
            if (const char* v = take_value(i, arg)) args.ignore.push_back(v);
        }
        else if (strcmp(arg, "-t") == 0 || strcmp(arg, "--threshold") == 0) {
            if (const char* v = take_value(i, arg)) {
                if (parse_float(v, args.threshold)) {
                    args.threshold_set = true;
                } else {
                    args.error = std::string("invalid threshold '") + v + "'";
                }
            }
        }
        else if (strcmp(arg, "--name-threshold") == 0) {
            if (const char* v = take_value(i, arg)) {
                if (parse_float(v, args.name_threshold)) {
                    args.name_threshold_set = true;
                } else {
                    args.error = std::string("invalid name threshold '") + v + "'";
                }
            }
        }
        else if (strcmp(arg, "--prefix") == 0) {
            if (const char* v = take_value(i, arg)) args.prefix = v;
        }
        else if (strcmp(arg, "--rewrite") == 0) {
            args.rewrite = true;
        }
        else if (strcmp(arg, "--dry-run") == 0) {
            args.dry_run = true;
        }
        else if (strcmp(arg, "--no-parallel") == 0) {
            args.no_parallel = true;
        }
        else if (strcmp(arg, "--no-progress") == 0) {
            args.no_progress = true;
        }
        else if (strcmp(arg, "-v") == 0 || strcmp(arg, "--verbose") == 0) {
            args.verbose = true;
        }
        else if (arg[0] == '-' && arg[1] != '\0') {
            args.error = std::string("unknown option ") + arg;
        }
        else {
            args.patterns.push_back(arg);
        }
    }

    return args;
}

void print_help(const char* prog) {
    printf("Usage: %s [OPTIONS] <GLOB>...\n\n", prog);
    printf("Scan stylesheets for hex colors, merge near-identical ones and name them.\n\n");
    printf("GLOB:\n");
    printf("  Glob patterns to include (e.g. \"src/**/*.css\"); a directory scans everything below it\n\n");
    printf("OPTIONS:\n");
    printf("  -o, --out <FILE>            Write the raw color count report (JSON) here instead of stdout\n");
    printf("      --css-vars <FILE>       Write canonical CSS custom properties\n");
    printf("      --mapping <FILE>        Write the original -> canonical refactor mapping (JSON)\n");
    printf("  -i, --ignore <TEXT>         Skip paths containing TEXT (repeatable)\n");
    printf("  -t, --threshold <N>         Merge colors closer than N Delta E (default: 10)\n");
    printf("      --name-threshold <N>    Use a named color within N Delta E (default: 2.3)\n");
    printf("      --prefix <NAME>         Identifier prefix (default: color)\n");
    printf("      --rewrite               Replace literals in scanned files with var(--identifier)\n");
    printf("      --dry-run               Report what --rewrite would change without writing\n");
    printf("      --config <FILE>         Config file path (default: platform-specific)\n");
    printf("      --no-parallel           Read files on a single thread\n");
    printf("      --no-progress           Do not print the file counter while scanning\n");
    printf("  -v, --verbose               Print cluster membership to stderr\n");
    printf("  -h, --help                  Show this help\n");
    printf("\nCONFIG FILE:\n");
    printf("  Default locations:\n");
    printf("    Linux:   ~/.config/hexvar/config.toml\n");
    printf("    macOS:   ~/Library/Application Support/hexvar/config.toml\n");
    printf("    Windows: %%APPDATA%%\\hexvar\\config.toml\n");
}

}
