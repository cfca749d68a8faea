#pragma once

#include <string>
#include <vector>

namespace hexvar {

struct Args {
    std::vector<std::string> patterns;
    std::vector<std::string> ignore;
    std::string out;
    std::string css_vars;
    std::string mapping;
    std::string config_path;
    std::string prefix;

    float threshold = 10.0f;
    bool threshold_set = false;
    float name_threshold = 2.3f;
    bool name_threshold_set = false;

    bool rewrite = false;
    bool dry_run = false;
    bool no_parallel = false;
    bool no_progress = false;
    bool verbose = false;

    bool show_help = false;
    std::string error;
};

Args parse_args(int argc, char* argv[]);
void print_help(const char* prog);

}
