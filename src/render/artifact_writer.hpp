#pragma once

#include "render/artifact_builder.hpp"
#include <string>

namespace hexvar {

std::string json_escape(const std::string& s);

// ":root { --id: #hex; ... }" in declaration order.
std::string render_css_vars(const Artifacts& artifacts);

// {"#orig": {"identifier": ..., "representative": ..., "replacement": "var(--id)"}}
std::string render_mapping_json(const Artifacts& artifacts);

// {"#hex": count} in first-seen order.
std::string render_audit_json(const ColorCounts& counts);

Result write_text_file(const std::string& path, const std::string& content);

}
