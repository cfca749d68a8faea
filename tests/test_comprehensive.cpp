#include <iostream>
#include <cassert>
#include <cmath>
#include <cstdint>
#include <set>
#include <string>
#include <vector>
#include <stdexcept>

#include "../src/core/types.hpp"
#include "../src/core/color_space.hpp"
#include "../src/core/delta_e.hpp"
#include "../src/core/pipeline.hpp"
#include "../src/mapping/color_clusterer.hpp"
#include "../src/mapping/canonical_namer.hpp"
#include "../src/mapping/named_colors.hpp"
#include "../src/render/artifact_builder.hpp"
#include "../src/render/artifact_writer.hpp"

using namespace hexvar;

#define TEST(name) static void test_##name()
#define RUN_TEST(name) do { \
    std::cout << "Running " #name "... "; \
    try { \
        test_##name(); \
        std::cout << "PASSED\n"; \
    } catch (const std::exception& e) { \
        std::cout << "FAILED: " << e.what() << "\n"; \
        failures++; \
    } catch (...) { \
        std::cout << "FAILED: unknown exception\n"; \
        failures++; \
    } \
} while(0)

int failures = 0;

static bool approx(float a, float b, float eps) {
    return std::abs(a - b) < eps;
}

static ColorCounts counts_of(const std::vector<std::pair<std::string, uint64_t>>& rows) {
    ColorCounts counts;
    for (const auto& r : rows) counts.add(HexColor::parse(r.first), r.second);
    return counts;
}

static std::vector<ColorCluster> cluster_with(float threshold, const ColorCounts& counts) {
    ColorClusterer::Config cfg;
    cfg.threshold = threshold;
    return ColorClusterer(cfg).cluster(counts);
}

TEST(hex_color_normalization) {
    assert(HexColor::parse("#FF6347").str() == "#ff6347");
    assert(HexColor::parse("ff6347").str() == "#ff6347");
    assert(HexColor::parse("#FfF").str() == "#ffffff");
    assert(HexColor::parse("#11223344").str() == "#11223344");
    assert(HexColor::parse("#abc") == HexColor::parse("#AABBCC"));

    HexColor c = HexColor::parse("#0a141e");
    assert(c.rgb() == Rgb(10, 20, 30));
    assert(c.alpha() == 255);
    assert(!c.has_alpha());
    assert(c.digits() == "0a141e");

    HexColor translucent = HexColor::parse("#0a141e80");
    assert(translucent.has_alpha());
    assert(translucent.alpha() == 0x80);
    assert(translucent.rgb() == c.rgb());
}

TEST(color_counts_first_seen_order) {
    ColorCounts counts;
    counts.add(HexColor::parse("#222222"));
    counts.add(HexColor::parse("#111111"), 3);
    counts.add(HexColor::parse("#222"), 2);

    assert(counts.size() == 2);
    assert(counts.entries()[0].hex.str() == "#222222");
    assert(counts.entries()[0].count == 3);
    assert(counts.entries()[1].hex.str() == "#111111");
    assert(counts.count(HexColor::parse("#111111")) == 3);
    assert(counts.count(HexColor::parse("#333333")) == 0);
    assert(counts.total() == 6);
}

TEST(srgb_transfer_curve) {
    assert(ColorSpace::srgb_to_linear(static_cast<uint8_t>(0)) == 0.0f);
    assert(approx(ColorSpace::srgb_to_linear(static_cast<uint8_t>(255)), 1.0f, 1e-6f));
    // 10/255 sits on the linear segment.
    assert(approx(ColorSpace::srgb_to_linear(static_cast<uint8_t>(10)), (10.0f / 255.0f) / 12.92f, 1e-7f));
    assert(approx(ColorSpace::srgb_to_linear(static_cast<uint8_t>(128)), 0.2158605f, 1e-5f));

    for (int i = 0; i < 256; ++i) {
        uint8_t v = static_cast<uint8_t>(i);
        assert(ColorSpace::linear_to_srgb(ColorSpace::srgb_to_linear(v)) == v);
    }
}

TEST(lab_reference_values) {
    Lab red = ColorSpace::to_lab(HexColor::parse("#ff0000"));
    assert(approx(red.L, 53.2408f, 0.01f));
    assert(approx(red.a, 80.0925f, 0.01f));
    assert(approx(red.b, 67.2032f, 0.01f));

    Lab green = ColorSpace::to_lab(HexColor::parse("#00ff00"));
    assert(approx(green.L, 87.7347f, 0.01f));
    assert(approx(green.a, -86.1827f, 0.01f));
    assert(approx(green.b, 83.1793f, 0.01f));

    Lab blue = ColorSpace::to_lab(HexColor::parse("#0000ff"));
    assert(approx(blue.L, 32.2970f, 0.01f));
    assert(approx(blue.a, 79.1875f, 0.01f));
    assert(approx(blue.b, -107.8602f, 0.01f));

    Lab white = ColorSpace::to_lab(HexColor::parse("#ffffff"));
    assert(approx(white.L, 100.0f, 0.01f));
    assert(approx(white.a, 0.0f, 0.01f));
    assert(approx(white.b, 0.0f, 0.01f));

    Lab black = ColorSpace::to_lab(HexColor::parse("#000000"));
    assert(approx(black.L, 0.0f, 1e-3f) && approx(black.a, 0.0f, 1e-3f) && approx(black.b, 0.0f, 1e-3f));

    Lab gray = ColorSpace::to_lab(HexColor::parse("#808080"));
    assert(approx(gray.L, 53.5850f, 0.01f));
}

TEST(to_lab_is_deterministic) {
    Lab a = ColorSpace::to_lab(std::string("#3366CC"));
    Lab b = ColorSpace::to_lab(HexColor::parse("#3366cc"));
    assert(a == b);
}

TEST(to_hex_and_lab_round_trip) {
    assert(ColorSpace::to_hex(Rgb(255, 99, 71)).str() == "#ff6347");
    assert(ColorSpace::to_hex(Rgb(1, 2, 3), 0x40).str() == "#01020340");
    assert(ColorSpace::to_hex(Rgb(1, 2, 3), 255).str() == "#010203");

    // Lossy in general; primaries and greys survive 8-bit quantization.
    for (const char* hex : {"#ff0000", "#00ff00", "#0000ff", "#808080", "#ffffff", "#000000"}) {
        HexColor c = HexColor::parse(hex);
        Rgb back = ColorSpace::lab_to_rgb(ColorSpace::to_lab(c));
        assert(ColorSpace::to_hex(back) == c);
    }
}

TEST(delta_e_reference_pairs) {
    auto de = [](const char* a, const char* b) {
        return delta_e(HexColor::parse(a), HexColor::parse(b));
    };
    assert(approx(de("#000000", "#ffffff"), 100.0f, 0.01f));
    assert(approx(de("#ff0000", "#00ff00"), 170.5652f, 0.02f));
    assert(approx(de("#ff0000", "#0000ff"), 176.3140f, 0.02f));
    assert(approx(de("#ff6347", "#ff6350"), 4.6899f, 0.01f));
    assert(approx(de("#888888", "#878787"), 0.3879f, 0.01f));
    assert(approx(de("#777777", "#888888"), 6.6690f, 0.01f));
    assert(approx(de("#336699", "#3366cc"), 31.4689f, 0.01f));
}

TEST(delta_e_metric_properties) {
    const char* samples[] = {"#000000", "#ffffff", "#ff6347", "#336699", "#abcdef", "#123456", "#808080"};
    for (const char* a : samples) {
        Lab la = ColorSpace::to_lab(HexColor::parse(a));
        assert(delta_e(la, la) == 0.0f);
        for (const char* b : samples) {
            Lab lb = ColorSpace::to_lab(HexColor::parse(b));
            float ab = delta_e(la, lb);
            assert(ab >= 0.0f);
            assert(ab == delta_e(lb, la));
            if (std::string(a) != b) assert(ab > 0.0f);
        }
    }
}

TEST(cluster_scenario_similar_tomatoes) {
    auto clusters = cluster_with(10.0f, counts_of({{"#ff6347", 5}, {"#ff6350", 2}, {"#ff6348", 1}}));
    assert(clusters.size() == 1);
    assert(clusters[0].representative.str() == "#ff6347");
    assert(clusters[0].members.size() == 3);
    assert(clusters[0].total_count() == 8);
    assert(clusters[0].contains(HexColor::parse("#ff6350")));
    assert(clusters[0].contains(HexColor::parse("#ff6348")));
}

TEST(cluster_scenario_near_greys) {
    auto clusters = cluster_with(10.0f, counts_of({{"#888888", 3}, {"#878787", 1}}));
    assert(clusters.size() == 1);
    assert(clusters[0].representative.str() == "#888888");
}

TEST(cluster_scenario_black_and_white) {
    auto clusters = cluster_with(10.0f, counts_of({{"#000000", 1}, {"#ffffff", 1}}));
    assert(clusters.size() == 2);
    assert(clusters[0].representative.str() == "#000000");
    assert(clusters[1].representative.str() == "#ffffff");
    assert(clusters[0].members.size() == 1);
    assert(clusters[1].members.size() == 1);
}

TEST(cluster_empty_input) {
    auto clusters = cluster_with(10.0f, ColorCounts{});
    assert(clusters.empty());
}

TEST(cluster_singleton) {
    auto clusters = cluster_with(10.0f, counts_of({{"#123456", 1}}));
    assert(clusters.size() == 1);
    assert(clusters[0].representative.str() == "#123456");
}

TEST(cluster_first_match_not_nearest) {
    // #777777 is 6.84 from #666666 and 3.55 from #808080; #666666 opened first.
    auto clusters = cluster_with(10.0f, counts_of({{"#666666", 5}, {"#808080", 4}, {"#777777", 1}}));
    assert(clusters.size() == 2);
    assert(clusters[0].representative.str() == "#666666");
    assert(clusters[1].representative.str() == "#808080");
    assert(clusters[0].contains(HexColor::parse("#777777")));
    assert(!clusters[1].contains(HexColor::parse("#777777")));
}

TEST(cluster_visits_by_descending_count) {
    // The less frequent color seen first must not become the representative.
    auto clusters = cluster_with(10.0f, counts_of({{"#ff6350", 1}, {"#ff6347", 9}}));
    assert(clusters.size() == 1);
    assert(clusters[0].representative.str() == "#ff6347");
    assert(clusters[0].members[0].hex.str() == "#ff6347");
}

TEST(cluster_count_ties_follow_first_seen) {
    auto a = cluster_with(10.0f, counts_of({{"#777777", 2}, {"#888888", 2}}));
    assert(a.size() == 1 && a[0].representative.str() == "#777777");

    auto b = cluster_with(10.0f, counts_of({{"#888888", 2}, {"#777777", 2}}));
    assert(b.size() == 1 && b[0].representative.str() == "#888888");
}

TEST(cluster_threshold_is_strict) {
    // #777777 <-> #888888 is ~6.669
    assert(cluster_with(6.6f, counts_of({{"#777777", 1}, {"#888888", 1}})).size() == 2);
    assert(cluster_with(6.7f, counts_of({{"#777777", 1}, {"#888888", 1}})).size() == 1);
    // Zero threshold never merges distinct colors.
    assert(cluster_with(0.0f, counts_of({{"#888888", 1}, {"#878787", 1}})).size() == 2);
}

TEST(cluster_partition_threshold_and_representative_properties) {
    ColorCounts counts;
    uint32_t state = 12345u;
    for (int i = 0; i < 300; ++i) {
        state = state * 1664525u + 1013904223u;
        Rgb rgb(static_cast<uint8_t>(state >> 24),
                static_cast<uint8_t>(state >> 16),
                static_cast<uint8_t>(state >> 8));
        counts.add(ColorSpace::to_hex(rgb), 1 + (state % 7));
    }

    const float threshold = 12.0f;
    auto clusters = cluster_with(threshold, counts);

    std::set<std::string> seen;
    size_t members = 0;
    for (const auto& c : clusters) {
        assert(!c.members.empty());
        assert(c.members[0].hex == c.representative);
        assert(c.lab == ColorSpace::to_lab(c.representative));
        for (const auto& m : c.members) {
            assert(seen.insert(m.hex.str()).second);
            assert(m.count == counts.count(m.hex));
            assert(delta_e(ColorSpace::to_lab(m.hex), c.lab) < threshold);
            assert(m.count <= c.members[0].count);
            ++members;
        }
    }
    assert(members == counts.size());
    for (const auto& e : counts.entries()) {
        assert(seen.count(e.hex.str()) == 1);
    }
}

TEST(cluster_is_deterministic) {
    ColorCounts counts = counts_of({{"#ff6347", 5}, {"#ff6350", 2}, {"#336699", 2}, {"#3366cc", 2},
                                    {"#ffffff", 7}, {"#fafafa", 1}, {"#000", 4}, {"#111111", 4}});
    auto a = cluster_with(10.0f, counts);
    auto b = cluster_with(10.0f, counts);
    assert(a.size() == b.size());
    for (size_t i = 0; i < a.size(); ++i) {
        assert(a[i].representative == b[i].representative);
        assert(a[i].members.size() == b[i].members.size());
        for (size_t j = 0; j < a[i].members.size(); ++j) {
            assert(a[i].members[j].hex == b[i].members[j].hex);
        }
    }
}

TEST(named_table_lookup) {
    const NamedColorTable& css = NamedColorTable::css();
    assert(css.size() == 148);

    auto tomato = css.nearest(ColorSpace::to_lab(HexColor::parse("#ff6347")), 2.3f);
    assert(tomato && tomato->entry->name == "tomato");
    assert(tomato->distance == 0.0f);

    // aqua and cyan share a value; table order wins.
    auto aqua = css.nearest(ColorSpace::to_lab(HexColor::parse("#00ffff")), 2.3f);
    assert(aqua && aqua->entry->name == "aqua");

    auto near_red = css.nearest(ColorSpace::to_lab(HexColor::parse("#fd0000")), 2.3f);
    assert(near_red && near_red->entry->name == "red");

    assert(!css.nearest(ColorSpace::to_lab(HexColor::parse("#336699")), 2.3f));
}

TEST(namer_prefers_color_names) {
    auto clusters = cluster_with(10.0f, counts_of({{"#ff6347", 5}, {"#3366cc", 3}, {"#f5f5f5", 1}}));
    CanonicalNamer namer(NamedColorTable::css());
    auto named = namer.name(clusters);

    assert(named.size() == 3);
    assert(named[0].identifier == "color-tomato");
    assert(named[0].color_name == "tomato");
    assert(named[1].identifier == "color-3366cc");
    assert(named[1].color_name.empty());
    assert(named[2].identifier == "color-whitesmoke");
    assert(named[0].custom_property() == "--color-tomato");
    assert(named[0].replacement() == "var(--color-tomato)");
}

TEST(namer_resolves_collisions) {
    // Three distinct reds, all within naming distance of "red".
    auto clusters = cluster_with(0.5f, counts_of({{"#ff0000", 3}, {"#fd0000", 2}, {"#fc0101", 1}}));
    assert(clusters.size() == 3);

    CanonicalNamer namer(NamedColorTable::css());
    auto named = namer.name(clusters);
    assert(named[0].identifier == "color-red");
    assert(named[1].identifier == "color-red-1");
    assert(named[2].identifier == "color-red-2");
}

TEST(namer_identifiers_unique_and_valid) {
    ColorCounts counts;
    uint32_t state = 777u;
    for (int i = 0; i < 200; ++i) {
        state = state * 1664525u + 1013904223u;
        counts.add(ColorSpace::to_hex(Rgb(static_cast<uint8_t>(state >> 24),
                                          static_cast<uint8_t>(state >> 16),
                                          static_cast<uint8_t>(state >> 8))));
    }
    counts.add(HexColor::parse("#ff000080"));

    CanonicalNamer namer(NamedColorTable::css());
    auto named = namer.name(cluster_with(1.0f, counts));

    std::set<std::string> ids;
    for (const auto& nc : named) {
        assert(ids.insert(nc.identifier).second);
        assert(!nc.identifier.empty());
        assert(nc.identifier[0] >= 'a' && nc.identifier[0] <= 'z');
        for (char c : nc.identifier) {
            assert((c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '-');
        }
    }
}

TEST(namer_uses_injected_table) {
    NamedColorTable brand({{"Brand Primary", "#3366CC"}, {"brand__accent!", "#ff6347"}});
    CanonicalNamer::Config cfg;
    cfg.prefix = "brand";
    CanonicalNamer namer(brand, cfg);

    auto named = namer.name(cluster_with(10.0f, counts_of({{"#3366cc", 2}, {"#ff6347", 1}, {"#000000", 1}})));
    assert(named[0].identifier == "brand-brand-primary");
    assert(named[1].identifier == "brand-brand-accent");
    assert(named[2].identifier == "brand-000000");
}

TEST(slugify_rules) {
    assert(CanonicalNamer::slugify("AliceBlue") == "aliceblue");
    assert(CanonicalNamer::slugify("  Deep -- Sky_Blue  ") == "deep-sky-blue");
    assert(CanonicalNamer::slugify("***").empty());
    assert(CanonicalNamer::is_valid_prefix("color"));
    assert(CanonicalNamer::is_valid_prefix("ds-color2"));
    assert(!CanonicalNamer::is_valid_prefix("2color"));
    assert(!CanonicalNamer::is_valid_prefix("Color"));
    assert(!CanonicalNamer::is_valid_prefix("color-"));
    assert(!CanonicalNamer::is_valid_prefix(""));
}

TEST(artifacts_cover_every_input) {
    ColorCounts counts = counts_of({{"#ff6350", 2}, {"#ff6347", 5}, {"#000000", 1}, {"#ff6348", 1}});
    CanonicalNamer namer(NamedColorTable::css());
    auto named = namer.name(cluster_with(10.0f, counts));
    Artifacts art = ArtifactBuilder::build(named, counts);

    assert(art.declarations.size() == 2);
    assert(art.declarations[0].identifier == "color-tomato");
    assert(art.declarations[0].hex.str() == "#ff6347");
    assert(art.declarations[1].identifier == "color-black");

    assert(art.mapping.size() == counts.size());
    for (size_t i = 0; i < counts.size(); ++i) {
        assert(art.mapping[i].original == counts.entries()[i].hex);
    }
    const MappingEntry* m = art.find(HexColor::parse("#ff6348"));
    assert(m && m->identifier == "color-tomato" && m->representative.str() == "#ff6347");
    assert(!art.find(HexColor::parse("#abcdef")));

    assert(art.audit.size() == counts.size());
    assert(art.audit.entries()[0].hex.str() == "#ff6350");
    assert(art.audit.entries()[0].count == 2);
}

TEST(render_outputs) {
    ColorCounts counts = counts_of({{"#ff6347", 5}, {"#ff6350", 2}});
    CanonicalNamer namer(NamedColorTable::css());
    Artifacts art = ArtifactBuilder::build(namer.name(cluster_with(10.0f, counts)), counts);

    assert(render_css_vars(art) == ":root {\n    --color-tomato: #ff6347;\n}\n");
    assert(render_audit_json(counts) == "{\n  \"#ff6347\": 5,\n  \"#ff6350\": 2\n}");

    std::string mapping = render_mapping_json(art);
    assert(mapping.find("\"#ff6350\": {") != std::string::npos);
    assert(mapping.find("\"replacement\": \"var(--color-tomato)\"") != std::string::npos);

    assert(json_escape("a\"b\\c\n") == "a\\\"b\\\\c\\n");
    assert(render_audit_json(ColorCounts{}) == "{}");
}

TEST(pipeline_scenarios) {
    Pipeline pipeline(NamedColorTable::css());
    Pipeline::Output out;

    Result r = pipeline.process({{"#ff6347", 5}, {"#ff6350", 2}, {"#ff6348", 1}}, out);
    assert(r.success());
    assert(out.clusters.size() == 1);
    assert(out.clusters[0].identifier == "color-tomato");
    assert(out.artifacts.mapping.size() == 3);
    for (const auto& m : out.artifacts.mapping) {
        assert(m.representative.str() == "#ff6347");
    }

    r = pipeline.process({{"#000000", 1}, {"#ffffff", 1}}, out);
    assert(r.success());
    assert(out.clusters.size() == 2);
    assert(out.clusters[0].identifier == "color-black");
    assert(out.clusters[1].identifier == "color-white");

    r = pipeline.process(ColorCounts{}, out);
    assert(r.success());
    assert(out.clusters.empty());
    assert(out.artifacts.declarations.empty());
    assert(out.artifacts.mapping.empty());
    assert(out.artifacts.audit.empty());
}

TEST(pipeline_merges_spellings) {
    Pipeline pipeline(NamedColorTable::css());
    Pipeline::Output out;
    Result r = pipeline.process({{"#FFF", 2}, {"#ffffff", 1}, {"#Ff6347", 1}}, out);
    assert(r.success());
    assert(out.artifacts.audit.size() == 2);
    assert(out.artifacts.audit.count(HexColor::parse("#ffffff")) == 3);
}

int main() {
    std::cout << "=== hexvar Comprehensive Test Suite ===\n\n";

    std::cout << "--- Data Model Tests ---\n";
    RUN_TEST(hex_color_normalization);
    RUN_TEST(color_counts_first_seen_order);

    std::cout << "\n--- Color Space Tests ---\n";
    RUN_TEST(srgb_transfer_curve);
    RUN_TEST(lab_reference_values);
    RUN_TEST(to_lab_is_deterministic);
    RUN_TEST(to_hex_and_lab_round_trip);

    std::cout << "\n--- Delta E Tests ---\n";
    RUN_TEST(delta_e_reference_pairs);
    RUN_TEST(delta_e_metric_properties);

    std::cout << "\n--- Clusterer Tests ---\n";
    RUN_TEST(cluster_scenario_similar_tomatoes);
    RUN_TEST(cluster_scenario_near_greys);
    RUN_TEST(cluster_scenario_black_and_white);
    RUN_TEST(cluster_empty_input);
    RUN_TEST(cluster_singleton);
    RUN_TEST(cluster_first_match_not_nearest);
    RUN_TEST(cluster_visits_by_descending_count);
    RUN_TEST(cluster_count_ties_follow_first_seen);
    RUN_TEST(cluster_threshold_is_strict);
    RUN_TEST(cluster_partition_threshold_and_representative_properties);
    RUN_TEST(cluster_is_deterministic);

    std::cout << "\n--- Namer Tests ---\n";
    RUN_TEST(named_table_lookup);
    RUN_TEST(namer_prefers_color_names);
    RUN_TEST(namer_resolves_collisions);
    RUN_TEST(namer_identifiers_unique_and_valid);
    RUN_TEST(namer_uses_injected_table);
    RUN_TEST(slugify_rules);

    std::cout << "\n--- Artifact Tests ---\n";
    RUN_TEST(artifacts_cover_every_input);
    RUN_TEST(render_outputs);

    std::cout << "\n--- Pipeline Tests ---\n";
    RUN_TEST(pipeline_scenarios);
    RUN_TEST(pipeline_merges_spellings);

    std::cout << "\n=== Test Summary ===\n";
    std::cout << "Failures: " << failures << "\n";

    if (failures == 0) {
        std::cout << "\nAll tests passed.\n";
        return 0;
    }
    std::cout << "\nSome tests failed.\n";
    return 1;
}
