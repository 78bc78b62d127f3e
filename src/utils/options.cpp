#include "utils/options.h"
#include "utils/config.h"
#include "utils/errors.h"
#include <array>
#include <charconv>
#include <utility>

namespace {

template <typename E, size_t N>
E lookup_name(const std::array<std::pair<std::string_view, E>, N>& table, std::string_view name, const char* what) {
    for (const auto& [key, value] : table) {
        if (key == name) return value;
    }
    throw OptionError(std::string("unknown ") + what + " '" + std::string(name) + "'");
}

template <typename E, size_t N>
std::string lookup_value(const std::array<std::pair<std::string_view, E>, N>& table, E value) {
    for (const auto& [key, v] : table) {
        if (v == value) return std::string(key);
    }
    return "unknown";
}

constexpr std::array<std::pair<std::string_view, PieceTypeOrder>, 7> TYPE_ORDER_NAMES = {{
    {"random_order", PieceTypeOrder::RandomOrder},
    {"corners_edges_normal", PieceTypeOrder::CornersEdgesNormal},
    {"normal_edges_corners", PieceTypeOrder::NormalEdgesCorners},
    {"edges_normal_corners", PieceTypeOrder::EdgesNormalCorners},
    {"corners_normal_edges", PieceTypeOrder::CornersNormalEdges},
    {"normal_corners_edges", PieceTypeOrder::NormalCornersEdges},
    {"edges_corners_normal", PieceTypeOrder::EdgesCornersNormal},
}};

constexpr std::array<std::pair<std::string_view, PieceOrderStrategy>, 3> STRATEGY_NAMES = {{
    {"random_order", PieceOrderStrategy::RandomOrder},
    {"every_piece_fits", PieceOrderStrategy::EveryPieceFits},
    {"least_merges_possible", PieceOrderStrategy::LeastMergesPossible},
}};

constexpr std::array<std::pair<std::string_view, Orientation>, 4> ORIENTATION_NAMES = {{
    {"square", Orientation::Square},
    {"landscape", Orientation::Landscape},
    {"portrait", Orientation::Portrait},
    {"custom", Orientation::Custom},
}};

int parse_int(std::string_view key, std::string_view value) {
    int out = 0;
    auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), out);
    if (ec != std::errc() || ptr != value.data() + value.size()) {
        throw OptionError(std::string(key) + ": '" + std::string(value) + "' is not an integer");
    }
    return out;
}

bool parse_bool(std::string_view key, std::string_view value) {
    if (value == "true" || value == "1" || value == "on") return true;
    if (value == "false" || value == "0" || value == "off") return false;
    throw OptionError(std::string(key) + ": '" + std::string(value) + "' is not a boolean");
}

void check_range(const char* key, int value, int lo, int hi) {
    if (value < lo || value > hi) {
        throw OptionError(std::string(key) + " = " + std::to_string(value) + " outside [" +
                          std::to_string(lo) + ", " + std::to_string(hi) + "]");
    }
}

} // namespace

double JigsawOptions::orientation_ratio() const {
    switch (orientation_of_image) {
        case Orientation::Landscape: return 1.5;
        case Orientation::Portrait: return 0.8;
        case Orientation::Custom: return static_cast<double>(width_of_image) / height_of_image;
        case Orientation::Square: break;
    }
    return 1.0;
}

PieceTypeOrder parse_piece_type_order(std::string_view name) {
    return lookup_name(TYPE_ORDER_NAMES, name, "piece_order_type");
}

PieceOrderStrategy parse_piece_order_strategy(std::string_view name) {
    return lookup_name(STRATEGY_NAMES, name, "piece_order");
}

Orientation parse_orientation(std::string_view name) {
    return lookup_name(ORIENTATION_NAMES, name, "orientation_of_image");
}

std::string to_string(PieceTypeOrder v) { return lookup_value(TYPE_ORDER_NAMES, v); }
std::string to_string(PieceOrderStrategy v) { return lookup_value(STRATEGY_NAMES, v); }
std::string to_string(Orientation v) { return lookup_value(ORIENTATION_NAMES, v); }

bool parse_option(JigsawOptions& opts, std::string_view arg) {
    if (arg.starts_with("--")) arg.remove_prefix(2);
    const size_t eq = arg.find('=');
    if (eq == std::string_view::npos) return false;
    const std::string_view key = arg.substr(0, eq);
    const std::string_view value = arg.substr(eq + 1);

    if (key == "number_of_pieces") opts.number_of_pieces = parse_int(key, value);
    else if (key == "orientation_of_image") opts.orientation_of_image = parse_orientation(value);
    else if (key == "width_of_image") opts.width_of_image = parse_int(key, value);
    else if (key == "height_of_image") opts.height_of_image = parse_int(key, value);
    else if (key == "which_image") opts.which_image = parse_int(key, value);
    else if (key == "piece_order_type") opts.piece_order_type = parse_piece_type_order(value);
    else if (key == "strictness_piece_order_type") opts.strictness_piece_order_type = parse_int(key, value);
    else if (key == "piece_order") opts.piece_order = parse_piece_order_strategy(value);
    else if (key == "strictness_piece_order") opts.strictness_piece_order = parse_int(key, value);
    else if (key == "number_of_checks_out_of_logic") opts.number_of_checks_out_of_logic = parse_int(key, value);
    else if (key == "percentage_of_extra_pieces") opts.percentage_of_extra_pieces = parse_int(key, value);
    else if (key == "percentage_of_merges_that_are_checks") opts.percentage_of_merges_that_are_checks = parse_int(key, value);
    else if (key == "maximum_number_of_checks") opts.maximum_number_of_checks = parse_int(key, value);
    else if (key == "merge_based_logic") opts.merge_based_logic = parse_bool(key, value);
    else return false;
    return true;
}

void validate_options(const JigsawOptions& opts) {
    check_range("number_of_pieces", opts.number_of_pieces, JigsawConfig::MIN_PIECES, JigsawConfig::MAX_PIECES);
    check_range("width_of_image", opts.width_of_image, 1, 100000);
    check_range("height_of_image", opts.height_of_image, 1, 100000);
    check_range("which_image", opts.which_image, 1, 100);
    check_range("strictness_piece_order_type", opts.strictness_piece_order_type, 0, 100);
    check_range("strictness_piece_order", opts.strictness_piece_order, 0, 100);
    check_range("number_of_checks_out_of_logic", opts.number_of_checks_out_of_logic, 0, 15);
    check_range("percentage_of_extra_pieces", opts.percentage_of_extra_pieces, 0, 100);
    check_range("percentage_of_merges_that_are_checks", opts.percentage_of_merges_that_are_checks, 0, 100);
    check_range("maximum_number_of_checks", opts.maximum_number_of_checks, 0, 1000);
}
