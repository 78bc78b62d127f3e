#pragma once
#include <string>
#include <string_view>

enum class Orientation { Square, Landscape, Portrait, Custom };

// Order in which the piece kinds are handed out.
enum class PieceTypeOrder {
    RandomOrder,
    CornersEdgesNormal,
    NormalEdgesCorners,
    EdgesNormalCorners,
    CornersNormalEdges,
    NormalCornersEdges,
    EdgesCornersNormal
};

enum class PieceOrderStrategy { RandomOrder, EveryPieceFits, LeastMergesPossible };

struct JigsawOptions {
    int number_of_pieces = 25;
    Orientation orientation_of_image = Orientation::Square;
    int width_of_image = 2034;
    int height_of_image = 2112;
    int which_image = 1;
    PieceTypeOrder piece_order_type = PieceTypeOrder::CornersEdgesNormal;
    int strictness_piece_order_type = 100;
    PieceOrderStrategy piece_order = PieceOrderStrategy::EveryPieceFits;
    int strictness_piece_order = 100;
    int number_of_checks_out_of_logic = 0;
    int percentage_of_extra_pieces = 10;
    int percentage_of_merges_that_are_checks = 100;
    int maximum_number_of_checks = 1000;
    bool merge_based_logic = false;

    // Width / height ratio of the image the grid is cut from.
    double orientation_ratio() const;
};

// Applies one "--key=value" (or "key=value") argument.
// Returns false when the key is not an option key; throws OptionError on a bad value.
bool parse_option(JigsawOptions& opts, std::string_view arg);

// Throws OptionError naming the first option outside its range.
void validate_options(const JigsawOptions& opts);

PieceTypeOrder parse_piece_type_order(std::string_view name);
PieceOrderStrategy parse_piece_order_strategy(std::string_view name);
Orientation parse_orientation(std::string_view name);

std::string to_string(PieceTypeOrder v);
std::string to_string(PieceOrderStrategy v);
std::string to_string(Orientation v);
