#include "data/slot_data.h"
#include "utils/errors.h"
#include <charconv>
#include <functional>
#include <map>
#include <sstream>

namespace {

int parse_int_field(std::string_view key, std::string_view value) {
    int out = 0;
    auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), out);
    if (ec != std::errc() || ptr != value.data() + value.size() || value.empty()) {
        throw OptionError("slot data " + std::string(key) + ": '" + std::string(value) + "' is not an integer");
    }
    return out;
}

double parse_double_field(std::string_view key, std::string_view value) {
    double out = 0.0;
    auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), out);
    if (ec != std::errc() || ptr != value.data() + value.size() || value.empty()) {
        throw OptionError("slot data " + std::string(key) + ": '" + std::string(value) + "' is not a number");
    }
    return out;
}

} // namespace

std::string serialize_int_list(const std::vector<int>& values) {
    std::string s;
    s.reserve(values.size() * 4);
    for (size_t i = 0; i < values.size(); ++i) {
        if (i > 0) s += ',';
        s += std::to_string(values[i]);
    }
    return s;
}

std::vector<int> parse_int_list(std::string_view text) {
    std::vector<int> out;
    if (text.empty()) return out;
    size_t start = 0;
    while (true) {
        const size_t comma = text.find(',', start);
        const std::string_view token = text.substr(start, comma == std::string_view::npos ? std::string_view::npos : comma - start);
        out.push_back(parse_int_field("list", token));
        if (comma == std::string_view::npos) break;
        start = comma + 1;
    }
    return out;
}

std::string serialize_slot_data(const SlotData& data) {
    // Shortest text that reads back to the same double, independent of locale.
    char orientation[32];
    const auto [end, ec] = std::to_chars(orientation, orientation + sizeof(orientation), data.orientation);
    if (ec != std::errc()) throw OptionError("slot data orientation: value does not fit the text buffer");

    std::ostringstream ss;
    ss << "seed_name=" << data.seed_name << '\n'
       << "player=" << data.player << '\n'
       << "which_image=" << data.which_image << '\n'
       << "orientation=" << std::string_view(orientation, end - orientation) << '\n'
       << "nx=" << data.nx << '\n'
       << "ny=" << data.ny << '\n'
       << "piece_order=" << serialize_int_list(data.piece_order) << '\n'
       << "possible_merges=" << serialize_int_list(data.possible_merges) << '\n'
       << "actual_possible_merges=" << serialize_int_list(data.actual_possible_merges) << '\n'
       << "ap_world_version=" << data.ap_world_version << '\n';
    return ss.str();
}

SlotData parse_slot_data(std::string_view text) {
    std::map<std::string, std::string, std::less<>> fields;
    size_t start = 0;
    while (start < text.size()) {
        size_t end = text.find('\n', start);
        if (end == std::string_view::npos) end = text.size();
        const std::string_view line = text.substr(start, end - start);
        start = end + 1;
        if (line.empty()) continue;
        const size_t eq = line.find('=');
        if (eq == std::string_view::npos) {
            throw OptionError("slot data line without '=': '" + std::string(line) + "'");
        }
        fields[std::string(line.substr(0, eq))] = std::string(line.substr(eq + 1));
    }

    auto field = [&](const char* key) -> const std::string& {
        const auto it = fields.find(key);
        if (it == fields.end()) throw OptionError(std::string("slot data missing field '") + key + "'");
        return it->second;
    };

    SlotData data;
    data.seed_name = field("seed_name");
    data.player = parse_int_field("player", field("player"));
    data.which_image = parse_int_field("which_image", field("which_image"));
    data.orientation = parse_double_field("orientation", field("orientation"));
    data.nx = parse_int_field("nx", field("nx"));
    data.ny = parse_int_field("ny", field("ny"));
    data.piece_order = parse_int_list(field("piece_order"));
    data.possible_merges = parse_int_list(field("possible_merges"));
    data.actual_possible_merges = parse_int_list(field("actual_possible_merges"));
    data.ap_world_version = field("ap_world_version");
    return data;
}
