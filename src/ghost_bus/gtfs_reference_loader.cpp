// === GTFS Reference Loader ===================================================
//
// Parses the subset of a GTFS feed the service cares about. Files are read
// with a small quoted-CSV splitter; columns are looked up by header name so
// feeds with extra or reordered columns load unchanged. Rows with malformed
// numeric fields are skipped with a warning rather than failing the load.

#include "ghost_bus/gtfs_reference_loader.hpp"

#include <algorithm>
#include <fstream>
#include <functional>
#include <optional>
#include <stdexcept>
#include <unordered_map>
#include <utility>

#include "ghost_bus/errors.hpp"

namespace ghost_bus {

namespace {

/** @brief Header-indexed accessor for one parsed CSV row. */
class CsvRow final {
  public:
    CsvRow(const std::unordered_map<std::string, std::size_t>& columns, std::vector<std::string> fields)
        : columns_(columns),
          list_fields_(std::move(fields)) {}

    [[nodiscard]] std::string text(const std::string& column, const std::string& fallback = {}) const {
        const auto iterator_column = columns_.find(column);
        if (iterator_column == columns_.end() || iterator_column->second >= list_fields_.size()) {
            return fallback;
        }
        const std::string& value = list_fields_[iterator_column->second];
        return value.empty() ? fallback : value;
    }

    [[nodiscard]] double number(const std::string& column, double fallback = 0.0) const {
        const std::string value = text(column);
        return value.empty() ? fallback : std::stod(value);
    }

    [[nodiscard]] int integer(const std::string& column, int fallback = 0) const {
        const std::string value = text(column);
        return value.empty() ? fallback : std::stoi(value);
    }

  private:
    const std::unordered_map<std::string, std::size_t>& columns_;
    std::vector<std::string> list_fields_;
};

void strip_line_ending(std::string& line) {
    while (!line.empty() && (line.back() == '\r' || line.back() == '\n')) {
        line.pop_back();
    }
}

/** @brief Stream every row of @p path into @p on_row. */
void read_csv(const std::filesystem::path& path, const std::function<void(const CsvRow&)>& on_row, spdlog::logger& logger) {
    std::ifstream input(path);
    if (!input) {
        throw CollaboratorUnavailable("unable to open GTFS file " + path.string());
    }

    std::string line;
    if (!std::getline(input, line)) {
        logger.warn("GTFS file {} is empty", path.string());
        return;
    }
    strip_line_ending(line);
    // Some feeds ship a UTF-8 byte order mark on the header line.
    if (line.rfind("\xEF\xBB\xBF", 0) == 0) {
        line.erase(0, 3);
    }

    std::unordered_map<std::string, std::size_t> columns;
    const std::vector<std::string> header = split_csv_line(line);
    for (std::size_t index = 0; index < header.size(); ++index) {
        columns.emplace(header[index], index);
    }

    std::size_t skipped = 0;
    std::size_t line_number = 1;
    while (std::getline(input, line)) {
        ++line_number;
        strip_line_ending(line);
        if (line.empty()) {
            continue;
        }
        try {
            on_row(CsvRow{columns, split_csv_line(line)});
        } catch (const std::logic_error& exc) {
            ++skipped;
            logger.debug("Skipping {}:{}: {}", path.filename().string(), line_number, exc.what());
        }
    }
    if (skipped > 0) {
        logger.warn("Skipped {} malformed rows in {}", skipped, path.filename().string());
    }
}

}  // namespace

std::vector<std::string> split_csv_line(const std::string& line) {
    std::vector<std::string> fields;
    std::string current;
    bool in_quotes = false;
    for (std::size_t index = 0; index < line.size(); ++index) {
        const char character = line[index];
        if (in_quotes) {
            if (character == '"') {
                if (index + 1 < line.size() && line[index + 1] == '"') {
                    current.push_back('"');
                    ++index;
                } else {
                    in_quotes = false;
                }
            } else {
                current.push_back(character);
            }
            continue;
        }
        if (character == '"') {
            in_quotes = true;
        } else if (character == ',') {
            fields.push_back(std::move(current));
            current.clear();
        } else {
            current.push_back(character);
        }
    }
    fields.push_back(std::move(current));
    return fields;
}

GtfsReferenceLoader::GtfsReferenceLoader(std::filesystem::path gtfs_directory)
    : path_gtfs_directory_(std::move(gtfs_directory)),
      logger_(get_logger()) {}

void GtfsReferenceLoader::load() {
    logger_->info("Loading GTFS data from {}", path_gtfs_directory_.string());

    std::vector<Route> list_routes;
    std::vector<Stop> list_stops;
    std::multimap<std::string, Trip> map_trips;
    std::multimap<std::string, StopTime> map_stop_times;
    std::multimap<std::string, ShapePoint> map_shapes;

    read_csv(path_gtfs_directory_ / "routes.txt", [&list_routes](const CsvRow& row) {
        Route route{};
        route.route_id = row.text("route_id");
        route.short_name = row.text("route_short_name");
        route.long_name = row.text("route_long_name");
        route.route_type = row.integer("route_type", 3);
        route.color = row.text("route_color", "FFFFFF");
        route.text_color = row.text("route_text_color", "000000");
        list_routes.push_back(std::move(route));
    }, *logger_);

    read_csv(path_gtfs_directory_ / "stops.txt", [&list_stops](const CsvRow& row) {
        Stop stop{};
        stop.stop_id = row.text("stop_id");
        stop.name = row.text("stop_name");
        stop.latitude_deg = row.number("stop_lat");
        stop.longitude_deg = row.number("stop_lon");
        stop.code = row.text("stop_code");
        stop.location_type = row.integer("location_type");
        stop.parent_station = row.text("parent_station");
        list_stops.push_back(std::move(stop));
    }, *logger_);

    read_csv(path_gtfs_directory_ / "trips.txt", [&map_trips](const CsvRow& row) {
        Trip trip{};
        trip.trip_id = row.text("trip_id");
        trip.route_id = row.text("route_id");
        trip.service_id = row.text("service_id");
        trip.headsign = row.text("trip_headsign");
        trip.direction_id = row.integer("direction_id");
        trip.shape_id = row.text("shape_id");
        map_trips.emplace(trip.route_id, std::move(trip));
    }, *logger_);

    read_csv(path_gtfs_directory_ / "stop_times.txt", [&map_stop_times](const CsvRow& row) {
        StopTime stop_time{};
        stop_time.trip_id = row.text("trip_id");
        stop_time.arrival_time = row.text("arrival_time");
        stop_time.departure_time = row.text("departure_time");
        stop_time.stop_id = row.text("stop_id");
        stop_time.stop_sequence = row.integer("stop_sequence");
        stop_time.shape_dist_traveled = row.number("shape_dist_traveled");
        map_stop_times.emplace(stop_time.trip_id, std::move(stop_time));
    }, *logger_);

    const std::filesystem::path path_shapes = path_gtfs_directory_ / "shapes.txt";
    if (std::filesystem::exists(path_shapes)) {
        read_csv(path_shapes, [&map_shapes](const CsvRow& row) {
            ShapePoint point{};
            point.shape_id = row.text("shape_id");
            point.latitude_deg = row.number("shape_pt_lat");
            point.longitude_deg = row.number("shape_pt_lon");
            point.sequence = row.integer("shape_pt_sequence");
            point.dist_traveled = row.number("shape_dist_traveled");
            map_shapes.emplace(point.shape_id, std::move(point));
        }, *logger_);
    } else {
        logger_->warn("Optional GTFS file not found: {}", path_shapes.string());
    }

    list_routes_ = std::move(list_routes);
    list_stops_ = std::move(list_stops);
    map_trips_by_route_ = std::move(map_trips);
    map_stop_times_by_trip_ = std::move(map_stop_times);
    map_shape_points_ = std::move(map_shapes);

    logger_->info(
        "Loaded GTFS: routes={} stops={} trips={} stop_times={} shape_points={}",
        list_routes_.size(),
        list_stops_.size(),
        map_trips_by_route_.size(),
        map_stop_times_by_trip_.size(),
        map_shape_points_.size()
    );
}

const std::vector<Route>& GtfsReferenceLoader::routes() const {
    return list_routes_;
}

const std::vector<Stop>& GtfsReferenceLoader::stops() const {
    return list_stops_;
}

std::vector<Trip> GtfsReferenceLoader::trips_for_route(const std::string& route_id) const {
    std::vector<Trip> trips;
    const auto [first, last] = map_trips_by_route_.equal_range(route_id);
    for (auto iterator_trip = first; iterator_trip != last; ++iterator_trip) {
        trips.push_back(iterator_trip->second);
    }
    return trips;
}

std::vector<StopTime> GtfsReferenceLoader::stop_times_for_trip(const std::string& trip_id) const {
    std::vector<StopTime> stop_times;
    const auto [first, last] = map_stop_times_by_trip_.equal_range(trip_id);
    for (auto iterator_stop_time = first; iterator_stop_time != last; ++iterator_stop_time) {
        stop_times.push_back(iterator_stop_time->second);
    }
    std::stable_sort(stop_times.begin(), stop_times.end(), [](const StopTime& lhs, const StopTime& rhs) {
        return lhs.stop_sequence < rhs.stop_sequence;
    });
    return stop_times;
}

std::vector<ShapePoint> GtfsReferenceLoader::shape_points(const std::string& shape_id) const {
    std::vector<ShapePoint> points;
    const auto [first, last] = map_shape_points_.equal_range(shape_id);
    for (auto iterator_point = first; iterator_point != last; ++iterator_point) {
        points.push_back(iterator_point->second);
    }
    std::stable_sort(points.begin(), points.end(), [](const ShapePoint& lhs, const ShapePoint& rhs) {
        return lhs.sequence < rhs.sequence;
    });
    return points;
}

}  // namespace ghost_bus
