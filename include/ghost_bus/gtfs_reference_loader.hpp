// === GTFS Reference Data =====================================================
//
// Static network reference (routes, stops, trips, stop times, shapes) loaded
// from a GTFS feed directory. Classification does not consult it today; it is
// exposed so stop- or shape-aware rules can be layered on later and so the
// route records can be cached in the durable store.

#pragma once

#include <filesystem>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "ghost_bus/logging.hpp"

namespace ghost_bus {

struct Route final {
    std::string route_id{};
    std::string short_name{};
    std::string long_name{};
    int route_type{3};                    /**< GTFS route_type; 3 is bus. */
    std::string color{"FFFFFF"};
    std::string text_color{"000000"};
};

struct Stop final {
    std::string stop_id{};
    std::string name{};
    double latitude_deg{};
    double longitude_deg{};
    std::string code{};
    int location_type{};
    std::string parent_station{};
};

struct Trip final {
    std::string trip_id{};
    std::string route_id{};
    std::string service_id{};
    std::string headsign{};
    int direction_id{};
    std::string shape_id{};
};

struct StopTime final {
    std::string trip_id{};
    std::string arrival_time{};           /**< HH:MM:SS, may exceed 24h. */
    std::string departure_time{};
    std::string stop_id{};
    int stop_sequence{};
    double shape_dist_traveled{};
};

struct ShapePoint final {
    std::string shape_id{};
    double latitude_deg{};
    double longitude_deg{};
    int sequence{};
    double dist_traveled{};
};

/** @brief Read-only view over static network reference data. */
class ReferenceDataSource {
  public:
    virtual ~ReferenceDataSource() = default;

    [[nodiscard]] virtual const std::vector<Route>& routes() const = 0;
    [[nodiscard]] virtual const std::vector<Stop>& stops() const = 0;
    [[nodiscard]] virtual std::vector<Trip> trips_for_route(const std::string& route_id) const = 0;
    /** @brief Stop times ordered by stop_sequence. */
    [[nodiscard]] virtual std::vector<StopTime> stop_times_for_trip(const std::string& trip_id) const = 0;
    /** @brief Shape vertices ordered by sequence. */
    [[nodiscard]] virtual std::vector<ShapePoint> shape_points(const std::string& shape_id) const = 0;
};

using ReferenceDataSourcePtr = std::shared_ptr<ReferenceDataSource>;

/** @brief ReferenceDataSource backed by a directory of GTFS .txt files. */
class GtfsReferenceLoader final : public ReferenceDataSource {
  public:
    explicit GtfsReferenceLoader(std::filesystem::path gtfs_directory);

    /**
     * @brief Parse the feed. routes/stops/trips/stop_times are required,
     *        shapes is optional.
     * @throws CollaboratorUnavailable if a required file is missing or
     *         unreadable.
     */
    void load();

    [[nodiscard]] const std::vector<Route>& routes() const override;
    [[nodiscard]] const std::vector<Stop>& stops() const override;
    [[nodiscard]] std::vector<Trip> trips_for_route(const std::string& route_id) const override;
    [[nodiscard]] std::vector<StopTime> stop_times_for_trip(const std::string& trip_id) const override;
    [[nodiscard]] std::vector<ShapePoint> shape_points(const std::string& shape_id) const override;

  private:
    std::filesystem::path path_gtfs_directory_;
    std::vector<Route> list_routes_;
    std::vector<Stop> list_stops_;
    std::multimap<std::string, Trip> map_trips_by_route_;
    std::multimap<std::string, StopTime> map_stop_times_by_trip_;
    std::multimap<std::string, ShapePoint> map_shape_points_;
    std::shared_ptr<spdlog::logger> logger_;
};

/** @brief Split one CSV record, honouring double-quoted fields. */
[[nodiscard]] std::vector<std::string> split_csv_line(const std::string& line);

}  // namespace ghost_bus
