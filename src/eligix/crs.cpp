#include "eligix/crs.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <iomanip>
#include <sstream>
#include <vector>

#include <concord/concord.hpp>

#include "eligix/errors.hpp"

namespace eligix {

    namespace {

        std::string upper(std::string s) {
            std::transform(s.begin(), s.end(), s.begin(),
                           [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
            return s;
        }

        std::string trim(const std::string &s) {
            auto begin = s.find_first_not_of(" \t");
            if (begin == std::string::npos)
                return {};
            auto end = s.find_last_not_of(" \t");
            return s.substr(begin, end - begin + 1);
        }

        std::vector<double> parse_numbers(const std::string &list, const std::string &identifier) {
            std::vector<double> out;
            std::stringstream ss(list);
            std::string item;
            while (std::getline(ss, item, ',')) {
                item = trim(item);
                std::size_t used = 0;
                double value = 0.0;
                try {
                    value = std::stod(item, &used);
                } catch (const std::exception &) {
                    throw CRSResolutionError("malformed reference system '" + identifier + "'");
                }
                if (used != item.size() || !std::isfinite(value))
                    throw CRSResolutionError("malformed reference system '" + identifier + "'");
                out.push_back(value);
            }
            return out;
        }

        BPoint to_wgs(const BPoint &p, const ReferenceSystem &from) {
            if (from.is_geographic()) {
                if (std::abs(p.y()) > 90.0)
                    throw CRSResolutionError("latitude " + std::to_string(p.y()) + " out of range in " +
                                             from.identifier());
                return p;
            }
            concord::frame::ENU enu{p.x(), p.y(), 0.0, from.datum()};
            auto wgs = concord::frame::to_wgs(enu);
            return BPoint{wgs.longitude, wgs.latitude};
        }

        BPoint from_wgs(const BPoint &p, const ReferenceSystem &to) {
            if (to.is_geographic())
                return p;
            concord::earth::WGS wgs{p.y(), p.x(), to.datum().altitude};
            auto enu = concord::frame::to_enu(to.datum(), wgs);
            return BPoint{enu.east(), enu.north()};
        }

    } // namespace

    ReferenceSystem ReferenceSystem::parse(const std::string &identifier) {
        const std::string id = trim(identifier);
        const std::string up = upper(id);

        if (up == "EPSG:4326" || up == "WGS84" || up == "WGS")
            return wgs84();

        if (up.rfind("ENU:", 0) == 0) {
            auto values = parse_numbers(id.substr(4), id);
            if (values.size() != 2 && values.size() != 3)
                throw CRSResolutionError("reference system '" + id + "' needs <lat>,<lon>[,<alt>]");
            if (std::abs(values[0]) > 90.0 || std::abs(values[1]) > 180.0)
                throw CRSResolutionError("datum of '" + id + "' is outside the WGS84 domain");
            return enu(datapod::Geo{values[0], values[1], values.size() == 3 ? values[2] : 0.0});
        }

        if (up.rfind("LOCAL:", 0) == 0) {
            auto name = trim(id.substr(6));
            if (name.empty())
                throw CRSResolutionError("reference system '" + id + "' has no name");
            return local(name);
        }

        if (id.empty())
            throw CRSResolutionError("reference system is undetermined");
        throw CRSResolutionError("unknown reference system '" + id + "'");
    }

    ReferenceSystem ReferenceSystem::wgs84() {
        ReferenceSystem crs;
        crs.kind_ = Kind::Geographic;
        crs.identifier_ = "EPSG:4326";
        return crs;
    }

    ReferenceSystem ReferenceSystem::enu(const datapod::Geo &datum) {
        ReferenceSystem crs;
        crs.kind_ = Kind::LocalTangent;
        crs.datum_ = datum;
        std::ostringstream oss;
        oss << "ENU:" << std::setprecision(15) << datum.latitude << "," << datum.longitude << "," << datum.altitude;
        crs.identifier_ = oss.str();
        return crs;
    }

    ReferenceSystem ReferenceSystem::local(const std::string &name) {
        ReferenceSystem crs;
        crs.kind_ = Kind::Engineering;
        crs.identifier_ = "LOCAL:" + name;
        return crs;
    }

    bool can_reproject(const ReferenceSystem &from, const ReferenceSystem &to) {
        if (!from.determined() || !to.determined())
            return false;
        if (from == to)
            return true;
        auto earth_bound = [](const ReferenceSystem &crs) {
            return crs.kind() == ReferenceSystem::Kind::Geographic ||
                   crs.kind() == ReferenceSystem::Kind::LocalTangent;
        };
        return earth_bound(from) && earth_bound(to);
    }

    void reproject(Geometry &geometry, const ReferenceSystem &from, const ReferenceSystem &to) {
        if (!from.determined())
            throw CRSResolutionError("source reference system is undetermined");
        if (!to.determined())
            throw CRSResolutionError("target reference system is undetermined");
        if (from == to)
            return;
        if (!can_reproject(from, to))
            throw CRSResolutionError("cannot reproject from " + from.identifier() + " to " + to.identifier());

        std::visit(
            [&](auto &g) {
                bg::for_each_point(g, [&](BPoint &p) {
                    BPoint q = from_wgs(to_wgs(p, from), to);
                    if (!std::isfinite(q.x()) || !std::isfinite(q.y()))
                        throw CRSResolutionError("coordinate did not survive reprojection from " +
                                                 from.identifier() + " to " + to.identifier());
                    p = q;
                });
            },
            geometry);
    }

} // namespace eligix
