#include"CoordRef.hpp"
#include"GisExceptions.hpp"

namespace zoneshift {

	CoordRef::CoordRef(const std::string& s)
	{
		if (s.empty()) {
			return;
		}
		_p = projCreateWrapper(s);
		if (!_p) {
			throw CrsParseException("Unable to interpret " + s + " as a coordinate reference system");
		}
	}
	CoordRef::CoordRef(const char* s) : CoordRef(std::string(s))
	{
	}
	CoordRef::CoordRef(const OGRSpatialReference* osr)
	{
		if (!osr || osr->IsEmpty()) {
			return;
		}
		_p = sharedPJFromOSR(*osr);
	}

	bool CoordRef::isEmpty() const
	{
		return !_p;
	}

	bool CoordRef::isConsistentHoriz(const CoordRef& other) const
	{
		if (isEmpty() || other.isEmpty()) {
			return isEmpty() && other.isEmpty();
		}
		SharedPJ thisHoriz = getHorizontalCrs(_p);
		SharedPJ otherHoriz = getHorizontalCrs(other._p);
		if (!thisHoriz || !otherHoriz) {
			return false;
		}
		return proj_is_equivalent_to_with_ctx(ProjContextByThread::get(), thisHoriz.get(), otherHoriz.get(),
			PJ_COMP_EQUIVALENT_EXCEPT_AXIS_ORDER_GEOGCRS);
	}

	std::string CoordRef::getCompleteWKT() const
	{
		if (isEmpty()) {
			return "";
		}
		const char* wkt = proj_as_wkt(ProjContextByThread::get(), _p.get(), PJ_WKT2_2019, nullptr);
		return wkt ? std::string(wkt) : std::string();
	}

	std::string CoordRef::getShortName() const
	{
		if (isEmpty()) {
			return "(no CRS)";
		}
		const char* auth = proj_get_id_auth_name(_p.get(), 0);
		const char* code = proj_get_id_code(_p.get(), 0);
		if (auth && code) {
			return std::string(auth) + ":" + code;
		}
		const char* name = proj_get_name(_p.get());
		return name ? std::string(name) : std::string("(unnamed CRS)");
	}

	std::ostream& operator<<(std::ostream& os, const CoordRef& crs)
	{
		os << crs.getShortName();
		return os;
	}
}
