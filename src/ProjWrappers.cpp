#include"zoneshift_pch.hpp"
#include"projwrappers.hpp"
#include"GDALWrappers.hpp"

namespace zoneshift {

	PJ_CONTEXT* ProjContextByThread::get()
	{
		static std::mutex mut;
		std::scoped_lock<std::mutex> lock{ mut };
		std::thread::id thisthread = std::this_thread::get_id();
		if (!_ctxs.count(thisthread)) {
			_ctxs.emplace(thisthread, getNewPJContext());
		}
		return _ctxs.at(thisthread).get();
	}
	SharedPJ makeSharedPJ(PJ* pj)
	{
		return SharedPJ(pj,
			[](PJ* pj) {
				if (pj) {
					proj_destroy(pj);
				}
			}
		);
	}
	SharedPJCtx getNewPJContext()
	{
		return SharedPJCtx(proj_context_create(),
			[](PJ_CONTEXT* pjc) {
				if (pjc) {
					proj_context_destroy(pjc);
				}
			}
		);
	}
	SharedPJ projCreateWrapper(const std::string& s)
	{
		return makeSharedPJ(proj_create(ProjContextByThread::get(), s.c_str()));
	}
	SharedPJ getSubCrs(const SharedPJ& base, int index)
	{
		return makeSharedPJ(
			proj_crs_get_sub_crs(ProjContextByThread::get(), base.get(), index)
		);
	}
	SharedPJ sharedPJFromOSR(const OGRSpatialReference& osr)
	{
		UniqueGdalString wkt = exportToWktWrapper(osr);
		if (!wkt) {
			return SharedPJ();
		}
		return projCreateWrapper(wkt.get());
	}
	SharedPJ getHorizontalCrs(const SharedPJ& crs)
	{
		if (!crs) {
			return SharedPJ();
		}
		PJ_TYPE t = proj_get_type(crs.get());
		SharedPJ temp;
		switch (t) {
		case PJ_TYPE_CRS:
		case PJ_TYPE_GEOCENTRIC_CRS:
		case PJ_TYPE_GEOGRAPHIC_CRS:
		case PJ_TYPE_GEOGRAPHIC_2D_CRS:
		case PJ_TYPE_PROJECTED_CRS:
		case PJ_TYPE_ENGINEERING_CRS:
		case PJ_TYPE_OTHER_CRS:
			return crs;
		case PJ_TYPE_GEOGRAPHIC_3D_CRS:
			return getHorizontalCrs(makeSharedPJ(proj_crs_demote_to_2D(ProjContextByThread::get(), nullptr, crs.get())));
		case PJ_TYPE_COMPOUND_CRS:
			temp = getHorizontalCrs(getSubCrs(crs, 0));
			if (!temp) {
				return getHorizontalCrs(getSubCrs(crs, 1));
			}
			return temp;
		case PJ_TYPE_BOUND_CRS:
		case PJ_TYPE_DERIVED_PROJECTED_CRS:
			return getHorizontalCrs(makeSharedPJ(proj_get_source_crs(ProjContextByThread::get(), crs.get())));
		default:
			//datums, ellipsoids, vertical CRSs and operations don't define a horizontal system
			return SharedPJ();
		}
	}
}
