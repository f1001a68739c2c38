#pragma once
#ifndef zoneshift_projwrappers_h
#define zoneshift_projwrappers_h

#include"zoneshift_pch.hpp"

namespace zoneshift {

	using SharedPJ = std::shared_ptr<PJ>;
	SharedPJ makeSharedPJ(PJ* pj);

	using SharedPJCtx = std::shared_ptr<PJ_CONTEXT>;
	SharedPJCtx getNewPJContext();

	//PROJ contexts are not thread safe, so each thread gets its own
	class ProjContextByThread {
	private:
		inline static std::unordered_map<std::thread::id, SharedPJCtx> _ctxs;
	public:
		static PJ_CONTEXT* get();
	};

	SharedPJ projCreateWrapper(const std::string& s);
	SharedPJ getSubCrs(const SharedPJ& base, int index);

	SharedPJ sharedPJFromOSR(const OGRSpatialReference& osr);

	//strips vertical components, bound CRS wrappers and the like, returning the CRS that defines x and y
	SharedPJ getHorizontalCrs(const SharedPJ& crs);
}

#endif
