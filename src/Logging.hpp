#pragma once
#ifndef zoneshift_logging_h
#define zoneshift_logging_h

#include"zoneshift_pch.hpp"

namespace zoneshift {

	//Messages go through GDAL's CPL error machinery, so they're printed, redirected or silenced
	//alongside GDAL's own. Info messages are CPLDebug output and only appear with CPL_DEBUG=ON.
	constexpr const char* ZONESHIFT_LOG_CATEGORY = "ZoneShift";

	void logInfo(const std::string& message);
	void logWarning(const std::string& message);

	//While alive, records every warning emitted on this thread, and still forwards everything to the default handler
	class WarningCollector {
	public:
		WarningCollector();
		~WarningCollector();
		WarningCollector(const WarningCollector&) = delete;
		WarningCollector& operator=(const WarningCollector&) = delete;

		const std::vector<std::string>& warnings() const;

	private:
		std::vector<std::string> _warnings;
		static void CPL_STDCALL _handler(CPLErr level, CPLErrorNum num, const char* msg);
	};

	std::string formatValue(double d);
}

#endif
