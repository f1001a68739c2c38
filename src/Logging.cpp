#include"Logging.hpp"

namespace zoneshift {

	void logInfo(const std::string& message)
	{
		CPLDebug(ZONESHIFT_LOG_CATEGORY, "%s", message.c_str());
	}
	void logWarning(const std::string& message)
	{
		CPLError(CE_Warning, CPLE_AppDefined, "%s", message.c_str());
	}

	WarningCollector::WarningCollector()
	{
		CPLPushErrorHandlerEx(&WarningCollector::_handler, this);
	}
	WarningCollector::~WarningCollector()
	{
		CPLPopErrorHandler();
	}
	const std::vector<std::string>& WarningCollector::warnings() const
	{
		return _warnings;
	}
	void CPL_STDCALL WarningCollector::_handler(CPLErr level, CPLErrorNum num, const char* msg)
	{
		if (level == CE_Warning) {
			WarningCollector* self = static_cast<WarningCollector*>(CPLGetErrorHandlerUserData());
			if (self) {
				self->_warnings.emplace_back(msg ? msg : "");
			}
		}
		CPLDefaultErrorHandler(level, num, msg);
	}

	std::string formatValue(double d)
	{
		return CPLSPrintf("%.6g", d);
	}
}
