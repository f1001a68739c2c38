#include"ScenarioConfig.hpp"

namespace zoneshift {

	std::string toString(NoneLayerHandling n)
	{
		switch (n) {
		case NoneLayerHandling::ZeroChange:
			return "zero-change";
		case NoneLayerHandling::PassThrough:
			return "pass-through";
		case NoneLayerHandling::Omit:
			return "omit";
		}
		return "unknown";
	}
	std::string toString(CrsMismatchPolicy c)
	{
		return c == CrsMismatchPolicy::Fail ? "fail" : "warn";
	}
	NoneLayerHandling noneLayerHandlingFromString(const std::string& s)
	{
		if (s == "zero-change") {
			return NoneLayerHandling::ZeroChange;
		}
		if (s == "pass-through") {
			return NoneLayerHandling::PassThrough;
		}
		if (s == "omit") {
			return NoneLayerHandling::Omit;
		}
		throw std::invalid_argument("Unrecognized none-layer handling '" + s + "'");
	}
	CrsMismatchPolicy crsMismatchPolicyFromString(const std::string& s)
	{
		if (s == "fail") {
			return CrsMismatchPolicy::Fail;
		}
		if (s == "warn") {
			return CrsMismatchPolicy::Warn;
		}
		throw std::invalid_argument("Unrecognized CRS mismatch policy '" + s + "'");
	}
}
