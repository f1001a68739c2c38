#pragma once
#ifndef zoneshift_pch_h
#define zoneshift_pch_h

#include<algorithm>
#include<array>
#include<cctype>
#include<cmath>
#include<cstdint>
#include<filesystem>
#include<limits>
#include<map>
#include<memory>
#include<mutex>
#include<optional>
#include<ostream>
#include<set>
#include<sstream>
#include<stdexcept>
#include<string>
#include<thread>
#include<typeinfo>
#include<type_traits>
#include<unordered_map>
#include<variant>
#include<vector>

#include<gdal_priv.h>
#include<ogrsf_frmts.h>
#include<ogr_spatialref.h>
#include<cpl_conv.h>
#include<cpl_error.h>
#include<cpl_json.h>
#include<cpl_string.h>

#include<proj.h>

#include<xtl/xoptional.hpp>
#include<xtl/xoptional_sequence.hpp>

#include"ZoneShiftTypeDefs.hpp"

#endif
